#include "reader/reader.hpp"

namespace docpress {

Document new_document(const Document_Source& source)
{
    Document result;
    result.set_attribute(Node_Id::root, "source", source.name);
    return result;
}

Result<Document, Transform_Halt>
read_document(const Document_Source& source, Reader& reader, const Read_Options& options)
{
    Document document = new_document(source);
    reader.parse(document, source, options.settings, options.logger);

    const Transform_Options transform_options { .logger = options.logger,
                                                .counter = options.counter };
    if (Result<void, Transform_Halt> r
        = do_transforms(document, reader.transforms(), options.settings, transform_options);
        !r) {
        return std::move(r.error());
    }
    return document;
}

} // namespace docpress
