#ifndef DOCPRESS_READER_READER_HPP
#define DOCPRESS_READER_READER_HPP

#include <vector>

#include "common/logger.hpp"
#include "common/result.hpp"

#include "doc/document.hpp"

#include "reader/source.hpp"

#include "transform/scheduler.hpp"
#include "transform/transform.hpp"

namespace docpress {

struct Settings;

/// @brief Turns a source into a document tree.
struct Reader {
    virtual ~Reader() = default;

    /// @brief Parses `source` into `document`, which has been created with `new_document`.
    /// Problems in the markup are reported to `logger` rather than failing.
    virtual void parse(Document& document,
                       const Document_Source& source,
                       const Settings& settings,
                       Logger& logger)
        = 0;

    /// @brief Returns the transforms to apply after parsing.
    [[nodiscard]] virtual std::vector<Transform_Spec> transforms() const = 0;
};

/// @brief Creates an empty document for `source`.
/// The root has a `source` attribute holding the name of the source.
[[nodiscard]] Document new_document(const Document_Source& source);

struct Read_Options {
    const Settings& settings;
    Logger& logger = ignorant_logger;
    Order_Counter& counter = global_order_counter();
};

/// @brief Creates a document, parses `source` into it with `reader`, and applies the transforms
/// of the reader.
/// @return The document, or the condition which halted the transforms.
[[nodiscard]] Result<Document, Transform_Halt>
read_document(const Document_Source& source, Reader& reader, const Read_Options& options);

} // namespace docpress

#endif
