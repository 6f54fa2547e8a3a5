#include <istream>
#include <iterator>

#include "common/io.hpp"

#include "reader/source.hpp"

namespace docpress {

Document_Source Document_Source::from_lines(std::span<const std::string_view> lines,
                                            std::string name)
{
    std::string text;
    for (const std::string_view line : lines) {
        text += line;
        text += '\n';
    }
    return from_text(std::move(text), std::move(name));
}

Result<Document_Source, IO_Error_Code> Document_Source::from_stream(std::istream& in,
                                                                    std::string name)
{
    std::string text(std::istreambuf_iterator<char>(in), {});
    if (in.bad()) {
        return IO_Error_Code::read_error;
    }
    return from_text(std::move(text), std::move(name));
}

Result<Document_Source, IO_Error_Code> load_source(const std::filesystem::path& path)
{
    Result<std::string, IO_Error_Code> text = file_to_string(path);
    if (!text) {
        return text.error();
    }
    return Document_Source { .text = std::move(*text),
                             .path = path,
                             .name = path.generic_string() };
}

} // namespace docpress
