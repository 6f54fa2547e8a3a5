#ifndef DOCPRESS_READER_SOURCE_HPP
#define DOCPRESS_READER_SOURCE_HPP

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "common/io_error.hpp"
#include "common/result.hpp"

namespace docpress {

/// @brief The input of a reader.
struct Document_Source {
    std::string text;
    /// @brief The file that the text was loaded from, if any.
    /// Path-backed sources are also looked up in the configuration file next to them.
    std::optional<std::filesystem::path> path {};
    /// @brief A name for the source used in diagnostics.
    std::string name = "<input>";

    [[nodiscard]] static Document_Source from_text(std::string text, std::string name = "<input>")
    {
        return { .text = std::move(text), .name = std::move(name) };
    }

    /// @brief Creates a source from lines, without line terminators.
    [[nodiscard]] static Document_Source from_lines(std::span<const std::string_view> lines,
                                                    std::string name = "<input>");

    /// @brief Creates a source from the remaining contents of a stream.
    [[nodiscard]] static Result<Document_Source, IO_Error_Code>
    from_stream(std::istream& in, std::string name = "<stdin>");
};

/// @brief Loads the file at `path` as a source.
[[nodiscard]] Result<Document_Source, IO_Error_Code> load_source(const std::filesystem::path& path);

} // namespace docpress

#endif
