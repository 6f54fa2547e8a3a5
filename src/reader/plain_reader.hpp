#ifndef DOCPRESS_READER_PLAIN_READER_HPP
#define DOCPRESS_READER_PLAIN_READER_HPP

#include <string_view>
#include <vector>

#include "reader/reader.hpp"

namespace docpress {

/// @brief Parses inline markup in `text` and appends the resulting nodes to `parent`.
/// Recognized are `**strong**`, `*emphasis*`, and ``` ``literal`` ```.
/// A start marker without matching end marker is kept as text, and a warning is logged.
void parse_inline(Document& document,
                  Node_Id parent,
                  std::string_view text,
                  Logger& logger = ignorant_logger);

/// @brief A reader for a small line-oriented markup.
///
/// - Blocks are separated by blank lines.
/// - A line followed by a line of `=`, `-`, or `~` which is at least as long is a section title.
///   The first underline character encountered denotes the outermost sections, the second the
///   sections within them, and so on.
/// - A block whose lines start with `- ` is a bullet list.
/// - A block starting with `..` is a comment.
/// - A paragraph ending in `::` is followed by an indented literal block.
///   The `marker` attribute of the block is `attached` for `Text::`, `expanded` for `Text ::`,
///   and `lone` for a paragraph consisting only of `::`.
/// - Any other block is a paragraph which may contain inline markup.
///
/// Tabs are expanded according to the `tab-width` setting.
struct Plain_Reader final : Reader {
private:
    std::vector<const Transform_Type*> m_transforms;

public:
    /// @brief Creates a reader which applies `standard_transforms()`.
    Plain_Reader();

    /// @brief Creates a reader which applies the given transforms.
    explicit Plain_Reader(std::vector<const Transform_Type*> transforms)
        : m_transforms(std::move(transforms))
    {
    }

    void parse(Document& document,
               const Document_Source& source,
               const Settings& settings,
               Logger& logger) final;

    [[nodiscard]] std::vector<Transform_Spec> transforms() const final;
};

} // namespace docpress

#endif
