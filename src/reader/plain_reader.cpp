#include <algorithm>
#include <string>

#include "common/parse.hpp"

#include "settings/registry.hpp"
#include "settings/settings.hpp"

#include "transform/standard.hpp"

#include "reader/plain_reader.hpp"

namespace docpress {

namespace {

constexpr std::string_view underline_characters = "=-~";

void warn(Logger& logger, const Document& document, std::optional<Size> line, std::string message)
{
    const std::optional<std::string_view> source = document.attribute(Node_Id::root, "source");
    logger(Diagnostic { .severity = Severity::warning,
                        .message = std::move(message),
                        .file = std::string(source.value_or("")),
                        .line = line });
}

[[nodiscard]] bool is_underline(std::string_view line, Size title_length)
{
    line = trim_right(line);
    if (line.empty() || line.size() < title_length
        || underline_characters.find(line.front()) == std::string_view::npos) {
        return false;
    }
    return std::ranges::all_of(line, [&](char c) { return c == line.front(); });
}

/// @brief Returns `true` if the inline marker at the start of `text` is followed by text
/// rather than whitespace, which is what makes it a start marker.
[[nodiscard]] bool is_start_marker(std::string_view text, Size marker_length)
{
    return text.size() > marker_length && !is_space(text[marker_length]);
}

struct Block_Parser {
    Document& document;
    Logger& logger;
    std::vector<std::string> lines;
    Size pos = 0;
    std::string underline_styles {};
    std::vector<Node_Id> sections {};

    void parse()
    {
        while (pos < lines.size()) {
            if (is_blank(lines[pos])) {
                ++pos;
                continue;
            }
            parse_block();
        }
    }

private:
    [[nodiscard]] Node_Id current_parent() const
    {
        return sections.empty() ? Node_Id::root : sections.back();
    }

    [[nodiscard]] Size block_end() const
    {
        Size end = pos;
        while (end < lines.size() && !is_blank(lines[end])) {
            ++end;
        }
        return end;
    }

    [[nodiscard]] Node_Id append_block(Node_Kind kind, Size line, std::string text = {})
    {
        const Node_Id node = document.make_node(kind, std::move(text));
        document.set_line(node, line);
        document.append_child(current_parent(), node);
        return node;
    }

    void parse_block()
    {
        const Size end = block_end();
        const std::string_view first = lines[pos];

        if (end - pos >= 2 && indentation_of(first) == 0
            && is_underline(lines[pos + 1], trim(first).size())) {
            parse_title();
        }
        else if (first.starts_with("..") && (first.size() == 2 || first[2] == ' ')) {
            parse_comment(end);
        }
        else if (first.starts_with("- ")) {
            parse_bullet_list(end);
        }
        else {
            parse_paragraph(end);
        }
    }

    void parse_title()
    {
        const Size line = pos + 1;
        const std::string_view text = trim(lines[pos]);
        const char underline = trim(lines[pos + 1]).front();
        pos += 2;

        Size level = underline_styles.find(underline);
        if (level == std::string::npos) {
            level = underline_styles.size();
            underline_styles.push_back(underline);
        }
        if (level > sections.size()) {
            warn(logger, document, line,
                 "Title level inconsistent; the section is nested in the enclosing section.");
            level = sections.size();
        }
        sections.resize(level);

        const Node_Id section = append_block(Node_Kind::section, line);
        const Node_Id title = document.make_node(Node_Kind::title);
        document.set_line(title, line);
        document.append_child(section, title);
        parse_inline(document, title, text, logger);
        sections.push_back(section);
    }

    void parse_comment(Size end)
    {
        const Size line = pos + 1;
        std::string text(trim(std::string_view(lines[pos]).substr(2)));
        for (Size i = pos + 1; i < end; ++i) {
            text += '\n';
            text += trim(lines[i]);
        }
        pos = end;
        (void)append_block(Node_Kind::comment, line, std::move(text));
    }

    void parse_bullet_list(Size end)
    {
        const Node_Id list = append_block(Node_Kind::bullet_list, pos + 1);

        std::vector<std::pair<Size, std::string>> items;
        for (Size i = pos; i < end; ++i) {
            const std::string_view line = lines[i];
            if (line.starts_with("- ")) {
                items.emplace_back(i + 1, std::string(trim(line.substr(2))));
            }
            else {
                items.back().second += '\n';
                items.back().second += trim(line);
            }
        }
        pos = end;

        for (const auto& [line, text] : items) {
            const Node_Id item = document.make_node(Node_Kind::list_item);
            document.set_line(item, line);
            document.append_child(list, item);
            parse_inline(document, item, text, logger);
        }
    }

    void parse_paragraph(Size end)
    {
        const Size line = pos + 1;
        std::string text;
        for (Size i = pos; i < end; ++i) {
            if (i != pos) {
                text += '\n';
            }
            text += lines[i];
        }
        pos = end;

        const bool literal_follows = text.ends_with("::");
        std::string_view marker;
        if (literal_follows) {
            text.pop_back();
            // "Text ::" loses both colons, "Text::" keeps one, and a lone "::" vanishes.
            if (text == ":" || text.ends_with(" :")) {
                marker = text == ":" ? "lone" : "expanded";
                text.pop_back();
                text.resize(trim_right(text).size());
            }
            else {
                marker = "attached";
            }
        }
        if (!text.empty()) {
            const Node_Id paragraph = append_block(Node_Kind::paragraph, line);
            parse_inline(document, paragraph, text, logger);
        }
        if (literal_follows) {
            parse_literal_block(line, marker);
        }
    }

    /// @brief Parses the indented block after a paragraph ending in `::`.
    /// @param marker how the `::` was written, recorded as the `marker` attribute of the block
    void parse_literal_block(Size paragraph_line, std::string_view marker)
    {
        while (pos < lines.size() && is_blank(lines[pos])) {
            ++pos;
        }
        if (pos == lines.size() || indentation_of(lines[pos]) == 0) {
            warn(logger, document, paragraph_line, "Literal block expected; none found.");
            return;
        }

        Size last = pos;
        Size indentation = indentation_of(lines[pos]);
        for (Size i = pos; i < lines.size(); ++i) {
            if (is_blank(lines[i])) {
                continue;
            }
            const Size indent = indentation_of(lines[i]);
            if (indent == 0) {
                break;
            }
            indentation = std::min(indentation, indent);
            last = i;
        }

        std::string text;
        for (Size i = pos; i <= last; ++i) {
            if (i != pos) {
                text += '\n';
            }
            if (!is_blank(lines[i])) {
                text += std::string_view(lines[i]).substr(indentation);
            }
        }

        const Node_Id block = append_block(Node_Kind::literal_block, pos + 1);
        document.set_attribute(block, "marker", std::string(marker));
        document.append_child(block, document.make_text(std::move(text)));
        pos = last + 1;
    }
};

} // namespace

void parse_inline(Document& document, Node_Id parent, std::string_view text, Logger& logger)
{
    std::string plain;
    const auto flush = [&] {
        if (!plain.empty()) {
            document.append_child(parent, document.make_text(std::move(plain)));
            plain.clear();
        }
    };
    const auto append_markup = [&](Node_Kind kind, std::string_view content) {
        flush();
        const Node_Id node = document.make_node(kind);
        document.append_child(node, document.make_text(std::string(content)));
        document.append_child(parent, node);
    };

    for (Size i = 0; i < text.size();) {
        const std::string_view rest = text.substr(i);

        std::string_view marker;
        Node_Kind kind {};
        if (rest.starts_with("``")) {
            marker = "``";
            kind = Node_Kind::literal;
        }
        else if (rest.starts_with("**")) {
            marker = "**";
            kind = Node_Kind::strong;
        }
        else if (rest.starts_with('*')) {
            marker = "*";
            kind = Node_Kind::emphasis;
        }

        if (marker.empty() || !is_start_marker(rest, marker.size())) {
            plain += text[i++];
            continue;
        }

        const Size end = rest.find(marker, marker.size());
        if (end == std::string_view::npos) {
            warn(logger, document, document.line(parent),
                 "Inline markup start-string '" + std::string(marker)
                     + "' without end-string.");
            plain += marker;
            i += marker.size();
            continue;
        }
        append_markup(kind, rest.substr(marker.size(), end - marker.size()));
        i += end + marker.size();
    }
    flush();
}

Plain_Reader::Plain_Reader()
    : m_transforms(standard_transforms())
{
}

void Plain_Reader::parse(Document& document,
                         const Document_Source& source,
                         const Settings& settings,
                         Logger& logger)
{
    const Int tab_width = settings.get_integer(option_names::tab_width).value_or(8);

    Block_Parser parser { .document = document, .logger = logger, .lines = {} };
    for (const std::string_view line : split_lines(source.text)) {
        parser.lines.push_back(expand_tabs(line, Size(tab_width)));
    }
    parser.parse();
}

std::vector<Transform_Spec> Plain_Reader::transforms() const
{
    std::vector<Transform_Spec> result;
    result.reserve(m_transforms.size());
    for (const Transform_Type* type : m_transforms) {
        result.emplace_back(std::in_place_type<const Transform_Type*>, type);
    }
    return result;
}

} // namespace docpress
