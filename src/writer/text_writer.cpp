#include <algorithm>
#include <optional>
#include <string>

#include "common/parse.hpp"

#include "writer/text_writer.hpp"

namespace docpress {

namespace {

constexpr std::string_view underline_characters = "=-~";

[[nodiscard]] bool has_document_title(const Document& document)
{
    return !document.empty()
        && document.kind(document.child(Node_Id::root, 0)) == Node_Kind::title;
}

[[nodiscard]] std::optional<Node_Id> sibling_of(const Document& document, Node_Id node, int offset)
{
    const std::optional<Node_Id> parent = document.parent(node);
    if (!parent) {
        return {};
    }
    const Size index = document.index_in_parent(node);
    if (offset < 0 && index == 0) {
        return {};
    }
    const Size sibling = offset < 0 ? index - 1 : index + 1;
    if (sibling >= document.child_count(*parent)) {
        return {};
    }
    return document.child(*parent, sibling);
}

[[nodiscard]] bool is_of_kind(const Document& document, std::optional<Node_Id> node, Node_Kind kind)
{
    return node && document.kind(*node) == kind;
}

/// @brief Returns `true` if the literal block `node` is introduced by a `::` of its own.
[[nodiscard]] bool has_lone_marker(const Document& document, Node_Id node)
{
    return document.attribute(node, "marker") == "lone"
        || !is_of_kind(document, sibling_of(document, node, -1), Node_Kind::paragraph);
}

} // namespace

void Text_Writer::begin_block()
{
    if (m_blocks++ != 0) {
        append("\n");
    }
}

Result<Visit_Flow, Visitor_Condition> Text_Writer::visit_document(Node_Id)
{
    m_section_depth = 0;
    m_blocks = 0;
    return Visit_Flow::proceed;
}

Result<Visit_Flow, Visitor_Condition> Text_Writer::visit_section(Node_Id)
{
    ++m_section_depth;
    return Visit_Flow::proceed;
}

Result<void, Visitor_Condition> Text_Writer::depart_section(Node_Id)
{
    --m_section_depth;
    return {};
}

Result<Visit_Flow, Visitor_Condition> Text_Writer::visit_title(Node_Id node)
{
    const std::string text = document().text_content(node);
    if (text.empty()) {
        return Visitor_Condition { "Cannot write a title without text.", node };
    }

    Size level = m_section_depth == 0 ? 0 : m_section_depth - 1;
    if (m_section_depth != 0 && has_document_title(document())) {
        ++level;
    }
    const char underline = underline_characters[std::min(level, underline_characters.size() - 1)];

    begin_block();
    append(text);
    append("\n");
    append(std::string(text.size(), underline));
    append("\n");
    return Visit_Flow::skip_children;
}

Result<Visit_Flow, Visitor_Condition> Text_Writer::visit_paragraph(Node_Id)
{
    begin_block();
    return Visit_Flow::proceed;
}

Result<void, Visitor_Condition> Text_Writer::depart_paragraph(Node_Id node)
{
    // A literal block is introduced by its preceding paragraph unless it has a lone marker.
    const std::optional<Node_Id> next = sibling_of(document(), node, 1);
    if (is_of_kind(document(), next, Node_Kind::literal_block)
        && !has_lone_marker(document(), *next)) {
        const std::optional<std::string_view> marker = document().attribute(*next, "marker");
        if (marker == "attached") {
            append(":");
        }
        else if (marker == "expanded") {
            append(" ::");
        }
        else {
            append(document().text_content(node).ends_with(':') ? ":" : " ::");
        }
    }
    append("\n");
    return {};
}

Result<Visit_Flow, Visitor_Condition> Text_Writer::visit_text(Node_Id node)
{
    append(document().text(node));
    return Visit_Flow::proceed;
}

Result<Visit_Flow, Visitor_Condition> Text_Writer::visit_emphasis(Node_Id)
{
    append("*");
    return Visit_Flow::proceed;
}

Result<void, Visitor_Condition> Text_Writer::depart_emphasis(Node_Id)
{
    append("*");
    return {};
}

Result<Visit_Flow, Visitor_Condition> Text_Writer::visit_strong(Node_Id)
{
    append("**");
    return Visit_Flow::proceed;
}

Result<void, Visitor_Condition> Text_Writer::depart_strong(Node_Id)
{
    append("**");
    return {};
}

Result<Visit_Flow, Visitor_Condition> Text_Writer::visit_literal(Node_Id)
{
    append("``");
    return Visit_Flow::proceed;
}

Result<void, Visitor_Condition> Text_Writer::depart_literal(Node_Id)
{
    append("``");
    return {};
}

Result<Visit_Flow, Visitor_Condition> Text_Writer::visit_literal_block(Node_Id node)
{
    if (has_lone_marker(document(), node)) {
        begin_block();
        append("::\n");
    }
    begin_block();
    const std::string text = document().text_content(node);
    for (const std::string_view line : split_lines(text)) {
        if (!line.empty()) {
            append("    ");
            append(line);
        }
        append("\n");
    }
    return Visit_Flow::skip_children;
}

Result<Visit_Flow, Visitor_Condition> Text_Writer::visit_bullet_list(Node_Id)
{
    begin_block();
    return Visit_Flow::proceed;
}

Result<Visit_Flow, Visitor_Condition> Text_Writer::visit_list_item(Node_Id)
{
    append("- ");
    return Visit_Flow::proceed;
}

Result<void, Visitor_Condition> Text_Writer::depart_list_item(Node_Id)
{
    append("\n");
    return {};
}

Result<Visit_Flow, Visitor_Condition> Text_Writer::visit_comment(Node_Id node)
{
    begin_block();
    append(".. ");
    append(document().text(node));
    append("\n");
    return Visit_Flow::skip_children;
}

Result<Visit_Flow, Visitor_Condition> Text_Writer::visit_system_message(Node_Id node)
{
    begin_block();
    append("[");
    append(document().attribute(node, "type").value_or("ERROR"));
    append("] ");
    if (const std::optional<std::string_view> line = document().attribute(node, "line")) {
        append("line ");
        append(*line);
        append(": ");
    }
    append(document().text_content(node));
    append("\n");
    return Visit_Flow::skip_children;
}

} // namespace docpress
