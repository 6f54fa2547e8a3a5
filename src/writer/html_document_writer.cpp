#include <algorithm>
#include <string>

#include "settings/registry.hpp"
#include "settings/settings.hpp"

#include "writer/html_document_writer.hpp"

namespace docpress {

void HTML_Document_Writer::open_element(std::string_view tag,
                                        Node_Id node,
                                        std::string_view extra_class)
{
    Attribute_Writer attributes = m_html.open_tag_with_attributes(tag);
    if (const std::optional<std::string_view> id = document().attribute(node, "ids")) {
        attributes.write_attribute("id", *id);
    }

    std::string classes(document().attribute(node, "classes").value_or(""));
    if (!extra_class.empty()) {
        if (!classes.empty()) {
            classes += ' ';
        }
        classes += extra_class;
    }
    if (!classes.empty()) {
        attributes.write_attribute("class", classes);
    }
    attributes.end();
}

std::string_view HTML_Document_Writer::heading_tag(Node_Id title) const
{
    static constexpr std::string_view tags[] = { "h1", "h2", "h3", "h4", "h5", "h6" };
    if (document().parent(title) == Node_Id::root) {
        return tags[0];
    }
    const Size level = std::min<Size>(6, m_section_depth + (m_has_title ? 1 : 0));
    return tags[std::max<Size>(level, 1) - 1];
}

Result<Visit_Flow, Visitor_Condition> HTML_Document_Writer::visit_document(Node_Id node)
{
    const Document& doc = document();
    m_section_depth = 0;
    m_has_title = !doc.empty() && doc.kind(doc.child(node, 0)) == Node_Kind::title;

    with_part("head_prefix", [&] {
        m_html.write_preamble();
        m_html.open_tag("html");
        m_html.write_inner_html("\n");
        m_html.open_tag("head");
        m_html.write_inner_html("\n");
        m_html.open_tag_with_attributes("meta").write_attribute("charset", "utf-8").end_empty();
        m_html.write_inner_html("\n");
    });

    with_part("head", [&] {
        if (const std::optional<std::string_view> title = doc.attribute(node, "title")) {
            m_html.open_tag("title").write_inner_text(*title).close_tag("title");
            m_html.write_inner_html("\n");
        }
        if (const Setting_List* stylesheets = settings().get_list(option_names::stylesheets)) {
            for (const Setting_Element& stylesheet : *stylesheets) {
                const std::string href = to_string(stylesheet);
                m_html.open_tag_with_attributes("link")
                    .write_attribute("rel", "stylesheet")
                    .write_attribute("href", href)
                    .end_empty();
                m_html.write_inner_html("\n");
            }
        }
    });

    with_part("body_prefix", [&] {
        m_html.close_tag("head");
        m_html.write_inner_html("\n");
        m_html.open_tag("body");
        m_html.write_inner_html("\n");
    });

    Result<void, Visitor_Condition> body = with_part("body", [&] { return walk_children(node); });
    if (!body) {
        return std::move(body.error());
    }
    return Visit_Flow::skip_children;
}

Result<void, Visitor_Condition> HTML_Document_Writer::depart_document(Node_Id)
{
    with_part("body_suffix", [&] {
        m_html.close_tag("body");
        m_html.write_inner_html("\n");
        m_html.close_tag("html");
        m_html.write_inner_html("\n");
    });
    return {};
}

Result<Visit_Flow, Visitor_Condition> HTML_Document_Writer::visit_section(Node_Id node)
{
    ++m_section_depth;
    open_element("section", node);
    m_html.write_inner_html("\n");
    return Visit_Flow::proceed;
}

Result<void, Visitor_Condition> HTML_Document_Writer::depart_section(Node_Id)
{
    --m_section_depth;
    m_html.close_tag("section");
    m_html.write_inner_html("\n");
    return {};
}

Result<Visit_Flow, Visitor_Condition> HTML_Document_Writer::visit_title(Node_Id node)
{
    const bool is_document_title = document().parent(node) == Node_Id::root;
    open_element(heading_tag(node), node, is_document_title ? "title" : "");
    return Visit_Flow::proceed;
}

Result<void, Visitor_Condition> HTML_Document_Writer::depart_title(Node_Id node)
{
    m_html.close_tag(heading_tag(node));
    m_html.write_inner_html("\n");
    return {};
}

Result<Visit_Flow, Visitor_Condition> HTML_Document_Writer::visit_paragraph(Node_Id node)
{
    open_element("p", node);
    return Visit_Flow::proceed;
}

Result<void, Visitor_Condition> HTML_Document_Writer::depart_paragraph(Node_Id)
{
    m_html.close_tag("p");
    m_html.write_inner_html("\n");
    return {};
}

Result<Visit_Flow, Visitor_Condition> HTML_Document_Writer::visit_text(Node_Id node)
{
    m_html.write_inner_text(document().text(node));
    return Visit_Flow::proceed;
}

Result<Visit_Flow, Visitor_Condition> HTML_Document_Writer::visit_emphasis(Node_Id node)
{
    open_element("em", node);
    return Visit_Flow::proceed;
}

Result<void, Visitor_Condition> HTML_Document_Writer::depart_emphasis(Node_Id)
{
    m_html.close_tag("em");
    return {};
}

Result<Visit_Flow, Visitor_Condition> HTML_Document_Writer::visit_strong(Node_Id node)
{
    open_element("strong", node);
    return Visit_Flow::proceed;
}

Result<void, Visitor_Condition> HTML_Document_Writer::depart_strong(Node_Id)
{
    m_html.close_tag("strong");
    return {};
}

Result<Visit_Flow, Visitor_Condition> HTML_Document_Writer::visit_literal(Node_Id node)
{
    open_element("code", node);
    return Visit_Flow::proceed;
}

Result<void, Visitor_Condition> HTML_Document_Writer::depart_literal(Node_Id)
{
    m_html.close_tag("code");
    return {};
}

Result<Visit_Flow, Visitor_Condition> HTML_Document_Writer::visit_literal_block(Node_Id node)
{
    open_element("pre", node);
    m_html.write_inner_text(document().text_content(node));
    m_html.close_tag("pre");
    m_html.write_inner_html("\n");
    return Visit_Flow::skip_children;
}

Result<Visit_Flow, Visitor_Condition> HTML_Document_Writer::visit_bullet_list(Node_Id node)
{
    open_element("ul", node);
    m_html.write_inner_html("\n");
    return Visit_Flow::proceed;
}

Result<void, Visitor_Condition> HTML_Document_Writer::depart_bullet_list(Node_Id)
{
    m_html.close_tag("ul");
    m_html.write_inner_html("\n");
    return {};
}

Result<Visit_Flow, Visitor_Condition> HTML_Document_Writer::visit_list_item(Node_Id node)
{
    open_element("li", node);
    return Visit_Flow::proceed;
}

Result<void, Visitor_Condition> HTML_Document_Writer::depart_list_item(Node_Id)
{
    m_html.close_tag("li");
    m_html.write_inner_html("\n");
    return {};
}

Result<Visit_Flow, Visitor_Condition> HTML_Document_Writer::visit_comment(Node_Id node)
{
    m_html.write_comment(document().text(node));
    m_html.write_inner_html("\n");
    return Visit_Flow::skip_children;
}

Result<Visit_Flow, Visitor_Condition> HTML_Document_Writer::visit_system_message(Node_Id node)
{
    const Document& doc = document();
    open_element("div", node, "system-message");
    m_html.write_inner_html("\n");

    m_html.open_tag_with_attributes("p").write_attribute("class", "system-message-title").end();
    m_html.write_inner_text("System Message: ");
    m_html.write_inner_text(doc.attribute(node, "type").value_or("ERROR"));
    m_html.write_inner_text("/");
    m_html.write_inner_text(doc.attribute(node, "level").value_or("6"));
    if (const std::optional<std::string_view> line = doc.attribute(node, "line")) {
        m_html.write_inner_text(" (line ");
        m_html.write_inner_text(*line);
        m_html.write_inner_text(")");
    }
    for (const Node_Id target : doc.back_references_from(node)) {
        const std::optional<std::string_view> id = doc.attribute(target, "ids");
        if (!id) {
            continue;
        }
        const std::string href = "#" + std::string(*id);
        m_html.write_inner_text(" ");
        m_html.open_tag_with_attributes("a").write_attribute("href", href).end();
        m_html.write_inner_text("backlink");
        m_html.close_tag("a");
    }
    m_html.close_tag("p");
    m_html.write_inner_html("\n");
    return Visit_Flow::proceed;
}

Result<void, Visitor_Condition> HTML_Document_Writer::depart_system_message(Node_Id)
{
    m_html.close_tag("div");
    m_html.write_inner_html("\n");
    return {};
}

} // namespace docpress
