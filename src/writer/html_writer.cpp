#include <algorithm>

#include "common/parse.hpp"

#include "writer/html_writer.hpp"

namespace docpress {
namespace {

[[nodiscard]] std::string_view entity_of(char c)
{
    switch (c) {
    case '<': return "&lt;";
    case '>': return "&gt;";
    case '&': return "&amp;";
    case '"': return "&quot;";
    default: DOCPRESS_ASSERT_UNREACHABLE("Logical mistake.");
    }
}

void write_escaped(Text_Sink& out, std::string_view text, std::string_view special)
{
    while (!text.empty()) {
        const Size pos = text.find_first_of(special);
        out.write(text.substr(0, std::min(text.length(), pos)));
        if (pos == std::string_view::npos) {
            break;
        }
        out.write(entity_of(text[pos]));
        text = text.substr(pos + 1);
    }
}

} // namespace

bool is_html_identifier(std::string_view id)
{
    return !id.empty() && is_ascii_alpha(id.front())
        && std::ranges::all_of(
               id, [](char c) { return is_ascii_alpha(c) || is_decimal_digit(c) || c == '-'; });
}

HTML_Writer::HTML_Writer(Text_Sink& out)
    : m_out(out)
{
}

auto HTML_Writer::write_inner_text(std::string_view text) -> Self&
{
    DOCPRESS_ASSERT(!m_in_attributes);
    write_escaped(m_out, text, "<>&");
    return *this;
}

auto HTML_Writer::write_inner_html(std::string_view text) -> Self&
{
    DOCPRESS_ASSERT(!m_in_attributes);
    m_out.write(text);
    return *this;
}

auto HTML_Writer::write_preamble() -> Self&
{
    DOCPRESS_ASSERT(!m_in_attributes);
    m_out.write("<!DOCTYPE html>\n");
    return *this;
}

auto HTML_Writer::write_empty_tag(std::string_view id) -> Self&
{
    DOCPRESS_ASSERT(!m_in_attributes);
    DOCPRESS_ASSERT(is_html_identifier(id));

    m_out.write("<");
    m_out.write(id);
    m_out.write("/>");
    return *this;
}

auto HTML_Writer::open_tag(std::string_view id) -> Self&
{
    DOCPRESS_ASSERT(!m_in_attributes);
    DOCPRESS_ASSERT(is_html_identifier(id));

    m_out.write("<");
    m_out.write(id);
    m_out.write(">");
    ++m_depth;
    return *this;
}

Attribute_Writer HTML_Writer::open_tag_with_attributes(std::string_view id)
{
    DOCPRESS_ASSERT(!m_in_attributes);
    DOCPRESS_ASSERT(is_html_identifier(id));

    m_out.write("<");
    m_out.write(id);
    m_in_attributes = true;
    return Attribute_Writer { *this };
}

auto HTML_Writer::close_tag(std::string_view id) -> Self&
{
    DOCPRESS_ASSERT(!m_in_attributes);
    DOCPRESS_ASSERT(is_html_identifier(id));
    DOCPRESS_ASSERT(m_depth != 0);

    --m_depth;
    m_out.write("</");
    m_out.write(id);
    m_out.write(">");
    return *this;
}

auto HTML_Writer::write_comment(std::string_view comment) -> Self&
{
    DOCPRESS_ASSERT(!m_in_attributes);
    m_out.write("<!--");
    write_escaped(m_out, comment, "<>");
    m_out.write("-->");
    return *this;
}

auto HTML_Writer::write_attribute(std::string_view key, std::string_view value) -> Self&
{
    DOCPRESS_ASSERT(m_in_attributes);
    DOCPRESS_ASSERT(is_html_identifier(key));

    m_out.write(" ");
    m_out.write(key);

    if (!value.empty()) {
        m_out.write("=");
        if (requires_quotes_in_attribute(value)) {
            m_out.write("\"");
            write_escaped(m_out, value, "&\"");
            m_out.write("\"");
        }
        else {
            m_out.write(value);
        }
    }
    return *this;
}

auto HTML_Writer::end_attributes() -> Self&
{
    DOCPRESS_ASSERT(m_in_attributes);

    m_out.write(">");
    m_in_attributes = false;
    ++m_depth;
    return *this;
}

auto HTML_Writer::end_empty_tag_attributes() -> Self&
{
    DOCPRESS_ASSERT(m_in_attributes);

    m_out.write("/>");
    m_in_attributes = false;
    return *this;
}

} // namespace docpress
