#ifndef DOCPRESS_WRITER_HTML_WRITER_HPP
#define DOCPRESS_WRITER_HTML_WRITER_HPP

#include <string_view>

#include "common/assert.hpp"
#include "common/config.hpp"

#include "writer/writer.hpp"

namespace docpress {

/// @brief Returns `true` if `id` is a valid name for an HTML tag or attribute.
/// This is more restrictive than the HTML standard; only ASCII letters, digits, and `-` are
/// accepted, and the first character has to be a letter.
[[nodiscard]] bool is_html_identifier(std::string_view id);

/// @brief Returns `true` if the given string requires wrapping in quotes when it
/// appears as the value in an attribute.
/// For example, `id=123` is a valid HTML attribute with a value and requires
/// no wrapping, but `id="<x>"` requires `<x>` to be surrounded by quotes.
[[nodiscard]] inline bool requires_quotes_in_attribute(std::string_view value)
{
    return value.find_first_of("\"/'`=<>& ") != std::string_view::npos;
}

struct Attribute_Writer;

/// @brief A class which provides member functions for writing HTML content to a sink
/// correctly.
/// Both entire HTML documents can be written, as well as HTML snippets.
/// This writer only performs checks that are possible without additional memory.
/// These include:
/// - verifying that given tag names are appropriate
/// - ensuring that the number of opened tags matches the number of closed tags
///
/// To correctly use this class, the opening tags must match the closing tags.
/// I.e. for every `open_tag(id)` or `open_tag_with_attributes(id)`,
/// there must be a matching `close_tag(id)`.
struct HTML_Writer {
public:
    friend struct Attribute_Writer;
    using Self = HTML_Writer;

private:
    Text_Sink& m_out;

    Size m_depth = 0;
    bool m_in_attributes = false;

public:
    /// @brief Constructor.
    /// Writes nothing to the sink.
    explicit HTML_Writer(Text_Sink& out);

    HTML_Writer(const HTML_Writer&) = delete;
    HTML_Writer& operator=(const HTML_Writer&) = delete;

    /// @brief Returns `true` if every opened tag has been closed.
    [[nodiscard]] bool is_done() const
    {
        return m_depth == 0 && !m_in_attributes;
    }

    /// @brief Writes the `<!DOCTYPE html>` preamble.
    Self& write_preamble();

    /// @brief Writes an empty tag such as `<br/>` or `<hr/>`.
    Self& write_empty_tag(std::string_view id);

    /// @brief Writes an HTML comment with the given contents.
    Self& write_comment(std::string_view comment);

    /// @brief Writes an opening tag such as `<div>`.
    Self& open_tag(std::string_view id);

    /// @brief Writes an incomplete opening tag such as `<div`.
    /// Returns an `Attribute_Writer` which must be used to write attributes (if any)
    /// and complete the opening tag.
    [[nodiscard]] Attribute_Writer open_tag_with_attributes(std::string_view id);

    /// @brief Writes a closing tag, such as `</div>`.
    Self& close_tag(std::string_view id);

    /// @brief Writes text between tags.
    /// Characters such as `<` or `&` which interfere with HTML are converted to entities.
    Self& write_inner_text(std::string_view text);

    /// @brief Writes HTML content between tags without escaping.
    Self& write_inner_html(std::string_view text);

private:
    Self& write_attribute(std::string_view key, std::string_view value);
    Self& end_attributes();
    Self& end_empty_tag_attributes();
};

/// @brief RAII helper class which lets us write attributes more conveniently.
/// This class is not intended to be used directly, but with the help of `HTML_Writer`.
struct Attribute_Writer {
private:
    HTML_Writer& m_writer;

public:
    explicit Attribute_Writer(HTML_Writer& writer)
        : m_writer(writer)
    {
    }

    Attribute_Writer(const Attribute_Writer&) = delete;
    Attribute_Writer& operator=(const Attribute_Writer&) = delete;

    /// @brief Writes an attribute, such as `class=centered`.
    /// If `value` is empty, writes `key` on its own.
    /// If `value` requires quotes to comply with the HTML standard, quotes are added.
    /// @param key the attribute key; `is_html_identifier(key)` shall be `true`.
    /// @param value the attribute value, or an empty string
    Attribute_Writer& write_attribute(std::string_view key, std::string_view value = "")
    {
        m_writer.write_attribute(key, value);
        return *this;
    }

    /// @brief Writes `>` and finishes writing attributes.
    /// This function or `end_empty()` shall be called exactly once.
    Attribute_Writer& end()
    {
        m_writer.end_attributes();
        return *this;
    }

    /// @brief Writes `/>` and finishes writing attributes.
    /// This function or `end()` shall be called exactly once.
    Attribute_Writer& end_empty()
    {
        m_writer.end_empty_tag_attributes();
        return *this;
    }
};

} // namespace docpress

#endif
