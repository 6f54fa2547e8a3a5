#ifndef DOCPRESS_DOC_NODE_KIND_HPP
#define DOCPRESS_DOC_NODE_KIND_HPP

#include <string_view>

#include "common/assert.hpp"
#include "common/config.hpp"

namespace docpress {

enum struct Node_Kind : Default_Underlying {
    /// @brief The root of every document tree.
    document,
    /// @brief A section, starting with a `title`.
    section,
    title,
    paragraph,
    /// @brief A leaf holding a run of text.
    text,
    emphasis,
    strong,
    /// @brief Inline literal text, like ``code``.
    literal,
    /// @brief A block of literal text, where whitespace is preserved.
    literal_block,
    bullet_list,
    list_item,
    /// @brief A leaf holding a comment, which is not rendered by most writers.
    comment,
    /// @brief A diagnostic recorded within the document, such as a failed transform.
    system_message,
};

[[nodiscard]] constexpr std::string_view node_kind_name(Node_Kind kind)
{
    using enum Node_Kind;
    switch (kind) {
        DOCPRESS_ENUM_STRING_CASE(document);
        DOCPRESS_ENUM_STRING_CASE(section);
        DOCPRESS_ENUM_STRING_CASE(title);
        DOCPRESS_ENUM_STRING_CASE(paragraph);
        DOCPRESS_ENUM_STRING_CASE(text);
        DOCPRESS_ENUM_STRING_CASE(emphasis);
        DOCPRESS_ENUM_STRING_CASE(strong);
        DOCPRESS_ENUM_STRING_CASE(literal);
        DOCPRESS_ENUM_STRING_CASE(literal_block);
        DOCPRESS_ENUM_STRING_CASE(bullet_list);
        DOCPRESS_ENUM_STRING_CASE(list_item);
        DOCPRESS_ENUM_STRING_CASE(comment);
        DOCPRESS_ENUM_STRING_CASE(system_message);
    }
    DOCPRESS_ASSERT_UNREACHABLE("Invalid node kind.");
}

/// @brief Returns `true` if nodes of this kind hold text instead of children.
[[nodiscard]] constexpr bool node_kind_is_leaf(Node_Kind kind)
{
    return kind == Node_Kind::text || kind == Node_Kind::comment;
}

/// @brief Returns `true` if nodes of this kind are rendered as blocks rather than inline.
[[nodiscard]] constexpr bool node_kind_is_block(Node_Kind kind)
{
    using enum Node_Kind;
    switch (kind) {
    case document:
    case section:
    case title:
    case paragraph:
    case literal_block:
    case bullet_list:
    case list_item:
    case comment:
    case system_message: return true;

    case text:
    case emphasis:
    case strong:
    case literal: return false;
    }
    DOCPRESS_ASSERT_UNREACHABLE("Invalid node kind.");
}

} // namespace docpress

#endif
