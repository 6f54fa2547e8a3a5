#ifndef DOCPRESS_COMMON_PARSE_HPP
#define DOCPRESS_COMMON_PARSE_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/config.hpp"

namespace docpress {

/// @brief Returns `true` if the given character is a decimal digit (`0` through `9`).
constexpr bool is_decimal_digit(char c)
{
    return c >= '0' && c <= '9';
}

/// @brief Returns `true` if the given character is an ASCII letter.
constexpr bool is_ascii_alpha(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

/// @brief Returns true if the given character is whitespace.
constexpr bool is_space(char c)
{
    return c == ' ' || c == '\n' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

constexpr char to_ascii_lower(char c)
{
    return c >= 'A' && c <= 'Z' ? char(c - 'A' + 'a') : c;
}

[[nodiscard]] std::string_view trim_left(std::string_view str) noexcept;

[[nodiscard]] std::string_view trim_right(std::string_view str) noexcept;

/// @brief Removes leading and trailing whitespace.
[[nodiscard]] inline std::string_view trim(std::string_view str) noexcept
{
    return trim_right(trim_left(str));
}

/// @brief Returns `true` if `str` is empty or consists only of whitespace.
[[nodiscard]] bool is_blank(std::string_view str) noexcept;

/// @brief Returns a copy of `str` where ASCII upper-case letters are converted to lower case.
[[nodiscard]] std::string to_ascii_lower(std::string_view str);

/// @brief Compares two strings, ignoring ASCII case.
[[nodiscard]] bool equals_ignore_case(std::string_view x, std::string_view y) noexcept;

/// @brief Parses a decimal integer with an optional leading `+` or `-` sign.
/// The whole string has to be matched; surrounding whitespace is not permitted.
/// @return The parsed integer, or `std::nullopt` if the string is not a valid integer or if the
/// integer is not representable.
[[nodiscard]] std::optional<Int> parse_integer(std::string_view str) noexcept;

/// @brief Splits `str` at every occurrence of `separator`.
/// Every piece is trimmed.
/// An empty or blank `str` results in no pieces.
[[nodiscard]] std::vector<std::string_view> split_trimmed(std::string_view str, char separator);

/// @brief Splits text into lines, removing `\n` and `\r\n` line terminators.
/// A trailing terminator does not produce an empty last line.
[[nodiscard]] std::vector<std::string_view> split_lines(std::string_view text);

/// @brief Replaces tab characters with spaces, so that text following a tab begins at the next
/// multiple of `tab_width`.
[[nodiscard]] std::string expand_tabs(std::string_view line, Size tab_width);

/// @brief Returns the amount of leading space characters.
[[nodiscard]] Size indentation_of(std::string_view line) noexcept;

} // namespace docpress

#endif
