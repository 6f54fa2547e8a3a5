#include <algorithm>
#include <charconv>

#include "common/assert.hpp"
#include "common/parse.hpp"

namespace docpress {

std::string_view trim_left(std::string_view str) noexcept
{
    const auto first = std::ranges::find_if_not(str, is_space);
    return str.substr(Size(first - str.begin()));
}

std::string_view trim_right(std::string_view str) noexcept
{
    while (!str.empty() && is_space(str.back())) {
        str.remove_suffix(1);
    }
    return str;
}

bool is_blank(std::string_view str) noexcept
{
    return std::ranges::all_of(str, is_space);
}

std::string to_ascii_lower(std::string_view str)
{
    std::string result(str);
    for (char& c : result) {
        c = to_ascii_lower(c);
    }
    return result;
}

bool equals_ignore_case(std::string_view x, std::string_view y) noexcept
{
    return std::ranges::equal(x, y, [](char a, char b) { //
        return to_ascii_lower(a) == to_ascii_lower(b);
    });
}

std::optional<Int> parse_integer(std::string_view str) noexcept
{
    if (!str.empty() && str.front() == '+') {
        str.remove_prefix(1);
        // "+-1" is not a number.
        if (!str.empty() && str.front() == '-') {
            return {};
        }
    }
    if (str.empty()) {
        return {};
    }

    Int result;
    const char* const end = str.data() + str.size();
    const auto [ptr, ec] = std::from_chars(str.data(), end, result);
    if (ec != std::errc {} || ptr != end) {
        return {};
    }
    return result;
}

std::vector<std::string_view> split_trimmed(std::string_view str, char separator)
{
    std::vector<std::string_view> result;
    if (is_blank(str)) {
        return result;
    }
    while (true) {
        const Size pos = str.find(separator);
        result.push_back(trim(str.substr(0, pos)));
        if (pos == std::string_view::npos) {
            break;
        }
        str = str.substr(pos + 1);
    }
    return result;
}

std::vector<std::string_view> split_lines(std::string_view text)
{
    std::vector<std::string_view> result;
    while (!text.empty()) {
        const Size pos = text.find('\n');
        std::string_view line = text.substr(0, pos);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        result.push_back(line);
        if (pos == std::string_view::npos) {
            break;
        }
        text = text.substr(pos + 1);
    }
    return result;
}

std::string expand_tabs(std::string_view line, Size tab_width)
{
    DOCPRESS_ASSERT(tab_width != 0);

    std::string result;
    result.reserve(line.size());
    for (const char c : line) {
        if (c == '\t') {
            result.append(tab_width - result.size() % tab_width, ' ');
        }
        else {
            result.push_back(c);
        }
    }
    return result;
}

Size indentation_of(std::string_view line) noexcept
{
    return std::min(line.find_first_not_of(' '), line.size());
}

} // namespace docpress
