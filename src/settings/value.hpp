#ifndef DOCPRESS_SETTINGS_VALUE_HPP
#define DOCPRESS_SETTINGS_VALUE_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "common/config.hpp"

namespace docpress {

/// @brief A value chosen from a fixed set of names.
struct Symbol {
    std::string name;

    [[nodiscard]] friend bool operator==(const Symbol&, const Symbol&) = default;
};

/// @brief A single non-null value, which may also be an element of a list.
using Setting_Element = std::variant<bool, Int, std::string, std::filesystem::path, Symbol>;

/// @brief The value of a setting.
/// `std::monostate` represents a null value, which is only valid for nullable strings and paths.
using Setting_Value = std::variant<std::monostate,
                                   bool,
                                   Int,
                                   std::string,
                                   std::filesystem::path,
                                   Symbol,
                                   std::vector<Setting_Element>>;

using Setting_List = std::vector<Setting_Element>;

[[nodiscard]] inline bool is_null(const Setting_Value& value) noexcept
{
    return std::holds_alternative<std::monostate>(value);
}

/// @brief Converts a value to the textual form used in configuration files.
/// Null values are converted to an empty string, lists are separated with `", "`.
[[nodiscard]] std::string to_string(const Setting_Element& element);

/// @brief Converts a value to the textual form used in configuration files.
/// Null values are converted to an empty string, lists are separated with `", "`.
[[nodiscard]] std::string to_string(const Setting_Value& value);

} // namespace docpress

#endif
