#ifndef DOCPRESS_SETTINGS_OPTION_HPP
#define DOCPRESS_SETTINGS_OPTION_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "common/config.hpp"
#include "common/result.hpp"

#include "settings/config_error.hpp"
#include "settings/value.hpp"

namespace docpress {

enum struct Option_Kind : Default_Underlying {
    boolean,
    integer,
    string,
    path,
    symbol,
    list,
};

[[nodiscard]] std::string_view option_kind_name(Option_Kind kind);

/// @brief Describes the set of valid values of an option.
/// A list type describes its elements using `element_kind`, `min`, `max`, and `symbols`.
struct Option_Type {
    Option_Kind kind;
    Option_Kind element_kind = kind;
    bool nullable = false;
    Int min = 0;
    Int max = 0;
    std::vector<std::string> symbols {};

    [[nodiscard]] static Option_Type boolean()
    {
        return { .kind = Option_Kind::boolean };
    }

    [[nodiscard]] static Option_Type integer(Int min, Int max)
    {
        return { .kind = Option_Kind::integer, .min = min, .max = max };
    }

    [[nodiscard]] static Option_Type string(bool nullable = false)
    {
        return { .kind = Option_Kind::string, .nullable = nullable };
    }

    [[nodiscard]] static Option_Type path(bool nullable = false)
    {
        return { .kind = Option_Kind::path, .nullable = nullable };
    }

    [[nodiscard]] static Option_Type symbol(std::vector<std::string> symbols)
    {
        return { .kind = Option_Kind::symbol, .symbols = std::move(symbols) };
    }

    /// @brief Returns a list type whose elements are of type `element`.
    /// `element` shall not be a list or nullable.
    [[nodiscard]] static Option_Type list_of(Option_Type element);

    [[nodiscard]] bool is_list() const noexcept
    {
        return kind == Option_Kind::list;
    }
};

/// @brief Returns `true` if `value` is a valid value for an option of type `type`.
[[nodiscard]] bool value_matches_type(const Option_Type& type, const Setting_Value& value);

/// @brief Parses the raw text of a setting according to `type`.
/// Booleans accept `1`, `true`, `yes`, and `on` or `0`, `false`, `no`, and `off`, ignoring case.
/// An empty value is null for nullable types.
/// List elements are separated by commas.
/// @param type the type of the option
/// @param raw the raw value, already trimmed
/// @param base_directory the directory that relative paths are resolved against,
/// or an empty path if paths should be taken as-is
[[nodiscard]] Result<Setting_Value, Config_Error_Code>
parse_option_value(const Option_Type& type,
                   std::string_view raw,
                   const std::filesystem::path& base_directory = {});

} // namespace docpress

#endif
