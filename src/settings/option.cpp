#include <algorithm>

#include "common/assert.hpp"
#include "common/parse.hpp"

#include "settings/option.hpp"

namespace docpress {

std::string_view option_kind_name(Option_Kind kind)
{
    using enum Option_Kind;
    switch (kind) {
        DOCPRESS_ENUM_STRING_CASE(boolean);
        DOCPRESS_ENUM_STRING_CASE(integer);
        DOCPRESS_ENUM_STRING_CASE(string);
        DOCPRESS_ENUM_STRING_CASE(path);
        DOCPRESS_ENUM_STRING_CASE(symbol);
        DOCPRESS_ENUM_STRING_CASE(list);
    }
    DOCPRESS_ASSERT_UNREACHABLE("invalid option kind");
}

Option_Type Option_Type::list_of(Option_Type element)
{
    DOCPRESS_ASSERT(!element.is_list());
    DOCPRESS_ASSERT(!element.nullable);
    element.element_kind = element.kind;
    element.kind = Option_Kind::list;
    return element;
}

namespace {

[[nodiscard]] bool element_matches(const Option_Type& type, const Setting_Element& element)
{
    switch (type.element_kind) {
    case Option_Kind::boolean: return std::holds_alternative<bool>(element);
    case Option_Kind::integer: {
        const Int* x = std::get_if<Int>(&element);
        return x && *x >= type.min && *x <= type.max;
    }
    case Option_Kind::string: return std::holds_alternative<std::string>(element);
    case Option_Kind::path: return std::holds_alternative<std::filesystem::path>(element);
    case Option_Kind::symbol: {
        const Symbol* s = std::get_if<Symbol>(&element);
        return s && std::ranges::find(type.symbols, s->name) != type.symbols.end();
    }
    case Option_Kind::list: break;
    }
    DOCPRESS_ASSERT_UNREACHABLE("invalid element kind");
}

[[nodiscard]] Result<Setting_Element, Config_Error_Code>
parse_element(const Option_Type& type,
              std::string_view raw,
              const std::filesystem::path& base_directory)
{
    switch (type.element_kind) {
    case Option_Kind::boolean: {
        for (std::string_view yes : { "1", "true", "yes", "on" }) {
            if (equals_ignore_case(raw, yes)) {
                return Setting_Element { true };
            }
        }
        for (std::string_view no : { "0", "false", "no", "off" }) {
            if (equals_ignore_case(raw, no)) {
                return Setting_Element { false };
            }
        }
        return Config_Error_Code::invalid_boolean;
    }
    case Option_Kind::integer: {
        const std::optional<Int> x = parse_integer(raw);
        if (!x) {
            return Config_Error_Code::invalid_integer;
        }
        if (*x < type.min || *x > type.max) {
            return Config_Error_Code::integer_out_of_range;
        }
        return Setting_Element { *x };
    }
    case Option_Kind::string: return Setting_Element { std::string(raw) };
    case Option_Kind::path: {
        std::filesystem::path result(raw);
        if (!base_directory.empty() && result.is_relative()) {
            result = base_directory / result;
        }
        return Setting_Element { std::move(result).lexically_normal() };
    }
    case Option_Kind::symbol: {
        const std::string name = to_ascii_lower(raw);
        if (std::ranges::find(type.symbols, name) == type.symbols.end()) {
            return Config_Error_Code::invalid_symbol;
        }
        return Setting_Element { Symbol { name } };
    }
    case Option_Kind::list: break;
    }
    DOCPRESS_ASSERT_UNREACHABLE("invalid element kind");
}

[[nodiscard]] Setting_Value to_value(Setting_Element&& element)
{
    return std::visit([](auto&& e) -> Setting_Value { return std::move(e); }, std::move(element));
}

} // namespace

bool value_matches_type(const Option_Type& type, const Setting_Value& value)
{
    if (is_null(value)) {
        return type.nullable;
    }
    if (type.is_list()) {
        const Setting_List* list = std::get_if<Setting_List>(&value);
        return list
            && std::ranges::all_of(
                   *list, [&](const Setting_Element& e) { return element_matches(type, e); });
    }
    if (std::holds_alternative<Setting_List>(value)) {
        return false;
    }
    return std::visit(
        [&]<typename T>(const T& v) {
            if constexpr (std::is_same_v<T, std::monostate> || std::is_same_v<T, Setting_List>) {
                return false;
            }
            else {
                return element_matches(type, Setting_Element { v });
            }
        },
        value);
}

Result<Setting_Value, Config_Error_Code>
parse_option_value(const Option_Type& type,
                   std::string_view raw,
                   const std::filesystem::path& base_directory)
{
    if (type.is_list()) {
        Setting_List result;
        for (std::string_view piece : split_trimmed(raw, ',')) {
            Result<Setting_Element, Config_Error_Code> element
                = parse_element(type, piece, base_directory);
            if (!element) {
                return element.error();
            }
            result.push_back(std::move(*element));
        }
        return Setting_Value { std::move(result) };
    }

    if (raw.empty()) {
        if (type.nullable) {
            return Setting_Value {};
        }
        if (type.kind != Option_Kind::string) {
            return Config_Error_Code::null_not_allowed;
        }
    }

    Result<Setting_Element, Config_Error_Code> element = parse_element(type, raw, base_directory);
    if (!element) {
        return element.error();
    }
    return to_value(std::move(*element));
}

} // namespace docpress
