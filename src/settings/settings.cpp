#include "settings/registry.hpp"
#include "settings/settings.hpp"

namespace docpress {

const Setting_Value* Settings::find(std::string_view name) const
{
    const auto it = m_values.find(name);
    return it == m_values.end() ? nullptr : &it->second;
}

void Settings::set(std::string_view name, Setting_Value value)
{
    m_values.insert_or_assign(std::string(name), std::move(value));
}

void Settings::merge(const Settings& other)
{
    for (const auto& [name, value] : other.m_values) {
        m_values.insert_or_assign(name, value);
    }
}

namespace {

template <typename T>
const T* get_alternative(const Settings& settings, std::string_view name)
{
    const Setting_Value* value = settings.find(name);
    return value ? std::get_if<T>(value) : nullptr;
}

} // namespace

std::optional<bool> Settings::get_bool(std::string_view name) const
{
    if (const bool* b = get_alternative<bool>(*this, name)) {
        return *b;
    }
    return {};
}

std::optional<Int> Settings::get_integer(std::string_view name) const
{
    if (const Int* x = get_alternative<Int>(*this, name)) {
        return *x;
    }
    return {};
}

std::optional<std::string_view> Settings::get_string(std::string_view name) const
{
    if (const std::string* s = get_alternative<std::string>(*this, name)) {
        return *s;
    }
    return {};
}

std::optional<std::filesystem::path> Settings::get_path(std::string_view name) const
{
    if (const std::filesystem::path* p = get_alternative<std::filesystem::path>(*this, name)) {
        return *p;
    }
    return {};
}

std::optional<std::string_view> Settings::get_symbol(std::string_view name) const
{
    if (const Symbol* s = get_alternative<Symbol>(*this, name)) {
        return s->name;
    }
    return {};
}

const Setting_List* Settings::get_list(std::string_view name) const
{
    return get_alternative<Setting_List>(*this, name);
}

Severity Settings::report_level() const
{
    const std::optional<Int> level = get_integer(option_names::report_level);
    return level ? severity_from_number(*level) : default_report_level;
}

Severity Settings::halt_level() const
{
    const std::optional<Int> level = get_integer(option_names::halt_level);
    return level ? severity_from_number(*level) : default_halt_level;
}

} // namespace docpress
