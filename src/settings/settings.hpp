#ifndef DOCPRESS_SETTINGS_SETTINGS_HPP
#define DOCPRESS_SETTINGS_SETTINGS_HPP

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "common/severity.hpp"

#include "settings/value.hpp"

namespace docpress {

/// @brief A resolved mapping from option names to values.
/// Settings are built once per run and passed by `const&` from then on.
struct Settings {
public:
    using map_type = std::map<std::string, Setting_Value, std::less<>>;
    using const_iterator = map_type::const_iterator;

private:
    map_type m_values;

public:
    [[nodiscard]] const Setting_Value* find(std::string_view name) const;

    [[nodiscard]] bool contains(std::string_view name) const
    {
        return find(name) != nullptr;
    }

    void set(std::string_view name, Setting_Value value);

    /// @brief Copies every entry of `other` into `*this`, overwriting existing entries.
    void merge(const Settings& other);

    [[nodiscard]] Size size() const noexcept
    {
        return m_values.size();
    }

    [[nodiscard]] const_iterator begin() const noexcept
    {
        return m_values.begin();
    }

    [[nodiscard]] const_iterator end() const noexcept
    {
        return m_values.end();
    }

    // The following getters return `std::nullopt` if the setting is absent, null, or of a
    // different type.

    [[nodiscard]] std::optional<bool> get_bool(std::string_view name) const;
    [[nodiscard]] std::optional<Int> get_integer(std::string_view name) const;
    [[nodiscard]] std::optional<std::string_view> get_string(std::string_view name) const;
    [[nodiscard]] std::optional<std::filesystem::path> get_path(std::string_view name) const;
    [[nodiscard]] std::optional<std::string_view> get_symbol(std::string_view name) const;
    [[nodiscard]] const Setting_List* get_list(std::string_view name) const;

    /// @brief Returns the `report-level`, or `default_report_level` if it is not set.
    [[nodiscard]] Severity report_level() const;

    /// @brief Returns the `halt-level`, or `default_halt_level` if it is not set.
    [[nodiscard]] Severity halt_level() const;
};

} // namespace docpress

#endif
