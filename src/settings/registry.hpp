#ifndef DOCPRESS_SETTINGS_REGISTRY_HPP
#define DOCPRESS_SETTINGS_REGISTRY_HPP

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "settings/option.hpp"
#include "settings/value.hpp"

namespace docpress {

/// @brief The names of the options registered by `register_core_options`.
namespace option_names {

inline constexpr std::string_view config = "config";
inline constexpr std::string_view report_level = "report-level";
inline constexpr std::string_view halt_level = "halt-level";
inline constexpr std::string_view warning_stream = "warning-stream";
inline constexpr std::string_view tab_width = "tab-width";
inline constexpr std::string_view title = "title";
inline constexpr std::string_view doctitle = "doctitle";
inline constexpr std::string_view stylesheets = "stylesheets";
inline constexpr std::string_view output_format = "output-format";
inline constexpr std::string_view strip_comments = "strip-comments";
inline constexpr std::string_view section_ids = "section-ids";

} // namespace option_names

struct Option_Definition {
    std::string name;
    Option_Type type;
    Setting_Value default_value;
    std::string description;
};

/// @brief Converts an option name into the form stored in the registry.
/// Names are trimmed, converted to lower case, and underscores are replaced with hyphens,
/// so that `Report_Level` and `report-level` denote the same option.
[[nodiscard]] std::string normalize_option_name(std::string_view name);

/// @brief A catalogue of recognized options.
struct Option_Registry {
private:
    std::vector<Option_Definition> m_options;

public:
    /// @brief Registers an option.
    /// If an option with the same (normalized) name already exists, its definition is replaced,
    /// but it keeps its position in `options()`.
    /// `default_value` shall be a valid value of `type`.
    void register_option(std::string_view name,
                         Option_Type type,
                         Setting_Value default_value,
                         std::string description);

    /// @brief Returns the definition of the option with the given name, or `nullptr`.
    /// The name is normalized prior to lookup.
    [[nodiscard]] const Option_Definition* find(std::string_view name) const;

    [[nodiscard]] bool contains(std::string_view name) const
    {
        return find(name) != nullptr;
    }

    [[nodiscard]] std::span<const Option_Definition> options() const noexcept
    {
        return m_options;
    }

    [[nodiscard]] Size size() const noexcept
    {
        return m_options.size();
    }
};

/// @brief Registers the options that the library itself understands.
void register_core_options(Option_Registry& registry);

/// @brief Returns the process-wide registry, which initially contains the core options.
/// Options of readers, writers, and transforms are registered here before any document is
/// processed.
[[nodiscard]] Option_Registry& global_option_registry();

} // namespace docpress

#endif
