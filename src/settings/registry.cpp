#include <algorithm>

#include "common/assert.hpp"
#include "common/parse.hpp"
#include "common/severity.hpp"

#include "settings/registry.hpp"

namespace docpress {

std::string normalize_option_name(std::string_view name)
{
    std::string result = to_ascii_lower(trim(name));
    std::ranges::replace(result, '_', '-');
    return result;
}

void Option_Registry::register_option(std::string_view name,
                                      Option_Type type,
                                      Setting_Value default_value,
                                      std::string description)
{
    DOCPRESS_ASSERT(value_matches_type(type, default_value));

    Option_Definition definition { .name = normalize_option_name(name),
                                   .type = std::move(type),
                                   .default_value = std::move(default_value),
                                   .description = std::move(description) };
    DOCPRESS_ASSERT(!definition.name.empty());
    DOCPRESS_ASSERT(definition.name != option_names::config);

    const auto it = std::ranges::find(m_options, definition.name, &Option_Definition::name);
    if (it != m_options.end()) {
        *it = std::move(definition);
    }
    else {
        m_options.push_back(std::move(definition));
    }
}

const Option_Definition* Option_Registry::find(std::string_view name) const
{
    const std::string key = normalize_option_name(name);
    const auto it = std::ranges::find(m_options, key, &Option_Definition::name);
    return it == m_options.end() ? nullptr : &*it;
}

void register_core_options(Option_Registry& registry)
{
    constexpr Int min_level = min_severity;
    constexpr Int max_level = max_severity;

    registry.register_option(option_names::report_level, Option_Type::integer(min_level, max_level),
                             Int(severity_number(default_report_level)),
                             "Conditions at least this severe are reported.");
    registry.register_option(option_names::halt_level, Option_Type::integer(min_level, max_level),
                             Int(severity_number(default_halt_level)),
                             "Conditions at least this severe abort processing.");
    registry.register_option(option_names::warning_stream, Option_Type::path(true), {},
                             "File that diagnostics are written to instead of standard error.");
    registry.register_option(option_names::tab_width, Option_Type::integer(1, 16), Int(8),
                             "Distance between tab stops in the source.");
    registry.register_option(option_names::title, Option_Type::string(true), {},
                             "Overrides the title of the document.");
    registry.register_option(option_names::doctitle, Option_Type::boolean(), true,
                             "Promotes a lone top-level section title to the document title.");
    registry.register_option(option_names::stylesheets,
                             Option_Type::list_of(Option_Type::path()), Setting_List {},
                             "Stylesheets linked by HTML output.");
    registry.register_option(option_names::output_format, Option_Type::symbol({ "html", "text" }),
                             Symbol { "html" }, "Output format used by 'publish'.");
    registry.register_option(option_names::strip_comments, Option_Type::boolean(), false,
                             "Removes comments from the document.");
    registry.register_option(option_names::section_ids, Option_Type::boolean(), true,
                             "Assigns ids derived from section titles.");
}

Option_Registry& global_option_registry()
{
    static Option_Registry registry = [] {
        Option_Registry result;
        register_core_options(result);
        return result;
    }();
    return registry;
}

} // namespace docpress
