#include <cstdlib>
#include <set>
#include <string>

#include "common/io.hpp"
#include "common/parse.hpp"

#include "settings/option.hpp"
#include "settings/resolve.hpp"

namespace docpress {

std::vector<std::filesystem::path> standard_config_files()
{
    std::vector<std::filesystem::path> result;
    result.emplace_back("/etc/docpress.conf");
    if (const char* home = std::getenv("HOME"); home && *home) {
        result.push_back(std::filesystem::path(home) / ".docpress.conf");
    }
    return result;
}

std::vector<std::filesystem::path>
config_files_for_source(const std::optional<std::filesystem::path>& source_path,
                        std::span<const std::filesystem::path> standard)
{
    std::vector<std::filesystem::path> result(standard.begin(), standard.end());
    if (source_path) {
        result.push_back(source_path->parent_path() / local_config_file_name);
    }
    return result;
}

Settings default_settings(const Option_Registry& registry)
{
    Settings result;
    for (const Option_Definition& option : registry.options()) {
        result.set(option.name, option.default_value);
    }
    return result;
}

namespace {

struct Config_Resolver {
    const Resolve_Options& options;
    Settings result;
    std::set<std::filesystem::path> processed {};

    [[nodiscard]] Result<void, Config_Error> process_file(const std::filesystem::path& file)
    {
        std::error_code ec;
        const std::filesystem::path canonical = std::filesystem::weakly_canonical(file, ec);
        if (!processed.insert(ec ? file : canonical).second) {
            return {};
        }
        if (!is_existing_regular_file(file)) {
            return {};
        }

        Result<std::string, IO_Error_Code> text = file_to_string(file);
        if (!text) {
            warn(file, {}, "Unable to read configuration file.");
            return {};
        }

        const std::filesystem::path directory = file.parent_path();
        Settings own;

        const std::vector<std::string_view> lines = split_lines(*text);
        for (Size i = 0; i < lines.size(); ++i) {
            const Size line_number = i + 1;
            const std::string_view line = trim(lines[i]);
            if (line.empty() || line.starts_with('#')) {
                continue;
            }

            const std::size_t colon = line.find(':');
            if (colon == std::string_view::npos) {
                warn(file, line_number, "Malformed line without ':' is ignored.");
                continue;
            }
            const std::string name = normalize_option_name(line.substr(0, colon));
            const std::string_view raw = trim(line.substr(colon + 1));

            if (name == option_names::config) {
                std::filesystem::path included(raw);
                if (included.is_relative()) {
                    included = directory / included;
                }
                if (!is_existing_regular_file(included)) {
                    warn(file, line_number,
                         "Included configuration file '" + included.generic_string()
                             + "' does not exist.");
                    continue;
                }
                if (Result<void, Config_Error> r = process_file(included); !r) {
                    return r;
                }
                continue;
            }

            const Option_Definition* definition = options.registry.find(name);
            if (!definition) {
                own.set(name, std::string(raw));
                continue;
            }

            Result<Setting_Value, Config_Error_Code> value
                = parse_option_value(definition->type, raw, directory);
            if (value) {
                own.set(name, std::move(*value));
                continue;
            }
            if (options.policy == Invalid_Value_Policy::abort) {
                return Config_Error { .code = value.error(),
                                      .file = file,
                                      .line = line_number,
                                      .key = name,
                                      .value = std::string(raw) };
            }
            warn(file, line_number,
                 "Invalid value '" + std::string(raw) + "' for option '" + name
                     + "'; using the default value instead.");
            own.set(name, definition->default_value);
        }

        result.merge(own);
        return {};
    }

    void warn(const std::filesystem::path& file, std::optional<Size> line, std::string message)
    {
        options.logger(Diagnostic { .severity = Severity::warning,
                                    .message = std::move(message),
                                    .file = file.generic_string(),
                                    .line = line });
    }
};

} // namespace

Result<Settings, Config_Error> resolve_settings(const Resolve_Options& options)
{
    Config_Resolver resolver { .options = options, .result = default_settings(options.registry) };
    for (const std::filesystem::path& file : options.files) {
        if (Result<void, Config_Error> r = resolver.process_file(file); !r) {
            return std::move(r.error());
        }
    }
    return std::move(resolver.result);
}

} // namespace docpress
