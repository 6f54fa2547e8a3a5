#ifndef DOCPRESS_SETTINGS_RESOLVE_HPP
#define DOCPRESS_SETTINGS_RESOLVE_HPP

#include <filesystem>
#include <optional>
#include <span>
#include <vector>

#include "common/logger.hpp"
#include "common/result.hpp"

#include "settings/config_error.hpp"
#include "settings/registry.hpp"
#include "settings/settings.hpp"

namespace docpress {

/// @brief Decides what happens when a configuration file contains an invalid value for a
/// recognized option.
enum struct Invalid_Value_Policy : Default_Underlying {
    /// @brief Warn, and use the default value of the option instead.
    use_default,
    /// @brief Fail resolution with a `Config_Error`.
    abort,
};

/// @brief The name of the configuration file which is looked up next to a source file.
inline constexpr std::string_view local_config_file_name = "docpress.conf";

/// @brief Returns the system-wide and user configuration files, in processing order.
/// The user file is omitted if `HOME` is not set.
[[nodiscard]] std::vector<std::filesystem::path> standard_config_files();

/// @brief Returns the configuration files to consult for a source, in processing order.
/// The standard files come first; for path-backed sources, the `docpress.conf` in the directory
/// of the source comes last and thus takes precedence over them.
[[nodiscard]] std::vector<std::filesystem::path>
config_files_for_source(const std::optional<std::filesystem::path>& source_path,
                        std::span<const std::filesystem::path> standard
                        = standard_config_files());

struct Resolve_Options {
    const Option_Registry& registry;
    /// @brief The files to process, where later files override earlier ones.
    /// Files that don't exist are skipped.
    std::span<const std::filesystem::path> files;
    Invalid_Value_Policy policy = Invalid_Value_Policy::use_default;
    Logger& logger = ignorant_logger;
};

/// @brief Returns settings which hold the default value of every option in `registry`.
[[nodiscard]] Settings default_settings(const Option_Registry& registry);

/// @brief Resolves settings from the defaults of the registry and the given configuration files.
///
/// Each file consists of `name: value` lines; blank lines and lines starting with `#` are
/// ignored, and lines without `:` are reported as warnings and skipped.
/// A `config: path` line includes another file, which is processed immediately.
/// The keys of a file itself override the keys of any file it includes, regardless of where the
/// `config` line appears.
/// No file is processed more than once, which makes cyclic inclusion harmless.
///
/// Values of recognized options are validated against their type, and failures are handled
/// according to the policy.
/// Unrecognized options are kept as raw strings.
[[nodiscard]] Result<Settings, Config_Error> resolve_settings(const Resolve_Options& options);

} // namespace docpress

#endif
