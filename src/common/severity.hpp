#ifndef DOCPRESS_COMMON_SEVERITY_HPP
#define DOCPRESS_COMMON_SEVERITY_HPP

#include <compare>
#include <string_view>

#include "common/config.hpp"

namespace docpress {

/// @brief The severity of a condition, on a scale from `0` to `10`.
/// Higher values are more severe.
/// Only some points on the scale are named; the values in between are valid as well.
enum struct Severity : Default_Underlying {
    debug = 0,
    info = 2,
    warning = 4,
    error = 6,
    severe = 8,
    fatal = 10,
};

inline constexpr int min_severity = 0;
inline constexpr int max_severity = 10;

/// @brief The default `report-level`; less severe conditions are not logged.
inline constexpr Severity default_report_level = Severity::warning;
/// @brief The default `halt-level`; conditions at least this severe abort processing.
inline constexpr Severity default_halt_level = Severity::severe;

constexpr auto operator<=>(Severity x, Severity y) noexcept
{
    return static_cast<Default_Underlying>(x) <=> static_cast<Default_Underlying>(y);
}

[[nodiscard]] constexpr int severity_number(Severity severity) noexcept
{
    return static_cast<int>(severity);
}

/// @brief Converts a number to a `Severity`, clamping it into the valid range.
[[nodiscard]] constexpr Severity severity_from_number(Int number) noexcept
{
    const Int clamped = number < min_severity ? min_severity
        : number > max_severity               ? max_severity
                                              : number;
    return static_cast<Severity>(clamped);
}

/// @brief Returns the label under which conditions of the given severity are reported.
/// Unnamed severities share the label of the closest named severity below them.
[[nodiscard]] constexpr std::string_view severity_label(Severity severity) noexcept
{
    if (severity < Severity::info) {
        return "DEBUG";
    }
    if (severity < Severity::warning) {
        return "INFO";
    }
    if (severity < Severity::error) {
        return "WARNING";
    }
    if (severity < Severity::severe) {
        return "ERROR";
    }
    return "SEVERE";
}

} // namespace docpress

#endif
