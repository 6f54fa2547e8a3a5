#ifndef DOCPRESS_COMMON_LOGGER_HPP
#define DOCPRESS_COMMON_LOGGER_HPP

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/config.hpp"
#include "common/severity.hpp"

namespace docpress {

/// @brief A single reported diagnostic.
struct Diagnostic {
    Severity severity;
    std::string message;
    /// @brief The file that the diagnostic concerns, or empty.
    std::string file {};
    /// @brief One-based line number, if known.
    std::optional<Size> line {};
};

/// @brief The destination of reported diagnostics.
struct Logger {
    virtual void operator()(const Diagnostic& diagnostic) = 0;

protected:
    ~Logger() = default;
};

/// @brief A `Logger` which discards everything.
struct Ignorant_Logger final : Logger {
    void operator()(const Diagnostic&) final { }
};

inline Ignorant_Logger ignorant_logger;

/// @brief A `Logger` which stores every diagnostic it receives.
struct Collecting_Logger final : Logger {
    std::vector<Diagnostic> diagnostics;

    void operator()(const Diagnostic& diagnostic) final
    {
        diagnostics.push_back(diagnostic);
    }

    [[nodiscard]] Size count() const noexcept
    {
        return diagnostics.size();
    }
};

/// @brief A `Logger` which prints each diagnostic as one line to a stream.
/// @see print_diagnostic
struct Stream_Logger final : Logger {
private:
    std::ostream& m_out;
    bool m_colors;

public:
    explicit Stream_Logger(std::ostream& out, bool colors = false)
        : m_out(out)
        , m_colors(colors)
    {
    }

    void operator()(const Diagnostic& diagnostic) final;
};

} // namespace docpress

#endif
