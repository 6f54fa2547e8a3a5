#ifndef DOCPRESS_COMMON_TTY_HPP
#define DOCPRESS_COMMON_TTY_HPP

#include <cstdio>

namespace docpress {

// https://pubs.opengroup.org/onlinepubs/009695399/functions/isatty.html
[[nodiscard]] bool is_tty(std::FILE*) noexcept;

/// @brief True if `is_tty(stdout)` is `true`.
extern const bool is_stdout_tty;
/// @brief True if `is_tty(stderr)` is `true`.
extern const bool is_stderr_tty;

} // namespace docpress

#endif
