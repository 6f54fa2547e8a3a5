#ifndef DOCPRESS_COMMON_IO_HPP
#define DOCPRESS_COMMON_IO_HPP

#include <filesystem>
#include <string>

#include "common/io_error.hpp"
#include "common/result.hpp"

namespace docpress {

/// @brief Reads the whole file at `path` into a string.
/// No newline conversion or decoding takes place.
[[nodiscard]] Result<std::string, IO_Error_Code> file_to_string(const std::filesystem::path& path);

/// @brief Returns `true` if `path` names an existing regular file.
/// Errors are treated as absence.
[[nodiscard]] bool is_existing_regular_file(const std::filesystem::path& path) noexcept;

} // namespace docpress

#endif
