#ifndef DOCPRESS_SETTINGS_CONFIG_ERROR_HPP
#define DOCPRESS_SETTINGS_CONFIG_ERROR_HPP

#include <filesystem>
#include <string>

#include "common/config.hpp"

namespace docpress {

enum struct Config_Error_Code : Default_Underlying {
    /// @brief A boolean value is not one of the recognized spellings.
    invalid_boolean,
    /// @brief An integer value could not be parsed.
    invalid_integer,
    /// @brief An integer value lies outside the range of the option.
    integer_out_of_range,
    /// @brief A symbol value is not one of the permitted symbols.
    invalid_symbol,
    /// @brief An empty value was given for an option that cannot be null.
    null_not_allowed,
};

/// @brief An invalid value of a recognized option within a configuration file.
struct Config_Error {
    Config_Error_Code code;
    std::filesystem::path file;
    Size line;
    std::string key;
    std::string value;
};

} // namespace docpress

#endif
