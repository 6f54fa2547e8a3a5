#ifndef DOCPRESS_COMMON_IO_ERROR_HPP
#define DOCPRESS_COMMON_IO_ERROR_HPP

#include "common/config.hpp"

namespace docpress {

enum struct IO_Error_Code : Default_Underlying {
    cannot_open,
    read_error,
    write_error,
};

} // namespace docpress

#endif
