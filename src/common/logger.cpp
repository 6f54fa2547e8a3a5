#include <ostream>

#include "common/code_string.hpp"
#include "common/diagnostics.hpp"
#include "common/logger.hpp"

namespace docpress {

void Stream_Logger::operator()(const Diagnostic& diagnostic)
{
    Code_String out;
    print_diagnostic(out, diagnostic);
    print_code_string(m_out, out, m_colors);
}

} // namespace docpress
