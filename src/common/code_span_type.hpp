#ifndef DOCPRESS_COMMON_CODE_SPAN_TYPE_HPP
#define DOCPRESS_COMMON_CODE_SPAN_TYPE_HPP

#include "common/config.hpp"

namespace docpress {

/// @brief The type of a span in a piece of highlighted console output.
/// Diagnostics, tree dumps and settings listings all fall into these categories
/// for the purpose of coloring.
enum struct Code_Span_Type : Default_Underlying {
    text,
    diagnostic_text,
    diagnostic_error_text,
    diagnostic_code_position,
    diagnostic_debug,
    diagnostic_info,
    diagnostic_warning,
    diagnostic_error,
    diagnostic_severe,
    diagnostic_line_number,
    diagnostic_punctuation,
    diagnostic_internal_error_notice,
    diagnostic_operand,
    tree_node_kind,
    tree_attribute_key,
    tree_attribute_value,
    tree_text,
    setting_name,
    setting_value,
};

} // namespace docpress

#endif
