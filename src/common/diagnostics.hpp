#ifndef DOCPRESS_COMMON_DIAGNOSTICS_HPP
#define DOCPRESS_COMMON_DIAGNOSTICS_HPP

#include <iosfwd>
#include <string_view>

#include "common/fwd.hpp"

namespace docpress {

/// @brief Converts the given error code to a prose string which explains the problem.
/// @param e the error code
/// @return The representative prose.
[[nodiscard]] std::string_view to_prose(IO_Error_Code e);

/// @brief Converts the given error code to a prose string which explains the problem.
/// @param e the error code
/// @return The representative prose.
[[nodiscard]] std::string_view to_prose(Config_Error_Code e);

/// @brief Returns the ANSI escape sequence used to color spans of the given type.
[[nodiscard]] std::string_view highlight_color_of(Code_Span_Type type);

/// @brief Prints the location of the file nicely formatted.
/// @param out the string to write to
/// @param file the file
void print_location_of_file(Code_String& out, std::string_view file);

/// @brief Prints a diagnostic as a single line of the form `LABEL [line N] message`.
/// If the diagnostic has a file, the line is prefixed with `file: `.
/// The `[line N]` group is omitted if the line is unknown.
void print_diagnostic(Code_String& out, const Diagnostic& diagnostic);

void print_io_error(Code_String& out, std::string_view file, IO_Error_Code error);

void print_config_error(Code_String& out, const Config_Error& error);

/// @brief Prints the condition which halted a run of transforms, followed by the name of the
/// transform which raised it.
void print_transform_halt(Code_String& out, std::string_view file, const Transform_Halt& halt);

void print_visitor_condition(Code_String& out,
                             std::string_view file,
                             const Document& document,
                             const Visitor_Condition& condition);

void print_assertion_error(Code_String& out, const Assertion_Error& error);

void print_internal_error_notice(Code_String& out);

struct Tree_Formatting_Options {
    int indent_width;
    int max_node_text_length;
};

/// @brief Prints the document tree, one node per line, with children indented below their
/// parent.
void print_tree(Code_String& out, const Document& document, Tree_Formatting_Options options);

/// @brief Prints settings as `name: value` lines, in the format understood by configuration
/// files.
void print_settings(Code_String& out, const Settings& settings);

std::ostream& print_code_string(std::ostream& out, const Code_String& string, bool colors);

} // namespace docpress

#endif
