#include <algorithm>
#include <ostream>

#include "common/ansi.hpp"
#include "common/assert.hpp"
#include "common/code_string.hpp"
#include "common/diagnostics.hpp"
#include "common/io_error.hpp"
#include "common/logger.hpp"

#include "doc/document.hpp"

#include "settings/config_error.hpp"
#include "settings/settings.hpp"
#include "settings/value.hpp"

#include "transform/scheduler.hpp"

#include "writer/writer.hpp"

namespace docpress {

namespace {

[[nodiscard]] Code_Span_Type severity_span_type(Severity severity)
{
    if (severity < Severity::info) {
        return Code_Span_Type::diagnostic_debug;
    }
    if (severity < Severity::warning) {
        return Code_Span_Type::diagnostic_info;
    }
    if (severity < Severity::error) {
        return Code_Span_Type::diagnostic_warning;
    }
    if (severity < Severity::severe) {
        return Code_Span_Type::diagnostic_error;
    }
    return Code_Span_Type::diagnostic_severe;
}

void print_condition_line(Code_String& out,
                          std::string_view file,
                          Severity severity,
                          std::optional<Size> line,
                          std::string_view message)
{
    if (!file.empty()) {
        print_location_of_file(out, file);
        out.append(' ');
    }
    out.append(severity_label(severity), severity_span_type(severity));
    if (line) {
        out.append(' ');
        out.build(Code_Span_Type::diagnostic_line_number)
            .append("[line ")
            .append_integer(*line)
            .append(']');
    }
    out.append(' ');
    out.append(message, Code_Span_Type::diagnostic_text);
    out.append('\n');
}

} // namespace

std::string_view to_prose(IO_Error_Code e)
{
    switch (e) {
    case IO_Error_Code::cannot_open: return "Failed to open file.";
    case IO_Error_Code::read_error: return "I/O error occurred when reading from file.";
    case IO_Error_Code::write_error: return "I/O error occurred when writing to file.";
    }
    DOCPRESS_ASSERT_UNREACHABLE("invalid error code");
}

std::string_view to_prose(Config_Error_Code e)
{
    using enum Config_Error_Code;
    switch (e) {
    case invalid_boolean:
        return "Expected a boolean value, such as 'true', 'false', 'yes', 'no', 'on', 'off', '1', "
               "or '0'.";
    case invalid_integer: return "Expected an integer.";
    case integer_out_of_range: return "The integer is outside the range permitted for the option.";
    case invalid_symbol: return "The value is not one of the values permitted for the option.";
    case null_not_allowed: return "The option requires a value, but none was given.";
    }
    DOCPRESS_ASSERT_UNREACHABLE("invalid error code");
}

[[nodiscard]] std::string_view highlight_color_of(Code_Span_Type type)
{
    using enum Code_Span_Type;
    switch (type) {
    case text:
    case diagnostic_text:
    case diagnostic_punctuation:
    case diagnostic_operand: return ansi::reset;

    case diagnostic_code_position:
    case diagnostic_debug: return ansi::h_black;

    case diagnostic_info: return ansi::h_cyan;

    case diagnostic_warning:
    case diagnostic_line_number: return ansi::h_yellow;

    case diagnostic_error_text:
    case diagnostic_error: return ansi::h_red;

    case diagnostic_severe: return ansi::red;

    case diagnostic_internal_error_notice: return ansi::h_yellow;

    case tree_node_kind: return ansi::h_blue;
    case tree_attribute_key: return ansi::h_white;
    case tree_attribute_value:
    case tree_text: return ansi::h_green;

    case setting_name: return ansi::h_white;
    case setting_value: return ansi::h_green;
    }
    DOCPRESS_ASSERT_UNREACHABLE("invalid code span type");
}

void print_location_of_file(Code_String& out, std::string_view file)
{
    out.build(Code_Span_Type::diagnostic_code_position).append(file).append(':');
}

void print_diagnostic(Code_String& out, const Diagnostic& diagnostic)
{
    print_condition_line(out, diagnostic.file, diagnostic.severity, diagnostic.line,
                         diagnostic.message);
}

void print_io_error(Code_String& out, std::string_view file, IO_Error_Code error)
{
    print_location_of_file(out, file);
    out.append(' ');
    out.append(to_prose(error), Code_Span_Type::diagnostic_text);
    out.append('\n');
}

void print_config_error(Code_String& out, const Config_Error& error)
{
    out.build(Code_Span_Type::diagnostic_code_position)
        .append(error.file.generic_string())
        .append(':')
        .append_integer(error.line)
        .append(':');
    out.append(' ');
    out.append("Invalid value ", Code_Span_Type::diagnostic_error_text);
    out.build(Code_Span_Type::diagnostic_operand).append('\'').append(error.value).append('\'');
    out.append(" for option ", Code_Span_Type::diagnostic_error_text);
    out.build(Code_Span_Type::diagnostic_operand).append('\'').append(error.key).append('\'');
    out.append(':', Code_Span_Type::diagnostic_punctuation);
    out.append(' ');
    out.append(to_prose(error.code), Code_Span_Type::diagnostic_text);
    out.append('\n');
}

void print_transform_halt(Code_String& out, std::string_view file, const Transform_Halt& halt)
{
    print_condition_line(out, file, halt.condition.severity, halt.condition.line,
                         halt.condition.message);
    out.append("Processing was halted by the transform ", Code_Span_Type::diagnostic_text);
    out.build(Code_Span_Type::diagnostic_operand)
        .append('\'')
        .append(halt.transform_name)
        .append('\'');
    out.append('.', Code_Span_Type::diagnostic_text);
    out.append('\n');
}

void print_visitor_condition(Code_String& out,
                             std::string_view file,
                             const Document& document,
                             const Visitor_Condition& condition)
{
    const std::optional<Size> line
        = condition.node ? document.line(*condition.node) : std::optional<Size> {};
    print_condition_line(out, file, Severity::error, line, condition.message);
}

void print_assertion_error(Code_String& out, const Assertion_Error& error)
{
    out.append("Assertion failed! ", Code_Span_Type::diagnostic_error);

    const std::string_view message = error.type == Assertion_Error_Type::expression
        ? "The following expression evaluated to 'false', but was expected to be 'true':"
        : "Code which must be unreachable has been reached.";
    out.append(message, Code_Span_Type::diagnostic_text);
    out.append("\n\n");

    out.build(Code_Span_Type::diagnostic_code_position)
        .append(error.location.file_name())
        .append(':')
        .append_integer(error.location.line())
        .append(':');
    out.append(' ');
    out.append(error.message, Code_Span_Type::diagnostic_error_text);
    out.append("\n\n");
    print_internal_error_notice(out);
}

void print_internal_error_notice(Code_String& out)
{
    constexpr std::string_view notice = "This is an internal error. Please report this bug.\n";
    out.append(notice, Code_Span_Type::diagnostic_internal_error_notice);
}

namespace {

void print_tree_node(Code_String& out,
                     const Document& document,
                     Node_Id node,
                     Tree_Formatting_Options options,
                     int depth)
{
    out.append(Size(depth * options.indent_width), ' ');
    out.append(node_kind_name(document.kind(node)), Code_Span_Type::tree_node_kind);

    for (const auto& [key, value] : document.attributes(node)) {
        out.append(' ');
        out.append(key, Code_Span_Type::tree_attribute_key);
        out.append('=', Code_Span_Type::diagnostic_punctuation);
        out.build(Code_Span_Type::tree_attribute_value).append('"').append(value).append('"');
    }

    if (node_kind_is_leaf(document.kind(node))) {
        std::string_view text = document.text(node);
        const Size max_length = Size(std::max(options.max_node_text_length, 0));
        const bool truncated = text.length() > max_length;
        text = text.substr(0, max_length);

        auto builder = out.build(Code_Span_Type::tree_text);
        builder.append(' ').append('"');
        for (const char c : text) {
            if (c == '\n') {
                builder.append("\\n");
            }
            else {
                builder.append(c);
            }
        }
        builder.append('"');
        if (truncated) {
            builder.append("...");
        }
    }
    out.append('\n');

    for (const Node_Id child : document.children(node)) {
        print_tree_node(out, document, child, options, depth + 1);
    }
}

} // namespace

void print_tree(Code_String& out, const Document& document, Tree_Formatting_Options options)
{
    print_tree_node(out, document, Node_Id::root, options, 0);
}

void print_settings(Code_String& out, const Settings& settings)
{
    for (const auto& [name, value] : settings) {
        out.append(name, Code_Span_Type::setting_name);
        out.append(':', Code_Span_Type::diagnostic_punctuation);
        if (!is_null(value)) {
            out.append(' ');
            out.append(to_string(value), Code_Span_Type::setting_value);
        }
        out.append('\n');
    }
}

std::ostream& print_code_string(std::ostream& out, const Code_String& string, bool colors)
{
    const std::string_view text = string.get_text();
    if (!colors) {
        return out << text;
    }

    Code_String_Span previous {};
    for (const Code_String_Span span : string) {
        const Size previous_end = previous.begin + previous.length;
        DOCPRESS_ASSERT(span.begin >= previous_end);
        if (previous_end != span.begin) {
            out << text.substr(previous_end, span.begin - previous_end);
        }
        out << highlight_color_of(span.type) << text.substr(span.begin, span.length) << ansi::reset;
        previous = span;
    }
    const Size last_span_end = previous.begin + previous.length;
    if (last_span_end != text.size()) {
        out << text.substr(last_span_end);
    }

    return out;
}

} // namespace docpress
