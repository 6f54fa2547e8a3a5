#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <vector>

#include "common/ansi.hpp"
#include "common/assert.hpp"
#include "common/code_string.hpp"
#include "common/diagnostics.hpp"
#include "common/logger.hpp"
#include "common/tty.hpp"

#include "doc/document.hpp"

#include "settings/config_error.hpp"
#include "settings/registry.hpp"
#include "settings/resolve.hpp"
#include "settings/settings.hpp"

#include "reader/plain_reader.hpp"
#include "reader/source.hpp"

#include "transform/scheduler.hpp"

#include "writer/html_document_writer.hpp"
#include "writer/text_writer.hpp"

namespace docpress {
namespace {

/// @brief Everything a command needs once the input has been loaded and the settings for it
/// have been resolved.
struct Session {
    Document_Source source;
    Settings settings;
    std::ofstream warning_file {};
    std::ostream* diagnostics = &std::cerr;
    bool diagnostic_colors = is_stderr_tty;
    std::optional<Stream_Logger> logger {};

    void print(const Code_String& out) const
    {
        print_code_string(*diagnostics, out, diagnostic_colors);
    }
};

int report_io_error(std::string_view file, IO_Error_Code error)
{
    Code_String out;
    print_io_error(out, file, error);
    print_code_string(std::cerr, out, is_stderr_tty);
    return 1;
}

/// @brief Loads `file` (or stdin for `-`), resolves its settings, sets up the diagnostic
/// stream, and invokes `command` with the resulting session.
template <typename F>
int with_session(std::string_view file, F&& command)
{
    Result<Document_Source, IO_Error_Code> source = file == "-"
        ? Document_Source::from_stream(std::cin)
        : load_source(std::filesystem::path(file));
    if (!source) {
        return report_io_error(file, source.error());
    }

    const std::vector<std::filesystem::path> config_files = config_files_for_source(source->path);
    // Nothing is known about the warning stream until the settings are resolved,
    // so diagnostics raised during resolution are replayed afterwards.
    Collecting_Logger startup_logger;
    Result<Settings, Config_Error> settings
        = resolve_settings({ .registry = global_option_registry(),
                             .files = config_files,
                             .policy = Invalid_Value_Policy::abort,
                             .logger = startup_logger });
    if (!settings) {
        Code_String out;
        print_config_error(out, settings.error());
        print_code_string(std::cerr, out, is_stderr_tty);
        return 1;
    }

    Session session { .source = std::move(*source), .settings = std::move(*settings) };
    if (const std::optional<std::filesystem::path> stream
        = session.settings.get_path(option_names::warning_stream)) {
        session.warning_file.open(*stream, std::ios::app);
        if (!session.warning_file) {
            return report_io_error(stream->generic_string(), IO_Error_Code::cannot_open);
        }
        session.diagnostics = &session.warning_file;
        session.diagnostic_colors = false;
    }
    session.logger.emplace(*session.diagnostics, session.diagnostic_colors);

    for (const Diagnostic& diagnostic : startup_logger.diagnostics) {
        (*session.logger)(diagnostic);
    }

    return command(session);
}

[[nodiscard]] std::optional<Document> read(Session& session)
{
    Plain_Reader reader;
    Result<Document, Transform_Halt> document = read_document(
        session.source, reader, { .settings = session.settings, .logger = *session.logger });
    if (!document) {
        Code_String out;
        print_transform_halt(out, session.source.name, document.error());
        session.print(out);
        return {};
    }
    return std::move(*document);
}

int write(Session& session,
          const Document& document,
          Writer& writer,
          std::optional<std::string_view> out_file)
{
    std::ofstream file_stream;
    if (out_file) {
        file_stream.open(std::string(*out_file));
        if (!file_stream) {
            return report_io_error(*out_file, IO_Error_Code::cannot_open);
        }
    }
    std::ostream& out = out_file ? file_stream : std::cout;

    const Result<void, Write_Error> result
        = write_document(writer, document, session.settings, out);
    if (result) {
        return 0;
    }

    Code_String error_out;
    if (const auto* condition = std::get_if<Visitor_Condition>(&result.error())) {
        print_visitor_condition(error_out, session.source.name, document, *condition);
    }
    else {
        print_io_error(error_out, out_file.value_or("stdout"),
                       std::get<IO_Error_Code>(result.error()));
    }
    session.print(error_out);
    return 1;
}

enum struct Output_Format { html, text };

int convert(std::string_view file,
            std::optional<std::string_view> out_file,
            std::optional<Output_Format> format)
{
    return with_session(file, [&](Session& session) {
        Output_Format chosen = Output_Format::html;
        if (format) {
            chosen = *format;
        }
        else if (session.settings.get_symbol(option_names::output_format) == "text") {
            chosen = Output_Format::text;
        }

        const std::optional<Document> document = read(session);
        if (!document) {
            return 1;
        }

        switch (chosen) {
        case Output_Format::html: {
            HTML_Document_Writer writer { Visitor_Failure_Policy::resume, *session.logger };
            return write(session, *document, writer, out_file);
        }
        case Output_Format::text: {
            Text_Writer writer { Visitor_Failure_Policy::resume, *session.logger };
            return write(session, *document, writer, out_file);
        }
        }
        DOCPRESS_ASSERT_UNREACHABLE("invalid output format");
    });
}

int dump_settings(std::string_view file)
{
    return with_session(file, [](Session& session) {
        Code_String out;
        print_settings(out, session.settings);
        print_code_string(std::cout, out, is_stdout_tty);
        return 0;
    });
}

int dump_tree(std::string_view file)
{
    return with_session(file, [](Session& session) {
        const std::optional<Document> document = read(session);
        if (!document) {
            return 1;
        }
        Code_String out;
        print_tree(out, *document, { .indent_width = 2, .max_node_text_length = 40 });
        print_code_string(std::cout, out, is_stdout_tty);
        return 0;
    });
}

struct Command_Help {
    std::string_view name;
    std::string_view arguments;
    std::string_view description;
};

constexpr Command_Help command_helps[] {
    { "html", "FILE [OUTPUT_FILE]", "Converts the document to HTML, or prints it to stdout." },
    { "text", "FILE [OUTPUT_FILE]", "Converts the document to plain text." },
    { "publish", "FILE [OUTPUT_FILE]",
      "Converts the document to the format given by the 'output-format' setting." },
    { "settings", "FILE", "Prints the settings which apply to the document." },
    { "dump", "FILE", "Prints the document tree after all transforms have been applied." },
};

void print_help(std::string_view program_name)
{
    const bool colors = is_stdout_tty;
    const auto color = [&](std::string_view code) { return colors ? code : std::string_view {}; };

    std::cout << color(ansi::black) << "Usage: " << color(ansi::reset) << program_name //
              << color(ansi::yellow) << " COMMAND " //
              << color(ansi::h_green) << "FILE...\n";
    for (const Command_Help& help : command_helps) {
        std::cout << "    " << color(ansi::yellow) << help.name << " " //
                  << color(ansi::h_green) << help.arguments << '\n' //
                  << "      " << color(ansi::reset) << help.description << '\n';
    }
    std::cout << "FILE may be '-' to read from stdin.\n";
}

int main(int argc, const char** argv)
try {
    const std::vector<std::string_view> args(argv, argv + argc);
    const std::string_view program_name = args.size() == 0 ? "docpress" : args[0];

    if (args.size() < 3) {
        print_help(program_name);
        return 1;
    }

    const std::optional<std::string_view> out_file
        = args.size() > 3 ? args[3] : std::optional<std::string_view> {};

    if (args[1] == "html") {
        return convert(args[2], out_file, Output_Format::html);
    }
    else if (args[1] == "text") {
        return convert(args[2], out_file, Output_Format::text);
    }
    else if (args[1] == "publish") {
        return convert(args[2], out_file, std::nullopt);
    }
    else if (args[1] == "settings") {
        return dump_settings(args[2]);
    }
    else if (args[1] == "dump") {
        return dump_tree(args[2]);
    }
    else {
        std::cerr << "Unknown command '" << args[1] << "'\n";
        return 1;
    }
} catch (const Assertion_Error& e) {
    Code_String out;
    print_assertion_error(out, e);
    print_code_string(std::cerr, out, is_stderr_tty);
    return 1;
} catch (const std::exception& e) {
    Code_String out;
    out.append("Unhandled exception! ", Code_Span_Type::diagnostic_error_text);
    out.append("An exception with the following message has been raised:",
               Code_Span_Type::diagnostic_text);
    out.append("\n\n");
    out.append(e.what(), Code_Span_Type::diagnostic_text);
    out.append("\n\n");
    print_internal_error_notice(out);
    print_code_string(std::cerr, out, is_stderr_tty);
    return 1;
}

} // namespace
} // namespace docpress

int main(int argc, const char** argv)
{
    return docpress::main(argc, argv);
}
