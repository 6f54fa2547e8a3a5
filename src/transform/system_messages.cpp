#include <string>

#include "transform/system_messages.hpp"

namespace docpress {

bool is_system_messages_section(const Document& document, Node_Id node)
{
    if (document.kind(node) != Node_Kind::section || document.child_count(node) == 0) {
        return false;
    }
    const Node_Id title = document.child(node, 0);
    return document.kind(title) == Node_Kind::title
        && document.text_content(title) == system_messages_title;
}

std::optional<Node_Id> find_system_messages_section(const Document& document, Logger& logger)
{
    std::optional<Node_Id> result;
    for (const Node_Id child : document.children(Node_Id::root)) {
        if (!is_system_messages_section(document, child)) {
            continue;
        }
        if (result) {
            logger(Diagnostic { .severity = Severity::warning,
                                .message = "Multiple system message sections found; "
                                           "using the last one.",
                                .line = document.line(child) });
        }
        result = child;
    }
    return result;
}

Node_Id ensure_system_messages_section(Document& document, Logger& logger)
{
    if (const std::optional<Node_Id> existing = find_system_messages_section(document, logger)) {
        return *existing;
    }

    const Node_Id section = document.make_node(Node_Kind::section);
    document.set_attribute(section, "classes", "system-messages");
    const Node_Id title = document.make_node(Node_Kind::title);
    document.append_child(title, document.make_text(std::string(system_messages_title)));
    document.append_child(section, title);
    document.append_child(Node_Id::root, section);
    return section;
}

Node_Id make_system_message(Document& document, const Condition& condition)
{
    const Node_Id message = document.make_node(Node_Kind::system_message);
    document.set_attribute(message, "level", std::to_string(severity_number(condition.severity)));
    document.set_attribute(message, "type", std::string(severity_label(condition.severity)));
    if (condition.line) {
        document.set_attribute(message, "line", std::to_string(*condition.line));
        document.set_line(message, *condition.line);
    }

    const Node_Id paragraph = document.make_node(Node_Kind::paragraph);
    document.append_child(paragraph, document.make_text(condition.message));
    document.append_child(message, paragraph);
    return message;
}

} // namespace docpress
