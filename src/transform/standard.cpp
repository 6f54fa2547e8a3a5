#include <string>

#include "common/parse.hpp"

#include "settings/registry.hpp"
#include "settings/settings.hpp"

#include "transform/standard.hpp"
#include "transform/system_messages.hpp"

namespace docpress {

std::string make_id_slug(std::string_view text)
{
    std::string result;
    bool pending_hyphen = false;
    for (const char c : text) {
        if (is_ascii_alpha(c) || is_decimal_digit(c)) {
            if (pending_hyphen && !result.empty()) {
                result.push_back('-');
            }
            pending_hyphen = false;
            result.push_back(to_ascii_lower(c));
        }
        else {
            pending_hyphen = true;
        }
    }
    return result.empty() ? "section" : result;
}

namespace {

[[nodiscard]] std::vector<Node_Id>
nodes_of_kind(const Document& document, Node_Id root, Node_Kind kind)
{
    std::vector<Node_Id> result;
    document.for_each_node(root, [&](Node_Id node) {
        if (document.kind(node) == kind) {
            result.push_back(node);
        }
    });
    return result;
}

[[nodiscard]] std::optional<Node_Id> section_title(const Document& document, Node_Id section)
{
    if (document.child_count(section) == 0) {
        return {};
    }
    const Node_Id first = document.child(section, 0);
    return document.kind(first) == Node_Kind::title ? std::optional { first } : std::nullopt;
}

} // namespace

Result<void, Condition> Section_Ids_Transform::apply(Transform_Context& context)
{
    if (!context.settings.get_bool(option_names::section_ids).value_or(true)) {
        return {};
    }
    Document& document = context.document;
    for (const Node_Id section : nodes_of_kind(document, target(), Node_Kind::section)) {
        if (document.attribute(section, "ids")) {
            continue;
        }
        const std::optional<Node_Id> title = section_title(document, section);
        const std::string base = make_id_slug(title ? document.text_content(*title) : "");
        document.set_id(section, document.make_unique_id(base));
    }
    return {};
}

Result<void, Condition> Doc_Title_Transform::apply(Transform_Context& context)
{
    if (!context.settings.get_bool(option_names::doctitle).value_or(true)) {
        return {};
    }
    Document& document = context.document;
    const Node_Id root = target();

    std::optional<Node_Id> section;
    for (const Node_Id child : document.children(root)) {
        const Node_Kind kind = document.kind(child);
        if (kind == Node_Kind::comment) {
            continue;
        }
        if (kind != Node_Kind::section || section || is_system_messages_section(document, child)) {
            return {};
        }
        section = child;
    }
    if (!section) {
        return {};
    }
    const std::optional<Node_Id> title = section_title(document, *section);
    if (!title) {
        return {};
    }

    document.set_attribute(root, "title", document.text_content(*title));

    // The title becomes the first child of the document, and the remaining contents of the
    // section take the place of the section.
    Size index = document.index_in_parent(*section);
    document.move_child(*title, root, 0);
    ++index;
    while (document.child_count(*section) != 0) {
        document.move_child(document.child(*section, 0), root, ++index);
    }
    document.remove(*section);
    return {};
}

Result<void, Condition> Title_Override_Transform::apply(Transform_Context& context)
{
    if (const std::optional<std::string_view> title
        = context.settings.get_string(option_names::title)) {
        context.document.set_attribute(target(), "title", std::string(*title));
    }
    return {};
}

Result<void, Condition> Strip_Comments_Transform::apply(Transform_Context& context)
{
    if (!context.settings.get_bool(option_names::strip_comments).value_or(false)) {
        return {};
    }
    for (const Node_Id comment : nodes_of_kind(context.document, target(), Node_Kind::comment)) {
        context.document.remove(comment);
    }
    return {};
}

Result<void, Condition> Empty_Sections_Transform::apply(Transform_Context& context)
{
    const Document& document = context.document;
    for (const Node_Id section : nodes_of_kind(document, target(), Node_Kind::section)) {
        if (document.child_count(section) != 1 || !section_title(document, section)
            || is_system_messages_section(document, section)) {
            continue;
        }
        const std::string title = document.text_content(document.child(section, 0));
        return make_warning("Section \"" + title + "\" has no content.", section,
                            document.line(section));
    }
    return {};
}

const Transform_Type section_ids_transform { .name = "section-ids",
                                             .priority = Section_Ids_Transform::default_priority,
                                             .create = &create_transform<Section_Ids_Transform> };
const Transform_Type doc_title_transform { .name = "doctitle",
                                           .priority = Doc_Title_Transform::default_priority,
                                           .create = &create_transform<Doc_Title_Transform> };
const Transform_Type title_override_transform {
    .name = "title-override",
    .priority = Title_Override_Transform::default_priority,
    .create = &create_transform<Title_Override_Transform>
};
const Transform_Type strip_comments_transform {
    .name = "strip-comments",
    .priority = Strip_Comments_Transform::default_priority,
    .create = &create_transform<Strip_Comments_Transform>
};
const Transform_Type empty_sections_transform {
    .name = "empty-sections",
    .priority = Empty_Sections_Transform::default_priority,
    .create = &create_transform<Empty_Sections_Transform>
};

std::vector<const Transform_Type*> standard_transforms()
{
    return { &section_ids_transform, &doc_title_transform, &title_override_transform,
             &strip_comments_transform, &empty_sections_transform };
}

} // namespace docpress
