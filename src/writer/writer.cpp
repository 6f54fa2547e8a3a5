#include <algorithm>
#include <ostream>

#include "common/assert.hpp"

#include "writer/writer.hpp"

namespace docpress {

Writer::Writer(std::initializer_list<std::string_view> part_names,
               Visitor_Failure_Policy policy,
               Logger& logger)
    : m_policy(policy)
    , m_logger(logger)
{
    DOCPRESS_ASSERT(part_names.size() != 0);
    for (const std::string_view name : part_names) {
        DOCPRESS_ASSERT(find_part(name) == nullptr);
        m_parts.emplace_back(name);
    }
}

const Part* Writer::find_part(std::string_view name) const
{
    const auto it = std::ranges::find(m_parts, name, &Part::name);
    return it == m_parts.end() ? nullptr : &*it;
}

Size Writer::part_index(std::string_view name) const
{
    const Part* part = find_part(name);
    DOCPRESS_ASSERT(part != nullptr);
    return Size(part - m_parts.data());
}

const Document& Writer::document() const
{
    DOCPRESS_ASSERT(m_document != nullptr);
    return *m_document;
}

const Settings& Writer::settings() const
{
    DOCPRESS_ASSERT(m_settings != nullptr);
    return *m_settings;
}

Result<void, Visitor_Condition> Writer::attach(const Document& document, const Settings& settings)
{
    if (is_attached(document)) {
        return {};
    }

    for (Part& part : m_parts) {
        part.clear();
    }
    m_recovered.clear();
    m_current_part = 0;
    m_document = &document;
    m_document_instance = document.instance_id();
    m_settings = &settings;

    const Result<Visit_Flow, Visitor_Condition> result = walk(Node_Id::root);

    for (Part& part : m_parts) {
        part.finalize();
    }
    if (!result) {
        detach();
        return result.error();
    }
    return {};
}

Result<Visit_Flow, Visitor_Condition> Writer::walk(Node_Id node)
{
    const Result<Visit_Flow, Visitor_Condition> flow = dispatch_visit(node);
    if (!flow) {
        return flow;
    }
    if (*flow == Visit_Flow::skip_siblings) {
        return Visit_Flow::skip_siblings;
    }
    if (*flow == Visit_Flow::proceed) {
        if (Result<void, Visitor_Condition> r = walk_children(node); !r) {
            return std::move(r.error());
        }
    }
    if (Result<void, Visitor_Condition> r = dispatch_departure(node); !r) {
        return std::move(r.error());
    }
    return Visit_Flow::proceed;
}

Result<void, Visitor_Condition> Writer::walk_children(Node_Id node)
{
    for (const Node_Id child : document().children(node)) {
        Result<Visit_Flow, Visitor_Condition> result = walk(child);
        if (result) {
            if (*result == Visit_Flow::skip_siblings) {
                break;
            }
            continue;
        }
        if (m_policy == Visitor_Failure_Policy::propagate) {
            return std::move(result.error());
        }
        Visitor_Condition& condition = result.error();
        if (!condition.node) {
            condition.node = child;
        }
        m_logger(Diagnostic { .severity = Severity::warning,
                              .message = condition.message,
                              .line = document().line(*condition.node) });
        m_recovered.push_back(std::move(condition));
    }
    return {};
}

Result<Visit_Flow, Visitor_Condition> Writer::dispatch_visit(Node_Id node)
{
    switch (document().kind(node)) {
    case Node_Kind::document: return visit_document(node);
    case Node_Kind::section: return visit_section(node);
    case Node_Kind::title: return visit_title(node);
    case Node_Kind::paragraph: return visit_paragraph(node);
    case Node_Kind::text: return visit_text(node);
    case Node_Kind::emphasis: return visit_emphasis(node);
    case Node_Kind::strong: return visit_strong(node);
    case Node_Kind::literal: return visit_literal(node);
    case Node_Kind::literal_block: return visit_literal_block(node);
    case Node_Kind::bullet_list: return visit_bullet_list(node);
    case Node_Kind::list_item: return visit_list_item(node);
    case Node_Kind::comment: return visit_comment(node);
    case Node_Kind::system_message: return visit_system_message(node);
    }
    DOCPRESS_ASSERT_UNREACHABLE("invalid node kind");
}

Result<void, Visitor_Condition> Writer::dispatch_departure(Node_Id node)
{
    switch (document().kind(node)) {
    case Node_Kind::document: return depart_document(node);
    case Node_Kind::section: return depart_section(node);
    case Node_Kind::title: return depart_title(node);
    case Node_Kind::paragraph: return depart_paragraph(node);
    case Node_Kind::text: return depart_text(node);
    case Node_Kind::emphasis: return depart_emphasis(node);
    case Node_Kind::strong: return depart_strong(node);
    case Node_Kind::literal: return depart_literal(node);
    case Node_Kind::literal_block: return depart_literal_block(node);
    case Node_Kind::bullet_list: return depart_bullet_list(node);
    case Node_Kind::list_item: return depart_list_item(node);
    case Node_Kind::comment: return depart_comment(node);
    case Node_Kind::system_message: return depart_system_message(node);
    }
    DOCPRESS_ASSERT_UNREACHABLE("invalid node kind");
}

// clang-format off
Result<Visit_Flow, Visitor_Condition> Writer::visit_document(Node_Id) { return Visit_Flow::proceed; }
Result<Visit_Flow, Visitor_Condition> Writer::visit_section(Node_Id) { return Visit_Flow::proceed; }
Result<Visit_Flow, Visitor_Condition> Writer::visit_title(Node_Id) { return Visit_Flow::proceed; }
Result<Visit_Flow, Visitor_Condition> Writer::visit_paragraph(Node_Id) { return Visit_Flow::proceed; }
Result<Visit_Flow, Visitor_Condition> Writer::visit_text(Node_Id) { return Visit_Flow::proceed; }
Result<Visit_Flow, Visitor_Condition> Writer::visit_emphasis(Node_Id) { return Visit_Flow::proceed; }
Result<Visit_Flow, Visitor_Condition> Writer::visit_strong(Node_Id) { return Visit_Flow::proceed; }
Result<Visit_Flow, Visitor_Condition> Writer::visit_literal(Node_Id) { return Visit_Flow::proceed; }
Result<Visit_Flow, Visitor_Condition> Writer::visit_literal_block(Node_Id) { return Visit_Flow::proceed; }
Result<Visit_Flow, Visitor_Condition> Writer::visit_bullet_list(Node_Id) { return Visit_Flow::proceed; }
Result<Visit_Flow, Visitor_Condition> Writer::visit_list_item(Node_Id) { return Visit_Flow::proceed; }
Result<Visit_Flow, Visitor_Condition> Writer::visit_comment(Node_Id) { return Visit_Flow::proceed; }
Result<Visit_Flow, Visitor_Condition> Writer::visit_system_message(Node_Id) { return Visit_Flow::proceed; }

Result<void, Visitor_Condition> Writer::depart_document(Node_Id) { return {}; }
Result<void, Visitor_Condition> Writer::depart_section(Node_Id) { return {}; }
Result<void, Visitor_Condition> Writer::depart_title(Node_Id) { return {}; }
Result<void, Visitor_Condition> Writer::depart_paragraph(Node_Id) { return {}; }
Result<void, Visitor_Condition> Writer::depart_text(Node_Id) { return {}; }
Result<void, Visitor_Condition> Writer::depart_emphasis(Node_Id) { return {}; }
Result<void, Visitor_Condition> Writer::depart_strong(Node_Id) { return {}; }
Result<void, Visitor_Condition> Writer::depart_literal(Node_Id) { return {}; }
Result<void, Visitor_Condition> Writer::depart_literal_block(Node_Id) { return {}; }
Result<void, Visitor_Condition> Writer::depart_bullet_list(Node_Id) { return {}; }
Result<void, Visitor_Condition> Writer::depart_list_item(Node_Id) { return {}; }
Result<void, Visitor_Condition> Writer::depart_comment(Node_Id) { return {}; }
Result<void, Visitor_Condition> Writer::depart_system_message(Node_Id) { return {}; }
// clang-format on

Result<void, Write_Error> write_document(Writer& writer,
                                         const Document& document,
                                         const Settings& settings,
                                         std::ostream& out)
{
    if (Result<void, Visitor_Condition> r = writer.attach(document, settings); !r) {
        return Write_Error { std::move(r.error()) };
    }
    writer.detach();
    for (const Part& part : writer.parts()) {
        if (Result<void, IO_Error_Code> r = write_part(writer, part.name(), out); !r) {
            return Write_Error { r.error() };
        }
    }
    return {};
}

Result<void, IO_Error_Code>
write_part(const Writer& writer, std::string_view part_name, std::ostream& out)
{
    const Part* part = writer.find_part(part_name);
    DOCPRESS_ASSERT(part != nullptr);
    for (const std::string& fragment : part->fragments()) {
        out << fragment;
    }
    if (!out) {
        return IO_Error_Code::write_error;
    }
    return {};
}

} // namespace docpress
