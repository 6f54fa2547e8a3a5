#ifndef DOCPRESS_WRITER_HTML_DOCUMENT_WRITER_HPP
#define DOCPRESS_WRITER_HTML_DOCUMENT_WRITER_HPP

#include <string_view>

#include "writer/html_writer.hpp"
#include "writer/writer.hpp"

namespace docpress {

/// @brief Writes a document as a complete HTML page.
///
/// The output consists of the parts `head_prefix`, `head`, `body_prefix`, `body`, and
/// `body_suffix`, in that order.
/// `head` and `body` hold the content of the `<head>` and `<body>` elements, so that they can be
/// emitted independently, e.g. to embed the document into another page.
struct HTML_Document_Writer final : Writer {
private:
    HTML_Writer m_html;
    Size m_section_depth = 0;
    bool m_has_title = false;

public:
    explicit HTML_Document_Writer(Visitor_Failure_Policy policy = Visitor_Failure_Policy::resume,
                                  Logger& logger = ignorant_logger)
        : Writer({ "head_prefix", "head", "body_prefix", "body", "body_suffix" }, policy, logger)
        , m_html(*this)
    {
    }

protected:
    Result<Visit_Flow, Visitor_Condition> visit_document(Node_Id) final;
    Result<Visit_Flow, Visitor_Condition> visit_section(Node_Id) final;
    Result<Visit_Flow, Visitor_Condition> visit_title(Node_Id) final;
    Result<Visit_Flow, Visitor_Condition> visit_paragraph(Node_Id) final;
    Result<Visit_Flow, Visitor_Condition> visit_text(Node_Id) final;
    Result<Visit_Flow, Visitor_Condition> visit_emphasis(Node_Id) final;
    Result<Visit_Flow, Visitor_Condition> visit_strong(Node_Id) final;
    Result<Visit_Flow, Visitor_Condition> visit_literal(Node_Id) final;
    Result<Visit_Flow, Visitor_Condition> visit_literal_block(Node_Id) final;
    Result<Visit_Flow, Visitor_Condition> visit_bullet_list(Node_Id) final;
    Result<Visit_Flow, Visitor_Condition> visit_list_item(Node_Id) final;
    Result<Visit_Flow, Visitor_Condition> visit_comment(Node_Id) final;
    Result<Visit_Flow, Visitor_Condition> visit_system_message(Node_Id) final;

    Result<void, Visitor_Condition> depart_document(Node_Id) final;
    Result<void, Visitor_Condition> depart_section(Node_Id) final;
    Result<void, Visitor_Condition> depart_title(Node_Id) final;
    Result<void, Visitor_Condition> depart_paragraph(Node_Id) final;
    Result<void, Visitor_Condition> depart_emphasis(Node_Id) final;
    Result<void, Visitor_Condition> depart_strong(Node_Id) final;
    Result<void, Visitor_Condition> depart_literal(Node_Id) final;
    Result<void, Visitor_Condition> depart_bullet_list(Node_Id) final;
    Result<void, Visitor_Condition> depart_list_item(Node_Id) final;
    Result<void, Visitor_Condition> depart_system_message(Node_Id) final;

private:
    /// @brief Opens `tag`, with the `ids` and `classes` attributes of `node` as `id` and `class`.
    void open_element(std::string_view tag, Node_Id node, std::string_view extra_class = {});

    [[nodiscard]] std::string_view heading_tag(Node_Id title) const;
};

} // namespace docpress

#endif
