#ifndef DOCPRESS_WRITER_TEXT_WRITER_HPP
#define DOCPRESS_WRITER_TEXT_WRITER_HPP

#include "writer/writer.hpp"

namespace docpress {

/// @brief Writes a document as plain text in the markup understood by `Plain_Reader`.
/// Everything is written to a single part named `body`.
struct Text_Writer final : Writer {
private:
    Size m_section_depth = 0;
    Size m_blocks = 0;

public:
    explicit Text_Writer(Visitor_Failure_Policy policy = Visitor_Failure_Policy::resume,
                         Logger& logger = ignorant_logger)
        : Writer({ "body" }, policy, logger)
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

    Result<void, Visitor_Condition> depart_section(Node_Id) final;
    Result<void, Visitor_Condition> depart_paragraph(Node_Id) final;
    Result<void, Visitor_Condition> depart_emphasis(Node_Id) final;
    Result<void, Visitor_Condition> depart_strong(Node_Id) final;
    Result<void, Visitor_Condition> depart_literal(Node_Id) final;
    Result<void, Visitor_Condition> depart_list_item(Node_Id) final;

private:
    void begin_block();
};

} // namespace docpress

#endif
