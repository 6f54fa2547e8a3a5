#include <sstream>
#include <string>
#include <type_traits>

#include <gtest/gtest.h>

#include "common/assert.hpp"
#include "common/logger.hpp"

#include "settings/settings.hpp"

#include "writer/part.hpp"
#include "writer/writer.hpp"

namespace docpress {
namespace {

TEST(Part, prepend_after_appends)
{
    Part part("body");
    part.append("a");
    part.append("b");
    part.prepend("c");
    part.finalize();
    EXPECT_EQ(part.text(), "cab");
}

TEST(Part, prepend_and_append)
{
    Part part("body");
    part.append("c");
    part.prepend("b");
    part.append("d");
    part.prepend("a");
    EXPECT_FALSE(part.empty());

    part.finalize();
    EXPECT_EQ(part.text(), "abcd");
    EXPECT_EQ(part.fragments().size(), 4);

    part.clear();
    EXPECT_TRUE(part.empty());
    EXPECT_EQ(part.text(), "");
}

/// @brief Writes the text of every paragraph to a part determined by its `part` attribute, and
/// records the order in which nodes are visited and departed.
struct Recording_Writer final : Writer {
    std::string trace;

    explicit Recording_Writer(Visitor_Failure_Policy policy = Visitor_Failure_Policy::resume,
                              Logger& logger = ignorant_logger)
        : Writer({ "c", "a", "b" }, policy, logger)
    {
    }

protected:
    Result<Visit_Flow, Visitor_Condition> visit_section(Node_Id node) final
    {
        trace += "<section";
        if (document().attribute(node, "skip") == "children") {
            return Visit_Flow::skip_children;
        }
        if (document().attribute(node, "skip") == "siblings") {
            return Visit_Flow::skip_siblings;
        }
        return Visit_Flow::proceed;
    }

    Result<void, Visitor_Condition> depart_section(Node_Id) final
    {
        trace += ">";
        return {};
    }

    Result<Visit_Flow, Visitor_Condition> visit_paragraph(Node_Id node) final
    {
        trace += "p";
        if (document().attribute(node, "fail")) {
            return Visitor_Condition { "Cannot write paragraph." };
        }
        const std::string text = document().text_content(node);
        if (const std::optional<std::string_view> part = document().attribute(node, "part")) {
            with_part(*part, [&] { append(text); });
        }
        else if (document().attribute(node, "prepend")) {
            prepend(text);
        }
        else {
            append(text);
        }
        return Visit_Flow::skip_children;
    }
};

struct Writer_Test : ::testing::Test {
    Document document;
    Settings settings;

    Node_Id add_paragraph(Node_Id parent, std::string text)
    {
        const Node_Id paragraph = document.make_node(Node_Kind::paragraph);
        document.append_child(paragraph, document.make_text(std::move(text)));
        document.append_child(parent, paragraph);
        return paragraph;
    }

    Node_Id add_section(Node_Id parent)
    {
        const Node_Id section = document.make_node(Node_Kind::section);
        document.append_child(parent, section);
        return section;
    }
};

TEST_F(Writer_Test, parts_are_written_in_declared_order)
{
    document.set_attribute(add_paragraph(Node_Id::root, "1"), "part", "a");
    document.set_attribute(add_paragraph(Node_Id::root, "2"), "part", "b");
    add_paragraph(Node_Id::root, "3");

    Recording_Writer writer;
    std::ostringstream out;
    ASSERT_TRUE(write_document(writer, document, settings, out));

    EXPECT_EQ(out.str(), "312");
    EXPECT_EQ(writer.find_part("c")->text(), "3");
    EXPECT_EQ(writer.find_part("a")->text(), "1");
    EXPECT_EQ(writer.find_part("b")->text(), "2");
    EXPECT_EQ(writer.find_part("d"), nullptr);
}

TEST_F(Writer_Test, prepend_goes_before_appended_content)
{
    add_paragraph(Node_Id::root, "x");
    document.set_attribute(add_paragraph(Node_Id::root, "y"), "prepend", "");
    document.set_attribute(add_paragraph(Node_Id::root, "z"), "prepend", "");

    Recording_Writer writer;
    ASSERT_TRUE(writer.attach(document, settings));
    EXPECT_EQ(writer.find_part("c")->text(), "zyx");
}

TEST_F(Writer_Test, part_scope_restores_previous_part)
{
    Recording_Writer writer;
    EXPECT_EQ(writer.current_part_name(), "c");
    {
        const Writer::Part_Scope scope = writer.activate_part("b");
        EXPECT_EQ(writer.current_part_name(), "b");
        writer.with_part("a", [&] { EXPECT_EQ(writer.current_part_name(), "a"); });
        EXPECT_EQ(writer.current_part_name(), "b");
    }
    EXPECT_EQ(writer.current_part_name(), "c");
    EXPECT_THROW((void)writer.activate_part("nope"), Assertion_Error);
}

TEST_F(Writer_Test, skip_children_still_departs)
{
    const Node_Id section = add_section(Node_Id::root);
    document.set_attribute(section, "skip", "children");
    add_paragraph(section, "hidden");
    add_paragraph(Node_Id::root, "shown");

    Recording_Writer writer;
    ASSERT_TRUE(writer.attach(document, settings));
    EXPECT_EQ(writer.trace, "<section>p");
    EXPECT_EQ(writer.find_part("c")->text(), "shown");
}

TEST_F(Writer_Test, skip_siblings_skips_departure_and_siblings)
{
    const Node_Id outer = add_section(Node_Id::root);
    add_paragraph(outer, "before");
    const Node_Id inner = add_section(outer);
    document.set_attribute(inner, "skip", "siblings");
    add_paragraph(inner, "inside");
    add_paragraph(outer, "after");
    add_paragraph(Node_Id::root, "outside");

    Recording_Writer writer;
    ASSERT_TRUE(writer.attach(document, settings));
    EXPECT_EQ(writer.trace, "<sectionp<section>p");
    EXPECT_EQ(writer.find_part("c")->text(), "beforeoutside");
}

TEST_F(Writer_Test, resume_policy_continues_with_next_sibling)
{
    add_paragraph(Node_Id::root, "1");
    const Node_Id failing = add_paragraph(Node_Id::root, "2");
    document.set_attribute(failing, "fail", "");
    document.set_line(failing, 12);
    add_paragraph(Node_Id::root, "3");

    Collecting_Logger logger;
    Recording_Writer writer { Visitor_Failure_Policy::resume, logger };
    ASSERT_TRUE(writer.attach(document, settings));

    EXPECT_EQ(writer.find_part("c")->text(), "13");
    ASSERT_EQ(writer.recovered_failures().size(), 1);
    EXPECT_EQ(writer.recovered_failures()[0].node, failing);
    ASSERT_EQ(logger.count(), 1);
    EXPECT_EQ(logger.diagnostics[0].severity, Severity::warning);
    EXPECT_EQ(logger.diagnostics[0].line, 12);
}

TEST_F(Writer_Test, propagate_policy_aborts)
{
    add_paragraph(Node_Id::root, "1");
    document.set_attribute(add_paragraph(Node_Id::root, "2"), "fail", "");
    add_paragraph(Node_Id::root, "3");

    Recording_Writer writer { Visitor_Failure_Policy::propagate };
    const Result<void, Visitor_Condition> result = writer.attach(document, settings);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().message, "Cannot write paragraph.");
    EXPECT_FALSE(writer.is_attached(document));

    std::ostringstream out;
    const Result<void, Write_Error> written = write_document(writer, document, settings, out);
    ASSERT_FALSE(written);
    EXPECT_TRUE(std::holds_alternative<Visitor_Condition>(written.error()));
}

TEST_F(Writer_Test, attaching_twice_writes_once)
{
    add_paragraph(Node_Id::root, "once");

    Recording_Writer writer;
    ASSERT_TRUE(writer.attach(document, settings));
    ASSERT_TRUE(writer.attach(document, settings));
    EXPECT_TRUE(writer.is_attached(document));
    EXPECT_EQ(writer.find_part("c")->text(), "once");
    EXPECT_EQ(writer.trace, "p");

    writer.detach();
    ASSERT_TRUE(writer.attach(document, settings));
    EXPECT_EQ(writer.find_part("c")->text(), "once");
    EXPECT_EQ(writer.trace, "pp");
}

TEST_F(Writer_Test, failing_stream_is_reported)
{
    add_paragraph(Node_Id::root, "text");

    Recording_Writer writer;
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    const Result<void, Write_Error> result = write_document(writer, document, settings, out);
    ASSERT_FALSE(result);
    ASSERT_TRUE(std::holds_alternative<IO_Error_Code>(result.error()));
    EXPECT_EQ(std::get<IO_Error_Code>(result.error()), IO_Error_Code::write_error);
}

TEST(Writer, interfaces_cannot_be_destroyed_through_base)
{
    static_assert(!std::is_destructible_v<Logger>);
    static_assert(!std::is_destructible_v<Text_Sink>);
    static_assert(std::is_destructible_v<Collecting_Logger>);
    static_assert(std::is_destructible_v<String_Sink>);
    static_assert(std::has_virtual_destructor_v<Writer>);
}

TEST(Writer, duplicate_part_names_are_rejected)
{
    struct Duplicate_Writer final : Writer {
        Duplicate_Writer()
            : Writer({ "body", "body" })
        {
        }
    };
    EXPECT_THROW(Duplicate_Writer {}, Assertion_Error);
}

} // namespace
} // namespace docpress
