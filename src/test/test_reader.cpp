#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "common/logger.hpp"

#include "settings/registry.hpp"
#include "settings/settings.hpp"

#include "reader/plain_reader.hpp"
#include "reader/source.hpp"

namespace docpress {
namespace {

struct Plain_Reader_Test : ::testing::Test {
    Settings settings;
    Collecting_Logger logger;

    Document parse(std::string_view text)
    {
        const Document_Source source = Document_Source::from_text(std::string(text), "test.txt");
        Document document = new_document(source);
        Plain_Reader reader { std::vector<const Transform_Type*> {} };
        reader.parse(document, source, settings, logger);
        return document;
    }
};

TEST_F(Plain_Reader_Test, empty_input)
{
    EXPECT_TRUE(parse("").empty());
    EXPECT_TRUE(parse("\n\n   \n").empty());
    EXPECT_EQ(logger.count(), 0);
}

TEST_F(Plain_Reader_Test, paragraphs_are_separated_by_blank_lines)
{
    const Document document = parse("\n\nFirst line\nsecond line\n\nOther.\n");
    ASSERT_EQ(document.child_count(Node_Id::root), 2);

    const Node_Id first = document.child(Node_Id::root, 0);
    EXPECT_EQ(document.kind(first), Node_Kind::paragraph);
    EXPECT_EQ(document.text_content(first), "First line\nsecond line");
    EXPECT_EQ(document.line(first), 3);

    const Node_Id second = document.child(Node_Id::root, 1);
    EXPECT_EQ(document.text_content(second), "Other.");
    EXPECT_EQ(document.line(second), 6);
}

TEST_F(Plain_Reader_Test, inline_markup)
{
    const Document document = parse("Some *em* and **st** and ``a*b``.");
    const Node_Id paragraph = document.child(Node_Id::root, 0);
    ASSERT_EQ(document.child_count(paragraph), 7);

    const auto kind_at = [&](Size i) { return document.kind(document.child(paragraph, i)); };
    const auto text_at
        = [&](Size i) { return document.text_content(document.child(paragraph, i)); };

    EXPECT_EQ(kind_at(0), Node_Kind::text);
    EXPECT_EQ(text_at(0), "Some ");
    EXPECT_EQ(kind_at(1), Node_Kind::emphasis);
    EXPECT_EQ(text_at(1), "em");
    EXPECT_EQ(kind_at(3), Node_Kind::strong);
    EXPECT_EQ(text_at(3), "st");
    EXPECT_EQ(kind_at(5), Node_Kind::literal);
    EXPECT_EQ(text_at(5), "a*b");
    EXPECT_EQ(text_at(6), ".");
    EXPECT_EQ(logger.count(), 0);
}

TEST_F(Plain_Reader_Test, unmatched_inline_marker_is_kept_as_text)
{
    const Document document = parse("\nan *open marker\n");
    const Node_Id paragraph = document.child(Node_Id::root, 0);
    ASSERT_EQ(document.child_count(paragraph), 1);
    EXPECT_EQ(document.text_content(paragraph), "an *open marker");

    ASSERT_EQ(logger.count(), 1);
    EXPECT_EQ(logger.diagnostics[0].severity, Severity::warning);
    EXPECT_EQ(logger.diagnostics[0].file, "test.txt");
    EXPECT_EQ(logger.diagnostics[0].line, 2);
}

TEST_F(Plain_Reader_Test, marker_followed_by_space_is_text)
{
    const Document document = parse("2 * 3 = 6");
    EXPECT_EQ(document.text_content(Node_Id::root), "2 * 3 = 6");
    EXPECT_EQ(logger.count(), 0);
}

TEST_F(Plain_Reader_Test, section_levels_follow_underline_order)
{
    const Document document = parse("A\n=\n\nB\n---\n\ntext\n\nC\n===\n");
    ASSERT_EQ(document.child_count(Node_Id::root), 2);

    const Node_Id a = document.child(Node_Id::root, 0);
    EXPECT_EQ(document.kind(a), Node_Kind::section);
    EXPECT_EQ(document.line(a), 1);
    ASSERT_EQ(document.child_count(a), 2);
    EXPECT_EQ(document.kind(document.child(a, 0)), Node_Kind::title);
    EXPECT_EQ(document.text_content(document.child(a, 0)), "A");

    const Node_Id b = document.child(a, 1);
    EXPECT_EQ(document.kind(b), Node_Kind::section);
    EXPECT_EQ(document.text_content(document.child(b, 0)), "B");
    ASSERT_EQ(document.child_count(b), 2);
    EXPECT_EQ(document.kind(document.child(b, 1)), Node_Kind::paragraph);

    const Node_Id c = document.child(Node_Id::root, 1);
    EXPECT_EQ(document.text_content(document.child(c, 0)), "C");
    EXPECT_EQ(document.line(c), 9);
    EXPECT_EQ(logger.count(), 0);
}

TEST_F(Plain_Reader_Test, inconsistent_title_level)
{
    const Document document = parse("A\n=\n\nB\n-\n\nC\n=\n\nD\n~\n");
    ASSERT_EQ(document.child_count(Node_Id::root), 2);

    const Node_Id c = document.child(Node_Id::root, 1);
    ASSERT_EQ(document.child_count(c), 2);
    const Node_Id d = document.child(c, 1);
    EXPECT_EQ(document.kind(d), Node_Kind::section);
    EXPECT_EQ(document.text_content(d), "D");

    ASSERT_EQ(logger.count(), 1);
    EXPECT_EQ(logger.diagnostics[0].line, 10);
}

TEST_F(Plain_Reader_Test, short_underline_is_not_a_title)
{
    const Document document = parse("Title\n==\n");
    ASSERT_EQ(document.child_count(Node_Id::root), 1);
    const Node_Id paragraph = document.child(Node_Id::root, 0);
    EXPECT_EQ(document.kind(paragraph), Node_Kind::paragraph);
    EXPECT_EQ(document.text_content(paragraph), "Title\n==");
}

TEST_F(Plain_Reader_Test, bullet_list)
{
    const Document document = parse("- one\n- *two*\n  continued\n");
    ASSERT_EQ(document.child_count(Node_Id::root), 1);

    const Node_Id list = document.child(Node_Id::root, 0);
    EXPECT_EQ(document.kind(list), Node_Kind::bullet_list);
    ASSERT_EQ(document.child_count(list), 2);

    const Node_Id first = document.child(list, 0);
    EXPECT_EQ(document.kind(first), Node_Kind::list_item);
    EXPECT_EQ(document.text_content(first), "one");
    EXPECT_EQ(document.line(first), 1);

    const Node_Id second = document.child(list, 1);
    EXPECT_EQ(document.text_content(second), "two\ncontinued");
    EXPECT_EQ(document.kind(document.child(second, 0)), Node_Kind::emphasis);
    EXPECT_EQ(document.line(second), 2);
}

TEST_F(Plain_Reader_Test, comments)
{
    const Document document = parse(".. note\n   more\n\n..\n\n..not a comment\n");
    ASSERT_EQ(document.child_count(Node_Id::root), 3);

    const Node_Id first = document.child(Node_Id::root, 0);
    EXPECT_EQ(document.kind(first), Node_Kind::comment);
    EXPECT_EQ(document.text(first), "note\nmore");

    const Node_Id second = document.child(Node_Id::root, 1);
    EXPECT_EQ(document.kind(second), Node_Kind::comment);
    EXPECT_EQ(document.text(second), "");

    EXPECT_EQ(document.kind(document.child(Node_Id::root, 2)), Node_Kind::paragraph);
}

TEST_F(Plain_Reader_Test, literal_block)
{
    const Document document = parse("Code::\n\n    a\n\n      b\n\nAfter.\n");
    ASSERT_EQ(document.child_count(Node_Id::root), 3);

    const Node_Id paragraph = document.child(Node_Id::root, 0);
    EXPECT_EQ(document.text_content(paragraph), "Code:");

    const Node_Id block = document.child(Node_Id::root, 1);
    EXPECT_EQ(document.kind(block), Node_Kind::literal_block);
    EXPECT_EQ(document.text_content(block), "a\n\n  b");
    EXPECT_EQ(document.line(block), 3);
    EXPECT_EQ(document.attribute(block, "marker"), "attached");

    EXPECT_EQ(document.text_content(document.child(Node_Id::root, 2)), "After.");
    EXPECT_EQ(logger.count(), 0);
}

TEST_F(Plain_Reader_Test, literal_marker_variants)
{
    const Document spaced = parse("Text ::\n\n    x\n");
    EXPECT_EQ(spaced.text_content(spaced.child(Node_Id::root, 0)), "Text");
    EXPECT_EQ(spaced.attribute(spaced.child(Node_Id::root, 1), "marker"), "expanded");

    const Document lone = parse("::\n\n    x\n");
    ASSERT_EQ(lone.child_count(Node_Id::root), 1);
    EXPECT_EQ(lone.kind(lone.child(Node_Id::root, 0)), Node_Kind::literal_block);
    EXPECT_EQ(lone.attribute(lone.child(Node_Id::root, 0), "marker"), "lone");

    const Document separate = parse("Text.\n\n::\n\n    x\n");
    ASSERT_EQ(separate.child_count(Node_Id::root), 2);
    EXPECT_EQ(separate.text_content(separate.child(Node_Id::root, 0)), "Text.");
    EXPECT_EQ(separate.attribute(separate.child(Node_Id::root, 1), "marker"), "lone");
}

TEST_F(Plain_Reader_Test, missing_literal_block)
{
    const Document document = parse("Code::\n\nNot indented.\n");
    ASSERT_EQ(document.child_count(Node_Id::root), 2);
    EXPECT_EQ(document.kind(document.child(Node_Id::root, 1)), Node_Kind::paragraph);

    ASSERT_EQ(logger.count(), 1);
    EXPECT_EQ(logger.diagnostics[0].message, "Literal block expected; none found.");
    EXPECT_EQ(logger.diagnostics[0].line, 1);
}

TEST_F(Plain_Reader_Test, tabs_are_expanded)
{
    settings.set(option_names::tab_width, Int(2));
    const Document document = parse("::\n\n\t\tx\n\ty\n");
    EXPECT_EQ(document.text_content(document.child(Node_Id::root, 0)), "  x\ny");
}

TEST(Document_Source, from_lines)
{
    const std::vector<std::string_view> lines { "a", "b" };
    const Document_Source source = Document_Source::from_lines(lines, "lines");
    EXPECT_EQ(source.text, "a\nb\n");
    EXPECT_EQ(source.name, "lines");
    EXPECT_FALSE(source.path);
}

TEST(Document_Source, from_stream)
{
    std::istringstream in("Hello\nWorld\n");
    const Result<Document_Source, IO_Error_Code> source = Document_Source::from_stream(in);
    ASSERT_TRUE(source);
    EXPECT_EQ(source->text, "Hello\nWorld\n");
    EXPECT_EQ(source->name, "<stdin>");
}

TEST(Document_Source, missing_file)
{
    const Result<Document_Source, IO_Error_Code> source
        = load_source(std::filesystem::temp_directory_path() / "docpress-does-not-exist.txt");
    ASSERT_FALSE(source);
    EXPECT_EQ(source.error(), IO_Error_Code::cannot_open);
}

TEST(Read_Document, root_records_source_name)
{
    const Settings settings;
    Plain_Reader reader { std::vector<const Transform_Type*> {} };
    const Result<Document, Transform_Halt> document = read_document(
        Document_Source::from_text("Text.\n", "notes.txt"), reader, { .settings = settings });
    ASSERT_TRUE(document);
    EXPECT_EQ(document->attribute(Node_Id::root, "source"), "notes.txt");
    EXPECT_EQ(document->text_content(Node_Id::root), "Text.");
}

} // namespace
} // namespace docpress
