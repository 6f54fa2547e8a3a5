#include <gtest/gtest.h>

#include "common/assert.hpp"

#include "doc/document.hpp"

namespace docpress {
namespace {

TEST(Document, new_document_is_empty)
{
    const Document document;
    EXPECT_TRUE(document.empty());
    EXPECT_EQ(document.node_count(), 1);
    EXPECT_EQ(document.kind(Node_Id::root), Node_Kind::document);
    EXPECT_FALSE(document.parent(Node_Id::root));
    EXPECT_TRUE(document.is_attached(Node_Id::root));
}

TEST(Document, append_and_insert_children)
{
    Document document;
    const Node_Id a = document.make_node(Node_Kind::paragraph);
    const Node_Id b = document.make_node(Node_Kind::paragraph);
    const Node_Id c = document.make_node(Node_Kind::paragraph);

    EXPECT_FALSE(document.is_attached(a));
    document.append_child(Node_Id::root, a);
    document.append_child(Node_Id::root, c);
    document.insert_child(Node_Id::root, 1, b);

    ASSERT_EQ(document.child_count(Node_Id::root), 3);
    EXPECT_EQ(document.child(Node_Id::root, 0), a);
    EXPECT_EQ(document.child(Node_Id::root, 1), b);
    EXPECT_EQ(document.child(Node_Id::root, 2), c);
    EXPECT_EQ(document.parent(b), Node_Id::root);
    EXPECT_EQ(document.index_in_parent(c), 2);
    EXPECT_TRUE(document.is_attached(b));
    EXPECT_FALSE(document.empty());
}

TEST(Document, node_with_parent_cannot_be_inserted_twice)
{
    Document document;
    const Node_Id section = document.make_node(Node_Kind::section);
    const Node_Id paragraph = document.make_node(Node_Kind::paragraph);
    document.append_child(Node_Id::root, paragraph);

    EXPECT_THROW(document.append_child(section, paragraph), Assertion_Error);
}

TEST(Document, cycles_are_rejected)
{
    Document document;
    const Node_Id outer = document.make_node(Node_Kind::section);
    const Node_Id inner = document.make_node(Node_Kind::section);
    document.append_child(Node_Id::root, outer);
    document.append_child(outer, inner);

    EXPECT_THROW(document.move_to_end(outer, inner), Assertion_Error);
}

TEST(Document, leaves_have_no_children)
{
    Document document;
    const Node_Id text = document.make_text("abc");
    const Node_Id other = document.make_text("def");

    EXPECT_THROW(document.append_child(text, other), Assertion_Error);
    EXPECT_THROW((void)document.make_node(Node_Kind::paragraph, "text"), Assertion_Error);
}

TEST(Document, move_child)
{
    Document document;
    const Node_Id first = document.make_node(Node_Kind::section);
    const Node_Id second = document.make_node(Node_Kind::section);
    const Node_Id paragraph = document.make_node(Node_Kind::paragraph);
    document.append_child(Node_Id::root, first);
    document.append_child(Node_Id::root, second);
    document.append_child(first, paragraph);

    document.move_to_end(paragraph, second);

    EXPECT_EQ(document.child_count(first), 0);
    ASSERT_EQ(document.child_count(second), 1);
    EXPECT_EQ(document.child(second, 0), paragraph);
    EXPECT_EQ(document.parent(paragraph), second);
}

TEST(Document, remove_detaches_subtree)
{
    Document document;
    const Node_Id section = document.make_node(Node_Kind::section);
    const Node_Id paragraph = document.make_node(Node_Kind::paragraph);
    const Node_Id text = document.make_text("hello");
    document.append_child(Node_Id::root, section);
    document.append_child(section, paragraph);
    document.append_child(paragraph, text);

    document.remove(section);

    EXPECT_TRUE(document.empty());
    EXPECT_TRUE(document.is_removed(section));
    EXPECT_TRUE(document.is_removed(text));
    EXPECT_FALSE(document.is_attached(text));
    // The subtree itself stays intact and readable.
    EXPECT_EQ(document.text(text), "hello");
    EXPECT_EQ(document.parent(text), paragraph);
}

TEST(Document, remove_cleans_up_back_references)
{
    Document document;
    const Node_Id section = document.make_node(Node_Kind::section);
    const Node_Id paragraph = document.make_node(Node_Kind::paragraph);
    const Node_Id message = document.make_node(Node_Kind::system_message);
    const Node_Id other = document.make_node(Node_Kind::paragraph);
    document.append_child(Node_Id::root, section);
    document.append_child(section, paragraph);
    document.append_child(Node_Id::root, message);
    document.append_child(Node_Id::root, other);

    document.add_back_reference(message, paragraph);
    document.add_back_reference(message, other);
    document.add_back_reference(paragraph, other);
    EXPECT_EQ(document.back_references().size(), 3);

    document.remove(section);

    ASSERT_EQ(document.back_references().size(), 1);
    EXPECT_EQ(document.back_references()[0], (Back_Reference { message, other }));
    EXPECT_EQ(document.back_references_from(message), std::vector<Node_Id> { other });
    EXPECT_TRUE(document.back_references_to(paragraph).empty());
}

TEST(Document, duplicate_back_references_are_ignored)
{
    Document document;
    const Node_Id a = document.make_node(Node_Kind::paragraph);
    const Node_Id b = document.make_node(Node_Kind::paragraph);
    document.add_back_reference(a, b);
    document.add_back_reference(a, b);
    document.add_back_reference(b, a);

    EXPECT_EQ(document.back_references().size(), 2);
    EXPECT_EQ(document.back_references_to(b), std::vector<Node_Id> { a });
}

TEST(Document, text_content)
{
    Document document;
    const Node_Id paragraph = document.make_node(Node_Kind::paragraph);
    const Node_Id emphasis = document.make_node(Node_Kind::emphasis);
    document.append_child(paragraph, document.make_text("Hello, "));
    document.append_child(paragraph, emphasis);
    document.append_child(emphasis, document.make_text("world"));
    document.append_child(paragraph, document.make_node(Node_Kind::comment, "ignored"));
    document.append_child(paragraph, document.make_text("!"));

    EXPECT_EQ(document.text_content(paragraph), "Hello, world!");
}

TEST(Document, attributes)
{
    Document document;
    const Node_Id node = document.make_node(Node_Kind::section);

    EXPECT_FALSE(document.attribute(node, "classes"));
    document.set_attribute(node, "classes", "intro");
    EXPECT_EQ(document.attribute(node, "classes"), "intro");
    document.set_attribute(node, "classes", "outro");
    EXPECT_EQ(document.attribute(node, "classes"), "outro");

    EXPECT_TRUE(document.remove_attribute(node, "classes"));
    EXPECT_FALSE(document.remove_attribute(node, "classes"));
    EXPECT_TRUE(document.attributes(node).empty());
}

TEST(Document, ensure_id_is_stable_and_unique)
{
    Document document;
    const Node_Id a = document.make_node(Node_Kind::paragraph);
    const Node_Id b = document.make_node(Node_Kind::paragraph);

    const std::string id_a(document.ensure_id(a));
    EXPECT_EQ(document.ensure_id(a), id_a);

    const std::string id_b(document.ensure_id(b));
    EXPECT_NE(id_a, id_b);
    EXPECT_TRUE(id_a.starts_with("id"));
}

TEST(Document, make_unique_id_appends_suffix)
{
    Document document;
    EXPECT_EQ(document.make_unique_id("intro"), "intro");
    EXPECT_EQ(document.make_unique_id("intro"), "intro-2");
    EXPECT_EQ(document.make_unique_id("intro"), "intro-3");
    EXPECT_EQ(document.make_unique_id("other"), "other");
}

TEST(Document, generated_ids_avoid_reserved_ids)
{
    Document document;
    const Node_Id a = document.make_node(Node_Kind::paragraph);
    (void)document.make_unique_id("id1");

    EXPECT_EQ(document.ensure_id(a), "id2");
}

TEST(Document, for_each_node_is_pre_order)
{
    Document document;
    const Node_Id section = document.make_node(Node_Kind::section);
    const Node_Id title = document.make_node(Node_Kind::title);
    const Node_Id paragraph = document.make_node(Node_Kind::paragraph);
    document.append_child(Node_Id::root, section);
    document.append_child(section, title);
    document.append_child(Node_Id::root, paragraph);

    std::vector<Node_Id> visited;
    document.for_each_node(Node_Id::root, [&](Node_Id node) { visited.push_back(node); });

    const std::vector<Node_Id> expected { Node_Id::root, section, title, paragraph };
    EXPECT_EQ(visited, expected);
}

} // namespace
} // namespace docpress
