#include <algorithm>
#include <atomic>
#include <string>

#include "common/assert.hpp"

#include "doc/document.hpp"

namespace docpress {

Uint64 Document::Instance_Id::next() noexcept
{
    static std::atomic<Uint64> counter = 0;
    return counter.fetch_add(1, std::memory_order_relaxed);
}

Document::Document()
{
    m_nodes.push_back(Node { .kind = Node_Kind::document });
}

auto Document::get(Node_Id node) -> Node&
{
    DOCPRESS_ASSERT(node_index(node) < m_nodes.size());
    return m_nodes[node_index(node)];
}

auto Document::get(Node_Id node) const -> const Node&
{
    DOCPRESS_ASSERT(node_index(node) < m_nodes.size());
    return m_nodes[node_index(node)];
}

Node_Id Document::make_node(Node_Kind kind, std::string text)
{
    DOCPRESS_ASSERT(kind != Node_Kind::document);
    DOCPRESS_ASSERT(text.empty() || node_kind_is_leaf(kind));

    const auto id = static_cast<Node_Id>(m_nodes.size());
    m_nodes.push_back(Node { .kind = kind, .text = std::move(text) });
    return id;
}

void Document::append_child(Node_Id parent, Node_Id child)
{
    insert_child(parent, child_count(parent), child);
}

void Document::insert_child(Node_Id parent, Size index, Node_Id child)
{
    DOCPRESS_ASSERT(child != Node_Id::root);
    DOCPRESS_ASSERT(!get(child).parent);
    DOCPRESS_ASSERT(!get(child).removed);
    DOCPRESS_ASSERT(!node_kind_is_leaf(kind(parent)));
    // Inserting a node into its own subtree would create an ownership cycle.
    DOCPRESS_ASSERT(!is_within(parent, child));

    std::vector<Node_Id>& siblings = get(parent).children;
    DOCPRESS_ASSERT(index <= siblings.size());
    siblings.insert(siblings.begin() + Difference(index), child);
    get(child).parent = parent;
}

void Document::detach(Node_Id node)
{
    Node& n = get(node);
    if (!n.parent) {
        return;
    }
    std::vector<Node_Id>& siblings = get(*n.parent).children;
    const auto it = std::ranges::find(siblings, node);
    DOCPRESS_ASSERT(it != siblings.end());
    siblings.erase(it);
    n.parent.reset();
}

void Document::move_child(Node_Id node, Node_Id new_parent, Size index)
{
    detach(node);
    insert_child(new_parent, index, node);
}

void Document::remove(Node_Id node)
{
    DOCPRESS_ASSERT(node != Node_Id::root);

    detach(node);

    std::vector<Node_Id> subtree;
    for_each_node(node, [&](Node_Id n) { subtree.push_back(n); });
    std::ranges::sort(subtree);

    const auto in_subtree
        = [&](Node_Id n) { return std::ranges::binary_search(subtree, n); };

    std::erase_if(m_back_references, [&](const Back_Reference& ref) {
        return in_subtree(ref.from) || in_subtree(ref.to);
    });

    for (const Node_Id n : subtree) {
        get(n).removed = true;
    }
}

Node_Id Document::child(Node_Id node, Size index) const
{
    const Node& n = get(node);
    DOCPRESS_ASSERT(index < n.children.size());
    return n.children[index];
}

Size Document::index_in_parent(Node_Id node) const
{
    const std::optional<Node_Id> p = parent(node);
    DOCPRESS_ASSERT(p);
    const std::span<const Node_Id> siblings = children(*p);
    return Size(std::ranges::find(siblings, node) - siblings.begin());
}

bool Document::is_within(Node_Id node, Node_Id ancestor) const
{
    for (std::optional<Node_Id> n = node; n; n = parent(*n)) {
        if (*n == ancestor) {
            return true;
        }
    }
    return false;
}

bool Document::is_attached(Node_Id node) const
{
    return is_within(node, Node_Id::root);
}

void Document::set_text(Node_Id node, std::string text)
{
    DOCPRESS_ASSERT(node_kind_is_leaf(kind(node)));
    get(node).text = std::move(text);
}

std::string Document::text_content(Node_Id node) const
{
    std::string result;
    for_each_node(node, [&](Node_Id n) {
        if (kind(n) == Node_Kind::text) {
            result += text(n);
        }
    });
    return result;
}

std::optional<std::string_view> Document::attribute(Node_Id node, std::string_view key) const
{
    const Attributes& attrs = attributes(node);
    const auto it = attrs.find(key);
    if (it == attrs.end()) {
        return {};
    }
    return it->second;
}

void Document::set_attribute(Node_Id node, std::string_view key, std::string value)
{
    get(node).attributes.insert_or_assign(std::string(key), std::move(value));
}

bool Document::remove_attribute(Node_Id node, std::string_view key)
{
    Attributes& attrs = get(node).attributes;
    const auto it = attrs.find(key);
    if (it == attrs.end()) {
        return false;
    }
    attrs.erase(it);
    return true;
}

std::string Document::make_unique_id(std::string_view base)
{
    DOCPRESS_ASSERT(!base.empty());

    std::string candidate(base);
    for (Size suffix = 2; m_ids.contains(candidate); ++suffix) {
        candidate = std::string(base) + '-' + std::to_string(suffix);
    }
    m_ids.insert(candidate);
    return candidate;
}

void Document::set_id(Node_Id node, std::string id)
{
    DOCPRESS_ASSERT(!attribute(node, "ids"));
    DOCPRESS_ASSERT(m_ids.contains(id));
    set_attribute(node, "ids", std::move(id));
}

std::string_view Document::ensure_id(Node_Id node)
{
    if (!attribute(node, "ids")) {
        std::string id;
        do {
            id = "id" + std::to_string(m_next_generated_id++);
        } while (m_ids.contains(id));
        m_ids.insert(id);
        set_attribute(node, "ids", std::move(id));
    }
    return *attribute(node, "ids");
}

void Document::add_back_reference(Node_Id from, Node_Id to)
{
    DOCPRESS_ASSERT(!is_removed(from));
    DOCPRESS_ASSERT(!is_removed(to));

    const Back_Reference ref { from, to };
    if (std::ranges::find(m_back_references, ref) == m_back_references.end()) {
        m_back_references.push_back(ref);
    }
}

std::vector<Node_Id> Document::back_references_from(Node_Id from) const
{
    std::vector<Node_Id> result;
    for (const Back_Reference& ref : m_back_references) {
        if (ref.from == from) {
            result.push_back(ref.to);
        }
    }
    return result;
}

std::vector<Node_Id> Document::back_references_to(Node_Id to) const
{
    std::vector<Node_Id> result;
    for (const Back_Reference& ref : m_back_references) {
        if (ref.to == to) {
            result.push_back(ref.from);
        }
    }
    return result;
}

} // namespace docpress
