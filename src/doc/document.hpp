#ifndef DOCPRESS_DOC_DOCUMENT_HPP
#define DOCPRESS_DOC_DOCUMENT_HPP

#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "common/config.hpp"

#include "doc/node_kind.hpp"

namespace docpress {

/// @brief A stable index of a node within a `Document`.
/// Ids remain valid for the lifetime of the document, even when the node is removed from the tree.
enum struct Node_Id : Uint32 {
    /// @brief The id of the `document` node at the root of every tree.
    root = 0
};

using Attributes = std::map<std::string, std::string, std::less<>>;

/// @brief A non-owning relation between two nodes.
/// Back-references are used for cross-linking diagnostics with the nodes they concern and
/// never take part in ownership or traversal order.
struct Back_Reference {
    Node_Id from;
    Node_Id to;

    [[nodiscard]] friend bool operator==(const Back_Reference&, const Back_Reference&) = default;
};

/// @brief A document tree, stored as an arena of nodes.
///
/// Every node except the root has at most one parent, and a node is attached if following its
/// parents leads to the root.
/// Nodes are never deallocated individually; `remove` merely detaches a subtree from the tree.
struct Document {
private:
    struct Node {
        Node_Kind kind;
        std::optional<Node_Id> parent;
        std::vector<Node_Id> children;
        Attributes attributes;
        std::string text;
        std::optional<Size> line;
        bool removed = false;
    };

    /// @brief A process-unique number, renewed on construction, copy, move, and assignment.
    struct Instance_Id {
        Uint64 value = next();

        Instance_Id() = default;

        Instance_Id(const Instance_Id&) noexcept { }

        Instance_Id& operator=(const Instance_Id&) noexcept
        {
            value = next();
            return *this;
        }

        [[nodiscard]] static Uint64 next() noexcept;
    };

    std::vector<Node> m_nodes;
    std::vector<Back_Reference> m_back_references;
    std::unordered_set<std::string> m_ids;
    Size m_next_generated_id = 1;
    Instance_Id m_instance_id;

public:
    /// @brief Creates a document containing only a root node of kind `document`.
    [[nodiscard]] Document();

    /// @brief Returns a number which no other `Document` object in this process has had.
    /// Copies and assigned-to documents receive a new number.
    [[nodiscard]] Uint64 instance_id() const noexcept
    {
        return m_instance_id.value;
    }

    /// @brief Creates a new node which is not attached to the tree.
    /// @param kind the kind of node
    /// @param text the text, which shall be empty unless `node_kind_is_leaf(kind)`
    [[nodiscard]] Node_Id make_node(Node_Kind kind, std::string text = {});

    /// @brief Equivalent to `make_node(Node_Kind::text, std::move(text))`.
    [[nodiscard]] Node_Id make_text(std::string text)
    {
        return make_node(Node_Kind::text, std::move(text));
    }

    /// @brief Appends `child` as the last child of `parent`.
    /// `child` shall not have a parent.
    void append_child(Node_Id parent, Node_Id child);

    /// @brief Inserts `child` into the children of `parent` so that it becomes the child at
    /// `index`.
    /// `child` shall not have a parent, and `index` shall be at most `child_count(parent)`.
    void insert_child(Node_Id parent, Size index, Node_Id child);

    /// @brief Detaches `node` from its current parent and inserts it into the children of
    /// `new_parent` at `index`.
    /// Unlike `remove`, back-references involving the moved subtree are retained.
    void move_child(Node_Id node, Node_Id new_parent, Size index);

    /// @brief Equivalent to `move_child(node, new_parent, child_count(new_parent))`.
    void move_to_end(Node_Id node, Node_Id new_parent)
    {
        move_child(node, new_parent, child_count(new_parent));
    }

    /// @brief Removes `node` and its descendants from the tree.
    /// Any back-reference whose source or target lies within the removed subtree is discarded,
    /// so that no back-reference ever refers to a removed node.
    /// The root cannot be removed.
    void remove(Node_Id node);

    [[nodiscard]] Node_Kind kind(Node_Id node) const
    {
        return get(node).kind;
    }

    [[nodiscard]] Size child_count(Node_Id node) const
    {
        return get(node).children.size();
    }

    [[nodiscard]] Node_Id child(Node_Id node, Size index) const;

    [[nodiscard]] std::span<const Node_Id> children(Node_Id node) const
    {
        return get(node).children;
    }

    [[nodiscard]] std::optional<Node_Id> parent(Node_Id node) const
    {
        return get(node).parent;
    }

    /// @brief Returns the index of `node` within the children of its parent.
    /// `node` shall have a parent.
    [[nodiscard]] Size index_in_parent(Node_Id node) const;

    /// @brief Returns `true` if `node` can be reached from the root.
    [[nodiscard]] bool is_attached(Node_Id node) const;

    /// @brief Returns `true` if `node` has been removed using `remove`.
    [[nodiscard]] bool is_removed(Node_Id node) const
    {
        return get(node).removed;
    }

    /// @brief Returns `true` if the root has no children.
    [[nodiscard]] bool empty() const
    {
        return child_count(Node_Id::root) == 0;
    }

    /// @brief Returns the total amount of nodes ever created, including removed ones.
    [[nodiscard]] Size node_count() const noexcept
    {
        return m_nodes.size();
    }

    [[nodiscard]] std::string_view text(Node_Id node) const
    {
        return get(node).text;
    }

    void set_text(Node_Id node, std::string text);

    /// @brief Returns the concatenation of the text of all `text` leaves within the subtree.
    [[nodiscard]] std::string text_content(Node_Id node) const;

    /// @brief Returns the one-based source line of the node, if known.
    [[nodiscard]] std::optional<Size> line(Node_Id node) const
    {
        return get(node).line;
    }

    void set_line(Node_Id node, Size line)
    {
        get(node).line = line;
    }

    [[nodiscard]] const Attributes& attributes(Node_Id node) const
    {
        return get(node).attributes;
    }

    [[nodiscard]] std::optional<std::string_view> attribute(Node_Id node,
                                                            std::string_view key) const;

    /// @brief Sets an attribute.
    /// The `ids` attribute shall only be set using `set_id`, `ensure_id`, or `make_unique_id`,
    /// so that ids remain unique within the document.
    void set_attribute(Node_Id node, std::string_view key, std::string value);

    bool remove_attribute(Node_Id node, std::string_view key);

    /// @brief Returns an id derived from `base` which is not used by any node in this document,
    /// and reserves it.
    /// If `base` is unused, it is returned unchanged, otherwise a numeric suffix is added.
    [[nodiscard]] std::string make_unique_id(std::string_view base);

    /// @brief Sets the `ids` attribute of `node`, which shall not have one yet.
    /// `id` shall have been obtained from `make_unique_id`.
    void set_id(Node_Id node, std::string id);

    /// @brief Returns the id of `node`.
    /// If the node has no id yet, a unique id of the form `id<N>` is assigned first.
    std::string_view ensure_id(Node_Id node);

    /// @brief Registers a back-reference from `from` to `to`.
    /// Registering the same back-reference twice has no effect.
    void add_back_reference(Node_Id from, Node_Id to);

    /// @brief Returns the targets of all back-references originating from `from`,
    /// in registration order.
    [[nodiscard]] std::vector<Node_Id> back_references_from(Node_Id from) const;

    /// @brief Returns the sources of all back-references which target `to`,
    /// in registration order.
    [[nodiscard]] std::vector<Node_Id> back_references_to(Node_Id to) const;

    [[nodiscard]] std::span<const Back_Reference> back_references() const noexcept
    {
        return m_back_references;
    }

    /// @brief Invokes `f` for `node` and every descendant, in depth-first pre-order.
    template <typename F>
    void for_each_node(Node_Id node, F&& f) const
    {
        f(node);
        for (const Node_Id child : children(node)) {
            for_each_node(child, f);
        }
    }

private:
    [[nodiscard]] Node& get(Node_Id node);
    [[nodiscard]] const Node& get(Node_Id node) const;

    void detach(Node_Id node);
    [[nodiscard]] bool is_within(Node_Id node, Node_Id ancestor) const;
};

[[nodiscard]] constexpr Size node_index(Node_Id id) noexcept
{
    return static_cast<Size>(id);
}

} // namespace docpress

#endif
