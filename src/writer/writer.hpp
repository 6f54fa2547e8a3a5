#ifndef DOCPRESS_WRITER_WRITER_HPP
#define DOCPRESS_WRITER_WRITER_HPP

#include <initializer_list>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "common/io_error.hpp"
#include "common/logger.hpp"
#include "common/result.hpp"

#include "doc/document.hpp"

#include "writer/part.hpp"

namespace docpress {

struct Settings;

/// @brief Something that text can be written to.
struct Text_Sink {
    virtual void write(std::string_view text) = 0;

protected:
    ~Text_Sink() = default;
};

/// @brief A `Text_Sink` which appends to a string.
struct String_Sink final : Text_Sink {
    std::string& out;

    explicit String_Sink(std::string& out)
        : out(out)
    {
    }

    void write(std::string_view text) final
    {
        out += text;
    }
};

/// @brief Controls traversal after a node has been visited.
enum struct Visit_Flow : Default_Underlying {
    /// @brief Visit the children of the node, then depart from it.
    proceed,
    /// @brief Do not visit the children of the node, but depart from it.
    skip_children,
    /// @brief Skip the children of the node, its departure, and all of its remaining siblings.
    skip_siblings,
};

/// @brief A failure to write a node.
struct Visitor_Condition {
    std::string message;
    std::optional<Node_Id> node {};
};

/// @brief Decides what happens when visiting a node fails.
enum struct Visitor_Failure_Policy : Default_Underlying {
    /// @brief Log the failure and continue with the next sibling of the node.
    resume,
    /// @brief Abort writing the document.
    propagate,
};

/// @brief The base class of all writers.
///
/// A writer owns an ordered list of named parts.
/// Attaching a document clears every part, traverses the document depth-first in pre-order,
/// and finalizes the parts.
/// During traversal, content written by the visitor functions goes to the current part, which is
/// the first part unless another part has been activated using `activate_part` or `with_part`.
struct Writer : Text_Sink {
public:
    struct Part_Scope;

private:
    std::vector<Part> m_parts;
    Size m_current_part = 0;
    const Document* m_document = nullptr;
    Uint64 m_document_instance = 0;
    const Settings* m_settings = nullptr;
    Visitor_Failure_Policy m_policy;
    Logger& m_logger;
    std::vector<Visitor_Condition> m_recovered;

public:
    /// @brief Constructor.
    /// @param part_names the names of the parts, in output order; shall not be empty or contain
    /// duplicates
    /// @param policy the policy for failures of visitor functions
    /// @param logger receives failures that were recovered from
    Writer(std::initializer_list<std::string_view> part_names,
           Visitor_Failure_Policy policy = Visitor_Failure_Policy::resume,
           Logger& logger = ignorant_logger);

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    virtual ~Writer() = default;

    /// @brief Writes `document` into the parts.
    /// If `document` is already attached, does nothing.
    /// A different document which occupies the address of a destroyed one is not attached.
    /// @return Nothing, or the visitor failure that aborted writing, which only happens for the
    /// `propagate` policy.
    /// If writing fails, no document is attached afterwards.
    Result<void, Visitor_Condition> attach(const Document& document, const Settings& settings);

    /// @brief Forgets the attached document, so that the next `attach` writes again.
    /// The contents of the parts are retained.
    void detach() noexcept
    {
        m_document = nullptr;
        m_settings = nullptr;
    }

    [[nodiscard]] bool is_attached(const Document& document) const noexcept
    {
        return m_document == &document && m_document_instance == document.instance_id();
    }

    [[nodiscard]] std::span<const Part> parts() const noexcept
    {
        return m_parts;
    }

    /// @brief Returns the part with the given name, or `nullptr`.
    [[nodiscard]] const Part* find_part(std::string_view name) const;

    /// @brief Returns the failures that were recovered from during the last `attach`.
    [[nodiscard]] std::span<const Visitor_Condition> recovered_failures() const noexcept
    {
        return m_recovered;
    }

    [[nodiscard]] std::string_view current_part_name() const
    {
        return m_parts[m_current_part].name();
    }

    /// @brief Appends to the current part.
    void write(std::string_view text) final
    {
        append(text);
    }

    /// @brief Appends to the current part.
    void append(std::string_view fragment)
    {
        m_parts[m_current_part].append(fragment);
    }

    /// @brief Prepends to the current part.
    void prepend(std::string_view fragment)
    {
        m_parts[m_current_part].prepend(fragment);
    }

    /// @brief Makes the part named `name` the current part until the returned scope is
    /// destroyed, at which point the previously current part is restored.
    [[nodiscard]] Part_Scope activate_part(std::string_view name);

    /// @brief Invokes `f` while the part named `name` is the current part.
    template <typename F>
    decltype(auto) with_part(std::string_view name, F&& f);

protected:
    [[nodiscard]] const Document& document() const;
    [[nodiscard]] const Settings& settings() const;

    /// @brief Visits `node`, its descendants, and departs from it.
    /// @return The flow returned by the visit, or the failure that could not be recovered from.
    Result<Visit_Flow, Visitor_Condition> walk(Node_Id node);

    /// @brief Walks every child of `node` in order, until one of them returns
    /// `Visit_Flow::skip_siblings`.
    Result<void, Visitor_Condition> walk_children(Node_Id node);

    // Visitor functions, one pair per kind of node.
    // By default, nodes are visited without writing anything.

    virtual Result<Visit_Flow, Visitor_Condition> visit_document(Node_Id);
    virtual Result<Visit_Flow, Visitor_Condition> visit_section(Node_Id);
    virtual Result<Visit_Flow, Visitor_Condition> visit_title(Node_Id);
    virtual Result<Visit_Flow, Visitor_Condition> visit_paragraph(Node_Id);
    virtual Result<Visit_Flow, Visitor_Condition> visit_text(Node_Id);
    virtual Result<Visit_Flow, Visitor_Condition> visit_emphasis(Node_Id);
    virtual Result<Visit_Flow, Visitor_Condition> visit_strong(Node_Id);
    virtual Result<Visit_Flow, Visitor_Condition> visit_literal(Node_Id);
    virtual Result<Visit_Flow, Visitor_Condition> visit_literal_block(Node_Id);
    virtual Result<Visit_Flow, Visitor_Condition> visit_bullet_list(Node_Id);
    virtual Result<Visit_Flow, Visitor_Condition> visit_list_item(Node_Id);
    virtual Result<Visit_Flow, Visitor_Condition> visit_comment(Node_Id);
    virtual Result<Visit_Flow, Visitor_Condition> visit_system_message(Node_Id);

    virtual Result<void, Visitor_Condition> depart_document(Node_Id);
    virtual Result<void, Visitor_Condition> depart_section(Node_Id);
    virtual Result<void, Visitor_Condition> depart_title(Node_Id);
    virtual Result<void, Visitor_Condition> depart_paragraph(Node_Id);
    virtual Result<void, Visitor_Condition> depart_text(Node_Id);
    virtual Result<void, Visitor_Condition> depart_emphasis(Node_Id);
    virtual Result<void, Visitor_Condition> depart_strong(Node_Id);
    virtual Result<void, Visitor_Condition> depart_literal(Node_Id);
    virtual Result<void, Visitor_Condition> depart_literal_block(Node_Id);
    virtual Result<void, Visitor_Condition> depart_bullet_list(Node_Id);
    virtual Result<void, Visitor_Condition> depart_list_item(Node_Id);
    virtual Result<void, Visitor_Condition> depart_comment(Node_Id);
    virtual Result<void, Visitor_Condition> depart_system_message(Node_Id);

private:
    [[nodiscard]] Size part_index(std::string_view name) const;

    Result<Visit_Flow, Visitor_Condition> dispatch_visit(Node_Id node);
    Result<void, Visitor_Condition> dispatch_departure(Node_Id node);
};

struct [[nodiscard]] Writer::Part_Scope {
private:
    Writer& m_writer;
    Size m_previous;

public:
    Part_Scope(Writer& writer, Size part)
        : m_writer(writer)
        , m_previous(writer.m_current_part)
    {
        m_writer.m_current_part = part;
    }

    ~Part_Scope()
    {
        m_writer.m_current_part = m_previous;
    }

    Part_Scope(const Part_Scope&) = delete;
    Part_Scope& operator=(const Part_Scope&) = delete;
};

inline auto Writer::activate_part(std::string_view name) -> Part_Scope
{
    return { *this, part_index(name) };
}

template <typename F>
decltype(auto) Writer::with_part(std::string_view name, F&& f)
{
    const Part_Scope scope = activate_part(name);
    return std::forward<F>(f)();
}

using Write_Error = std::variant<Visitor_Condition, IO_Error_Code>;

/// @brief Attaches `document` to `writer` and writes every part, in order, to `out`.
/// `writer` is detached afterwards, but its parts keep their contents.
Result<void, Write_Error> write_document(Writer& writer,
                                         const Document& document,
                                         const Settings& settings,
                                         std::ostream& out);

/// @brief Writes the part named `part_name` of the attached document to `out`.
/// `writer` shall have a part with that name.
Result<void, IO_Error_Code>
write_part(const Writer& writer, std::string_view part_name, std::ostream& out);

} // namespace docpress

#endif
