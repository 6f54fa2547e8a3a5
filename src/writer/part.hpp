#ifndef DOCPRESS_WRITER_PART_HPP
#define DOCPRESS_WRITER_PART_HPP

#include <string>
#include <string_view>
#include <vector>

#include "common/config.hpp"

namespace docpress {

/// @brief A named buffer of output fragments.
///
/// While a document is being written, appended and prepended fragments are accumulated
/// separately, where prepended fragments are stored in reverse.
/// `finalize` arranges all fragments in forward order, so that the content of the part is
/// every prepended fragment (latest first), followed by every appended fragment (earliest first).
struct Part {
private:
    std::string m_name;
    std::vector<std::string> m_appended;
    std::vector<std::string> m_prepended_reversed;
    std::vector<std::string> m_fragments;

public:
    [[nodiscard]] explicit Part(std::string_view name)
        : m_name(name)
    {
    }

    [[nodiscard]] std::string_view name() const noexcept
    {
        return m_name;
    }

    void append(std::string_view fragment)
    {
        m_appended.emplace_back(fragment);
    }

    void prepend(std::string_view fragment)
    {
        m_prepended_reversed.emplace_back(fragment);
    }

    /// @brief Moves all pending fragments into forward order.
    /// Fragments that were finalized previously stay at the front.
    void finalize();

    /// @brief Removes all fragments, finalized or not.
    void clear() noexcept;

    /// @brief Returns the finalized fragments.
    [[nodiscard]] const std::vector<std::string>& fragments() const noexcept
    {
        return m_fragments;
    }

    /// @brief Returns the concatenation of the finalized fragments.
    [[nodiscard]] std::string text() const;

    [[nodiscard]] bool empty() const noexcept
    {
        return m_fragments.empty() && m_appended.empty() && m_prepended_reversed.empty();
    }
};

} // namespace docpress

#endif
