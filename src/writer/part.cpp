#include <algorithm>
#include <iterator>

#include "writer/part.hpp"

namespace docpress {

void Part::finalize()
{
    m_fragments.reserve(m_fragments.size() + m_prepended_reversed.size() + m_appended.size());
    std::ranges::move(m_prepended_reversed.rbegin(), m_prepended_reversed.rend(),
                      std::back_inserter(m_fragments));
    std::ranges::move(m_appended, std::back_inserter(m_fragments));
    m_prepended_reversed.clear();
    m_appended.clear();
}

void Part::clear() noexcept
{
    m_fragments.clear();
    m_appended.clear();
    m_prepended_reversed.clear();
}

std::string Part::text() const
{
    std::string result;
    for (const std::string& fragment : m_fragments) {
        result += fragment;
    }
    return result;
}

} // namespace docpress
