#ifndef DOCPRESS_TRANSFORM_CONDITION_HPP
#define DOCPRESS_TRANSFORM_CONDITION_HPP

#include <optional>
#include <string>

#include "common/config.hpp"
#include "common/severity.hpp"

#include "doc/document.hpp"

namespace docpress {

/// @brief A problem encountered by a transform while rewriting the document.
struct Condition {
    Severity severity;
    std::string message;
    /// @brief One-based source line, if known.
    std::optional<Size> line {};
    /// @brief The node which caused the problem, if any.
    std::optional<Node_Id> node {};
};

[[nodiscard]] inline Condition make_warning(std::string message,
                                            std::optional<Node_Id> node = {},
                                            std::optional<Size> line = {})
{
    return { Severity::warning, std::move(message), line, node };
}

[[nodiscard]] inline Condition make_error(std::string message,
                                          std::optional<Node_Id> node = {},
                                          std::optional<Size> line = {})
{
    return { Severity::error, std::move(message), line, node };
}

[[nodiscard]] inline Condition make_severe(std::string message,
                                           std::optional<Node_Id> node = {},
                                           std::optional<Size> line = {})
{
    return { Severity::severe, std::move(message), line, node };
}

} // namespace docpress

#endif
