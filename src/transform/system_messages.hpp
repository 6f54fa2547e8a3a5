#ifndef DOCPRESS_TRANSFORM_SYSTEM_MESSAGES_HPP
#define DOCPRESS_TRANSFORM_SYSTEM_MESSAGES_HPP

#include <optional>
#include <string_view>

#include "common/logger.hpp"

#include "doc/document.hpp"

#include "transform/condition.hpp"

namespace docpress {

/// @brief The title of the section which collects system messages.
inline constexpr std::string_view system_messages_title = "System Messages";

/// @brief Finds the system messages section among the children of the root, by its title.
/// If there are multiple such sections, a warning is logged and the last one is returned.
[[nodiscard]] std::optional<Node_Id> find_system_messages_section(const Document& document,
                                                                  Logger& logger
                                                                  = ignorant_logger);

/// @brief Returns the system messages section, appending it as the last child of the root if it
/// does not exist yet.
[[nodiscard]] Node_Id ensure_system_messages_section(Document& document,
                                                     Logger& logger = ignorant_logger);

/// @brief Creates a `system_message` node which describes `condition`.
/// The node is not attached to the tree.
[[nodiscard]] Node_Id make_system_message(Document& document, const Condition& condition);

/// @brief Returns `true` if `node` is a section titled `system_messages_title`.
[[nodiscard]] bool is_system_messages_section(const Document& document, Node_Id node);

} // namespace docpress

#endif
