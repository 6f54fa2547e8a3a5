#ifndef DOCPRESS_TRANSFORM_SCHEDULER_HPP
#define DOCPRESS_TRANSFORM_SCHEDULER_HPP

#include <string>
#include <vector>

#include "common/logger.hpp"
#include "common/result.hpp"

#include "doc/document.hpp"

#include "transform/condition.hpp"
#include "transform/transform.hpp"

namespace docpress {

struct Settings;

/// @brief The reason why a run of transforms was aborted.
struct Transform_Halt {
    Condition condition;
    /// @brief The name of the transform which raised the condition.
    std::string transform_name;
};

struct Transform_Options {
    /// @brief Receives conditions at or above the `report-level`.
    Logger& logger = ignorant_logger;
    /// @brief Provides order numbers for instantiated transform types and late additions.
    Order_Counter& counter = global_order_counter();
};

/// @brief Applies transforms to a document.
///
/// Nothing happens for a document without children.
/// Otherwise, every spec is turned into a transform instance, and the transforms are applied in
/// ascending order of `(priority, order)`.
/// Transforms scheduled through `Transform_Context::schedule` are sorted into the transforms
/// which have not run yet.
///
/// A condition raised by a transform is recorded as a `system_message` in the system messages
/// section, with a back-reference to the originating node if there is one.
/// It is also logged if its severity is at least the `report-level`.
/// If its severity is at least the `halt-level`, no further transforms run and the condition is
/// returned; otherwise, the next transform runs.
///
/// Finally, the system messages section is removed if it holds no messages.
[[nodiscard]] Result<void, Transform_Halt> do_transforms(Document& document,
                                                         std::vector<Transform_Spec> specs,
                                                         const Settings& settings,
                                                         const Transform_Options& options = {});

} // namespace docpress

#endif
