#ifndef DOCPRESS_TRANSFORM_TRANSFORM_HPP
#define DOCPRESS_TRANSFORM_TRANSFORM_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <string_view>
#include <variant>
#include <vector>

#include "common/assert.hpp"
#include "common/config.hpp"
#include "common/logger.hpp"
#include "common/result.hpp"

#include "doc/document.hpp"

#include "transform/condition.hpp"

namespace docpress {

struct Settings;
struct Transform_Context;

inline constexpr int min_transform_priority = 0;
inline constexpr int max_transform_priority = 999;

/// @brief The priority of transforms created from plain functions.
inline constexpr int function_transform_priority = 950;

/// @brief Hands out creation order numbers for transforms.
/// Numbers are unique for the lifetime of the counter; the first number is `1`, so that order
/// `0` sorts before any counted transform.
struct Order_Counter {
private:
    std::atomic<Uint64> m_next { 1 };

public:
    [[nodiscard]] Uint64 next() noexcept
    {
        return m_next.fetch_add(1, std::memory_order_relaxed);
    }
};

/// @brief Returns the counter used by a process unless another counter is passed explicitly.
[[nodiscard]] Order_Counter& global_order_counter() noexcept;

/// @brief A unit of document rewriting.
/// Transforms are ordered by ascending priority first, and by ascending order second.
struct Transform {
private:
    int m_priority;
    Uint64 m_order;
    Node_Id m_target;

public:
    /// @brief Creates a transform with an order number obtained from `counter`.
    Transform(int priority, Node_Id target, Order_Counter& counter)
        : Transform(priority, target, counter.next())
    {
    }

    Transform(int priority, Node_Id target, Uint64 order)
        : m_priority(priority)
        , m_order(order)
        , m_target(target)
    {
        DOCPRESS_ASSERT(priority >= min_transform_priority && priority <= max_transform_priority);
    }

    virtual ~Transform() = default;

    [[nodiscard]] int priority() const noexcept
    {
        return m_priority;
    }

    [[nodiscard]] Uint64 order() const noexcept
    {
        return m_order;
    }

    /// @brief Returns the root of the subtree which this transform rewrites.
    [[nodiscard]] Node_Id target() const noexcept
    {
        return m_target;
    }

    /// @brief Returns a short name which identifies this transform in diagnostics.
    [[nodiscard]] virtual std::string_view name() const = 0;

    /// @brief Rewrites the document.
    /// @return Nothing on success, or a condition describing the problem.
    /// The scheduler decides whether the run continues based on the severity of the condition.
    [[nodiscard]] virtual Result<void, Condition> apply(Transform_Context& context) = 0;
};

using Transform_Function = std::function<Result<void, Condition>(Transform_Context&)>;

/// @brief A transform which wraps a plain function.
/// Function transforms have priority `950` and order `0`, so that they run after any
/// explicitly prioritized transform of lower priority, and in list order among themselves.
struct Function_Transform final : Transform {
private:
    Transform_Function m_function;
    std::string_view m_name;

public:
    explicit Function_Transform(Transform_Function function,
                                Node_Id target = Node_Id::root,
                                std::string_view name = "function")
        : Transform(function_transform_priority, target, Uint64(0))
        , m_function(std::move(function))
        , m_name(name)
    {
        DOCPRESS_ASSERT(m_function);
    }

    [[nodiscard]] std::string_view name() const final
    {
        return m_name;
    }

    [[nodiscard]] Result<void, Condition> apply(Transform_Context& context) final
    {
        return m_function(context);
    }
};

/// @brief A reference to a type of transform, which can be instantiated for a target.
struct Transform_Type {
    using Factory = std::unique_ptr<Transform> (*)(Node_Id target, Order_Counter& counter);

    std::string_view name;
    int priority;
    Factory create;
};

template <typename T>
    requires std::is_base_of_v<Transform, T>
[[nodiscard]] std::unique_ptr<Transform> create_transform(Node_Id target, Order_Counter& counter)
{
    return std::make_unique<T>(target, counter);
}

/// @brief A transform that is passed to the scheduler as either an existing instance,
/// a type to be instantiated against the document root, or a plain function.
using Transform_Spec
    = std::variant<std::unique_ptr<Transform>, const Transform_Type*, Transform_Function>;

/// @brief The environment in which a transform is applied.
struct Transform_Context {
    Document& document;
    const Settings& settings;
    Logger& logger;
    /// @brief Transforms scheduled while the run is in progress.
    /// They are sorted into the transforms which have not run yet.
    std::vector<Transform_Spec> scheduled {};

    void schedule(Transform_Spec spec)
    {
        scheduled.push_back(std::move(spec));
    }
};

} // namespace docpress

#endif
