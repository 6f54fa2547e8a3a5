#include <algorithm>
#include <memory>
#include <optional>
#include <utility>

#include "common/assert.hpp"

#include "settings/settings.hpp"

#include "transform/scheduler.hpp"
#include "transform/system_messages.hpp"

namespace docpress {

Order_Counter& global_order_counter() noexcept
{
    static Order_Counter counter;
    return counter;
}

namespace {

using Transform_Pointer = std::unique_ptr<Transform>;

[[nodiscard]] Transform_Pointer instantiate(Transform_Spec&& spec, Order_Counter& counter)
{
    if (auto* const instance = std::get_if<Transform_Pointer>(&spec)) {
        DOCPRESS_ASSERT(*instance);
        return std::move(*instance);
    }
    if (auto* const type = std::get_if<const Transform_Type*>(&spec)) {
        DOCPRESS_ASSERT(*type);
        Transform_Pointer result = (*type)->create(Node_Id::root, counter);
        DOCPRESS_ASSERT(result);
        DOCPRESS_ASSERT(result->priority() == (*type)->priority);
        return result;
    }
    return std::make_unique<Function_Transform>(std::get<Transform_Function>(std::move(spec)));
}

[[nodiscard]] bool runs_before(const Transform_Pointer& x, const Transform_Pointer& y) noexcept
{
    return std::pair(x->priority(), x->order()) < std::pair(y->priority(), y->order());
}

struct Transform_Run {
    Document& document;
    const Settings& settings;
    const Transform_Options& options;

    void record(const Transform& transform, const Condition& condition)
    {
        const Node_Id section = ensure_system_messages_section(document, options.logger);
        const Node_Id message = make_system_message(document, condition);
        document.set_attribute(message, "source", std::string(transform.name()));
        document.append_child(section, message);

        std::optional<Size> line = condition.line;
        if (condition.node && !document.is_removed(*condition.node)) {
            const Node_Id origin = *condition.node;
            std::string id(document.ensure_id(origin));
            document.set_attribute(message, "backrefs", std::move(id));
            document.add_back_reference(message, origin);
            if (!line) {
                line = document.line(origin);
            }
        }

        if (condition.severity >= settings.report_level()) {
            const std::optional<std::string_view> source
                = document.attribute(Node_Id::root, "source");
            options.logger(Diagnostic { .severity = condition.severity,
                                        .message = condition.message,
                                        .file = std::string(source.value_or("")),
                                        .line = line });
        }
    }

    [[nodiscard]] Result<void, Transform_Halt> run(std::vector<Transform_Spec>&& specs)
    {
        std::vector<Transform_Pointer> transforms;
        transforms.reserve(specs.size());
        for (Transform_Spec& spec : specs) {
            transforms.push_back(instantiate(std::move(spec), options.counter));
        }
        std::ranges::stable_sort(transforms, runs_before);

        Transform_Context context { .document = document,
                                    .settings = settings,
                                    .logger = options.logger };

        std::optional<Transform_Halt> halt;
        for (Size i = 0; i < transforms.size(); ++i) {
            Transform& transform = *transforms[i];
            const Result<void, Condition> result = transform.apply(context);

            if (!context.scheduled.empty()) {
                for (Transform_Spec& spec : context.scheduled) {
                    transforms.push_back(instantiate(std::move(spec), options.counter));
                }
                context.scheduled.clear();
                std::stable_sort(transforms.begin() + Difference(i + 1), transforms.end(),
                                 runs_before);
            }

            if (result) {
                continue;
            }
            record(transform, result.error());
            if (result.error().severity >= settings.halt_level()) {
                halt = Transform_Halt { result.error(), std::string(transform.name()) };
                break;
            }
        }

        if (const std::optional<Node_Id> section = find_system_messages_section(document);
            section && document.child_count(*section) < 2) {
            document.remove(*section);
        }

        if (halt) {
            return std::move(*halt);
        }
        return {};
    }
};

} // namespace

Result<void, Transform_Halt> do_transforms(Document& document,
                                           std::vector<Transform_Spec> specs,
                                           const Settings& settings,
                                           const Transform_Options& options)
{
    if (document.empty()) {
        return {};
    }
    Transform_Run run { document, settings, options };
    return run.run(std::move(specs));
}

} // namespace docpress
