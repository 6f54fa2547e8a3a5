#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "common/logger.hpp"

#include "settings/settings.hpp"

#include "transform/scheduler.hpp"
#include "transform/system_messages.hpp"

namespace docpress {
namespace {

using Trace = std::vector<std::string>;

/// @brief Appends its name to a trace when applied, and optionally fails with a condition.
struct Tracing_Transform final : Transform {
    std::string m_name;
    Trace& m_trace;
    std::optional<Condition> m_failure;

    Tracing_Transform(int priority,
                      Order_Counter& counter,
                      std::string name,
                      Trace& trace,
                      std::optional<Condition> failure = {})
        : Transform(priority, Node_Id::root, counter)
        , m_name(std::move(name))
        , m_trace(trace)
        , m_failure(std::move(failure))
    {
    }

    [[nodiscard]] std::string_view name() const final
    {
        return m_name;
    }

    [[nodiscard]] Result<void, Condition> apply(Transform_Context&) final
    {
        m_trace.push_back(m_name);
        if (m_failure) {
            return *m_failure;
        }
        return {};
    }
};

struct Scheduler_Test : ::testing::Test {
    Document document;
    Settings settings;
    Order_Counter counter;
    Collecting_Logger logger;
    Trace trace;
    Node_Id paragraph {};

    void SetUp() override
    {
        paragraph = document.make_node(Node_Kind::paragraph);
        document.set_line(paragraph, 7);
        document.append_child(paragraph, document.make_text("Body"));
        document.append_child(Node_Id::root, paragraph);
    }

    Transform_Spec tracing(int priority, std::string name, std::optional<Condition> failure = {})
    {
        return std::make_unique<Tracing_Transform>(priority, counter, std::move(name), trace,
                                                   std::move(failure));
    }

    Result<void, Transform_Halt> run(std::vector<Transform_Spec> specs)
    {
        return do_transforms(document, std::move(specs), settings,
                             { .logger = logger, .counter = counter });
    }

    [[nodiscard]] std::optional<Node_Id> messages() const
    {
        return find_system_messages_section(document);
    }
};

std::vector<Transform_Spec> make_specs(auto&&... specs)
{
    std::vector<Transform_Spec> result;
    (result.push_back(std::move(specs)), ...);
    return result;
}

TEST_F(Scheduler_Test, ascending_priority)
{
    ASSERT_TRUE(run(make_specs(tracing(500, "c"), tracing(100, "a"), tracing(300, "b"))));
    EXPECT_EQ(trace, (Trace { "a", "b", "c" }));
}

TEST_F(Scheduler_Test, equal_priority_runs_in_creation_order)
{
    Transform_Spec first = tracing(200, "first");
    Transform_Spec second = tracing(200, "second");
    Transform_Spec third = tracing(200, "third");

    ASSERT_TRUE(run(make_specs(std::move(third), std::move(first), std::move(second))));
    EXPECT_EQ(trace, (Trace { "first", "second", "third" }));
}

TEST_F(Scheduler_Test, function_transforms_keep_list_order)
{
    const auto function = [&](std::string name) -> Transform_Function {
        return [this, name](Transform_Context&) -> Result<void, Condition> {
            trace.push_back(name);
            return {};
        };
    };

    ASSERT_TRUE(run(make_specs(function("f1"), tracing(960, "late"), function("f2"),
                               tracing(100, "early"))));
    EXPECT_EQ(trace, (Trace { "early", "f1", "f2", "late" }));
}

TEST_F(Scheduler_Test, empty_document_is_left_alone)
{
    Document empty;
    const Result<void, Transform_Halt> result
        = do_transforms(empty, make_specs(tracing(100, "never", make_severe("boom"))), settings,
                        { .logger = logger, .counter = counter });

    EXPECT_TRUE(result);
    EXPECT_TRUE(trace.empty());
    EXPECT_TRUE(empty.empty());
    EXPECT_EQ(logger.count(), 0);
}

TEST_F(Scheduler_Test, no_conditions_leaves_no_section)
{
    ASSERT_TRUE(run(make_specs(tracing(100, "a"))));
    EXPECT_FALSE(messages());
    EXPECT_EQ(document.child_count(Node_Id::root), 1);
}

TEST_F(Scheduler_Test, condition_is_recorded_as_system_message)
{
    ASSERT_TRUE(run(make_specs(tracing(100, "checker", make_error("Bad paragraph.", paragraph)),
                               tracing(200, "after"))));

    EXPECT_EQ(trace, (Trace { "checker", "after" }));

    const std::optional<Node_Id> section = messages();
    ASSERT_TRUE(section);
    EXPECT_EQ(document.index_in_parent(*section), 1);
    ASSERT_EQ(document.child_count(*section), 2);

    const Node_Id message = document.child(*section, 1);
    EXPECT_EQ(document.kind(message), Node_Kind::system_message);
    EXPECT_EQ(document.attribute(message, "level"), "6");
    EXPECT_EQ(document.attribute(message, "type"), "ERROR");
    EXPECT_EQ(document.attribute(message, "source"), "checker");
    EXPECT_EQ(document.text_content(message), "Bad paragraph.");

    const std::optional<std::string_view> id = document.attribute(paragraph, "ids");
    ASSERT_TRUE(id);
    EXPECT_EQ(document.attribute(message, "backrefs"), *id);
    EXPECT_EQ(document.back_references_from(message), std::vector<Node_Id> { paragraph });
}

TEST_F(Scheduler_Test, existing_section_is_reused)
{
    const Node_Id existing = ensure_system_messages_section(document);
    const Node_Id old_message = make_system_message(document, make_warning("Old."));
    document.append_child(existing, old_message);

    ASSERT_TRUE(run(make_specs(tracing(100, "a", make_warning("New.")))));

    ASSERT_EQ(messages(), existing);
    ASSERT_EQ(document.child_count(existing), 3);
    EXPECT_EQ(document.text_content(document.child(existing, 2)), "New.");
}

TEST_F(Scheduler_Test, empty_existing_section_is_removed)
{
    const Node_Id existing = ensure_system_messages_section(document);
    ASSERT_TRUE(run(make_specs(tracing(100, "a"))));

    EXPECT_FALSE(messages());
    EXPECT_TRUE(document.is_removed(existing));
}

TEST_F(Scheduler_Test, report_level_filters_logging)
{
    settings.set("report-level", Int(5));
    ASSERT_TRUE(run(make_specs(tracing(100, "a", make_warning("Quiet.")))));
    EXPECT_EQ(logger.count(), 0);
    // Conditions below the report level are still recorded in the document.
    ASSERT_TRUE(messages());

    settings.set("report-level", Int(3));
    ASSERT_TRUE(run(make_specs(tracing(100, "b", make_warning("Loud.", paragraph)))));
    ASSERT_EQ(logger.count(), 1);
    EXPECT_EQ(logger.diagnostics[0].severity, Severity::warning);
    EXPECT_EQ(logger.diagnostics[0].message, "Loud.");
    EXPECT_EQ(logger.diagnostics[0].line, 7);
}

TEST_F(Scheduler_Test, report_level_boundary)
{
    ASSERT_TRUE(run(make_specs(
        tracing(100, "five", Condition { .severity = severity_from_number(5), .message = "Five." }),
        tracing(200, "three",
                Condition { .severity = severity_from_number(3), .message = "Three." }))));

    ASSERT_EQ(logger.count(), 1);
    EXPECT_EQ(logger.diagnostics[0].message, "Five.");

    const std::optional<Node_Id> section = messages();
    ASSERT_TRUE(section);
    EXPECT_EQ(document.child_count(*section), 3);
}

TEST_F(Scheduler_Test, halt_level_stops_the_run)
{
    const Result<void, Transform_Halt> result
        = run(make_specs(tracing(100, "a"), tracing(200, "fatal", make_severe("Stop.")),
                         tracing(300, "c")));

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().transform_name, "fatal");
    EXPECT_EQ(result.error().condition.severity, Severity::severe);
    EXPECT_EQ(result.error().condition.message, "Stop.");
    EXPECT_EQ(trace, (Trace { "a", "fatal" }));

    const std::optional<Node_Id> section = messages();
    ASSERT_TRUE(section);
    EXPECT_EQ(document.child_count(*section), 2);
}

TEST_F(Scheduler_Test, lowered_halt_level)
{
    settings.set("halt-level", Int(4));
    const Result<void, Transform_Halt> result
        = run(make_specs(tracing(100, "warns", make_warning("Careful.")), tracing(200, "b")));

    ASSERT_FALSE(result);
    EXPECT_EQ(trace, (Trace { "warns" }));
}

TEST_F(Scheduler_Test, late_additions_join_remaining_transforms)
{
    const Transform_Function scheduling = [this](Transform_Context& context)
        -> Result<void, Condition> {
        trace.push_back("scheduler");
        context.schedule(tracing(100, "too-early"));
        context.schedule(tracing(960, "late"));
        context.schedule(tracing(600, "middle"));
        return {};
    };
    std::vector<Transform_Spec> specs = make_specs(tracing(500, "first"), tracing(800, "last"));
    specs.push_back(std::make_unique<Function_Transform>(scheduling, Node_Id::root, "sched"));

    ASSERT_TRUE(run(std::move(specs)));

    // The function transform has priority 950 and runs after "last".
    // A late addition with a lower priority than the current transform still runs afterwards.
    EXPECT_EQ(trace,
              (Trace { "first", "last", "scheduler", "too-early", "middle", "late" }));
}

TEST_F(Scheduler_Test, late_additions_are_sorted)
{
    const Transform_Function scheduling = [this](Transform_Context& context)
        -> Result<void, Condition> {
        trace.push_back("scheduler");
        context.schedule(tracing(700, "b"));
        context.schedule(tracing(400, "a"));
        return {};
    };
    std::vector<Transform_Spec> specs;
    specs.push_back(std::make_unique<Tracing_Transform>(100, counter, "start", trace));
    specs.push_back(std::make_unique<Function_Transform>(scheduling));
    specs.push_back(tracing(990, "end"));

    ASSERT_TRUE(run(std::move(specs)));
    EXPECT_EQ(trace, (Trace { "start", "scheduler", "a", "b", "end" }));
}

TEST_F(Scheduler_Test, removed_origin_is_not_referenced)
{
    const Transform_Function remover = [this](Transform_Context& context)
        -> Result<void, Condition> {
        context.document.remove(paragraph);
        return make_warning("Removed.", paragraph);
    };
    // Keep the document non-empty after the removal.
    document.append_child(Node_Id::root, document.make_node(Node_Kind::paragraph));

    ASSERT_TRUE(run(make_specs(remover)));

    const std::optional<Node_Id> section = messages();
    ASSERT_TRUE(section);
    const Node_Id message = document.child(*section, 1);
    EXPECT_FALSE(document.attribute(message, "backrefs"));
    EXPECT_TRUE(document.back_references().empty());
}

TEST(Order_Counter, numbers_are_increasing)
{
    Order_Counter counter;
    const Uint64 a = counter.next();
    const Uint64 b = counter.next();
    EXPECT_EQ(a, 1);
    EXPECT_LT(a, b);
}

TEST(Transform, priority_must_be_in_range)
{
    Order_Counter counter;
    Trace trace;
    EXPECT_THROW(Tracing_Transform(1000, counter, "x", trace), Assertion_Error);
    EXPECT_THROW(Tracing_Transform(-1, counter, "x", trace), Assertion_Error);
}

} // namespace
} // namespace docpress
