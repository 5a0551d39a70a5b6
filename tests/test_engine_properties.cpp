#include <gtest/gtest.h>
#include <execution/engine.hpp>
#include <plan_loaders/demo_plans.hpp>
#include <structure_validation/validator.hpp>
#include "test_helpers.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace test_utils;
using execution::Engine;

// Properties that hold for every plan: every committed snapshot is valid,
// navigation is idempotent and reproduces what was committed, replay after
// reset is deterministic.
class EnginePropertiesTest : public ::testing::TestWithParam<std::string> {
protected:
    void SetUp() override {
        auto plan = plan_loaders::generate_demo_plan(GetParam());
        ASSERT_TRUE(plan.has_value());
        ASSERT_TRUE(engine.initialize(*plan).success);
        results = engine.apply_remaining();
    }

    Engine engine;
    std::vector<execution::StateTransitionResult> results;
};

TEST_P(EnginePropertiesTest, EveryCommittedStateIsValid) {
    for (std::size_t i = 0; i < engine.history_size(); ++i) {
        auto nav = engine.go_to_step(static_cast<long>(i));
        ASSERT_TRUE(nav.success);
        const auto report = structure_validation::validate_state(*nav.state);
        EXPECT_TRUE(report.valid) << GetParam() << " index " << i << ": "
                                  << structure_model::describe_state(*nav.state);
        EXPECT_EQ(nav.state->step_index, static_cast<long>(i));
    }
}

TEST_P(EnginePropertiesTest, NavigationIsIdempotent) {
    for (std::size_t i = 0; i < engine.history_size(); ++i) {
        auto first = engine.go_to_step(static_cast<long>(i));
        auto second = engine.go_to_step(static_cast<long>(i));
        ASSERT_TRUE(first.success);
        EXPECT_EQ(first.state, second.state);
        EXPECT_EQ(*first.state, *second.state);
    }
}

TEST_P(EnginePropertiesTest, NavigationReturnsCommittedSnapshots) {
    for (const auto& r : results) {
        if (!r.success) continue;
        auto nav = engine.go_to_step(r.step_index + 1);
        ASSERT_TRUE(nav.success);
        EXPECT_EQ(*nav.state, *r.new_state);
    }
}

TEST_P(EnginePropertiesTest, NavigationRoundTrip) {
    for (std::size_t k = 1; k < engine.history_size(); ++k) {
        const auto forward = engine.go_to_step(static_cast<long>(k));
        ASSERT_TRUE(forward.success);
        const structure_model::StateGraph first_read = *forward.state;

        ASSERT_TRUE(engine.go_to_step(static_cast<long>(k) - 1).success);
        const auto again = engine.go_to_step(static_cast<long>(k));

        ASSERT_TRUE(again.success);
        EXPECT_EQ(*again.state, first_read) << GetParam() << " index " << k;
    }
}

TEST_P(EnginePropertiesTest, ReplayAfterResetIsDeterministic) {
    std::vector<structure_model::StateGraph> first;
    for (std::size_t i = 0; i < engine.history_size(); ++i)
        first.push_back(*engine.go_to_step(static_cast<long>(i)).state);

    engine.reset();
    engine.apply_remaining();

    ASSERT_EQ(engine.history_size(), first.size());
    for (std::size_t i = 0; i < first.size(); ++i)
        EXPECT_EQ(*engine.go_to_step(static_cast<long>(i)).state, first[i]) << "index " << i;
}

INSTANTIATE_TEST_SUITE_P(DemoPlans, EnginePropertiesTest,
    ::testing::Values("array", "singly", "doubly", "stack", "queue"));

// Demo plans whose last step is rejected.
class RejectingPlanTest : public EnginePropertiesTest {};

TEST_P(RejectingPlanTest, FailedStepLeavesLatestUntouched) {
    ASSERT_FALSE(results.empty());
    const auto& failed = results.back();
    ASSERT_FALSE(failed.success);

    EXPECT_EQ(engine.next_step_index(), failed.step_index);
    EXPECT_EQ(engine.current_state()->step_index, failed.step_index);
    ASSERT_EQ(engine.rejections().size(), 1u);
    EXPECT_EQ(engine.rejections()[0].step_index, failed.step_index);
}

INSTANTIATE_TEST_SUITE_P(DemoPlans, RejectingPlanTest, ::testing::Values("array", "stack", "queue"));

// === DEMO OUTCOMES ===

TEST(DemoPlanOutcomeTest, CommitCounts) {
    struct Expected {
        const char* name;
        std::size_t committed;
        bool ends_rejected;
    };
    const Expected table[] = {
        { "array", 5, true },
        { "singly", 6, false },
        { "doubly", 5, false },
        { "stack", 5, true },
        { "queue", 5, true },
    };

    for (const auto& e : table) {
        Engine engine;
        ASSERT_TRUE(engine.initialize(*plan_loaders::generate_demo_plan(e.name)).success) << e.name;
        auto results = engine.apply_remaining();
        EXPECT_EQ(engine.history_size() - 1, e.committed) << e.name;
        ASSERT_FALSE(results.empty());
        EXPECT_EQ(!results.back().success, e.ends_rejected) << e.name;
    }
}

TEST(DemoPlanOutcomeTest, SinglyDemoEndsReversed) {
    Engine engine;
    ASSERT_TRUE(engine.initialize(*plan_loaders::generate_demo_plan("singly")).success);
    engine.apply_remaining();

    const auto final_state = engine.current_state();
    EXPECT_EQ(values_in_order(*final_state), (std::vector<std::string>{ "B", "A", "Z" }));
    EXPECT_EQ(final_state->edge_case, structure_model::EdgeCase::NotFound);
}

TEST(DemoPlanOutcomeTest, UnknownDemoName) {
    EXPECT_FALSE(plan_loaders::generate_demo_plan("tree").has_value());
    EXPECT_EQ(plan_loaders::demo_plan_names().size(), 5u);
}

// === MIXED SEQUENCES ===

TEST(EngineSequenceTest, ListOperationsKeepInvariants) {
    std::vector<structure_model::Step> steps;
    long i = 0;
    for (const char* v : { "4", "1", "7", "3", "9" })
        steps.push_back(value_step(i++, OperationKind::InsertTail, v));
    steps.push_back(position_step(i++, OperationKind::InsertAt, 2, "5"));
    steps.push_back(step(i++, OperationKind::Reverse));
    steps.push_back(value_step(i++, OperationKind::DeleteByValue, "7"));
    steps.push_back(step(i++, OperationKind::DeleteHead));
    steps.push_back(position_step(i++, OperationKind::UpdateAt, 1, "8"));
    steps.push_back(step(i++, OperationKind::DeleteTail));
    steps.push_back(step(i++, OperationKind::Reverse));
    steps.push_back(position_step(i++, OperationKind::DeleteAt, 1));

    for (auto variant : { Variant::SinglyLinked, Variant::DoublyLinked }) {
        structure_model::ExecutionPlan plan;
        plan.initial = config(variant, {});
        plan.steps = steps;

        Engine engine;
        ASSERT_TRUE(engine.initialize(plan).success);
        for (const auto& r : engine.apply_remaining())
            EXPECT_TRUE(r.success) << "step " << r.step_index;
        EXPECT_TRUE(engine.finished());
        EXPECT_EQ(values_in_order(*engine.current_state()), (std::vector<std::string>{ "1", "3" }));
    }
}

TEST(EngineSequenceTest, QueueWrapsAroundManyTimes) {
    std::vector<structure_model::Step> steps;
    long i = 0;
    for (int round = 0; round < 6; ++round) {
        steps.push_back(value_step(i++, OperationKind::Enqueue, std::to_string(round)));
        steps.push_back(value_step(i++, OperationKind::Enqueue, std::to_string(round + 10)));
        steps.push_back(step(i++, OperationKind::Dequeue));
        steps.push_back(step(i++, OperationKind::Dequeue));
    }
    structure_model::ExecutionPlan plan;
    plan.initial = config(Variant::Queue, { "x" }, {}, 3);
    plan.steps = steps;

    Engine engine;
    ASSERT_TRUE(engine.initialize(plan).success);
    for (const auto& r : engine.apply_remaining())
        ASSERT_TRUE(r.success) << "step " << r.step_index;

    const auto final_state = engine.current_state();
    EXPECT_EQ(final_state->size, 1u);
    EXPECT_EQ(values_in_order(*final_state), (std::vector<std::string>{ "15" }));
    // Twelve dequeues on capacity 3 bring front back to 0.
    EXPECT_EQ(final_state->boundary.front, 0u);
}

// === CONCURRENT READERS ===

TEST(EngineConcurrencyTest, ReadersSeeCommittedSnapshotsWhileStepping) {
    std::vector<structure_model::Step> steps;
    for (long i = 0; i < 200; ++i)
        steps.push_back(value_step(i, OperationKind::InsertTail, std::to_string(i)));
    structure_model::ExecutionPlan plan;
    plan.initial = config(Variant::DoublyLinked, {});
    plan.steps = steps;

    Engine engine;
    ASSERT_TRUE(engine.initialize(plan).success);

    std::atomic<bool> done{ false };
    std::atomic<int> invalid{ 0 };
    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&] {
            while (!done.load()) {
                const auto latest = engine.current_state();
                if (!structure_validation::validate_state(*latest).valid) ++invalid;
                const long last = static_cast<long>(engine.history_size()) - 1;
                auto nav = engine.go_to_step(last / 2);
                if (!nav.success || nav.state->step_index != last / 2) ++invalid;
            }
        });
    }

    for (long i = 0; i < 200; ++i)
        EXPECT_TRUE(engine.apply_step(i).success);
    done = true;
    for (auto& r : readers) r.join();

    EXPECT_EQ(invalid.load(), 0);
    EXPECT_EQ(engine.current_state()->size, 200u);
}
