#include <gtest/gtest.h>
#include <execution/engine.hpp>
#include <execution/logging.hpp>
#include <spdlog/sinks/ostream_sink.h>
#include "test_helpers.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <type_traits>

using namespace test_utils;
using execution::Engine;
using structure_model::EdgeCase;
using structure_model::ErrorKind;

namespace {

structure_model::ExecutionPlan make_plan(structure_model::InitialConfiguration initial,
    std::vector<structure_model::Step> steps)
{
    structure_model::ExecutionPlan plan;
    plan.name = "engine test";
    plan.initial = std::move(initial);
    plan.steps = std::move(steps);
    return plan;
}

bool has_kind(const std::vector<structure_model::ExecutionError>& errors, ErrorKind kind) {
    return std::any_of(errors.begin(), errors.end(),
        [kind](const structure_model::ExecutionError& e) { return e.kind == kind; });
}

bool contains(const std::vector<std::string>& items, const std::string& item) {
    return std::find(items.begin(), items.end(), item) != items.end();
}

} // namespace

// === INITIALIZATION ===

TEST(EngineTest, UninitializedEngine) {
    Engine engine;

    EXPECT_FALSE(engine.initialized());
    EXPECT_EQ(engine.current_state(), nullptr);
    EXPECT_EQ(engine.next_step_index(), -1);
    EXPECT_EQ(engine.history_size(), 0u);

    auto result = engine.apply_step(0);
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(has_kind(result.errors, ErrorKind::Sequence));
    EXPECT_TRUE(engine.apply_remaining().empty());
}

TEST(EngineTest, InitializeRecordsInitialState) {
    Engine engine;
    auto init = engine.initialize(make_plan(config(Variant::SinglyLinked, { "5", "9" }, { "A", "B" }),
        { value_step(0, OperationKind::InsertTail, "3") }));

    ASSERT_TRUE(init.success);
    EXPECT_TRUE(init.errors.empty());
    EXPECT_EQ(init.initial_state->step_index, 0);
    EXPECT_EQ(engine.history_size(), 1u);
    EXPECT_EQ(engine.current_state(), init.initial_state);
    EXPECT_EQ(engine.next_step_index(), 0);
    EXPECT_EQ(engine.step_count(), 1u);
    EXPECT_FALSE(engine.finished());
}

TEST(EngineTest, UnknownOperationAbortsInitialization) {
    auto bad = step(0, OperationKind::Unknown);
    bad.operation_name = "ROTATE";

    Engine engine;
    auto init = engine.initialize(make_plan(config(Variant::SinglyLinked, { "1" }), { bad }));

    EXPECT_FALSE(init.success);
    EXPECT_EQ(init.initial_state, nullptr);
    ASSERT_FALSE(init.errors.empty());
    EXPECT_EQ(init.errors[0].kind, ErrorKind::Schema);
    EXPECT_FALSE(engine.initialized());
    EXPECT_EQ(engine.history_size(), 0u);
}

TEST(EngineTest, MalformedConfigurationAbortsInitialization) {
    Engine engine;
    auto init = engine.initialize(make_plan(config(Variant::Stack, { "1", "2" }), {}));

    EXPECT_FALSE(init.success);
    ASSERT_EQ(init.errors.size(), 1u);
    EXPECT_EQ(init.errors[0].kind, ErrorKind::Configuration);
    EXPECT_FALSE(engine.initialized());
}

TEST(EngineTest, ReinitializeDiscardsPreviousRun) {
    Engine engine;
    ASSERT_TRUE(engine.initialize(make_plan(config(Variant::Stack, {}, {}, 1),
        { value_step(0, OperationKind::Push, "1"), value_step(1, OperationKind::Push, "2") })).success);
    engine.apply_remaining();
    ASSERT_EQ(engine.rejections().size(), 1u);

    ASSERT_TRUE(engine.initialize(make_plan(config(Variant::Array, { "1" }), {})).success);
    EXPECT_EQ(engine.history_size(), 1u);
    EXPECT_TRUE(engine.rejections().empty());
    EXPECT_TRUE(engine.finished());
}

// === SEQUENCING ===

TEST(EngineTest, StepsMustBeAppliedInOrder) {
    Engine engine;
    ASSERT_TRUE(engine.initialize(make_plan(config(Variant::SinglyLinked, { "1" }),
        { step(0, OperationKind::Traverse), step(1, OperationKind::Traverse) })).success);

    auto skipped = engine.apply_step(1);
    EXPECT_FALSE(skipped.success);
    EXPECT_TRUE(has_kind(skipped.errors, ErrorKind::Sequence));
    EXPECT_EQ(engine.history_size(), 1u);

    EXPECT_TRUE(engine.apply_step(0).success);

    auto repeated = engine.apply_step(0);
    EXPECT_FALSE(repeated.success);
    EXPECT_TRUE(has_kind(repeated.errors, ErrorKind::Sequence));

    EXPECT_TRUE(engine.apply_step(1).success);
    EXPECT_TRUE(engine.finished());

    auto beyond = engine.apply_step(2);
    EXPECT_FALSE(beyond.success);
    EXPECT_TRUE(has_kind(beyond.errors, ErrorKind::Sequence));

    // Ordering mistakes are not structural violations.
    EXPECT_TRUE(engine.rejections().empty());
}

// === COMMITS AND REJECTIONS ===

TEST(EngineTest, CommitReportsHighlights) {
    Engine engine;
    ASSERT_TRUE(engine.initialize(make_plan(config(Variant::SinglyLinked, { "A", "B" }, { "A", "B" }),
        { position_step(0, OperationKind::InsertAt, 1, "C", "C") })).success);

    auto result = engine.apply_step(0);

    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.invariants_preserved);
    EXPECT_EQ(result.step_index, 0);
    EXPECT_EQ(result.modified_element_ids, ids({ "A", "C" }));
    EXPECT_EQ(result.new_state->step_index, 1);
    EXPECT_EQ(engine.current_state(), result.new_state);
    EXPECT_EQ(values_in_order(*result.new_state), (std::vector<std::string>{ "A", "C", "B" }));
}

TEST(EngineTest, StackPushThenOverflowIsRejected) {
    Engine engine;
    ASSERT_TRUE(engine.initialize(make_plan(config(Variant::Stack, { "5", "9" }, {}, 3),
        { value_step(0, OperationKind::Push, "4"), value_step(1, OperationKind::Push, "1") })).success);

    auto pushed = engine.apply_step(0);
    ASSERT_TRUE(pushed.success);
    EXPECT_EQ(pushed.new_state->boundary.top, 2);
    const auto committed = engine.current_state();

    auto refused = engine.apply_step(1);
    EXPECT_FALSE(refused.success);
    EXPECT_FALSE(refused.invariants_preserved);
    EXPECT_EQ(refused.edge_case, EdgeCase::Overflow);
    EXPECT_EQ(refused.new_state, nullptr);
    ASSERT_FALSE(refused.errors.empty());
    EXPECT_EQ(refused.errors[0].kind, ErrorKind::OutOfBounds);
    EXPECT_TRUE(contains(refused.errors[0].invariants, "size_within_capacity"));

    EXPECT_EQ(engine.current_state(), committed);
    EXPECT_EQ(engine.history_size(), 2u);

    auto rejections = engine.rejections();
    ASSERT_EQ(rejections.size(), 1u);
    EXPECT_EQ(rejections[0].step_index, 1);
    EXPECT_TRUE(contains(rejections[0].violated, "size_within_capacity"));
}

TEST(EngineTest, CycleFromTailToHeadIsRejected) {
    Engine engine;
    ASSERT_TRUE(engine.initialize(make_plan(config(Variant::SinglyLinked, { "1", "2", "3" }, { "A", "B", "C" }),
        { link_step(0, OperationKind::SetNext, "C", "A") })).success);
    const auto before = engine.current_state();

    auto result = engine.apply_step(0);

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(has_kind(result.errors, ErrorKind::Cycle));
    EXPECT_EQ(engine.current_state(), before);
    EXPECT_EQ(engine.current_state()->elements.at("C").next_id, "");
    EXPECT_EQ(engine.next_step_index(), 0);

    auto rejections = engine.rejections();
    ASSERT_EQ(rejections.size(), 1u);
    EXPECT_TRUE(contains(rejections[0].violated, "acyclic"));
    EXPECT_TRUE(contains(rejections[0].element_ids, "C"));
    EXPECT_TRUE(contains(rejections[0].element_ids, "A"));
}

TEST(EngineTest, DanglingLinkIsPointerError) {
    Engine engine;
    ASSERT_TRUE(engine.initialize(make_plan(config(Variant::DoublyLinked, { "1", "2" }, { "A", "B" }),
        { link_step(0, OperationKind::SetPrev, "B", "ghost") })).success);

    auto result = engine.apply_step(0);

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(has_kind(result.errors, ErrorKind::Pointer));
}

TEST(EngineTest, OrphaningSetNextIsLeak) {
    Engine engine;
    // A -> C skips B without unlinking it.
    ASSERT_TRUE(engine.initialize(make_plan(config(Variant::SinglyLinked, { "1", "2", "3" }, { "A", "B", "C" }),
        { link_step(0, OperationKind::SetNext, "A", "C") })).success);

    auto result = engine.apply_step(0);

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(has_kind(result.errors, ErrorKind::Leak));
}

TEST(EngineTest, NotFoundIsCommitted) {
    Engine engine;
    auto search = value_step(0, OperationKind::Search, "7");
    search.edge_case_tag = "NOT_FOUND";
    ASSERT_TRUE(engine.initialize(make_plan(config(Variant::Array, { "1", "2" }), { search })).success);

    auto result = engine.apply_step(0);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.edge_case, EdgeCase::NotFound);
    EXPECT_EQ(result.new_state->edge_case, EdgeCase::NotFound);
    EXPECT_EQ(result.visited_element_ids.size(), 2u);
}

TEST(EngineTest, ApplyRemainingStopsAtFirstFailure) {
    Engine engine;
    ASSERT_TRUE(engine.initialize(make_plan(config(Variant::Stack, { "1" }, {}, 2), {
        step(0, OperationKind::Pop),
        step(1, OperationKind::Pop),
        value_step(2, OperationKind::Push, "8"),
    })).success);

    auto results = engine.apply_remaining();

    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].success);
    EXPECT_FALSE(results[1].success);
    EXPECT_EQ(results[1].edge_case, EdgeCase::Underflow);
    EXPECT_EQ(engine.next_step_index(), 1);
    EXPECT_FALSE(engine.finished());
}

// === NAVIGATION AND RESET ===

TEST(EngineTest, QueueDequeueAndNavigateBack) {
    Engine engine;
    ASSERT_TRUE(engine.initialize(make_plan(config(Variant::Queue, { "1", "2" }, {}, 4),
        { step(0, OperationKind::Dequeue) })).success);

    auto result = engine.apply_step(0);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.new_state->boundary.front, 1u);

    auto back = engine.go_to_step(0);
    ASSERT_TRUE(back.success);
    EXPECT_EQ(back.state->boundary.front, 0u);
    EXPECT_EQ(back.state->size, 2u);
    // Navigation is read-only.
    EXPECT_EQ(engine.current_state()->boundary.front, 1u);
    EXPECT_EQ(engine.history_size(), 2u);
}

TEST(EngineTest, NavigationOutsideHistoryFails) {
    Engine engine;
    ASSERT_TRUE(engine.initialize(make_plan(config(Variant::SinglyLinked, { "1" }),
        { step(0, OperationKind::Traverse) })).success);

    for (long index : { -1L, 1L, 7L }) {
        auto nav = engine.go_to_step(index);
        EXPECT_FALSE(nav.success) << index;
        EXPECT_EQ(nav.state, nullptr);
        ASSERT_TRUE(nav.error.has_value());
        EXPECT_EQ(nav.error->kind, ErrorKind::Navigation);
    }
}

TEST(EngineTest, ResetReturnsToInitialState) {
    Engine engine;
    auto init = engine.initialize(make_plan(config(Variant::DoublyLinked, { "1", "2" }), {
        value_step(0, OperationKind::InsertHead, "0"),
        step(1, OperationKind::Reverse),
    }));
    ASSERT_TRUE(init.success);
    engine.apply_remaining();
    ASSERT_EQ(engine.history_size(), 3u);
    const auto final_state = *engine.current_state();

    engine.reset();

    EXPECT_EQ(engine.history_size(), 1u);
    EXPECT_EQ(engine.current_state(), init.initial_state);
    EXPECT_EQ(engine.next_step_index(), 0);
    EXPECT_FALSE(engine.go_to_step(1).success);

    engine.apply_remaining();
    EXPECT_EQ(*engine.current_state(), final_state);
}

TEST(EngineTest, ResetClearsRejectionLog) {
    Engine engine;
    ASSERT_TRUE(engine.initialize(make_plan(config(Variant::Stack, {}, {}, 2),
        { step(0, OperationKind::Pop) })).success);
    engine.apply_remaining();
    ASSERT_EQ(engine.rejections().size(), 1u);

    engine.reset();
    EXPECT_TRUE(engine.rejections().empty());

    // Replaying records the rejection once, not twice.
    engine.apply_remaining();
    ASSERT_EQ(engine.rejections().size(), 1u);
    EXPECT_EQ(engine.rejections()[0].step_index, 0);
}

TEST(EngineTest, ConfigDoesNotConvertImplicitly) {
    static_assert(!std::is_convertible_v<execution::EngineConfig, Engine>);
    static_assert(std::is_constructible_v<Engine, execution::EngineConfig>);
}

// === LOGGING ===

TEST(EngineTest, RejectionsAreLoggedThroughConfiguredLogger) {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto logger = std::make_shared<spdlog::logger>("engine_test", sink);
    logger->set_level(spdlog::level::debug);

    execution::EngineConfig cfg;
    cfg.logger = logger;
    Engine engine(cfg);
    ASSERT_TRUE(engine.initialize(make_plan(config(Variant::Stack, {}, {}, 1), {
        value_step(0, OperationKind::Push, "1"),
        value_step(1, OperationKind::Push, "2"),
    })).success);
    engine.apply_remaining();
    logger->flush();

    const std::string text = out.str();
    EXPECT_NE(text.find("initialized"), std::string::npos);
    EXPECT_NE(text.find("committed"), std::string::npos);
    EXPECT_NE(text.find("step 1 rejected"), std::string::npos);
    EXPECT_NE(text.find("size_within_capacity"), std::string::npos);
}

TEST(EngineTest, EdgeCaseMismatchIsOnlyAWarning) {
    std::ostringstream out;
    auto logger = std::make_shared<spdlog::logger>("edge_case_test",
        std::make_shared<spdlog::sinks::ostream_sink_mt>(out));

    execution::EngineConfig cfg;
    cfg.logger = logger;
    Engine engine(cfg);
    auto traverse = step(0, OperationKind::Traverse);
    traverse.edge_case_tag = "OVERFLOW";
    ASSERT_TRUE(engine.initialize(make_plan(config(Variant::SinglyLinked, { "1" }), { traverse })).success);

    EXPECT_TRUE(engine.apply_step(0).success);
    logger->flush();
    EXPECT_NE(out.str().find("declared edge case OVERFLOW"), std::string::npos);
}

TEST(EngineLoggingTest, FileLoggerWritesRejections) {
    const auto dir = std::filesystem::temp_directory_path() / "structure_stepper_tests";
    const auto path = dir / "engine.log";
    std::filesystem::remove(path);

    execution::EngineConfig cfg;
    cfg.logger = execution::make_file_logger("engine_file_test", path.string());
    ASSERT_NE(cfg.logger, nullptr);
    EXPECT_EQ(execution::make_file_logger("engine_file_test", path.string()), cfg.logger);

    Engine engine(cfg);
    ASSERT_TRUE(engine.initialize(make_plan(config(Variant::Queue, {}, {}, 2),
        { step(0, OperationKind::Dequeue) })).success);
    engine.apply_remaining();
    cfg.logger->flush();

    std::ifstream in(path);
    std::stringstream text;
    text << in.rdbuf();
    EXPECT_NE(text.str().find("step 0 rejected"), std::string::npos);
    spdlog::drop("engine_file_test");
}
