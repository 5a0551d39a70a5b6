#pragma once

#include <execution/history.hpp>
#include <structure_model/errors.hpp>
#include <structure_model/plan.hpp>
#include <structure_model/types.hpp>
#include <spdlog/spdlog.h>
#include <cstddef>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace execution {

struct EngineConfig {
    // nullptr logs through spdlog::default_logger().
    std::shared_ptr<spdlog::logger> logger;
    bool log_commits = true;
    // Warn when a step's declared edge_case_tag differs from the marker it produced.
    bool warn_on_edge_case_mismatch = true;
};

struct InitializeResult {
    bool success = false;
    structure_model::StateGraphPtr initial_state;
    std::vector<structure_model::ExecutionError> errors;
};

struct StateTransitionResult {
    bool success = false;
    long step_index = -1;
    structure_model::StateGraphPtr new_state;   // set on success
    std::set<structure_model::ElementId> modified_element_ids;
    std::vector<structure_model::ElementId> visited_element_ids;
    structure_model::EdgeCase edge_case = structure_model::EdgeCase::None;
    std::vector<structure_model::ExecutionError> errors;
    bool invariants_preserved = false;
};

struct NavigationResult {
    bool success = false;
    structure_model::StateGraphPtr state;
    std::optional<structure_model::ExecutionError> error;
};

// A rejected step as kept for external logging.
struct RejectionRecord {
    long step_index = -1;
    std::vector<std::string> violated;
    std::vector<structure_model::ElementId> element_ids;
    std::vector<structure_model::ExecutionError> errors;
};

// Applies a plan step by step. History index 0 holds the initial state and
// step i commits at index i + 1. One Engine serves one learner execution;
// mutations are serialized, reads may run concurrently with each other.
class Engine {
public:
    Engine();
    explicit Engine(EngineConfig config);

    InitializeResult initialize(structure_model::ExecutionPlan plan);

    // Only the next step (step_index == steps applied) can be applied.
    StateTransitionResult apply_step(long step_index);

    // Applies the remaining steps, stopping after the first failure.
    std::vector<StateTransitionResult> apply_remaining();

    // Latest committed state, nullptr before initialize.
    structure_model::StateGraphPtr current_state() const;

    // Committed snapshot at a history index; never re-executes transforms.
    NavigationResult go_to_step(long step_index) const;

    // Truncates history back to the initial state and clears the rejection log.
    void reset();

    bool initialized() const;
    bool finished() const;
    std::size_t history_size() const;
    long next_step_index() const;
    std::size_t step_count() const;
    std::vector<RejectionRecord> rejections() const;
    structure_model::ExecutionPlan plan() const;

private:
    StateTransitionResult apply_step_locked(long step_index);
    StateTransitionResult reject(long step_index, std::vector<structure_model::ExecutionError> errors);
    spdlog::logger& log() const;

    mutable std::shared_mutex mutex_;
    EngineConfig config_;
    structure_model::ExecutionPlan plan_;
    HistoryManager history_;
    std::vector<RejectionRecord> rejections_;
    bool initialized_ = false;
};

} // namespace execution
