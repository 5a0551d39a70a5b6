#include <execution/engine.hpp>
#include <execution/plan_schema.hpp>
#include <step_transforms/transforms.hpp>
#include <structure_validation/validator.hpp>
#include <structure_model/names.hpp>
#include <structure_model/state_graph.hpp>
#include <algorithm>
#include <mutex>
#include <utility>

namespace execution {

using structure_model::ErrorKind;
using structure_model::ExecutionError;

namespace {

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += item;
    }
    return out;
}

ExecutionError make_error(ErrorKind kind, long step_index, std::string message) {
    ExecutionError e;
    e.kind = kind;
    e.step_index = step_index;
    e.message = std::move(message);
    return e;
}

std::vector<ExecutionError> to_errors(const structure_validation::ValidationReport& report, long step_index) {
    std::vector<ExecutionError> errors;
    for (const auto& reason : report.reasons) {
        ExecutionError e;
        e.kind = reason.kind;
        e.step_index = step_index;
        e.invariants.push_back(reason.invariant);
        e.element_ids = reason.element_ids;
        e.message = reason.message;
        errors.push_back(std::move(e));
    }
    return errors;
}

} // namespace

Engine::Engine() = default;

Engine::Engine(EngineConfig config)
    : config_(std::move(config))
{
}

spdlog::logger& Engine::log() const {
    if (config_.logger) return *config_.logger;
    return *spdlog::default_logger();
}

InitializeResult Engine::initialize(structure_model::ExecutionPlan plan) {
    std::unique_lock lock(mutex_);
    InitializeResult result;

    initialized_ = false;
    history_.clear();
    rejections_.clear();

    result.errors = check_plan_schema(plan);
    if (!result.errors.empty()) {
        for (const auto& e : result.errors)
            log().error("plan '{}' step {}: {}: {}", plan.name, e.step_index,
                structure_model::error_kind_name(e.kind), e.message);
        return result;
    }

    ExecutionError config_error;
    auto initial = structure_model::build_initial_state(plan.initial, &config_error);
    if (!initial) {
        log().error("plan '{}': {}: {}", plan.name,
            structure_model::error_kind_name(config_error.kind), config_error.message);
        result.errors.push_back(std::move(config_error));
        return result;
    }

    const auto report = structure_validation::validate_state(*initial);
    if (!report.valid) {
        for (auto& e : to_errors(report, -1)) {
            e.message = "initial state: " + e.message;
            e.kind = ErrorKind::Configuration;
            log().error("plan '{}': ConfigurationError: {}", plan.name, e.message);
            result.errors.push_back(std::move(e));
        }
        return result;
    }

    plan_ = std::move(plan);
    auto snapshot = std::make_shared<const structure_model::StateGraph>(std::move(*initial));
    history_.append(snapshot);
    initialized_ = true;

    log().info("plan '{}' initialized: {} step(s), {}", plan_.name, plan_.steps.size(),
        structure_model::describe_state(*snapshot));
    result.success = true;
    result.initial_state = std::move(snapshot);
    return result;
}

StateTransitionResult Engine::reject(long step_index, std::vector<ExecutionError> errors) {
    StateTransitionResult result;
    result.step_index = step_index;
    result.errors = std::move(errors);

    RejectionRecord record;
    record.step_index = step_index;
    bool structural = false;
    for (const auto& e : result.errors) {
        structural = structural || structure_model::is_structural_violation(e.kind);
        for (const auto& name : e.invariants)
            if (std::find(record.violated.begin(), record.violated.end(), name) == record.violated.end())
                record.violated.push_back(name);
        for (const auto& id : e.element_ids)
            if (std::find(record.element_ids.begin(), record.element_ids.end(), id) == record.element_ids.end())
                record.element_ids.push_back(id);
    }

    for (const auto& e : result.errors)
        log().warn("step {} rejected: {}: {}", step_index, structure_model::error_kind_name(e.kind), e.message);
    if (structural) {
        log().warn("step {} violated [{}] elements [{}]", step_index, join(record.violated),
            join(record.element_ids));
        record.errors = result.errors;
        rejections_.push_back(std::move(record));
    }
    return result;
}

StateTransitionResult Engine::apply_step(long step_index) {
    std::unique_lock lock(mutex_);
    return apply_step_locked(step_index);
}

StateTransitionResult Engine::apply_step_locked(long step_index) {
    if (!initialized_) {
        return reject(step_index, { make_error(ErrorKind::Sequence, step_index, "engine is not initialized") });
    }
    const long expected = static_cast<long>(history_.size()) - 1;
    if (step_index != expected) {
        return reject(step_index, { make_error(ErrorKind::Sequence, step_index,
            "step " + std::to_string(step_index) + " applied out of order, next step is "
                + std::to_string(expected)) });
    }
    if (step_index >= static_cast<long>(plan_.steps.size())) {
        return reject(step_index, { make_error(ErrorKind::Sequence, step_index,
            "plan has no step " + std::to_string(step_index)) });
    }

    const auto& step = plan_.steps[static_cast<std::size_t>(step_index)];
    const auto current = history_.latest();
    auto candidate = step_transforms::apply_transform(*current, step);
    if (!candidate.supported) {
        return reject(step_index, { make_error(ErrorKind::Schema, step_index,
            structure_model::operation_name(step.kind) + " is not an operation of "
                + structure_model::variant_name(current->variant)) });
    }

    if (config_.warn_on_edge_case_mismatch && !step.edge_case_tag.empty()) {
        const auto declared = structure_model::edge_case_from_name(step.edge_case_tag);
        if (declared && *declared != candidate.edge_case) {
            log().warn("step {} declared edge case {} but produced {}", step_index, step.edge_case_tag,
                structure_model::edge_case_name(candidate.edge_case));
        }
    }

    const auto report = structure_validation::validate_candidate(candidate);
    if (!report.valid) {
        auto result = reject(step_index, to_errors(report, step_index));
        result.edge_case = candidate.edge_case;
        return result;
    }

    auto snapshot = std::make_shared<const structure_model::StateGraph>(std::move(candidate.state));
    history_.append(snapshot);
    if (config_.log_commits) {
        log().debug("step {} {} committed: {}", step_index, structure_model::operation_name(step.kind),
            structure_model::describe_state(*snapshot));
    }

    StateTransitionResult result;
    result.success = true;
    result.step_index = step_index;
    result.modified_element_ids = snapshot->modified_element_ids;
    result.visited_element_ids = snapshot->visited_element_ids;
    result.edge_case = snapshot->edge_case;
    result.invariants_preserved = true;
    result.new_state = std::move(snapshot);
    return result;
}

std::vector<StateTransitionResult> Engine::apply_remaining() {
    std::unique_lock lock(mutex_);
    std::vector<StateTransitionResult> results;
    if (!initialized_) return results;
    while (static_cast<std::size_t>(history_.size() - 1) < plan_.steps.size()) {
        results.push_back(apply_step_locked(static_cast<long>(history_.size()) - 1));
        if (!results.back().success) break;
    }
    return results;
}

structure_model::StateGraphPtr Engine::current_state() const {
    std::shared_lock lock(mutex_);
    return history_.latest();
}

NavigationResult Engine::go_to_step(long step_index) const {
    std::shared_lock lock(mutex_);
    NavigationResult result;
    if (step_index < 0 || static_cast<std::size_t>(step_index) >= history_.size()) {
        const long last = static_cast<long>(history_.size()) - 1;
        result.error = make_error(ErrorKind::Navigation, step_index,
            "step " + std::to_string(step_index) + " is not committed, history covers [0, "
                + std::to_string(last) + "]");
        return result;
    }
    result.success = true;
    result.state = history_.at(static_cast<std::size_t>(step_index));
    return result;
}

void Engine::reset() {
    std::unique_lock lock(mutex_);
    history_.truncate(1);
    rejections_.clear();
    log().info("plan '{}' reset to initial state", plan_.name);
}

bool Engine::initialized() const {
    std::shared_lock lock(mutex_);
    return initialized_;
}

bool Engine::finished() const {
    std::shared_lock lock(mutex_);
    return initialized_ && history_.size() - 1 >= plan_.steps.size();
}

std::size_t Engine::history_size() const {
    std::shared_lock lock(mutex_);
    return history_.size();
}

long Engine::next_step_index() const {
    std::shared_lock lock(mutex_);
    return static_cast<long>(history_.size()) - 1;
}

std::size_t Engine::step_count() const {
    std::shared_lock lock(mutex_);
    return plan_.steps.size();
}

std::vector<RejectionRecord> Engine::rejections() const {
    std::shared_lock lock(mutex_);
    return rejections_;
}

structure_model::ExecutionPlan Engine::plan() const {
    std::shared_lock lock(mutex_);
    return plan_;
}

} // namespace execution
