#pragma once

#include <execution/engine.hpp>
#include <structure_model/types.hpp>
#include <nlohmann/json.hpp>

namespace plan_loaders {

// Snapshot in the shape downstream consumers read: elements in logical order,
// boundary markers, highlight sets.
nlohmann::json state_to_json(const structure_model::StateGraph& state);

nlohmann::json transition_to_json(const execution::StateTransitionResult& result);

} // namespace plan_loaders
