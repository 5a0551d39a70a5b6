#pragma once

#include <structure_model/plan.hpp>
#include <optional>
#include <string>
#include <vector>

namespace plan_loaders {

// Built-in plans for the runner when no plan file is given.
// Names: "array", "singly", "doubly", "stack", "queue".
std::vector<std::string> demo_plan_names();
std::optional<structure_model::ExecutionPlan> generate_demo_plan(const std::string& name);

} // namespace plan_loaders
