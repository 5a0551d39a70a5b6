#pragma once

#include <structure_model/plan.hpp>
#include <optional>
#include <istream>
#include <string>

namespace plan_loaders {

// On failure returns nullopt and, when error is non-null, a description.
// Unknown operation names load as OperationKind::Unknown; the engine reports them.
std::optional<structure_model::ExecutionPlan> load_plan_from_json(std::istream& in,
    std::string* error = nullptr);
std::optional<structure_model::ExecutionPlan> load_plan_from_json_file(const std::string& path,
    std::string* error = nullptr);

} // namespace plan_loaders
