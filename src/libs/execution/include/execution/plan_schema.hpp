#pragma once

#include <structure_model/errors.hpp>
#include <structure_model/plan.hpp>
#include <vector>

namespace execution {

// Schema problems of a plan, all with ErrorKind::Schema; empty when the plan
// is well formed. Checks: step indices contiguous from 0, known operation
// supported by the plan's variant, required parameters present, at least one
// declared invariant and only names known for the variant, known edge-case tags.
std::vector<structure_model::ExecutionError> check_plan_schema(const structure_model::ExecutionPlan& plan);

} // namespace execution
