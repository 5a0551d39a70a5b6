#pragma once

#include <structure_model/candidate.hpp>
#include <structure_model/plan.hpp>
#include <structure_model/types.hpp>

namespace step_transforms {

// True when the variant accepts the operation kind.
bool supports(structure_model::Variant variant, structure_model::OperationKind kind);

// Maps (current state, step) to a candidate. Never fails: refused requests
// come back as the unchanged state plus an edge-case marker. Validity is
// decided by structure_validation, not here.
structure_model::Candidate apply_transform(const structure_model::StateGraph& current,
    const structure_model::Step& step);

} // namespace step_transforms
