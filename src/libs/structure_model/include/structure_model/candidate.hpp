#pragma once

#include <structure_model/types.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace structure_model {

// Tentative state produced by a transform, not yet validated or committed.
// state.modified_element_ids holds what the transform created, removed or
// mutated; the remaining fields describe what the step asked for so the
// validator can judge requests that were refused before touching the state.
struct Candidate {
    StateGraph state;
    EdgeCase edge_case = EdgeCase::None;
    std::size_t demanded_size = 0;
    std::optional<std::int64_t> requested_position;
    std::vector<ElementId> missing_ids;     // referenced by the step, absent from the state
    std::vector<ElementId> duplicate_ids;   // requested for creation, already present
    bool supported = true;                  // false when the variant has no such operation
};

} // namespace structure_model
