#pragma once

#include <structure_model/candidate.hpp>
#include <structure_model/plan.hpp>
#include <structure_model/types.hpp>
#include <cstddef>
#include <optional>

namespace step_transforms::detail {

using structure_model::Candidate;
using structure_model::EdgeCase;
using structure_model::ElementId;
using structure_model::StateGraph;
using structure_model::Step;

// Copy of current that will become the next history entry.
Candidate start_candidate(const StateGraph& current);

void mark(Candidate& c, EdgeCase edge_case);

// position as an index when it lies in [0, limit), or nullopt.
std::optional<std::size_t> checked_position(const Step& step, std::size_t limit);

// Id for a new element: the requested one, or the next free "n<serial>".
// Returns empty and records the conflict when the requested id is taken.
ElementId allocate_id(Candidate& c, const ElementId& requested);

Candidate transform_list(const StateGraph& current, const Step& step);
Candidate transform_array(const StateGraph& current, const Step& step);
Candidate transform_stack(const StateGraph& current, const Step& step);
Candidate transform_queue(const StateGraph& current, const Step& step);

} // namespace step_transforms::detail
