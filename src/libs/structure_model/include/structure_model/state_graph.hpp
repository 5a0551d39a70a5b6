#pragma once

#include <structure_model/errors.hpp>
#include <structure_model/plan.hpp>
#include <structure_model/types.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace structure_model {

// Builds the state described by an initial configuration. Returns nullopt and
// fills error (ErrorKind::Configuration) when the configuration is malformed.
std::optional<StateGraph> build_initial_state(const InitialConfiguration& config,
    ExecutionError* error = nullptr);

const Element* find_element(const StateGraph& state, const ElementId& id);
Element* find_element(StateGraph& state, const ElementId& id);

// Id of the element occupying a physical slot, or empty.
ElementId element_at_slot(const StateGraph& state, std::size_t slot);

// Element ids in logical order: head to tail for lists, index order for
// arrays, bottom to top for stacks, front to rear for queues. List walks stop
// after size + 1 hops, so a corrupted topology still terminates.
std::vector<ElementId> logical_order(const StateGraph& state);

// Physical slot holding logical position i of a queue.
std::size_t queue_slot(const StateGraph& state, std::size_t logical_index);

// One-line text rendering, e.g. "SINGLY_LINKED size=2 [A:5 -> B:9] head=A tail=B".
std::string describe_state(const StateGraph& state);

} // namespace structure_model
