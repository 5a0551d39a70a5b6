#pragma once

#include <structure_model/types.hpp>
#include <string>
#include <vector>

namespace structure_validation {

namespace invariant {

// Array, stack, queue
inline constexpr const char* size_within_capacity = "size_within_capacity";
inline constexpr const char* contiguous_slots = "contiguous_slots";
inline constexpr const char* top_in_range = "top_in_range";
inline constexpr const char* front_rear_in_range = "front_rear_in_range";
inline constexpr const char* queue_size_consistent = "queue_size_consistent";
inline constexpr const char* window_addressing = "window_addressing";

// Linked lists
inline constexpr const char* boundary_ids_valid = "boundary_ids_valid";
inline constexpr const char* links_valid = "links_valid";
inline constexpr const char* acyclic = "acyclic";
inline constexpr const char* traversal_matches_size = "traversal_matches_size";
inline constexpr const char* tail_is_last = "tail_is_last";
inline constexpr const char* prev_next_symmetric = "prev_next_symmetric";

// Every variant
inline constexpr const char* no_leaks = "no_leaks";

// Judged on the request a candidate carries rather than on its state.
inline constexpr const char* position_in_range = "position_in_range";
inline constexpr const char* non_empty_for_removal = "non_empty_for_removal";
inline constexpr const char* step_references_valid = "step_references_valid";
inline constexpr const char* unique_ids = "unique_ids";

} // namespace invariant

// Invariant names evaluated for a variant, candidate gates included.
const std::vector<std::string>& invariants_for(structure_model::Variant variant);

bool is_known_invariant(structure_model::Variant variant, const std::string& name);

} // namespace structure_validation
