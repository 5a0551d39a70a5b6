#include <structure_validation/validator.hpp>
#include <structure_validation/invariants.hpp>
#include <structure_model/names.hpp>
#include "checks.hpp"
#include <algorithm>
#include <utility>

namespace structure_validation {

using structure_model::EdgeCase;
using structure_model::ErrorKind;
using structure_model::Variant;

namespace detail {

void add_violation(ValidationReport& report, const char* invariant_name, ErrorKind kind,
    std::vector<structure_model::ElementId> element_ids, std::string message)
{
    report.valid = false;
    if (std::find(report.violated.begin(), report.violated.end(), invariant_name) == report.violated.end())
        report.violated.emplace_back(invariant_name);
    report.reasons.push_back(Violation{ invariant_name, kind, std::move(element_ids), std::move(message) });
}

} // namespace detail

bool ValidationReport::has(ErrorKind kind) const {
    for (const auto& r : reasons)
        if (r.kind == kind) return true;
    return false;
}

bool ValidationReport::violates(const std::string& invariant_name) const {
    return std::find(violated.begin(), violated.end(), invariant_name) != violated.end();
}

const std::vector<std::string>& invariants_for(Variant variant) {
    using namespace invariant;
    static const std::vector<std::string> array_names = {
        size_within_capacity, contiguous_slots, no_leaks,
        position_in_range, non_empty_for_removal, step_references_valid, unique_ids,
    };
    static const std::vector<std::string> singly_names = {
        boundary_ids_valid, links_valid, acyclic, traversal_matches_size, tail_is_last, no_leaks,
        position_in_range, non_empty_for_removal, step_references_valid, unique_ids,
    };
    static const std::vector<std::string> doubly_names = {
        boundary_ids_valid, links_valid, acyclic, traversal_matches_size, tail_is_last, no_leaks,
        prev_next_symmetric,
        position_in_range, non_empty_for_removal, step_references_valid, unique_ids,
    };
    static const std::vector<std::string> stack_names = {
        top_in_range, contiguous_slots, size_within_capacity, no_leaks,
        non_empty_for_removal, unique_ids,
    };
    static const std::vector<std::string> queue_names = {
        front_rear_in_range, queue_size_consistent, window_addressing, size_within_capacity, no_leaks,
        non_empty_for_removal, unique_ids,
    };
    switch (variant) {
    case Variant::Array: return array_names;
    case Variant::SinglyLinked: return singly_names;
    case Variant::DoublyLinked: return doubly_names;
    case Variant::Stack: return stack_names;
    case Variant::Queue: return queue_names;
    }
    return array_names;
}

bool is_known_invariant(Variant variant, const std::string& name) {
    const auto& names = invariants_for(variant);
    return std::find(names.begin(), names.end(), name) != names.end();
}

ValidationReport validate_state(const structure_model::StateGraph& state) {
    ValidationReport report;
    switch (state.variant) {
    case Variant::SinglyLinked:
    case Variant::DoublyLinked:
        detail::check_list(state, report);
        break;
    case Variant::Array:
        detail::check_array(state, report);
        break;
    case Variant::Stack:
        detail::check_stack(state, report);
        break;
    case Variant::Queue:
        detail::check_queue(state, report);
        break;
    }
    return report;
}

ValidationReport validate_candidate(const structure_model::Candidate& candidate) {
    ValidationReport gates;
    const auto& state = candidate.state;

    switch (candidate.edge_case) {
    case EdgeCase::Overflow:
        detail::add_violation(gates, invariant::size_within_capacity, ErrorKind::OutOfBounds, {},
            "operation needs size " + std::to_string(candidate.demanded_size)
                + " but capacity is " + std::to_string(state.capacity.value_or(0)));
        break;
    case EdgeCase::OutOfBounds: {
        const std::string requested = candidate.requested_position
            ? std::to_string(*candidate.requested_position) : std::string("none");
        detail::add_violation(gates, invariant::position_in_range, ErrorKind::OutOfBounds, {},
            "position " + requested + " outside structure of size " + std::to_string(state.size));
        break;
    }
    case EdgeCase::Underflow:
        detail::add_violation(gates, invariant::non_empty_for_removal, ErrorKind::OutOfBounds, {},
            "cannot read or remove from an empty " + structure_model::variant_name(state.variant));
        break;
    case EdgeCase::NotFound:
    case EdgeCase::None:
        break;
    }
    if (!candidate.missing_ids.empty()) {
        detail::add_violation(gates, invariant::step_references_valid, ErrorKind::Pointer,
            candidate.missing_ids, "step references elements that do not exist");
    }
    if (!candidate.duplicate_ids.empty()) {
        detail::add_violation(gates, invariant::unique_ids, ErrorKind::Pointer,
            candidate.duplicate_ids, "element id already in use");
    }

    ValidationReport structural = validate_state(state);
    if (gates.valid) return structural;

    for (auto& reason : structural.reasons) {
        detail::add_violation(gates, reason.invariant.c_str(), reason.kind,
            std::move(reason.element_ids), std::move(reason.message));
    }
    return gates;
}

} // namespace structure_validation
