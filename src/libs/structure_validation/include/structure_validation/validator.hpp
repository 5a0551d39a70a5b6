#pragma once

#include <structure_model/candidate.hpp>
#include <structure_model/errors.hpp>
#include <structure_model/types.hpp>
#include <string>
#include <vector>

namespace structure_validation {

struct Violation {
    std::string invariant;
    structure_model::ErrorKind kind = structure_model::ErrorKind::Pointer;
    std::vector<structure_model::ElementId> element_ids;
    std::string message;
};

struct ValidationReport {
    bool valid = true;
    std::vector<std::string> violated;   // invariant names, each listed once
    std::vector<Violation> reasons;

    bool has(structure_model::ErrorKind kind) const;
    bool violates(const std::string& invariant_name) const;
};

// Runs the variant's invariant table plus pointer, cycle and leak checks.
ValidationReport validate_state(const structure_model::StateGraph& state);

// validate_state on the candidate's state, preceded by the request gates:
// OVERFLOW, OUT_OF_BOUNDS and UNDERFLOW markers, ids the step referenced that
// do not exist and ids it tried to create twice.
ValidationReport validate_candidate(const structure_model::Candidate& candidate);

} // namespace structure_validation
