#pragma once

#include <structure_validation/validator.hpp>
#include <string>
#include <vector>

namespace structure_validation::detail {

void add_violation(ValidationReport& report, const char* invariant_name,
    structure_model::ErrorKind kind,
    std::vector<structure_model::ElementId> element_ids,
    std::string message);

void check_list(const structure_model::StateGraph& state, ValidationReport& report);
void check_array(const structure_model::StateGraph& state, ValidationReport& report);
void check_stack(const structure_model::StateGraph& state, ValidationReport& report);
void check_queue(const structure_model::StateGraph& state, ValidationReport& report);

} // namespace structure_validation::detail
