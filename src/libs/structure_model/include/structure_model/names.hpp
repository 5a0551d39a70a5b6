#pragma once

#include <structure_model/errors.hpp>
#include <structure_model/plan.hpp>
#include <structure_model/types.hpp>
#include <optional>
#include <string>

namespace structure_model {

// Names as they appear in plans and logs ("SINGLY_LINKED", "INSERT_AT", ...).
std::string variant_name(Variant v);
std::optional<Variant> variant_from_name(const std::string& s);

std::string operation_name(OperationKind kind);
// Unrecognized names map to OperationKind::Unknown.
OperationKind operation_from_name(const std::string& s);

std::string edge_case_name(EdgeCase e);
std::optional<EdgeCase> edge_case_from_name(const std::string& s);

std::string error_kind_name(ErrorKind kind);

} // namespace structure_model
