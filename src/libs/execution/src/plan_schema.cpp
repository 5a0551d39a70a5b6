#include <execution/plan_schema.hpp>
#include <step_transforms/transforms.hpp>
#include <structure_validation/invariants.hpp>
#include <structure_model/names.hpp>
#include <string>
#include <utility>

namespace execution {

using structure_model::ErrorKind;
using structure_model::ExecutionError;
using structure_model::OperationKind;

namespace {

ExecutionError schema_error(long step_index, std::string message) {
    ExecutionError e;
    e.kind = ErrorKind::Schema;
    e.step_index = step_index;
    e.message = std::move(message);
    return e;
}

bool needs_value(OperationKind kind) {
    switch (kind) {
    case OperationKind::InsertHead:
    case OperationKind::InsertTail:
    case OperationKind::InsertAt:
    case OperationKind::DeleteByValue:
    case OperationKind::UpdateAt:
    case OperationKind::Search:
    case OperationKind::Push:
    case OperationKind::Enqueue:
        return true;
    default:
        return false;
    }
}

bool needs_position(OperationKind kind) {
    return kind == OperationKind::InsertAt || kind == OperationKind::DeleteAt
        || kind == OperationKind::UpdateAt || kind == OperationKind::Access;
}

bool needs_element(OperationKind kind) {
    return kind == OperationKind::SetNext || kind == OperationKind::SetPrev;
}

} // namespace

std::vector<ExecutionError> check_plan_schema(const structure_model::ExecutionPlan& plan) {
    std::vector<ExecutionError> errors;
    const auto variant = plan.initial.variant;

    for (std::size_t i = 0; i < plan.steps.size(); ++i) {
        const auto& step = plan.steps[i];
        const long index = static_cast<long>(i);
        const std::string op = step.kind == OperationKind::Unknown && !step.operation_name.empty()
            ? step.operation_name : structure_model::operation_name(step.kind);

        if (step.step_index != index) {
            errors.push_back(schema_error(step.step_index, "step at position " + std::to_string(i)
                + " is numbered " + std::to_string(step.step_index) + ", expected " + std::to_string(i)));
        }
        if (step.kind == OperationKind::Unknown) {
            errors.push_back(schema_error(index, "undeclared operation kind '" + op + "'"));
            continue;
        }
        if (!step_transforms::supports(variant, step.kind)) {
            errors.push_back(schema_error(index, op + " is not an operation of "
                + structure_model::variant_name(variant)));
        }
        if (needs_value(step.kind) && !step.parameters.value)
            errors.push_back(schema_error(index, op + " requires a value"));
        if (needs_position(step.kind) && !step.parameters.position)
            errors.push_back(schema_error(index, op + " requires a position"));
        if (needs_element(step.kind) && step.parameters.element_id.empty())
            errors.push_back(schema_error(index, op + " requires an element_id"));

        if (step.declared_invariants.empty())
            errors.push_back(schema_error(index, op + " declares no invariant"));
        for (const auto& name : step.declared_invariants) {
            if (!structure_validation::is_known_invariant(variant, name)) {
                auto e = schema_error(index, "unknown invariant '" + name + "' for "
                    + structure_model::variant_name(variant));
                e.invariants.push_back(name);
                errors.push_back(std::move(e));
            }
        }
        if (!step.edge_case_tag.empty() && !structure_model::edge_case_from_name(step.edge_case_tag))
            errors.push_back(schema_error(index, "unknown edge case tag '" + step.edge_case_tag + "'"));
    }
    return errors;
}

} // namespace execution
