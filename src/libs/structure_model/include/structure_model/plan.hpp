#pragma once

#include <structure_model/types.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace structure_model {

enum class OperationKind {
    Unknown,
    InsertHead,
    InsertTail,
    InsertAt,
    DeleteHead,
    DeleteTail,
    DeleteAt,
    DeleteByValue,
    UpdateAt,
    Access,
    Search,
    Traverse,
    Reverse,
    SetNext,
    SetPrev,
    Push,
    Pop,
    Peek,
    Enqueue,
    Dequeue
};

struct StepParameters {
    std::optional<Value> value;
    std::optional<std::int64_t> position;
    ElementId element_id;   // SET_NEXT / SET_PREV source
    ElementId target_id;    // SET_NEXT / SET_PREV target, empty = null
    ElementId new_id;       // explicit id for a created element
};

struct Step {
    long step_index = 0;
    OperationKind kind = OperationKind::Unknown;
    // Raw operation name as written in the plan; kept for error messages.
    std::string operation_name;
    StepParameters parameters;
    std::vector<std::string> declared_invariants;
    std::string edge_case_tag;
};

// Declarative initial configuration. ids is either empty (generated) or has
// one entry per value. front is the physical slot of the first queue element.
struct InitialConfiguration {
    Variant variant = Variant::Array;
    std::vector<Value> values;
    std::vector<ElementId> ids;
    std::optional<std::size_t> capacity;
    std::size_t front = 0;
};

struct ExecutionPlan {
    std::string name;
    InitialConfiguration initial;
    std::vector<Step> steps;
};

} // namespace structure_model
