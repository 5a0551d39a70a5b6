#include <structure_model/names.hpp>
#include <utility>

namespace structure_model {

namespace {

const std::pair<Variant, const char*> variant_names[] = {
    { Variant::Array, "ARRAY" },
    { Variant::SinglyLinked, "SINGLY_LINKED" },
    { Variant::DoublyLinked, "DOUBLY_LINKED" },
    { Variant::Stack, "STACK" },
    { Variant::Queue, "QUEUE" },
};

const std::pair<OperationKind, const char*> operation_names[] = {
    { OperationKind::InsertHead, "INSERT_HEAD" },
    { OperationKind::InsertTail, "INSERT_TAIL" },
    { OperationKind::InsertAt, "INSERT_AT" },
    { OperationKind::DeleteHead, "DELETE_HEAD" },
    { OperationKind::DeleteTail, "DELETE_TAIL" },
    { OperationKind::DeleteAt, "DELETE_AT" },
    { OperationKind::DeleteByValue, "DELETE_BY_VALUE" },
    { OperationKind::UpdateAt, "UPDATE_AT" },
    { OperationKind::Access, "ACCESS" },
    { OperationKind::Search, "SEARCH" },
    { OperationKind::Traverse, "TRAVERSE" },
    { OperationKind::Reverse, "REVERSE" },
    { OperationKind::SetNext, "SET_NEXT" },
    { OperationKind::SetPrev, "SET_PREV" },
    { OperationKind::Push, "PUSH" },
    { OperationKind::Pop, "POP" },
    { OperationKind::Peek, "PEEK" },
    { OperationKind::Enqueue, "ENQUEUE" },
    { OperationKind::Dequeue, "DEQUEUE" },
};

const std::pair<EdgeCase, const char*> edge_case_names[] = {
    { EdgeCase::None, "NONE" },
    { EdgeCase::OutOfBounds, "OUT_OF_BOUNDS" },
    { EdgeCase::NotFound, "NOT_FOUND" },
    { EdgeCase::Overflow, "OVERFLOW" },
    { EdgeCase::Underflow, "UNDERFLOW" },
};

} // namespace

std::string variant_name(Variant v) {
    for (const auto& [value, name] : variant_names)
        if (value == v) return name;
    return "UNKNOWN";
}

std::optional<Variant> variant_from_name(const std::string& s) {
    for (const auto& [value, name] : variant_names)
        if (s == name) return value;
    return std::nullopt;
}

std::string operation_name(OperationKind kind) {
    for (const auto& [value, name] : operation_names)
        if (value == kind) return name;
    return "UNKNOWN";
}

OperationKind operation_from_name(const std::string& s) {
    for (const auto& [value, name] : operation_names)
        if (s == name) return value;
    return OperationKind::Unknown;
}

std::string edge_case_name(EdgeCase e) {
    for (const auto& [value, name] : edge_case_names)
        if (value == e) return name;
    return "NONE";
}

std::optional<EdgeCase> edge_case_from_name(const std::string& s) {
    for (const auto& [value, name] : edge_case_names)
        if (s == name) return value;
    return std::nullopt;
}

std::string error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Configuration: return "ConfigurationError";
    case ErrorKind::Schema: return "SchemaError";
    case ErrorKind::Sequence: return "SequenceError";
    case ErrorKind::OutOfBounds: return "OutOfBoundsError";
    case ErrorKind::Cycle: return "CycleError";
    case ErrorKind::Leak: return "LeakError";
    case ErrorKind::Pointer: return "PointerError";
    case ErrorKind::Navigation: return "NavigationError";
    }
    return "UnknownError";
}

} // namespace structure_model
