#pragma once

#include <structure_model/types.hpp>
#include <string>
#include <vector>

namespace structure_model {

enum class ErrorKind {
    Configuration,  // malformed initial configuration, initialize aborts
    Schema,         // malformed plan, initialize aborts
    Sequence,       // step applied out of order
    OutOfBounds,
    Cycle,
    Leak,
    Pointer,
    Navigation      // history index not committed
};

struct ExecutionError {
    ErrorKind kind = ErrorKind::Schema;
    long step_index = -1;
    std::vector<std::string> invariants;
    std::vector<ElementId> element_ids;
    std::string message;
};

inline bool is_structural_violation(ErrorKind kind) {
    return kind == ErrorKind::OutOfBounds || kind == ErrorKind::Cycle
        || kind == ErrorKind::Leak || kind == ErrorKind::Pointer;
}

} // namespace structure_model
