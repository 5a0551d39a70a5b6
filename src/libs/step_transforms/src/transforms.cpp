#include <step_transforms/transforms.hpp>
#include "transform_helpers.hpp"
#include <string>

namespace step_transforms {

using structure_model::OperationKind;
using structure_model::Variant;

namespace detail {

Candidate start_candidate(const StateGraph& current) {
    Candidate c;
    c.state = current;
    c.state.step_index = current.step_index + 1;
    c.state.modified_element_ids.clear();
    c.state.visited_element_ids.clear();
    c.state.edge_case = EdgeCase::None;
    c.demanded_size = current.size;
    return c;
}

void mark(Candidate& c, EdgeCase edge_case) {
    c.edge_case = edge_case;
    c.state.edge_case = edge_case;
}

std::optional<std::size_t> checked_position(const Step& step, std::size_t limit) {
    const auto& pos = step.parameters.position;
    if (!pos || *pos < 0) return std::nullopt;
    const auto index = static_cast<std::size_t>(*pos);
    if (index >= limit) return std::nullopt;
    return index;
}

ElementId allocate_id(Candidate& c, const ElementId& requested) {
    if (!requested.empty()) {
        if (c.state.elements.count(requested) != 0) {
            c.duplicate_ids.push_back(requested);
            return {};
        }
        return requested;
    }
    for (;;) {
        ElementId id = "n" + std::to_string(c.state.next_serial++);
        if (c.state.elements.count(id) == 0) return id;
    }
}

} // namespace detail

bool supports(Variant variant, OperationKind kind) {
    switch (kind) {
    case OperationKind::Unknown:
        return false;
    case OperationKind::InsertHead:
    case OperationKind::InsertTail:
    case OperationKind::InsertAt:
    case OperationKind::DeleteHead:
    case OperationKind::DeleteTail:
    case OperationKind::DeleteAt:
    case OperationKind::DeleteByValue:
    case OperationKind::UpdateAt:
    case OperationKind::Access:
    case OperationKind::Search:
        return variant == Variant::Array || structure_model::is_list(variant);
    case OperationKind::Traverse:
        return true;
    case OperationKind::Reverse:
    case OperationKind::SetNext:
        return structure_model::is_list(variant);
    case OperationKind::SetPrev:
        return variant == Variant::DoublyLinked;
    case OperationKind::Push:
    case OperationKind::Pop:
        return variant == Variant::Stack;
    case OperationKind::Peek:
        return variant == Variant::Stack || variant == Variant::Queue;
    case OperationKind::Enqueue:
    case OperationKind::Dequeue:
        return variant == Variant::Queue;
    }
    return false;
}

structure_model::Candidate apply_transform(const structure_model::StateGraph& current,
    const structure_model::Step& step)
{
    if (!supports(current.variant, step.kind)) {
        auto c = detail::start_candidate(current);
        c.supported = false;
        return c;
    }
    switch (current.variant) {
    case Variant::SinglyLinked:
    case Variant::DoublyLinked:
        return detail::transform_list(current, step);
    case Variant::Array:
        return detail::transform_array(current, step);
    case Variant::Stack:
        return detail::transform_stack(current, step);
    case Variant::Queue:
        return detail::transform_queue(current, step);
    }
    return detail::start_candidate(current);
}

} // namespace step_transforms
