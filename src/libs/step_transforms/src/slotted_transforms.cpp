#include "transform_helpers.hpp"
#include <structure_model/state_graph.hpp>
#include <algorithm>
#include <vector>

namespace step_transforms::detail {

using structure_model::Element;
using structure_model::OperationKind;

namespace {

bool at_capacity(const StateGraph& s) {
    return s.capacity && s.size >= *s.capacity;
}

void refuse_overflow(Candidate& c) {
    mark(c, EdgeCase::Overflow);
    c.demanded_size = c.state.size + 1;
}

// Creates an element in the given slot. Returns the new id, or empty when the
// requested id is already taken.
ElementId place_new(Candidate& c, const Step& step, std::size_t slot) {
    const ElementId id = allocate_id(c, step.parameters.new_id);
    if (id.empty()) return {};
    Element el;
    el.id = id;
    el.value = step.parameters.value.value_or("");
    el.slot = slot;
    c.state.elements.emplace(id, std::move(el));
    c.state.modified_element_ids.insert(id);
    ++c.state.size;
    c.demanded_size = c.state.size;
    return id;
}

void array_insert(Candidate& c, std::size_t index, const Step& step) {
    if (at_capacity(c.state)) {
        refuse_overflow(c);
        return;
    }
    if (!step.parameters.new_id.empty() && c.state.elements.count(step.parameters.new_id) != 0) {
        c.duplicate_ids.push_back(step.parameters.new_id);
        return;
    }
    for (auto& [id, el] : c.state.elements) {
        if (el.slot >= index) {
            ++el.slot;
            c.state.modified_element_ids.insert(id);
        }
    }
    place_new(c, step, index);
}

void array_delete(Candidate& c, std::size_t index) {
    const ElementId victim = structure_model::element_at_slot(c.state, index);
    c.state.elements.erase(victim);
    c.state.modified_element_ids.insert(victim);
    for (auto& [id, el] : c.state.elements) {
        if (el.slot > index) {
            --el.slot;
            c.state.modified_element_ids.insert(id);
        }
    }
    --c.state.size;
    c.demanded_size = c.state.size;
}

std::optional<std::size_t> array_find(Candidate& c, const structure_model::Value& value) {
    const std::vector<ElementId> order = structure_model::logical_order(c.state);
    for (std::size_t i = 0; i < order.size(); ++i) {
        c.state.visited_element_ids.push_back(order[i]);
        if (structure_model::find_element(c.state, order[i])->value == value) return i;
    }
    return std::nullopt;
}

} // namespace

Candidate transform_array(const StateGraph& current, const Step& step) {
    Candidate c = start_candidate(current);
    const std::size_t size = current.size;
    c.requested_position = step.parameters.position;

    switch (step.kind) {
    case OperationKind::InsertHead:
        array_insert(c, 0, step);
        break;
    case OperationKind::InsertTail:
        array_insert(c, size, step);
        break;
    case OperationKind::InsertAt:
        if (auto index = checked_position(step, size + 1))
            array_insert(c, *index, step);
        else
            mark(c, EdgeCase::OutOfBounds);
        break;
    case OperationKind::DeleteHead:
        if (size == 0)
            mark(c, EdgeCase::Underflow);
        else
            array_delete(c, 0);
        break;
    case OperationKind::DeleteTail:
        if (size == 0)
            mark(c, EdgeCase::Underflow);
        else
            array_delete(c, size - 1);
        break;
    case OperationKind::DeleteAt:
        if (auto index = checked_position(step, size))
            array_delete(c, *index);
        else
            mark(c, EdgeCase::OutOfBounds);
        break;
    case OperationKind::DeleteByValue:
        if (auto index = array_find(c, step.parameters.value.value_or("")))
            array_delete(c, *index);
        else
            mark(c, EdgeCase::NotFound);
        break;
    case OperationKind::UpdateAt:
        if (auto index = checked_position(step, size)) {
            const ElementId id = structure_model::element_at_slot(c.state, *index);
            structure_model::find_element(c.state, id)->value = step.parameters.value.value_or("");
            c.state.modified_element_ids.insert(id);
        } else {
            mark(c, EdgeCase::OutOfBounds);
        }
        break;
    case OperationKind::Access:
        if (auto index = checked_position(step, size))
            c.state.visited_element_ids.push_back(structure_model::element_at_slot(c.state, *index));
        else
            mark(c, EdgeCase::OutOfBounds);
        break;
    case OperationKind::Search:
        if (!array_find(c, step.parameters.value.value_or("")))
            mark(c, EdgeCase::NotFound);
        break;
    case OperationKind::Traverse:
        c.state.visited_element_ids = structure_model::logical_order(c.state);
        break;
    default:
        c.supported = false;
        break;
    }
    return c;
}

Candidate transform_stack(const StateGraph& current, const Step& step) {
    Candidate c = start_candidate(current);
    StateGraph& s = c.state;

    switch (step.kind) {
    case OperationKind::Push:
        if (at_capacity(s)) {
            refuse_overflow(c);
        } else if (!place_new(c, step, s.size).empty()) {
            ++s.boundary.top;
        }
        break;
    case OperationKind::Pop:
        if (s.size == 0) {
            mark(c, EdgeCase::Underflow);
        } else {
            const ElementId id = structure_model::element_at_slot(s, static_cast<std::size_t>(s.boundary.top));
            s.elements.erase(id);
            s.modified_element_ids.insert(id);
            --s.boundary.top;
            --s.size;
            c.demanded_size = s.size;
        }
        break;
    case OperationKind::Peek:
        if (s.size == 0)
            mark(c, EdgeCase::Underflow);
        else
            s.visited_element_ids.push_back(structure_model::element_at_slot(s, static_cast<std::size_t>(s.boundary.top)));
        break;
    case OperationKind::Traverse:
        // Top down, the order elements would be popped.
        s.visited_element_ids = structure_model::logical_order(s);
        std::reverse(s.visited_element_ids.begin(), s.visited_element_ids.end());
        break;
    default:
        c.supported = false;
        break;
    }
    return c;
}

Candidate transform_queue(const StateGraph& current, const Step& step) {
    Candidate c = start_candidate(current);
    StateGraph& s = c.state;
    const std::size_t cap = s.capacity.value_or(0);

    switch (step.kind) {
    case OperationKind::Enqueue:
        if (at_capacity(s) || cap == 0) {
            refuse_overflow(c);
        } else if (!place_new(c, step, s.boundary.rear).empty()) {
            s.boundary.rear = (s.boundary.rear + 1) % cap;
        }
        break;
    case OperationKind::Dequeue:
        if (s.size == 0) {
            mark(c, EdgeCase::Underflow);
        } else {
            const ElementId id = structure_model::element_at_slot(s, s.boundary.front);
            s.elements.erase(id);
            s.modified_element_ids.insert(id);
            s.boundary.front = (s.boundary.front + 1) % cap;
            --s.size;
            c.demanded_size = s.size;
        }
        break;
    case OperationKind::Peek:
        if (s.size == 0)
            mark(c, EdgeCase::Underflow);
        else
            s.visited_element_ids.push_back(structure_model::element_at_slot(s, s.boundary.front));
        break;
    case OperationKind::Traverse:
        s.visited_element_ids = structure_model::logical_order(s);
        break;
    default:
        c.supported = false;
        break;
    }
    return c;
}

} // namespace step_transforms::detail
