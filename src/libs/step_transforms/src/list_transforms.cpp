#include "transform_helpers.hpp"
#include <structure_model/state_graph.hpp>
#include <vector>

namespace step_transforms::detail {

using structure_model::Element;
using structure_model::OperationKind;
using structure_model::Variant;

namespace {

bool is_doubly(const StateGraph& s) {
    return s.variant == Variant::DoublyLinked;
}

void insert_at(Candidate& c, std::size_t index, const Step& step) {
    StateGraph& s = c.state;
    const ElementId id = allocate_id(c, step.parameters.new_id);
    if (id.empty()) return;

    const std::vector<ElementId> order = structure_model::logical_order(s);
    Element el;
    el.id = id;
    el.value = step.parameters.value.value_or("");

    if (index == 0) {
        el.next_id = s.boundary.head_id;
        if (is_doubly(s)) {
            if (Element* old_head = structure_model::find_element(s, s.boundary.head_id)) {
                old_head->prev_id = id;
                s.modified_element_ids.insert(old_head->id);
            }
        }
        s.boundary.head_id = id;
        if (s.boundary.tail_id.empty()) s.boundary.tail_id = id;
    } else {
        Element* pred = structure_model::find_element(s, order[index - 1]);
        el.next_id = pred->next_id;
        pred->next_id = id;
        s.modified_element_ids.insert(pred->id);
        if (is_doubly(s)) {
            el.prev_id = pred->id;
            if (Element* succ = structure_model::find_element(s, el.next_id)) {
                succ->prev_id = id;
                s.modified_element_ids.insert(succ->id);
            }
        }
        if (el.next_id.empty()) s.boundary.tail_id = id;
    }

    s.modified_element_ids.insert(id);
    s.elements.emplace(id, std::move(el));
    ++s.size;
    c.demanded_size = s.size;
}

void delete_at(Candidate& c, std::size_t index) {
    StateGraph& s = c.state;
    const std::vector<ElementId> order = structure_model::logical_order(s);
    const ElementId victim_id = order[index];
    const ElementId next_id = structure_model::find_element(s, victim_id)->next_id;

    if (index == 0) {
        s.boundary.head_id = next_id;
        if (is_doubly(s)) {
            if (Element* next = structure_model::find_element(s, next_id)) {
                next->prev_id.clear();
                s.modified_element_ids.insert(next->id);
            }
        }
    } else {
        Element* pred = structure_model::find_element(s, order[index - 1]);
        pred->next_id = next_id;
        s.modified_element_ids.insert(pred->id);
        if (is_doubly(s)) {
            if (Element* next = structure_model::find_element(s, next_id)) {
                next->prev_id = pred->id;
                s.modified_element_ids.insert(next->id);
            }
        }
    }
    if (next_id.empty())
        s.boundary.tail_id = index > 0 ? order[index - 1] : ElementId{};

    s.elements.erase(victim_id);
    s.modified_element_ids.insert(victim_id);
    --s.size;
    c.demanded_size = s.size;
}

// Index of the first element holding value, walking from head. Visited ids
// are recorded up to and including the match.
std::optional<std::size_t> find_value(Candidate& c, const structure_model::Value& value) {
    const std::vector<ElementId> order = structure_model::logical_order(c.state);
    for (std::size_t i = 0; i < order.size(); ++i) {
        c.state.visited_element_ids.push_back(order[i]);
        if (structure_model::find_element(c.state, order[i])->value == value) return i;
    }
    return std::nullopt;
}

void reverse(Candidate& c) {
    StateGraph& s = c.state;
    const std::vector<ElementId> order = structure_model::logical_order(s);
    const std::size_t n = order.size();
    for (std::size_t i = 0; i < n; ++i) {
        Element* el = structure_model::find_element(s, order[i]);
        const ElementId new_next = i > 0 ? order[i - 1] : ElementId{};
        bool changed = el->next_id != new_next;
        el->next_id = new_next;
        if (is_doubly(s)) {
            const ElementId new_prev = i + 1 < n ? order[i + 1] : ElementId{};
            changed = changed || el->prev_id != new_prev;
            el->prev_id = new_prev;
        }
        if (changed) s.modified_element_ids.insert(el->id);
    }
    std::swap(s.boundary.head_id, s.boundary.tail_id);
}

void set_link(Candidate& c, const Step& step, bool next_link) {
    Element* source = structure_model::find_element(c.state, step.parameters.element_id);
    if (!source) {
        c.missing_ids.push_back(step.parameters.element_id);
        return;
    }
    ElementId& link = next_link ? source->next_id : source->prev_id;
    if (link == step.parameters.target_id) return;
    link = step.parameters.target_id;
    c.state.modified_element_ids.insert(source->id);
}

} // namespace

Candidate transform_list(const StateGraph& current, const Step& step) {
    Candidate c = start_candidate(current);
    const std::size_t size = current.size;
    c.requested_position = step.parameters.position;

    switch (step.kind) {
    case OperationKind::InsertHead:
        insert_at(c, 0, step);
        break;
    case OperationKind::InsertTail:
        insert_at(c, size, step);
        break;
    case OperationKind::InsertAt:
        if (auto index = checked_position(step, size + 1))
            insert_at(c, *index, step);
        else
            mark(c, EdgeCase::OutOfBounds);
        break;
    case OperationKind::DeleteHead:
        if (size == 0)
            mark(c, EdgeCase::Underflow);
        else
            delete_at(c, 0);
        break;
    case OperationKind::DeleteTail:
        if (size == 0)
            mark(c, EdgeCase::Underflow);
        else
            delete_at(c, size - 1);
        break;
    case OperationKind::DeleteAt:
        if (auto index = checked_position(step, size))
            delete_at(c, *index);
        else
            mark(c, EdgeCase::OutOfBounds);
        break;
    case OperationKind::DeleteByValue:
        if (auto index = find_value(c, step.parameters.value.value_or("")))
            delete_at(c, *index);
        else
            mark(c, EdgeCase::NotFound);
        break;
    case OperationKind::UpdateAt:
        if (auto index = checked_position(step, size)) {
            const ElementId id = structure_model::logical_order(c.state)[*index];
            structure_model::find_element(c.state, id)->value = step.parameters.value.value_or("");
            c.state.modified_element_ids.insert(id);
        } else {
            mark(c, EdgeCase::OutOfBounds);
        }
        break;
    case OperationKind::Access:
        // Reaching position i in a list walks every node before it.
        if (auto index = checked_position(step, size)) {
            const std::vector<ElementId> order = structure_model::logical_order(c.state);
            c.state.visited_element_ids.assign(order.begin(), order.begin() + static_cast<long>(*index) + 1);
        } else {
            mark(c, EdgeCase::OutOfBounds);
        }
        break;
    case OperationKind::Search:
        if (!find_value(c, step.parameters.value.value_or("")))
            mark(c, EdgeCase::NotFound);
        break;
    case OperationKind::Traverse:
        c.state.visited_element_ids = structure_model::logical_order(c.state);
        break;
    case OperationKind::Reverse:
        reverse(c);
        break;
    case OperationKind::SetNext:
        set_link(c, step, true);
        break;
    case OperationKind::SetPrev:
        set_link(c, step, false);
        break;
    default:
        c.supported = false;
        break;
    }
    return c;
}

} // namespace step_transforms::detail
