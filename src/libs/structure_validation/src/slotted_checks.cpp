#include "checks.hpp"
#include <structure_validation/invariants.hpp>
#include <structure_model/state_graph.hpp>
#include <map>

namespace structure_validation::detail {

using structure_model::ElementId;
using structure_model::ErrorKind;
using structure_model::StateGraph;

namespace {

void check_capacity(const StateGraph& s, ValidationReport& report) {
    if (s.capacity && s.size > *s.capacity) {
        add_violation(report, invariant::size_within_capacity, ErrorKind::OutOfBounds, {},
            "size " + std::to_string(s.size) + " exceeds capacity " + std::to_string(*s.capacity));
    }
}

// Used region [0, used): every slot held exactly once, nothing beyond it.
void check_prefix(const StateGraph& s, std::size_t used, ValidationReport& report) {
    std::map<std::size_t, std::vector<ElementId>> by_slot;
    std::vector<ElementId> outside;
    for (const auto& [id, el] : s.elements) {
        if (el.slot >= used)
            outside.push_back(id);
        else
            by_slot[el.slot].push_back(id);
    }
    for (std::size_t slot = 0; slot < used; ++slot) {
        auto it = by_slot.find(slot);
        if (it == by_slot.end()) {
            add_violation(report, invariant::contiguous_slots, ErrorKind::OutOfBounds, {},
                "gap at index " + std::to_string(slot));
        } else if (it->second.size() > 1) {
            add_violation(report, invariant::contiguous_slots, ErrorKind::OutOfBounds, it->second,
                "index " + std::to_string(slot) + " held by " + std::to_string(it->second.size()) + " elements");
        }
    }
    if (!outside.empty()) {
        add_violation(report, invariant::no_leaks, ErrorKind::Leak, outside,
            std::to_string(outside.size()) + " element(s) outside the used region [0, "
                + std::to_string(used) + ")");
    }
}

} // namespace

void check_array(const StateGraph& s, ValidationReport& report) {
    check_capacity(s, report);
    check_prefix(s, s.size, report);
}

void check_stack(const StateGraph& s, ValidationReport& report) {
    const long top = s.boundary.top;
    const long cap = static_cast<long>(s.capacity.value_or(0));
    if (top < -1 || top >= cap) {
        add_violation(report, invariant::top_in_range, ErrorKind::OutOfBounds, {},
            "top " + std::to_string(top) + " outside [-1, " + std::to_string(cap) + ")");
    }
    if (top + 1 != static_cast<long>(s.size)) {
        add_violation(report, invariant::top_in_range, ErrorKind::OutOfBounds, {},
            "top " + std::to_string(top) + " disagrees with size " + std::to_string(s.size));
    }
    check_capacity(s, report);
    check_prefix(s, top < 0 ? 0 : static_cast<std::size_t>(top + 1), report);
}

void check_queue(const StateGraph& s, ValidationReport& report) {
    const std::size_t cap = s.capacity.value_or(0);
    const auto& b = s.boundary;
    if (b.front >= cap || b.rear >= cap) {
        add_violation(report, invariant::front_rear_in_range, ErrorKind::OutOfBounds, {},
            "front " + std::to_string(b.front) + " / rear " + std::to_string(b.rear)
                + " outside [0, " + std::to_string(cap) + ")");
        return;
    }
    check_capacity(s, report);
    if (s.size > cap)
        return;
    if ((b.front + s.size) % cap != b.rear) {
        add_violation(report, invariant::queue_size_consistent, ErrorKind::OutOfBounds, {},
            "size " + std::to_string(s.size) + " disagrees with front " + std::to_string(b.front)
                + " and rear " + std::to_string(b.rear));
    }
    if (s.elements.size() != s.size) {
        add_violation(report, invariant::queue_size_consistent, ErrorKind::OutOfBounds, {},
            std::to_string(s.elements.size()) + " element(s) stored, size is " + std::to_string(s.size));
    }

    // Logical window [front, front + size) taken modulo capacity.
    std::map<std::size_t, std::size_t> window;   // slot -> logical index
    for (std::size_t i = 0; i < s.size; ++i)
        window.emplace((b.front + i) % cap, i);

    std::map<std::size_t, std::vector<ElementId>> by_slot;
    std::vector<ElementId> outside;
    for (const auto& [id, el] : s.elements) {
        if (window.count(el.slot) == 0)
            outside.push_back(id);
        else
            by_slot[el.slot].push_back(id);
    }
    for (const auto& [slot, logical] : window) {
        auto it = by_slot.find(slot);
        if (it == by_slot.end()) {
            add_violation(report, invariant::window_addressing, ErrorKind::OutOfBounds, {},
                "logical position " + std::to_string(logical) + " (slot " + std::to_string(slot) + ") is empty");
        } else if (it->second.size() > 1) {
            add_violation(report, invariant::window_addressing, ErrorKind::OutOfBounds, it->second,
                "slot " + std::to_string(slot) + " held by " + std::to_string(it->second.size()) + " elements");
        }
    }
    if (!outside.empty()) {
        add_violation(report, invariant::no_leaks, ErrorKind::Leak, outside,
            std::to_string(outside.size()) + " element(s) addressed outside the [front, rear) window");
    }
}

} // namespace structure_validation::detail
