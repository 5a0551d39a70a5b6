#include "checks.hpp"
#include <structure_validation/invariants.hpp>
#include <structure_model/state_graph.hpp>
#include <algorithm>
#include <set>

namespace structure_validation::detail {

using structure_model::ElementId;
using structure_model::ErrorKind;
using structure_model::StateGraph;
using structure_model::Variant;

namespace {

struct Walk {
    std::vector<ElementId> order;   // ids reached from head, in order
    ElementId last;                 // last id reached
    bool terminated = false;        // reached a null next
    bool dangling = false;          // stopped on an id that does not exist
    ElementId cycle_entry;          // first id visited twice
    ElementId cycle_from;           // node whose next closed the cycle
};

// Follows next from head. The hop limit covers every element the state holds,
// so both cycles and chains longer than size are caught in bounded time.
Walk walk_from_head(const StateGraph& s) {
    Walk w;
    std::set<ElementId> seen;
    const std::size_t max_hops = std::max(s.size, s.elements.size()) + 1;
    ElementId cur = s.boundary.head_id;
    ElementId prev;
    for (std::size_t hops = 0; hops <= max_hops; ++hops) {
        if (cur.empty()) {
            w.terminated = true;
            return w;
        }
        const auto* el = structure_model::find_element(s, cur);
        if (!el) {
            w.dangling = true;
            return w;
        }
        if (!seen.insert(cur).second) {
            w.cycle_entry = cur;
            w.cycle_from = prev;
            return w;
        }
        w.order.push_back(cur);
        w.last = cur;
        prev = cur;
        cur = el->next_id;
    }
    return w;
}

void check_boundaries(const StateGraph& s, ValidationReport& report) {
    const auto& b = s.boundary;
    for (const ElementId* marker : { &b.head_id, &b.tail_id }) {
        if (!marker->empty() && !structure_model::find_element(s, *marker)) {
            add_violation(report, invariant::boundary_ids_valid, ErrorKind::Pointer, { *marker },
                "boundary marker names missing element '" + *marker + "'");
        }
    }
    if (s.size == 0 && (!b.head_id.empty() || !b.tail_id.empty())) {
        add_violation(report, invariant::boundary_ids_valid, ErrorKind::Pointer, {},
            "empty list must have null head and tail");
    }
    if (s.size > 0 && (b.head_id.empty() || b.tail_id.empty())) {
        add_violation(report, invariant::boundary_ids_valid, ErrorKind::Pointer, {},
            "non-empty list must have head and tail");
    }
}

void check_links(const StateGraph& s, ValidationReport& report) {
    const bool doubly = s.variant == Variant::DoublyLinked;
    for (const auto& [id, el] : s.elements) {
        if (!el.next_id.empty() && !structure_model::find_element(s, el.next_id)) {
            add_violation(report, invariant::links_valid, ErrorKind::Pointer, { id, el.next_id },
                "next of '" + id + "' points to missing element '" + el.next_id + "'");
        }
        if (!el.prev_id.empty()) {
            if (!doubly) {
                add_violation(report, invariant::links_valid, ErrorKind::Pointer, { id },
                    "singly linked node '" + id + "' carries a prev link");
            } else if (!structure_model::find_element(s, el.prev_id)) {
                add_violation(report, invariant::links_valid, ErrorKind::Pointer, { id, el.prev_id },
                    "prev of '" + id + "' points to missing element '" + el.prev_id + "'");
            }
        }
    }
}

void check_symmetry(const StateGraph& s, ValidationReport& report) {
    if (const auto* head = structure_model::find_element(s, s.boundary.head_id)) {
        if (!head->prev_id.empty()) {
            add_violation(report, invariant::prev_next_symmetric, ErrorKind::Pointer, { head->id },
                "head '" + head->id + "' has a prev link");
        }
    }
    for (const auto& [id, el] : s.elements) {
        if (const auto* next = structure_model::find_element(s, el.next_id)) {
            if (next->prev_id != id) {
                add_violation(report, invariant::prev_next_symmetric, ErrorKind::Pointer, { id, next->id },
                    "next('" + id + "') = '" + next->id + "' but prev('" + next->id + "') = '"
                        + next->prev_id + "'");
            }
        }
        if (const auto* prev = structure_model::find_element(s, el.prev_id)) {
            if (prev->next_id != id) {
                add_violation(report, invariant::prev_next_symmetric, ErrorKind::Pointer, { id, prev->id },
                    "prev('" + id + "') = '" + prev->id + "' but next('" + prev->id + "') = '"
                        + prev->next_id + "'");
            }
        }
    }
}

void check_leaks(const StateGraph& s, const Walk& walk, ValidationReport& report) {
    std::set<ElementId> reachable(walk.order.begin(), walk.order.end());
    ElementId cur = s.boundary.tail_id;
    while (!cur.empty() && reachable.count(cur) == 0) {
        const auto* el = structure_model::find_element(s, cur);
        if (!el) break;
        reachable.insert(cur);
        if (s.variant != Variant::DoublyLinked) break;
        cur = el->prev_id;
    }

    std::vector<ElementId> leaked;
    for (const auto& [id, el] : s.elements)
        if (reachable.count(id) == 0) leaked.push_back(id);
    if (!leaked.empty()) {
        add_violation(report, invariant::no_leaks, ErrorKind::Leak, leaked,
            std::to_string(leaked.size()) + " element(s) unreachable from head or tail");
    }
}

} // namespace

void check_list(const StateGraph& s, ValidationReport& report) {
    check_boundaries(s, report);
    check_links(s, report);

    const Walk walk = walk_from_head(s);
    if (!walk.cycle_entry.empty()) {
        std::vector<ElementId> ids;
        if (!walk.cycle_from.empty()) ids.push_back(walk.cycle_from);
        ids.push_back(walk.cycle_entry);
        add_violation(report, invariant::acyclic, ErrorKind::Cycle, ids,
            "traversal from head revisits '" + walk.cycle_entry + "'");
    } else if (walk.terminated) {
        if (walk.order.size() != s.size || s.elements.size() != s.size) {
            add_violation(report, invariant::traversal_matches_size, ErrorKind::Pointer, {},
                "traversal visits " + std::to_string(walk.order.size()) + " of "
                    + std::to_string(s.elements.size()) + " element(s), size is " + std::to_string(s.size));
        }
        if (walk.last != s.boundary.tail_id) {
            std::vector<ElementId> ids;
            if (!walk.last.empty()) ids.push_back(walk.last);
            if (!s.boundary.tail_id.empty()) ids.push_back(s.boundary.tail_id);
            add_violation(report, invariant::tail_is_last, ErrorKind::Pointer, ids,
                "traversal ends at '" + walk.last + "' but tail is '" + s.boundary.tail_id + "'");
        }
    }

    if (s.variant == Variant::DoublyLinked)
        check_symmetry(s, report);
    check_leaks(s, walk, report);
}

} // namespace structure_validation::detail
