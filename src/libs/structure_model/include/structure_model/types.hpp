#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace structure_model {

// Opaque element identifier. An empty id is the null link.
using ElementId = std::string;
using Value = std::string;

enum class Variant { Array, SinglyLinked, DoublyLinked, Stack, Queue };

enum class EdgeCase { None, OutOfBounds, NotFound, Overflow, Underflow };

struct Element {
    ElementId id;
    Value value;
    ElementId next_id;      // lists only
    ElementId prev_id;      // doubly linked only
    std::size_t slot = 0;   // physical index for array, stack and queue

    bool operator==(const Element&) const = default;
};

struct BoundaryMarkers {
    ElementId head_id;
    ElementId tail_id;
    long top = -1;
    std::size_t front = 0;
    std::size_t rear = 0;

    bool operator==(const BoundaryMarkers&) const = default;
};

// Snapshot of one structure at one history index.
struct StateGraph {
    Variant variant = Variant::Array;
    std::map<ElementId, Element> elements;
    BoundaryMarkers boundary;
    std::size_t size = 0;
    std::optional<std::size_t> capacity;
    long step_index = 0;
    std::set<ElementId> modified_element_ids;
    std::vector<ElementId> visited_element_ids;
    EdgeCase edge_case = EdgeCase::None;
    std::uint64_t next_serial = 0;

    bool operator==(const StateGraph&) const = default;
};

using StateGraphPtr = std::shared_ptr<const StateGraph>;

inline bool is_list(Variant v) {
    return v == Variant::SinglyLinked || v == Variant::DoublyLinked;
}

inline bool is_slotted(Variant v) {
    return !is_list(v);
}

inline bool is_null(const ElementId& id) {
    return id.empty();
}

} // namespace structure_model
