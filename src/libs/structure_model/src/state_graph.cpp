#include <structure_model/state_graph.hpp>
#include <structure_model/names.hpp>
#include <algorithm>
#include <set>
#include <utility>

namespace structure_model {

namespace {

void set_config_error(ExecutionError* error, std::string message, std::vector<ElementId> ids = {}) {
    if (!error) return;
    error->kind = ErrorKind::Configuration;
    error->step_index = -1;
    error->invariants.clear();
    error->element_ids = std::move(ids);
    error->message = std::move(message);
}

std::string capacity_text(const StateGraph& state) {
    if (!state.capacity) return std::to_string(state.size);
    return std::to_string(state.size) + "/" + std::to_string(*state.capacity);
}

std::string element_list_text(const StateGraph& state, const char* separator) {
    std::string out = "[";
    bool first = true;
    for (const auto& id : logical_order(state)) {
        const Element* el = find_element(state, id);
        if (!first) out += separator;
        first = false;
        out += id + ":" + (el ? el->value : std::string("?"));
    }
    out += "]";
    return out;
}

} // namespace

std::optional<StateGraph> build_initial_state(const InitialConfiguration& config, ExecutionError* error) {
    const std::size_t n = config.values.size();

    if (!config.ids.empty() && config.ids.size() != n) {
        set_config_error(error, "ids count " + std::to_string(config.ids.size())
            + " does not match values count " + std::to_string(n));
        return std::nullopt;
    }
    std::set<ElementId> seen;
    for (const auto& id : config.ids) {
        if (id.empty()) {
            set_config_error(error, "element id must not be empty");
            return std::nullopt;
        }
        if (!seen.insert(id).second) {
            set_config_error(error, "duplicate element id '" + id + "'", { id });
            return std::nullopt;
        }
    }

    const Variant v = config.variant;
    if (is_list(v) && config.capacity) {
        set_config_error(error, variant_name(v) + " does not take a capacity");
        return std::nullopt;
    }
    if ((v == Variant::Stack || v == Variant::Queue) && !config.capacity) {
        set_config_error(error, variant_name(v) + " requires a capacity");
        return std::nullopt;
    }
    if (v == Variant::Queue && *config.capacity == 0) {
        set_config_error(error, "QUEUE capacity must be at least 1");
        return std::nullopt;
    }
    if (config.capacity && n > *config.capacity) {
        set_config_error(error, std::to_string(n) + " values exceed capacity "
            + std::to_string(*config.capacity));
        return std::nullopt;
    }
    if (v == Variant::Queue && config.front >= *config.capacity) {
        set_config_error(error, "QUEUE front " + std::to_string(config.front)
            + " outside [0, " + std::to_string(*config.capacity) + ")");
        return std::nullopt;
    }
    if (v != Variant::Queue && config.front != 0) {
        set_config_error(error, "front is only meaningful for QUEUE");
        return std::nullopt;
    }

    StateGraph state;
    state.variant = v;
    state.capacity = config.capacity;
    state.size = n;
    state.step_index = 0;
    state.next_serial = n;

    std::vector<ElementId> ids = config.ids;
    if (ids.empty()) {
        for (std::size_t i = 0; i < n; ++i)
            ids.push_back("n" + std::to_string(i));
    }

    for (std::size_t i = 0; i < n; ++i) {
        Element el;
        el.id = ids[i];
        el.value = config.values[i];
        if (is_list(v)) {
            el.next_id = i + 1 < n ? ids[i + 1] : ElementId{};
            if (v == Variant::DoublyLinked)
                el.prev_id = i > 0 ? ids[i - 1] : ElementId{};
        } else if (v == Variant::Queue) {
            el.slot = (config.front + i) % *config.capacity;
        } else {
            el.slot = i;
        }
        state.elements.emplace(el.id, std::move(el));
    }

    if (is_list(v) && n > 0) {
        state.boundary.head_id = ids.front();
        state.boundary.tail_id = ids.back();
    }
    if (v == Variant::Stack)
        state.boundary.top = static_cast<long>(n) - 1;
    if (v == Variant::Queue) {
        state.boundary.front = config.front;
        state.boundary.rear = (config.front + n) % *config.capacity;
    }
    return state;
}

const Element* find_element(const StateGraph& state, const ElementId& id) {
    if (id.empty()) return nullptr;
    auto it = state.elements.find(id);
    if (it == state.elements.end()) return nullptr;
    return &it->second;
}

Element* find_element(StateGraph& state, const ElementId& id) {
    if (id.empty()) return nullptr;
    auto it = state.elements.find(id);
    if (it == state.elements.end()) return nullptr;
    return &it->second;
}

ElementId element_at_slot(const StateGraph& state, std::size_t slot) {
    for (const auto& [id, el] : state.elements)
        if (el.slot == slot) return id;
    return {};
}

std::size_t queue_slot(const StateGraph& state, std::size_t logical_index) {
    const std::size_t cap = state.capacity.value_or(0);
    if (cap == 0) return 0;
    return (state.boundary.front + logical_index) % cap;
}

std::vector<ElementId> logical_order(const StateGraph& state) {
    std::vector<ElementId> out;
    if (is_list(state.variant)) {
        ElementId cur = state.boundary.head_id;
        for (std::size_t hops = 0; hops <= state.size && !cur.empty(); ++hops) {
            const Element* el = find_element(state, cur);
            if (!el) break;
            out.push_back(cur);
            cur = el->next_id;
        }
        return out;
    }
    if (state.variant == Variant::Queue) {
        for (std::size_t i = 0; i < state.size; ++i) {
            ElementId id = element_at_slot(state, queue_slot(state, i));
            if (!id.empty()) out.push_back(std::move(id));
        }
        return out;
    }
    std::vector<std::pair<std::size_t, ElementId>> by_slot;
    for (const auto& [id, el] : state.elements)
        by_slot.emplace_back(el.slot, id);
    std::sort(by_slot.begin(), by_slot.end());
    for (auto& entry : by_slot)
        out.push_back(std::move(entry.second));
    return out;
}

std::string describe_state(const StateGraph& state) {
    std::string out = variant_name(state.variant) + " size=" + capacity_text(state) + " ";
    switch (state.variant) {
    case Variant::SinglyLinked:
        out += element_list_text(state, " -> ");
        break;
    case Variant::DoublyLinked:
        out += element_list_text(state, " <-> ");
        break;
    default:
        out += element_list_text(state, ", ");
        break;
    }
    if (is_list(state.variant)) {
        out += " head=" + (state.boundary.head_id.empty() ? std::string("null") : state.boundary.head_id);
        out += " tail=" + (state.boundary.tail_id.empty() ? std::string("null") : state.boundary.tail_id);
    } else if (state.variant == Variant::Stack) {
        out += " top=" + std::to_string(state.boundary.top);
    } else if (state.variant == Variant::Queue) {
        out += " front=" + std::to_string(state.boundary.front);
        out += " rear=" + std::to_string(state.boundary.rear);
    }
    if (state.edge_case != EdgeCase::None)
        out += " edge_case=" + edge_case_name(state.edge_case);
    return out;
}

} // namespace structure_model
