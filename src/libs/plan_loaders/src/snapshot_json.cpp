#include <plan_loaders/snapshot_json.hpp>
#include <structure_model/names.hpp>
#include <structure_model/state_graph.hpp>

namespace plan_loaders {

namespace {

nlohmann::json id_or_null(const structure_model::ElementId& id) {
    if (id.empty()) return nullptr;
    return id;
}

} // namespace

nlohmann::json state_to_json(const structure_model::StateGraph& state) {
    nlohmann::json j;
    j["variant"] = structure_model::variant_name(state.variant);
    j["step_index"] = state.step_index;
    j["size"] = state.size;
    j["capacity"] = state.capacity ? nlohmann::json(*state.capacity) : nlohmann::json(nullptr);
    j["edge_case"] = structure_model::edge_case_name(state.edge_case);

    nlohmann::json elements = nlohmann::json::array();
    for (const auto& id : structure_model::logical_order(state)) {
        const auto* el = structure_model::find_element(state, id);
        nlohmann::json e;
        e["id"] = el->id;
        e["value"] = el->value;
        if (structure_model::is_list(state.variant)) {
            e["next"] = id_or_null(el->next_id);
            if (state.variant == structure_model::Variant::DoublyLinked)
                e["prev"] = id_or_null(el->prev_id);
        } else {
            e["slot"] = el->slot;
        }
        elements.push_back(std::move(e));
    }
    j["elements"] = std::move(elements);

    nlohmann::json boundary;
    if (structure_model::is_list(state.variant)) {
        boundary["head"] = id_or_null(state.boundary.head_id);
        boundary["tail"] = id_or_null(state.boundary.tail_id);
    } else if (state.variant == structure_model::Variant::Stack) {
        boundary["top"] = state.boundary.top;
    } else if (state.variant == structure_model::Variant::Queue) {
        boundary["front"] = state.boundary.front;
        boundary["rear"] = state.boundary.rear;
    }
    j["boundary"] = boundary.is_null() ? nlohmann::json::object() : boundary;

    j["modified"] = nlohmann::json::array();
    for (const auto& id : state.modified_element_ids) j["modified"].push_back(id);
    j["visited"] = state.visited_element_ids;
    return j;
}

nlohmann::json transition_to_json(const execution::StateTransitionResult& result) {
    nlohmann::json j;
    j["success"] = result.success;
    j["step_index"] = result.step_index;
    j["invariants_preserved"] = result.invariants_preserved;
    j["edge_case"] = structure_model::edge_case_name(result.edge_case);
    j["new_state"] = result.new_state ? state_to_json(*result.new_state) : nlohmann::json(nullptr);

    nlohmann::json errors = nlohmann::json::array();
    for (const auto& e : result.errors) {
        errors.push_back({
            { "kind", structure_model::error_kind_name(e.kind) },
            { "step_index", e.step_index },
            { "invariants", e.invariants },
            { "element_ids", e.element_ids },
            { "message", e.message },
        });
    }
    j["errors"] = std::move(errors);
    return j;
}

} // namespace plan_loaders
