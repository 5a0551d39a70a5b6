#include <plan_loaders/json_loader.hpp>
#include <structure_model/names.hpp>
#include <nlohmann/json.hpp>
#include <fstream>

namespace plan_loaders {

namespace {

bool fail(std::string* error, const std::string& message) {
    if (error) *error = message;
    return false;
}

// Values are kept as text; numbers and booleans use their JSON spelling.
bool parse_value(const nlohmann::json& v, structure_model::Value& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return true;
    }
    if (v.is_number() || v.is_boolean()) {
        out = v.dump();
        return true;
    }
    return false;
}

bool parse_initial(const nlohmann::json& j, structure_model::InitialConfiguration& out, std::string* error) {
    if (!j.is_object()) return fail(error, "'initial' must be an object");
    if (!j.contains("variant") || !j["variant"].is_string())
        return fail(error, "'initial.variant' must be a string");
    const auto variant = structure_model::variant_from_name(j["variant"].get<std::string>());
    if (!variant) return fail(error, "unknown variant '" + j["variant"].get<std::string>() + "'");
    out.variant = *variant;

    if (j.contains("values")) {
        if (!j["values"].is_array()) return fail(error, "'initial.values' must be an array");
        for (const auto& v : j["values"]) {
            structure_model::Value value;
            if (!parse_value(v, value)) return fail(error, "'initial.values' holds a non-scalar entry");
            out.values.push_back(std::move(value));
        }
    }
    if (j.contains("ids")) {
        if (!j["ids"].is_array()) return fail(error, "'initial.ids' must be an array");
        for (const auto& id : j["ids"]) {
            if (!id.is_string()) return fail(error, "'initial.ids' entries must be strings");
            out.ids.push_back(id.get<std::string>());
        }
    }
    if (j.contains("capacity") && !j["capacity"].is_null()) {
        if (!j["capacity"].is_number_unsigned()) return fail(error, "'initial.capacity' must be a non-negative integer");
        out.capacity = j["capacity"].get<std::size_t>();
    }
    if (j.contains("front")) {
        if (!j["front"].is_number_unsigned()) return fail(error, "'initial.front' must be a non-negative integer");
        out.front = j["front"].get<std::size_t>();
    }
    return true;
}

bool parse_step(const nlohmann::json& s, structure_model::Step& step, std::string* error) {
    if (!s.is_object()) return fail(error, "steps must be objects");
    if (!s.contains("step_index") || !s["step_index"].is_number_integer())
        return fail(error, "step is missing an integer 'step_index'");
    step.step_index = s["step_index"].get<long>();
    if (!s.contains("operation") || !s["operation"].is_string())
        return fail(error, "step " + std::to_string(step.step_index) + " is missing 'operation'");
    step.operation_name = s["operation"].get<std::string>();
    step.kind = structure_model::operation_from_name(step.operation_name);

    if (s.contains("parameters")) {
        const auto& p = s["parameters"];
        if (!p.is_object())
            return fail(error, "step " + std::to_string(step.step_index) + " 'parameters' must be an object");
        if (p.contains("value")) {
            structure_model::Value value;
            if (!parse_value(p["value"], value))
                return fail(error, "step " + std::to_string(step.step_index) + " has a non-scalar value");
            step.parameters.value = std::move(value);
        }
        if (p.contains("position")) {
            if (!p["position"].is_number_integer())
                return fail(error, "step " + std::to_string(step.step_index) + " position must be an integer");
            step.parameters.position = p["position"].get<std::int64_t>();
        }
        step.parameters.element_id = p.contains("element_id") && p["element_id"].is_string()
            ? p["element_id"].get<std::string>() : "";
        step.parameters.target_id = p.contains("target_id") && p["target_id"].is_string()
            ? p["target_id"].get<std::string>() : "";
        step.parameters.new_id = p.contains("new_id") && p["new_id"].is_string()
            ? p["new_id"].get<std::string>() : "";
    }

    if (s.contains("declared_invariants") && s["declared_invariants"].is_array()) {
        for (const auto& name : s["declared_invariants"])
            if (name.is_string()) step.declared_invariants.push_back(name.get<std::string>());
    }
    step.edge_case_tag = s.contains("edge_case_tag") && s["edge_case_tag"].is_string()
        ? s["edge_case_tag"].get<std::string>() : "";
    return true;
}

std::optional<structure_model::ExecutionPlan> parse_plan_json(const nlohmann::json& j, std::string* error) {
    structure_model::ExecutionPlan plan;
    if (!j.is_object()) {
        fail(error, "plan must be a JSON object");
        return std::nullopt;
    }
    if (!j.contains("initial")) {
        fail(error, "plan is missing 'initial'");
        return std::nullopt;
    }
    if (!parse_initial(j["initial"], plan.initial, error)) return std::nullopt;

    if (j.contains("steps")) {
        if (!j["steps"].is_array()) {
            fail(error, "'steps' must be an array");
            return std::nullopt;
        }
        for (const auto& s : j["steps"]) {
            structure_model::Step step;
            if (!parse_step(s, step, error)) return std::nullopt;
            plan.steps.push_back(std::move(step));
        }
    }
    if (j.contains("name") && j["name"].is_string()) plan.name = j["name"].get<std::string>();
    return plan;
}

} // namespace

std::optional<structure_model::ExecutionPlan> load_plan_from_json(std::istream& in, std::string* error) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_plan_json(j, error);
    } catch (const nlohmann::json::exception& e) {
        fail(error, std::string("invalid JSON: ") + e.what());
        return std::nullopt;
    }
}

std::optional<structure_model::ExecutionPlan> load_plan_from_json_file(const std::string& path, std::string* error) {
    std::ifstream f(path);
    if (!f) {
        fail(error, "cannot open '" + path + "'");
        return std::nullopt;
    }
    return load_plan_from_json(f, error);
}

} // namespace plan_loaders
