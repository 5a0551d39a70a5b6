#include <plan_loaders/demo_plans.hpp>
#include <structure_validation/invariants.hpp>
#include <initializer_list>

namespace plan_loaders {

using structure_model::ExecutionPlan;
using structure_model::OperationKind;
using structure_model::Step;
using structure_model::Variant;

namespace {

struct PlanBuilder {
    ExecutionPlan plan;

    PlanBuilder(const char* name, Variant variant, std::initializer_list<const char*> values)
    {
        plan.name = name;
        plan.initial.variant = variant;
        for (auto v : values) plan.initial.values.emplace_back(v);
    }

    Step& add(OperationKind kind, const char* invariant_name, const char* edge_case = "") {
        Step step;
        step.step_index = static_cast<long>(plan.steps.size());
        step.kind = kind;
        step.declared_invariants.emplace_back(invariant_name);
        step.edge_case_tag = edge_case;
        plan.steps.push_back(std::move(step));
        return plan.steps.back();
    }

    void value_step(OperationKind kind, const char* value, const char* invariant_name, const char* edge_case = "") {
        add(kind, invariant_name, edge_case).parameters.value = value;
    }

    void position_step(OperationKind kind, long position, const char* invariant_name, const char* value = nullptr,
        const char* edge_case = "")
    {
        auto& step = add(kind, invariant_name, edge_case);
        step.parameters.position = position;
        if (value) step.parameters.value = value;
    }
};

ExecutionPlan array_demo() {
    using namespace structure_validation::invariant;
    PlanBuilder b("array insert and delete", Variant::Array, { "3", "8", "1" });
    b.plan.initial.capacity = 5;
    b.position_step(OperationKind::InsertAt, 1, contiguous_slots, "6");
    b.position_step(OperationKind::Access, 2, contiguous_slots);
    b.value_step(OperationKind::DeleteByValue, "8", contiguous_slots);
    b.value_step(OperationKind::InsertTail, "4", size_within_capacity);
    b.value_step(OperationKind::InsertTail, "9", size_within_capacity);
    b.value_step(OperationKind::InsertTail, "2", size_within_capacity, "OVERFLOW");
    return b.plan;
}

ExecutionPlan singly_demo() {
    using namespace structure_validation::invariant;
    PlanBuilder b("singly linked list walkthrough", Variant::SinglyLinked, { "A", "B" });
    b.plan.initial.ids = { "A", "B" };
    b.position_step(OperationKind::InsertAt, 1, acyclic, "C");
    b.value_step(OperationKind::InsertHead, "Z", boundary_ids_valid);
    b.add(OperationKind::Traverse, traversal_matches_size);
    b.value_step(OperationKind::DeleteByValue, "C", no_leaks);
    b.add(OperationKind::Reverse, acyclic);
    b.value_step(OperationKind::Search, "Q", acyclic, "NOT_FOUND");
    return b.plan;
}

ExecutionPlan doubly_demo() {
    using namespace structure_validation::invariant;
    PlanBuilder b("doubly linked list walkthrough", Variant::DoublyLinked, { "10", "20", "30" });
    b.value_step(OperationKind::InsertTail, "40", prev_next_symmetric);
    b.position_step(OperationKind::DeleteAt, 1, prev_next_symmetric);
    b.add(OperationKind::DeleteHead, prev_next_symmetric);
    b.add(OperationKind::Reverse, prev_next_symmetric);
    b.position_step(OperationKind::UpdateAt, 0, links_valid, "45");
    return b.plan;
}

ExecutionPlan stack_demo() {
    using namespace structure_validation::invariant;
    PlanBuilder b("stack push and pop", Variant::Stack, { "5", "9" });
    b.plan.initial.capacity = 3;
    b.value_step(OperationKind::Push, "7", top_in_range);
    b.add(OperationKind::Peek, top_in_range);
    b.add(OperationKind::Pop, top_in_range);
    b.add(OperationKind::Pop, top_in_range);
    b.add(OperationKind::Pop, top_in_range);
    b.add(OperationKind::Pop, non_empty_for_removal, "UNDERFLOW");
    return b.plan;
}

ExecutionPlan queue_demo() {
    using namespace structure_validation::invariant;
    PlanBuilder b("circular queue", Variant::Queue, { "1", "2" });
    b.plan.initial.capacity = 4;
    b.add(OperationKind::Dequeue, window_addressing);
    b.value_step(OperationKind::Enqueue, "3", queue_size_consistent);
    b.value_step(OperationKind::Enqueue, "4", queue_size_consistent);
    b.value_step(OperationKind::Enqueue, "5", queue_size_consistent);
    b.add(OperationKind::Traverse, window_addressing);
    b.value_step(OperationKind::Enqueue, "6", size_within_capacity, "OVERFLOW");
    return b.plan;
}

} // namespace

std::vector<std::string> demo_plan_names() {
    return { "array", "singly", "doubly", "stack", "queue" };
}

std::optional<ExecutionPlan> generate_demo_plan(const std::string& name) {
    if (name == "array") return array_demo();
    if (name == "singly") return singly_demo();
    if (name == "doubly") return doubly_demo();
    if (name == "stack") return stack_demo();
    if (name == "queue") return queue_demo();
    return std::nullopt;
}

} // namespace plan_loaders
