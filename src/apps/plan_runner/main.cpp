// Plan runner: loads an execution plan, steps through it and prints every state.
#include <execution/engine.hpp>
#include <execution/logging.hpp>
#include <plan_loaders/demo_plans.hpp>
#include <plan_loaders/json_loader.hpp>
#include <plan_loaders/snapshot_json.hpp>
#include <structure_model/names.hpp>
#include <structure_model/state_graph.hpp>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

namespace {

struct Options {
    std::string plan_path;
    std::string demo_name = "singly";
    std::string log_file;
    bool json = false;
    bool verbose = false;
    std::optional<long> goto_step;
};

void print_usage() {
    (void)fprintf(stderr,
        "usage: plan_runner [--plan FILE | --demo NAME] [--json] [--goto N] [--log-file PATH] [--verbose]\n"
        "demos:");
    for (const auto& name : plan_loaders::demo_plan_names())
        (void)fprintf(stderr, " %s", name.c_str());
    (void)fprintf(stderr, "\n");
}

bool parse_options(int argc, char* argv[], Options& out) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--plan" && has_value) {
            out.plan_path = argv[++i];
        } else if (arg == "--demo" && has_value) {
            out.demo_name = argv[++i];
        } else if (arg == "--log-file" && has_value) {
            out.log_file = argv[++i];
        } else if (arg == "--goto" && has_value) {
            char* end = nullptr;
            const long k = std::strtol(argv[++i], &end, 10);
            if (!end || *end != '\0') return false;
            out.goto_step = k;
        } else if (arg == "--json") {
            out.json = true;
        } else if (arg == "--verbose") {
            out.verbose = true;
        } else {
            return false;
        }
    }
    return true;
}

void print_state(const structure_model::StateGraph& state, bool json) {
    if (json)
        std::printf("%s\n", plan_loaders::state_to_json(state).dump().c_str());
    else
        std::printf("[%ld] %s\n", state.step_index, structure_model::describe_state(state).c_str());
}

void print_transition(const execution::StateTransitionResult& result, bool json) {
    if (json) {
        std::printf("%s\n", plan_loaders::transition_to_json(result).dump().c_str());
        return;
    }
    if (result.success) {
        print_state(*result.new_state, false);
        return;
    }
    std::printf("step %ld rejected:\n", result.step_index);
    for (const auto& e : result.errors)
        std::printf("  %s: %s\n", structure_model::error_kind_name(e.kind).c_str(), e.message.c_str());
}

} // namespace

int main(int argc, char* argv[])
{
    Options options;
    if (!parse_options(argc, argv, options)) {
        print_usage();
        return 2;
    }

    std::optional<structure_model::ExecutionPlan> plan;
    if (!options.plan_path.empty()) {
        std::string error;
        plan = plan_loaders::load_plan_from_json_file(options.plan_path, &error);
        if (!plan) {
            (void)fprintf(stderr, "failed to load %s: %s\n", options.plan_path.c_str(), error.c_str());
            return 2;
        }
    } else {
        plan = plan_loaders::generate_demo_plan(options.demo_name);
        if (!plan) {
            (void)fprintf(stderr, "unknown demo '%s'\n", options.demo_name.c_str());
            print_usage();
            return 2;
        }
    }

    execution::EngineConfig config;
    if (!options.log_file.empty())
        config.logger = execution::make_file_logger("plan_runner", options.log_file);
    if (options.verbose) {
        if (config.logger)
            config.logger->set_level(spdlog::level::debug);
        else
            spdlog::set_level(spdlog::level::debug);
    }

    execution::Engine engine(config);
    const auto init = engine.initialize(std::move(*plan));
    if (!init.success) {
        for (const auto& e : init.errors) {
            (void)fprintf(stderr, "%s (step %ld): %s\n", structure_model::error_kind_name(e.kind).c_str(),
                e.step_index, e.message.c_str());
        }
        return 2;
    }

    print_state(*init.initial_state, options.json);
    const auto results = engine.apply_remaining();
    for (const auto& result : results)
        print_transition(result, options.json);

    if (options.goto_step) {
        const auto nav = engine.go_to_step(*options.goto_step);
        if (!nav.success) {
            (void)fprintf(stderr, "%s: %s\n", structure_model::error_kind_name(nav.error->kind).c_str(),
                nav.error->message.c_str());
            return 1;
        }
        print_state(*nav.state, options.json);
    }

    if (!options.json) {
        std::printf("%zu of %zu step(s) committed, %zu rejection(s)\n", engine.history_size() - 1,
            engine.step_count(), engine.rejections().size());
    }
    return 0;
}
