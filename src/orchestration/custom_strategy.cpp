// src/orchestration/custom_strategy.cpp
#include "agentorch/orchestration/custom_strategy.h"
#include "agentorch/graph/graph_traversal.h"
#include "agentorch/utils/value_merge.h"
#include <algorithm>
#include <chrono>
#include <spdlog/spdlog.h>
#include <thread>
#include <unordered_set>

namespace agentorch {

Value CustomStrategy::run(OrchestrationContext& ctx) {
    const auto& graph = ctx.graph();
    if (graph.script.empty()) {
        return run_graph(ctx);
    }

    ScriptState state;
    state.data = ctx.input();
    execute_steps(ctx, graph.script, state);
    return state.data;
}

// 没有脚本时：从 StartNode 深度优先遍历，访问过的节点不再执行
Value CustomStrategy::run_graph(OrchestrationContext& ctx) {
    const auto& graph = ctx.graph();
    std::vector<const Node*> roots = start_nodes(graph);
    if (roots.empty()) {
        if (const Node* entry = find_entry_node(graph)) {
            roots.push_back(entry);
        } else if (!graph.nodes.empty()) {
            roots.push_back(&graph.nodes.front());
        } else {
            throw OrchestrationError("Workflow '" + graph.id + "' has no nodes to run");
        }
    }

    std::vector<std::pair<const Node*, Value>> stack;
    for (auto it = roots.rbegin(); it != roots.rend(); ++it) {
        stack.emplace_back(*it, ctx.input());
    }

    std::unordered_set<NodeId> visited;
    Value last = ctx.input();
    while (!stack.empty()) {
        auto [node, input] = std::move(stack.back());
        stack.pop_back();
        if (!visited.insert(node->id).second) continue;

        last = ctx.run_node(*node, input);
        auto next = successors(graph, node->id);
        for (auto it = next.rbegin(); it != next.rend(); ++it) {
            if (!visited.count((*it)->id)) {
                stack.emplace_back(*it, last);
            }
        }
    }
    return last;
}

void CustomStrategy::execute_steps(OrchestrationContext& ctx, const std::vector<ScriptStep>& steps,
                                   ScriptState& state) {
    std::vector<const ScriptStep*> ordered;
    for (const auto& step : steps) {
        if (step.enabled) ordered.push_back(&step);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const ScriptStep* a, const ScriptStep* b) { return a->order < b->order; });

    for (const ScriptStep* step : ordered) {
        ctx.checkpoint();
        const bool abort_on_error = step->parameters.value("on_error", std::string("continue")) == "abort";
        spdlog::debug("[{}] script step {} ({})", ctx.tracker().id(), step->id, to_string(step->type));

        try {
            switch (step->type) {
                case ScriptStepType::AGENT_EXECUTION: execute_agent_step(ctx, *step, state); break;
                case ScriptStepType::WAIT_CONDITION:  execute_wait_step(ctx, *step, state); break;
                case ScriptStepType::MERGE_RESULTS:   execute_merge_step(ctx, *step, state); break;
                case ScriptStepType::BRANCH:          execute_branch_step(ctx, *step, state); break;
                case ScriptStepType::LOOP:            execute_loop_step(ctx, *step, state); break;
            }
        } catch (const CancelledError&) {
            throw;
        } catch (const StepFailedError& e) {
            // 节点失败已记录在 step 上
            if (e.run_fatal() || abort_on_error) {
                throw StepFailedError(e, e.node_id(), e.step_id(), true);
            }
            spdlog::warn("[{}] script step {} failed, continuing: {}", ctx.tracker().id(), step->id, e.what());
        } catch (const EngineError& e) {
            ctx.tracker().add_error(make_error(e, std::nullopt, step->id));
            if (abort_on_error) {
                throw StepFailedError(e, std::nullopt, step->id, true);
            }
            spdlog::warn("[{}] script step {} failed, continuing: {}", ctx.tracker().id(), step->id, e.what());
        } catch (const std::exception& e) {
            OrchestrationError error("Script step '" + step->id + "' failed: " + e.what());
            ctx.tracker().add_error(make_error(error, std::nullopt, step->id));
            if (abort_on_error) {
                throw StepFailedError(error, std::nullopt, step->id, true);
            }
            spdlog::warn("[{}] {}", ctx.tracker().id(), error.what());
        }
    }
}

bool CustomStrategy::evaluate(OrchestrationContext& ctx, const ScriptStep& step, const ScriptState& state) const {
    auto& hook = ctx.hooks().script_condition;
    if (!hook) {
        return true;
    }
    Value view = as_object(state.data);
    view["results"] = state.results;
    return hook->evaluate(step, view);
}

void CustomStrategy::execute_agent_step(OrchestrationContext& ctx, const ScriptStep& step, ScriptState& state) {
    for (const auto& node_id : step.node_ids) {
        state.data = ctx.run_node(ctx.require_node(node_id), state.data);
    }
    state.results[step.id] = state.data;
}

void CustomStrategy::execute_wait_step(OrchestrationContext& ctx, const ScriptStep& step, ScriptState& state) {
    const int timeout_ms = step.parameters.value("timeout_ms", ctx.settings().wait_timeout_ms);
    const int poll_ms = std::max(1, step.parameters.value("poll_interval_ms", ctx.settings().poll_interval_ms));
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    while (!evaluate(ctx, step, state)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            throw OrchestrationError("Wait condition '" + step.id + "' timed out after " +
                                     std::to_string(timeout_ms) + " ms");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(poll_ms));
        ctx.checkpoint();
    }
    state.results[step.id] = state.data;
}

void CustomStrategy::execute_merge_step(OrchestrationContext&, const ScriptStep& step, ScriptState& state) {
    MergePolicy policy;
    policy.default_strategy = step.parameters.value("strategy", std::string("deep_merge"));
    if (!is_known_merge_strategy(policy.default_strategy)) {
        throw ValidationError("Merge step '" + step.id + "' uses unknown strategy: " + policy.default_strategy);
    }

    auto sources = step.parameters.find("sources");
    if (sources == step.parameters.end() || !sources->is_array() || sources->empty()) {
        throw ValidationError("Merge step '" + step.id + "' needs a non-empty 'sources' list");
    }

    Value merged = Value::object();
    for (const auto& source : *sources) {
        const std::string source_id = source.is_string() ? source.get<std::string>() : source.dump();
        auto it = state.results.find(source_id);
        if (it == state.results.end()) {
            throw OrchestrationError("Merge step '" + step.id + "' references step without output: " + source_id);
        }
        merge_values(merged, as_object(*it), policy);
    }
    state.data = merged;
    state.results[step.id] = merged;
}

void CustomStrategy::execute_branch_step(OrchestrationContext& ctx, const ScriptStep& step, ScriptState& state) {
    const bool taken = evaluate(ctx, step, state);
    execute_steps(ctx, taken ? step.steps : step.else_steps, state);
    state.results[step.id] = state.data;
}

void CustomStrategy::execute_loop_step(OrchestrationContext& ctx, const ScriptStep& step, ScriptState& state) {
    const int max_iterations = step.parameters.value("max_iterations", 10);
    int i = 0;
    for (; i < max_iterations; ++i) {
        if (step.condition && !evaluate(ctx, step, state)) {
            break;
        }
        execute_steps(ctx, step.steps, state);
    }
    spdlog::debug("[{}] loop {} ran {} iteration(s)", ctx.tracker().id(), step.id, i);
    state.results[step.id] = state.data;
}

} // namespace agentorch
