// src/orchestration/concurrent_strategy.cpp
#include "agentorch/orchestration/concurrent_strategy.h"
#include <future>
#include <optional>
#include <spdlog/spdlog.h>

namespace agentorch {

std::vector<const Node*> ConcurrentStrategy::eligible_nodes(const WorkflowGraph& graph) {
    std::vector<const Node*> result;
    for (const auto& node : graph.nodes) {
        if (!node.orchestration.participates || !node.orchestration.parallel) continue;
        if (node.type == node_types::START || node.type == node_types::END) continue;
        if (node.orchestration.has_role(NodeRole::AGGREGATOR)) continue;
        result.push_back(&node);
    }
    return result;
}

const Node* ConcurrentStrategy::find_aggregator(const WorkflowGraph& graph) {
    for (const auto& node : graph.nodes) {
        if (node.orchestration.participates && node.orchestration.has_role(NodeRole::AGGREGATOR)) {
            return &node;
        }
    }
    return nullptr;
}

Value ConcurrentStrategy::run(OrchestrationContext& ctx) {
    const auto branches = eligible_nodes(ctx.graph());
    if (branches.empty()) {
        throw OrchestrationError("Workflow '" + ctx.graph().id + "' has no parallel-eligible nodes");
    }

    ctx.checkpoint();
    const Value input = ctx.input();

    // Fan-out
    std::vector<std::future<Value>> futures;
    futures.reserve(branches.size());
    for (const Node* node : branches) {
        futures.push_back(std::async(std::launch::async, [&ctx, node, &input]() {
            return ctx.run_node(*node, input);
        }));
    }

    // Fan-in: every branch is joined before anything is rethrown
    Value merged = Value::object();
    std::optional<CancelledError> cancelled;
    size_t failed = 0;
    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            merged[branches[i]->id] = futures[i].get();
        } catch (const StepFailedError& e) {
            ++failed;
            spdlog::warn("[{}] branch {} failed: {}", ctx.tracker().id(), branches[i]->id, e.what());
        } catch (const CancelledError& e) {
            cancelled = e;
        }
    }
    if (cancelled) {
        throw *cancelled;
    }
    spdlog::info("[{}] fan-in: {}/{} branches succeeded", ctx.tracker().id(),
                 branches.size() - failed, branches.size());

    if (const Node* aggregator = find_aggregator(ctx.graph())) {
        return ctx.run_node(*aggregator, merged);
    }
    return merged;
}

} // namespace agentorch
