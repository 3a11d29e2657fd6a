// src/orchestration/handoff_strategy.cpp
#include "agentorch/orchestration/handoff_strategy.h"
#include "agentorch/graph/graph_traversal.h"
#include <spdlog/spdlog.h>
#include <unordered_set>

namespace agentorch {

const Connection* HandoffStrategy::choose_connection(OrchestrationContext& ctx, const Node& from,
                                                     const Value& output) const {
    auto& hook = ctx.hooks().handoff_condition;
    for (const Connection* connection : ctx.graph().outgoing(from.id)) {
        bool follow = true;
        if (hook) {
            try {
                follow = hook->should_follow(*connection, output);
            } catch (const EngineError&) {
                throw;
            } catch (const std::exception& e) {
                throw OrchestrationError("Handoff condition on '" + connection->id + "' failed: " + e.what());
            }
        }
        if (follow) {
            return connection;
        }
    }
    return nullptr;
}

Value HandoffStrategy::run(OrchestrationContext& ctx) {
    const Node* current = find_entry_node(ctx.graph());
    if (!current) {
        throw OrchestrationError("Handoff workflow '" + ctx.graph().id +
                                 "' has neither a StartNode nor a coordinator node");
    }

    std::unordered_set<NodeId> visited;
    Value data = ctx.input();
    while (current) {
        if (!visited.insert(current->id).second) {
            spdlog::info("[{}] handoff revisits {}, walk complete", ctx.tracker().id(), current->id);
            break;
        }
        data = ctx.run_node(*current, data);

        const Connection* next = choose_connection(ctx, *current, data);
        current = next ? &ctx.require_node(next->to_node) : nullptr;
    }
    return data;
}

} // namespace agentorch
