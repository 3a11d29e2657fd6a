// src/orchestration/sequential_strategy.cpp
#include "agentorch/orchestration/sequential_strategy.h"
#include "agentorch/graph/graph_traversal.h"

namespace agentorch {

Value SequentialStrategy::run(OrchestrationContext& ctx) {
    // 有环时抛 OrchestrationError，此时还没有任何 step
    const auto order = topological_order(ctx.graph());

    Value data = ctx.input();
    for (const Node* node : order) {
        data = ctx.run_node(*node, data);
    }
    return data;
}

} // namespace agentorch
