// src/orchestration/magentic_strategy.cpp
#include "agentorch/orchestration/magentic_strategy.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace agentorch {

Value MagenticStrategy::run(OrchestrationContext& ctx) {
    auto selector = ctx.hooks().node_selector;
    if (!selector) {
        throw OrchestrationError("Magentic orchestration requires a node selector");
    }

    // 起止节点只是透传，不参与选择
    std::vector<const Node*> candidates;
    for (const auto& node : ctx.graph().nodes) {
        if (!node.orchestration.participates) continue;
        if (node.type == node_types::START || node.type == node_types::END) continue;
        candidates.push_back(&node);
    }

    const int max_iterations = ctx.settings().magentic_max_iterations;
    Value data = ctx.input();
    int iterations = 0;
    while (true) {
        ctx.checkpoint();

        std::optional<NodeId> selected;
        try {
            selected = selector->select(candidates, data, ctx.steps());
        } catch (const EngineError&) {
            throw;
        } catch (const std::exception& e) {
            throw OrchestrationError(std::string("Node selector failed: ") + e.what());
        }
        if (!selected) {
            break;
        }
        if (iterations >= max_iterations) {
            throw OrchestrationError("Magentic selection exceeded " + std::to_string(max_iterations) +
                                     " iterations (next: " + *selected + ")");
        }

        auto it = std::find_if(candidates.begin(), candidates.end(),
                               [&](const Node* n) { return n->id == *selected; });
        if (it == candidates.end()) {
            throw OrchestrationError("Node selector chose a non-participating node: " + *selected);
        }

        spdlog::debug("[{}] magentic iteration {} -> {}", ctx.tracker().id(), iterations + 1, *selected);
        data = ctx.run_node(**it, data);
        ++iterations;
    }
    return data;
}

} // namespace agentorch
