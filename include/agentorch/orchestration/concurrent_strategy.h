// include/agentorch/orchestration/concurrent_strategy.h
#ifndef AGENTORCH_ORCHESTRATION_CONCURRENT_STRATEGY_H
#define AGENTORCH_ORCHESTRATION_CONCURRENT_STRATEGY_H

#include "agentorch/orchestration/strategy.h"
#include <vector>

namespace agentorch {

// Fan-out over every parallel-eligible node with the same input, fan-in into an
// object keyed by node id. Branch failures are isolated. An aggregator-role
// node, if present, runs on the merged object as the fan-in step.
class ConcurrentStrategy : public OrchestrationStrategy {
public:
    OrchestrationType type() const override { return OrchestrationType::CONCURRENT; }
    Value run(OrchestrationContext& ctx) override;

    static std::vector<const Node*> eligible_nodes(const WorkflowGraph& graph);
    static const Node* find_aggregator(const WorkflowGraph& graph);
};

} // namespace agentorch

#endif // AGENTORCH_ORCHESTRATION_CONCURRENT_STRATEGY_H
