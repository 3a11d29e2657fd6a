// include/agentorch/orchestration/sequential_strategy.h
#ifndef AGENTORCH_ORCHESTRATION_SEQUENTIAL_STRATEGY_H
#define AGENTORCH_ORCHESTRATION_SEQUENTIAL_STRATEGY_H

#include "agentorch/orchestration/strategy.h"

namespace agentorch {

// Pipeline in topological order; each output feeds the next node.
class SequentialStrategy : public OrchestrationStrategy {
public:
    OrchestrationType type() const override { return OrchestrationType::SEQUENTIAL; }
    Value run(OrchestrationContext& ctx) override;
};

} // namespace agentorch

#endif // AGENTORCH_ORCHESTRATION_SEQUENTIAL_STRATEGY_H
