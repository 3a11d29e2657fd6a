// include/agentorch/orchestration/magentic_strategy.h
#ifndef AGENTORCH_ORCHESTRATION_MAGENTIC_STRATEGY_H
#define AGENTORCH_ORCHESTRATION_MAGENTIC_STRATEGY_H

#include "agentorch/orchestration/strategy.h"

namespace agentorch {

// Dynamic selection: the node selector hook picks the next participating node
// until it returns nothing. At most settings().magentic_max_iterations nodes run;
// a further selection fails the run with OrchestrationError.
class MagenticStrategy : public OrchestrationStrategy {
public:
    OrchestrationType type() const override { return OrchestrationType::MAGENTIC; }
    Value run(OrchestrationContext& ctx) override;
};

} // namespace agentorch

#endif // AGENTORCH_ORCHESTRATION_MAGENTIC_STRATEGY_H
