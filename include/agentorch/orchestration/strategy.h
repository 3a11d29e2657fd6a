// include/agentorch/orchestration/strategy.h
#ifndef AGENTORCH_ORCHESTRATION_STRATEGY_H
#define AGENTORCH_ORCHESTRATION_STRATEGY_H

#include "agentorch/orchestration/orchestration_context.h"
#include <string>

namespace agentorch {

// Execution policy for one orchestration type. Strategies hold no per-run
// state; one instance serves every execution.
class OrchestrationStrategy {
public:
    virtual ~OrchestrationStrategy() = default;

    virtual OrchestrationType type() const = 0;
    std::string name() const { return to_string(type()); }

    // Walks the graph and returns the terminal output. Throws StepFailedError for
    // failures already recorded, other EngineErrors for run-level failures and
    // CancelledError when the execution is cancelled.
    virtual Value run(OrchestrationContext& ctx) = 0;
};

} // namespace agentorch

#endif // AGENTORCH_ORCHESTRATION_STRATEGY_H
