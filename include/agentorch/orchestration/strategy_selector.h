// include/agentorch/orchestration/strategy_selector.h
#ifndef AGENTORCH_ORCHESTRATION_STRATEGY_SELECTOR_H
#define AGENTORCH_ORCHESTRATION_STRATEGY_SELECTOR_H

#include "agentorch/orchestration/strategy.h"
#include <map>
#include <memory>

namespace agentorch {

// Orchestration type -> strategy. Comes with all six built-in strategies;
// any type without a strategy resolves to the custom one.
class StrategySelector {
public:
    StrategySelector();

    void register_strategy(std::shared_ptr<OrchestrationStrategy> strategy);

    // Never null.
    std::shared_ptr<OrchestrationStrategy> resolve(OrchestrationType type) const;

private:
    std::map<OrchestrationType, std::shared_ptr<OrchestrationStrategy>> strategies_;
};

} // namespace agentorch

#endif // AGENTORCH_ORCHESTRATION_STRATEGY_SELECTOR_H
