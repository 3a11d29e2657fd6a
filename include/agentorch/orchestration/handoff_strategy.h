// include/agentorch/orchestration/handoff_strategy.h
#ifndef AGENTORCH_ORCHESTRATION_HANDOFF_STRATEGY_H
#define AGENTORCH_ORCHESTRATION_HANDOFF_STRATEGY_H

#include "agentorch/orchestration/strategy.h"

namespace agentorch {

// Single-path walk from the entry node. After each node the condition hook picks
// exactly one outgoing connection; the walk ends when none is accepted or when
// a node would be visited a second time.
class HandoffStrategy : public OrchestrationStrategy {
public:
    OrchestrationType type() const override { return OrchestrationType::HANDOFF; }
    Value run(OrchestrationContext& ctx) override;

private:
    const Connection* choose_connection(OrchestrationContext& ctx, const Node& from, const Value& output) const;
};

} // namespace agentorch

#endif // AGENTORCH_ORCHESTRATION_HANDOFF_STRATEGY_H
