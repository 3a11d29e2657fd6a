// include/agentorch/orchestration/group_chat_strategy.h
#ifndef AGENTORCH_ORCHESTRATION_GROUP_CHAT_STRATEGY_H
#define AGENTORCH_ORCHESTRATION_GROUP_CHAT_STRATEGY_H

#include "agentorch/orchestration/strategy.h"
#include <vector>

namespace agentorch {

// Hands every participant to the group chat session hook and records the
// session as one step named "group-chat".
class GroupChatStrategy : public OrchestrationStrategy {
public:
    OrchestrationType type() const override { return OrchestrationType::GROUP_CHAT; }
    Value run(OrchestrationContext& ctx) override;

    // Participating nodes with a primary executor, assistant or coordinator role.
    static std::vector<const Node*> participants(const WorkflowGraph& graph);
};

} // namespace agentorch

#endif // AGENTORCH_ORCHESTRATION_GROUP_CHAT_STRATEGY_H
