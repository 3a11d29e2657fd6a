// src/orchestration/group_chat_strategy.cpp
#include "agentorch/orchestration/group_chat_strategy.h"

namespace agentorch {

namespace {
const char* const kSessionStepName = "group-chat";
} // namespace

std::vector<const Node*> GroupChatStrategy::participants(const WorkflowGraph& graph) {
    std::vector<const Node*> result;
    for (const auto& node : graph.nodes) {
        const auto& o = node.orchestration;
        if (!o.participates) continue;
        if (o.has_role(NodeRole::PRIMARY_EXECUTOR) || o.has_role(NodeRole::ASSISTANT) ||
            o.has_role(NodeRole::COORDINATOR)) {
            result.push_back(&node);
        }
    }
    return result;
}

Value GroupChatStrategy::run(OrchestrationContext& ctx) {
    auto session = ctx.hooks().group_chat;
    if (!session) {
        throw OrchestrationError("GroupChat orchestration requires a group chat session");
    }

    const auto nodes = participants(ctx.graph());
    if (nodes.empty()) {
        throw OrchestrationError("GroupChat workflow '" + ctx.graph().id + "' has no participants");
    }

    // 合成 step 挂在协调者上，没有协调者就用第一个参与者
    const Node* anchor = nodes.front();
    std::vector<GroupChatParticipant> seats;
    for (const Node* node : nodes) {
        if (node->orchestration.has_role(NodeRole::COORDINATOR) &&
            !anchor->orchestration.has_role(NodeRole::COORDINATOR)) {
            anchor = node;
        }
        seats.push_back({node->id, node->name, node->type, node->orchestration.roles});
    }

    ctx.checkpoint();
    Node session_node = *anchor;
    session_node.name = kSessionStepName;
    auto step_id = ctx.tracker().begin_step(session_node, ctx.input());
    if (!step_id) {
        throw CancelledError("Execution " + ctx.tracker().id() + " no longer accepts steps");
    }

    ParticipantInvoker invoke = [&ctx](const NodeId& id, const Value& message) {
        return ctx.invoke_node(ctx.require_node(id), message);
    };

    Value output;
    try {
        output = session->run(seats, ctx.input(), invoke);
    } catch (const CancelledError& e) {
        ctx.tracker().fail_step(*step_id, e);
        throw;
    } catch (const EngineError& e) {
        ctx.tracker().fail_step(*step_id, e);
        throw StepFailedError(e, anchor->id, *step_id);
    } catch (const std::exception& e) {
        CollaboratorError error(std::string("Group chat session failed: ") + e.what());
        ctx.tracker().fail_step(*step_id, error);
        throw StepFailedError(error, anchor->id, *step_id);
    }
    ctx.tracker().complete_step(*step_id, output);
    return output;
}

} // namespace agentorch
