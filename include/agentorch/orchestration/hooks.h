// include/agentorch/orchestration/hooks.h
#ifndef AGENTORCH_ORCHESTRATION_HOOKS_H
#define AGENTORCH_ORCHESTRATION_HOOKS_H

#include "agentorch/execution/execution.h"
#include "agentorch/graph/workflow_graph.h"
#include "agentorch/llm/llm_provider.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentorch {

// Handoff: decides whether the walk follows `connection` given the output of
// its source node. Asked for each outgoing connection in declaration order;
// the first `true` wins. Exceptions become OrchestrationError.
class HandoffConditionHook {
public:
    virtual ~HandoffConditionHook() = default;
    virtual bool should_follow(const Connection& connection, const Value& output) = 0;
};

// Follows a connection when it has no condition, or when its inja
// condition evaluates true against the output.
class ExpressionHandoffCondition : public HandoffConditionHook {
public:
    bool should_follow(const Connection& connection, const Value& output) override;
};

// Magentic: chooses the next node from `candidates`, or nullopt to stop.
// Returning an id outside `candidates` is an OrchestrationError.
class NodeSelector {
public:
    virtual ~NodeSelector() = default;
    virtual std::optional<NodeId> select(const std::vector<const Node*>& candidates,
                                         const Value& data,
                                         const std::vector<Step>& history) = 0;
};

// Highest priority candidate that has no step yet; declaration order on ties.
class PriorityNodeSelector : public NodeSelector {
public:
    std::optional<NodeId> select(const std::vector<const Node*>& candidates,
                                 const Value& data,
                                 const std::vector<Step>& history) override;
};

// Asks an LLM. The reply is trimmed and matched against candidate ids;
// "DONE" or anything unrecognised means no selection.
class LlmNodeSelector : public NodeSelector {
public:
    explicit LlmNodeSelector(std::shared_ptr<LlmProvider> llm, std::string prompt_template = {});

    std::optional<NodeId> select(const std::vector<const Node*>& candidates,
                                 const Value& data,
                                 const std::vector<Step>& history) override;

    static const char* default_prompt();

private:
    std::shared_ptr<LlmProvider> llm_;
    std::string prompt_template_;
};

struct GroupChatParticipant {
    NodeId id;
    std::string name;
    std::string type;
    std::vector<NodeRole> roles;
};

// Runs one participant's turn through node dispatch (no step is recorded).
using ParticipantInvoker = std::function<Value(const NodeId&, const Value&)>;

// GroupChat: one collaborative session over all participants; returns the
// aggregate output recorded on the synthetic step.
class GroupChatSession {
public:
    virtual ~GroupChatSession() = default;
    virtual Value run(const std::vector<GroupChatParticipant>& participants,
                      const Value& input,
                      const ParticipantInvoker& invoke) = 0;
};

// Each round, every participant speaks once in order and sees the transcript
// so far. An object output with "terminate": true ends the session.
class RoundRobinGroupChat : public GroupChatSession {
public:
    explicit RoundRobinGroupChat(int max_rounds = 1);

    Value run(const std::vector<GroupChatParticipant>& participants,
              const Value& input,
              const ParticipantInvoker& invoke) override;

private:
    int max_rounds_;
};

// Custom scripts: predicate of WaitCondition, Branch and Loop steps.
// `view` is the current data with "results" (outputs by script step id).
class ScriptConditionHook {
public:
    virtual ~ScriptConditionHook() = default;
    virtual bool evaluate(const ScriptStep& step, const Value& view) = 0;
};

// No condition is true; otherwise the inja expression is evaluated on `view`.
class ExpressionScriptCondition : public ScriptConditionHook {
public:
    bool evaluate(const ScriptStep& step, const Value& view) override;
};

struct OrchestrationHooks {
    std::shared_ptr<HandoffConditionHook> handoff_condition;
    std::shared_ptr<NodeSelector> node_selector;
    std::shared_ptr<GroupChatSession> group_chat;
    std::shared_ptr<ScriptConditionHook> script_condition;
};

} // namespace agentorch

#endif // AGENTORCH_ORCHESTRATION_HOOKS_H
