// include/agentorch/orchestration/orchestration_context.h
#ifndef AGENTORCH_ORCHESTRATION_ORCHESTRATION_CONTEXT_H
#define AGENTORCH_ORCHESTRATION_ORCHESTRATION_CONTEXT_H

#include "agentorch/execution/execution_tracker.h"
#include "agentorch/executor/node_executor.h"
#include "agentorch/orchestration/hooks.h"
#include <optional>
#include <string>
#include <vector>

namespace agentorch {

struct OrchestrationSettings {
    int magentic_max_iterations = 10;
    int group_chat_max_rounds = 1;
    int wait_timeout_ms = 5000;
    int poll_interval_ms = 50;
};

// A failure that has already been written to the execution (step + error).
// The runner only needs to settle the final status. `run_fatal` marks a custom
// script failure whose on_error policy is "abort".
class StepFailedError : public EngineError {
public:
    StepFailedError(const EngineError& cause, std::optional<NodeId> node_id,
                    std::optional<std::string> step_id, bool run_fatal = false)
        : EngineError(cause.kind(), cause.what()),
          node_id_(std::move(node_id)),
          step_id_(std::move(step_id)),
          run_fatal_(run_fatal) {}

    const std::optional<NodeId>& node_id() const { return node_id_; }
    const std::optional<std::string>& step_id() const { return step_id_; }
    bool run_fatal() const { return run_fatal_; }

private:
    std::optional<NodeId> node_id_;
    std::optional<std::string> step_id_;
    bool run_fatal_;
};

// Everything a strategy needs to drive one execution.
class OrchestrationContext {
public:
    OrchestrationContext(ExecutionTracker& tracker,
                         const NodeExecutor& executor,
                         const OrchestrationHooks& hooks,
                         const OrchestrationSettings& settings,
                         Value input);

    const WorkflowGraph& graph() const { return *tracker_.graph(); }
    const Value& input() const { return input_; }
    ExecutionTracker& tracker() { return tracker_; }
    const OrchestrationHooks& hooks() const { return hooks_; }
    const OrchestrationSettings& settings() const { return settings_; }

    // Node boundary: blocks while paused, throws CancelledError when cancelled.
    void checkpoint() { tracker_.checkpoint(); }

    // Runs `node` as a recorded Step and returns its output. On failure the error
    // is recorded on the step and the execution, then StepFailedError is thrown.
    Value run_node(const Node& node, const Value& input);

    // Dispatches without recording a Step.
    Value invoke_node(const Node& node, const Value& input);

    const Node& require_node(const NodeId& node_id) const;
    std::vector<Step> steps() const;

private:
    ExecutionTracker& tracker_;
    const NodeExecutor& executor_;
    const OrchestrationHooks& hooks_;
    const OrchestrationSettings& settings_;
    Value input_;
};

} // namespace agentorch

#endif // AGENTORCH_ORCHESTRATION_ORCHESTRATION_CONTEXT_H
