// src/orchestration/orchestration_context.cpp
#include "agentorch/orchestration/orchestration_context.h"

namespace agentorch {

OrchestrationContext::OrchestrationContext(ExecutionTracker& tracker,
                                           const NodeExecutor& executor,
                                           const OrchestrationHooks& hooks,
                                           const OrchestrationSettings& settings,
                                           Value input)
    : tracker_(tracker), executor_(executor), hooks_(hooks), settings_(settings), input_(std::move(input)) {}

Value OrchestrationContext::run_node(const Node& node, const Value& input) {
    checkpoint();

    auto step_id = tracker_.begin_step(node, input);
    if (!step_id) {
        // 执行已进入终态（被取消）
        throw CancelledError("Execution " + tracker_.id() + " no longer accepts steps");
    }

    Value output;
    try {
        output = executor_.execute(node, input, tracker_.scope());
    } catch (const EngineError& e) {
        tracker_.fail_step(*step_id, e);
        throw StepFailedError(e, node.id, *step_id);
    }
    tracker_.complete_step(*step_id, output);
    return output;
}

Value OrchestrationContext::invoke_node(const Node& node, const Value& input) {
    checkpoint();
    return executor_.execute(node, input, tracker_.scope());
}

const Node& OrchestrationContext::require_node(const NodeId& node_id) const {
    const Node* node = graph().find_node(node_id);
    if (!node) {
        throw OrchestrationError("Node not found in workflow '" + graph().id + "': " + node_id);
    }
    return *node;
}

std::vector<Step> OrchestrationContext::steps() const {
    return tracker_.snapshot().steps;
}

} // namespace agentorch
