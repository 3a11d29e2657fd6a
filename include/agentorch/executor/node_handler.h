// include/agentorch/executor/node_handler.h
#ifndef AGENTORCH_EXECUTOR_NODE_HANDLER_H
#define AGENTORCH_EXECUTOR_NODE_HANDLER_H

#include "agentorch/executor/agent_handle_cache.h"
#include "agentorch/executor/checkpoint_store.h"
#include "agentorch/graph/workflow_graph.h"
#include <string>

namespace agentorch {

// Per-execution state that node handlers may touch.
class ExecutionScope {
public:
    explicit ExecutionScope(ExecutionId execution_id)
        : execution_id_(std::move(execution_id)) {}

    const ExecutionId& execution_id() const { return execution_id_; }
    AgentHandleCache& agents() { return agents_; }
    CheckpointStore& checkpoints() { return checkpoints_; }

private:
    ExecutionId execution_id_;
    AgentHandleCache agents_;
    CheckpointStore checkpoints_;
};

// Capability behind one node type tag.
class NodeHandler {
public:
    virtual ~NodeHandler() = default;

    virtual std::string node_type() const = 0;

    // Returns the node output. May be called concurrently for different nodes
    // of the same execution.
    virtual Value execute(const Node& node, const Value& input, ExecutionScope& scope) = 0;

    // Throws ValidationError if the node's properties cannot be executed.
    virtual void validate(const Node& /*node*/) const {}
};

} // namespace agentorch

#endif // AGENTORCH_EXECUTOR_NODE_HANDLER_H
