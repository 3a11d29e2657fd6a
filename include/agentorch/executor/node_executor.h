// include/agentorch/executor/node_executor.h
#ifndef AGENTORCH_EXECUTOR_NODE_EXECUTOR_H
#define AGENTORCH_EXECUTOR_NODE_EXECUTOR_H

#include "agentorch/executor/node_handler.h"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentorch {

// Resolves a node's type tag to its handler and invokes it.
class NodeExecutor {
public:
    // Replaces any handler already registered for the same type.
    void register_handler(std::shared_ptr<NodeHandler> handler);

    bool has_handler(const std::string& node_type) const;
    std::vector<std::string> node_types() const;

    // Throws ValidationError for unknown types or rejected properties.
    void validate(const Node& node) const;
    void validate(const WorkflowGraph& graph) const;

    // Errors thrown by handlers keep their kind if they are EngineErrors,
    // anything else becomes NodeExecutionError.
    Value execute(const Node& node, const Value& input, ExecutionScope& scope) const;

private:
    std::shared_ptr<NodeHandler> find_handler(const std::string& node_type) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<NodeHandler>> handlers_;
};

} // namespace agentorch

#endif // AGENTORCH_EXECUTOR_NODE_EXECUTOR_H
