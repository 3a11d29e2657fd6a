// src/executor/node_executor.cpp
#include "agentorch/executor/node_executor.h"
#include "agentorch/common/errors.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace agentorch {

void NodeExecutor::register_handler(std::shared_ptr<NodeHandler> handler) {
    if (!handler) {
        throw std::invalid_argument("NodeExecutor::register_handler: null handler");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[handler->node_type()] = std::move(handler);
}

bool NodeExecutor::has_handler(const std::string& node_type) const {
    return find_handler(node_type) != nullptr;
}

std::vector<std::string> NodeExecutor::node_types() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> types;
    types.reserve(handlers_.size());
    for (const auto& [type, _] : handlers_) {
        types.push_back(type);
    }
    std::sort(types.begin(), types.end());
    return types;
}

std::shared_ptr<NodeHandler> NodeExecutor::find_handler(const std::string& node_type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(node_type);
    return it == handlers_.end() ? nullptr : it->second;
}

void NodeExecutor::validate(const Node& node) const {
    auto handler = find_handler(node.type);
    if (!handler) {
        throw ValidationError("Node '" + node.id + "' has unknown type: " + node.type);
    }
    handler->validate(node);
}

void NodeExecutor::validate(const WorkflowGraph& graph) const {
    for (const auto& node : graph.nodes) {
        validate(node);
    }
}

Value NodeExecutor::execute(const Node& node, const Value& input, ExecutionScope& scope) const {
    auto handler = find_handler(node.type);
    if (!handler) {
        throw ValidationError("No handler for node type '" + node.type + "' (node " + node.id + ")");
    }

    spdlog::debug("[{}] executing node {} ({})", scope.execution_id(), node.id, node.type);
    try {
        return handler->execute(node, input, scope);
    } catch (const EngineError&) {
        throw;
    } catch (const std::exception& e) {
        throw NodeExecutionError(node.id, "Node '" + node.id + "' failed: " + e.what());
    }
}

} // namespace agentorch
