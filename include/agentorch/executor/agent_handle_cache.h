// include/agentorch/executor/agent_handle_cache.h
#ifndef AGENTORCH_EXECUTOR_AGENT_HANDLE_CACHE_H
#define AGENTORCH_EXECUTOR_AGENT_HANDLE_CACHE_H

#include "agentorch/graph/workflow_graph.h"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace agentorch {

// Conversation state of one agent node within one execution.
class AgentHandle {
public:
    AgentHandle(NodeId node_id, std::string agent_type);

    const NodeId& node_id() const { return node_id_; }
    const std::string& agent_type() const { return agent_type_; }

    void append(const std::string& role, const std::string& content);

    // [{"role": ..., "content": ...}, ...]
    Value transcript() const;
    size_t turns() const;

private:
    NodeId node_id_;
    std::string agent_type_;
    mutable std::mutex mutex_;
    Value messages_ = Value::array();
};

// One cache per execution; handles never cross execution boundaries.
class AgentHandleCache {
public:
    std::shared_ptr<AgentHandle> get_or_create(const Node& node);
    std::shared_ptr<AgentHandle> find(const NodeId& node_id) const;
    size_t size() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<NodeId, std::shared_ptr<AgentHandle>> handles_;
};

} // namespace agentorch

#endif // AGENTORCH_EXECUTOR_AGENT_HANDLE_CACHE_H
