// src/executor/agent_handle_cache.cpp
#include "agentorch/executor/agent_handle_cache.h"

namespace agentorch {

AgentHandle::AgentHandle(NodeId node_id, std::string agent_type)
    : node_id_(std::move(node_id)), agent_type_(std::move(agent_type)) {}

void AgentHandle::append(const std::string& role, const std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back({{"role", role}, {"content", content}});
}

Value AgentHandle::transcript() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
}

size_t AgentHandle::turns() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}

std::shared_ptr<AgentHandle> AgentHandleCache::get_or_create(const Node& node) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& handle = handles_[node.id];
    if (!handle) {
        handle = std::make_shared<AgentHandle>(node.id, node.type);
    }
    return handle;
}

std::shared_ptr<AgentHandle> AgentHandleCache::find(const NodeId& node_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(node_id);
    return it == handles_.end() ? nullptr : it->second;
}

size_t AgentHandleCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.size();
}

void AgentHandleCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    handles_.clear();
}

} // namespace agentorch
