// src/graph/workflow_repository.cpp
#include "agentorch/graph/workflow_repository.h"
#include <algorithm>

namespace agentorch {

GraphSnapshot InMemoryWorkflowRepository::find(const WorkflowId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = workflows_.find(id);
    return it == workflows_.end() ? nullptr : it->second;
}

void InMemoryWorkflowRepository::save(WorkflowGraph graph) {
    graph.validate();
    auto snapshot = std::make_shared<const WorkflowGraph>(std::move(graph));
    std::lock_guard<std::mutex> lock(mutex_);
    workflows_[snapshot->id] = std::move(snapshot);
}

bool InMemoryWorkflowRepository::remove(const WorkflowId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return workflows_.erase(id) > 0;
}

std::vector<WorkflowId> InMemoryWorkflowRepository::list_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<WorkflowId> ids;
    ids.reserve(workflows_.size());
    for (const auto& [id, _] : workflows_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace agentorch
