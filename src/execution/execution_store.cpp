// src/execution/execution_store.cpp
#include "agentorch/execution/execution_store.h"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace agentorch {

ExecutionStore::ExecutionStore(size_t max_entries)
    : max_entries_(std::max<size_t>(max_entries, 1)) {}

void ExecutionStore::add(Execution execution) {
    if (!is_terminal(execution.status)) {
        throw std::invalid_argument("ExecutionStore::add: execution " + execution.id + " is still " +
                                    to_string(execution.status));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    ExecutionId id = execution.id;
    if (executions_.find(id) == executions_.end()) {
        order_.push_back(id);
    }
    executions_[id] = std::move(execution);
    enforce_limit();
}

void ExecutionStore::enforce_limit() {
    while (executions_.size() > max_entries_ && !order_.empty()) {
        spdlog::debug("Execution history full ({}), dropping {}", max_entries_, order_.front());
        executions_.erase(order_.front());
        order_.pop_front();
    }
}

std::optional<Execution> ExecutionStore::find(const ExecutionId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = executions_.find(id);
    if (it == executions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Execution> ExecutionStore::list_by_workflow(const WorkflowId& workflow_id) const {
    std::vector<Execution> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [_, execution] : executions_) {
            if (execution.workflow_id == workflow_id) {
                result.push_back(execution);
            }
        }
    }
    std::sort(result.begin(), result.end(), [](const Execution& a, const Execution& b) {
        return a.started_at > b.started_at;
    });
    return result;
}

size_t ExecutionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return executions_.size();
}

} // namespace agentorch
