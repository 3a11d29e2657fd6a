// include/agentorch/execution/execution_store.h
#ifndef AGENTORCH_EXECUTION_EXECUTION_STORE_H
#define AGENTORCH_EXECUTION_EXECUTION_STORE_H

#include "agentorch/execution/execution.h"
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace agentorch {

// Read-only snapshots of executions that reached a terminal status.
// Holds at most `max_entries` runs; the earliest added are evicted first.
class ExecutionStore {
public:
    explicit ExecutionStore(size_t max_entries = 500);

    // Throws std::invalid_argument if the execution is not terminal.
    void add(Execution execution);

    std::optional<Execution> find(const ExecutionId& id) const;

    // Newest first (started_at descending).
    std::vector<Execution> list_by_workflow(const WorkflowId& workflow_id) const;

    size_t size() const;
    size_t max_entries() const { return max_entries_; }

private:
    void enforce_limit(); // 调用方持有锁

    mutable std::mutex mutex_;
    std::unordered_map<ExecutionId, Execution> executions_;
    std::deque<ExecutionId> order_;
    size_t max_entries_;
};

} // namespace agentorch

#endif // AGENTORCH_EXECUTION_EXECUTION_STORE_H
