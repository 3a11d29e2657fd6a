// include/agentorch/execution/execution_service.h
#ifndef AGENTORCH_EXECUTION_EXECUTION_SERVICE_H
#define AGENTORCH_EXECUTION_EXECUTION_SERVICE_H

#include "agentorch/execution/execution_events.h"
#include "agentorch/execution/execution_store.h"
#include "agentorch/execution/execution_tracker.h"
#include "agentorch/executor/node_executor.h"
#include "agentorch/graph/workflow_repository.h"
#include "agentorch/orchestration/orchestration_context.h"
#include "agentorch/orchestration/strategy_selector.h"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace agentorch {

// Starts executions on worker threads and keeps the active-execution registry.
// A run stays in the registry until its worker has stopped; its final snapshot
// is then moved to the history store.
class ExecutionService {
public:
    struct Dependencies {
        std::shared_ptr<WorkflowRepository> workflows;
        std::shared_ptr<const NodeExecutor> executor;
        std::shared_ptr<const StrategySelector> strategies;
        OrchestrationHooks hooks;
        OrchestrationSettings settings;
        std::shared_ptr<ExecutionEvents> events;   // created if null
        std::shared_ptr<ExecutionStore> history;   // created if null
    };

    explicit ExecutionService(Dependencies deps);
    virtual ~ExecutionService(); // cancels active runs and joins all workers

    ExecutionService(const ExecutionService&) = delete;
    ExecutionService& operator=(const ExecutionService&) = delete;

    // Throws ValidationError (and creates no record) if the workflow is unknown
    // or invalid. If no worker thread can be started the error is rethrown and
    // the run is dropped from the registry.
    ExecutionId start(const WorkflowId& workflow_id, const Value& input);

    // false if the execution is not active or the transition is illegal.
    bool pause(const ExecutionId& id);
    bool resume(const ExecutionId& id);
    bool cancel(const ExecutionId& id);

    std::optional<Execution> status(const ExecutionId& id) const;
    std::vector<Step> list_steps(const ExecutionId& id) const;
    std::vector<ExecutionError> list_errors(const ExecutionId& id) const;

    // Active and finished executions of one workflow, newest first.
    std::vector<Execution> list_workflow_executions(const WorkflowId& workflow_id) const;
    std::vector<Execution> list_active() const;

    // Blocks until the run's worker has stopped. false on timeout or unknown id.
    bool wait(const ExecutionId& id, std::chrono::milliseconds timeout);

    ExecutionEvents& events() { return *events_; }
    const ExecutionStore& history() const { return *history_; }

protected:
    // Starts the thread that drives `tracker`. Called with mutex_ held.
    virtual std::thread spawn_worker(std::shared_ptr<ExecutionTracker> tracker);

private:
    void run_worker(std::shared_ptr<ExecutionTracker> tracker);
    void finish(const std::shared_ptr<ExecutionTracker>& tracker);
    std::shared_ptr<ExecutionTracker> find_active(const ExecutionId& id) const;
    void reap_finished_workers(); // 调用方持有 mutex_

    Dependencies deps_;
    std::shared_ptr<ExecutionEvents> events_;
    std::shared_ptr<ExecutionStore> history_;

    mutable std::mutex mutex_;
    std::unordered_map<ExecutionId, std::shared_ptr<ExecutionTracker>> active_;
    std::unordered_map<ExecutionId, std::thread> workers_;
    std::vector<ExecutionId> finished_workers_;
};

} // namespace agentorch

#endif // AGENTORCH_EXECUTION_EXECUTION_SERVICE_H
