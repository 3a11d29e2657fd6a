// include/agentorch/execution/execution_tracker.h
#ifndef AGENTORCH_EXECUTION_EXECUTION_TRACKER_H
#define AGENTORCH_EXECUTION_EXECUTION_TRACKER_H

#include "agentorch/execution/execution.h"
#include "agentorch/execution/execution_events.h"
#include "agentorch/executor/node_handler.h"
#include "agentorch/graph/workflow_graph.h"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace agentorch {

// Owns one Execution aggregate. Every mutation goes through here under one mutex;
// events are published after the lock is released.
//
// Status machine: RUNNING <-> PAUSED, and RUNNING/PAUSED -> COMPLETED|FAILED|CANCELLED.
// Once terminal, new steps and errors are rejected (logged, not thrown). Steps begun
// before the transition may still be closed with complete_step/fail_step.
class ExecutionTracker {
public:
    ExecutionTracker(ExecutionId id, GraphSnapshot graph, Value input,
                     std::shared_ptr<ExecutionEvents> events = nullptr);

    ExecutionTracker(const ExecutionTracker&) = delete;
    ExecutionTracker& operator=(const ExecutionTracker&) = delete;

    const ExecutionId& id() const { return id_; }
    const GraphSnapshot& graph() const { return graph_; }
    ExecutionScope& scope() { return scope_; }

    Execution snapshot() const;
    ExecutionStatus status() const;

    // ---- step bookkeeping (driven by the strategy) ----

    // Returns the new step id, or nullopt if the execution is already terminal.
    // Throws ValidationError if the node is not part of the captured graph.
    std::optional<std::string> begin_step(const Node& node, const Value& input);
    void complete_step(const std::string& step_id, const Value& output);
    // Attaches the error to the step and to the execution.
    void fail_step(const std::string& step_id, const EngineError& error);
    // Execution-level error (not tied to a node step).
    bool add_error(ExecutionError error);

    // Blocks while PAUSED; throws CancelledError once cancelled.
    void checkpoint();

    // ---- control (any thread) ----
    bool pause();
    bool resume();
    bool cancel();

    // ---- terminal transitions (worker) ----
    bool complete(const Value& output);
    bool fail(std::optional<ExecutionError> error);

    // Called by the owner once the worker has fully stopped.
    void mark_finished();
    bool wait_finished(std::chrono::milliseconds timeout) const;
    bool finished() const;

private:
    bool transition(ExecutionStatus to, std::unique_lock<std::mutex>& lock);
    Step* find_step(const std::string& step_id);

    const ExecutionId id_;
    const GraphSnapshot graph_;
    std::shared_ptr<ExecutionEvents> events_;
    ExecutionScope scope_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    Execution execution_;
    uint64_t next_sequence_ = 1;
    bool finished_ = false;
};

} // namespace agentorch

#endif // AGENTORCH_EXECUTION_EXECUTION_TRACKER_H
