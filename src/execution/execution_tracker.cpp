// src/execution/execution_tracker.cpp
#include "agentorch/execution/execution_tracker.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace agentorch {

namespace {

bool is_legal_transition(ExecutionStatus from, ExecutionStatus to) {
    if (is_terminal(from)) return false;
    if (from == to) return false;
    if (to == ExecutionStatus::PAUSED) return from == ExecutionStatus::RUNNING;
    if (to == ExecutionStatus::RUNNING) return from == ExecutionStatus::PAUSED;
    return true; // 终态
}

} // namespace

ExecutionTracker::ExecutionTracker(ExecutionId id, GraphSnapshot graph, Value input,
                                   std::shared_ptr<ExecutionEvents> events)
    : id_(std::move(id)), graph_(std::move(graph)), events_(std::move(events)), scope_(id_) {
    execution_.id = id_;
    execution_.workflow_id = graph_ ? graph_->id : WorkflowId{};
    execution_.orchestration = graph_ ? graph_->orchestration_type : OrchestrationType::UNKNOWN;
    execution_.status = ExecutionStatus::RUNNING;
    execution_.started_at = Clock::now();
    execution_.input = std::move(input);
}

Execution ExecutionTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return execution_;
}

ExecutionStatus ExecutionTracker::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return execution_.status;
}

Step* ExecutionTracker::find_step(const std::string& step_id) {
    auto it = std::find_if(execution_.steps.rbegin(), execution_.steps.rend(),
                           [&](const Step& s) { return s.id == step_id; });
    return it == execution_.steps.rend() ? nullptr : &*it;
}

std::optional<std::string> ExecutionTracker::begin_step(const Node& node, const Value& input) {
    if (!graph_ || !graph_->has_node(node.id)) {
        throw ValidationError("Node '" + node.id + "' is not part of the workflow snapshot");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (is_terminal(execution_.status)) {
        spdlog::warn("[{}] rejected step for node {}: execution is {}", id_, node.id,
                     to_string(execution_.status));
        return std::nullopt;
    }

    Step step;
    step.id = generate_id("step-");
    step.sequence = next_sequence_++;
    step.node_id = node.id;
    step.node_name = node.name;
    step.status = ExecutionStatus::RUNNING;
    step.started_at = Clock::now();
    // 系统时钟可能回拨，保证 started_at 不递减
    if (!execution_.steps.empty() && step.started_at < execution_.steps.back().started_at) {
        step.started_at = execution_.steps.back().started_at;
    }
    step.input = input;
    execution_.steps.push_back(std::move(step));
    return execution_.steps.back().id;
}

void ExecutionTracker::complete_step(const std::string& step_id, const Value& output) {
    Step copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Step* step = find_step(step_id);
        if (!step || step->status != ExecutionStatus::RUNNING) {
            spdlog::warn("[{}] complete_step: no running step {}", id_, step_id);
            return;
        }
        step->status = ExecutionStatus::COMPLETED;
        step->completed_at = Clock::now();
        step->output = output;
        copy = *step;
    }
    if (events_) events_->publish(StepCompletedEvent{id_, std::move(copy)});
}

void ExecutionTracker::fail_step(const std::string& step_id, const EngineError& error) {
    Step copy;
    std::optional<ExecutionError> recorded;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Step* step = find_step(step_id);
        if (!step || step->status != ExecutionStatus::RUNNING) {
            spdlog::warn("[{}] fail_step: no running step {}", id_, step_id);
            return;
        }
        ExecutionError err = make_error(error, step->node_id, step->id);
        step->status = ExecutionStatus::FAILED;
        step->completed_at = Clock::now();
        step->errors.push_back(err);
        copy = *step;
        if (!is_terminal(execution_.status)) {
            execution_.errors.push_back(err);
            recorded = std::move(err);
        }
    }
    if (events_) {
        events_->publish(StepCompletedEvent{id_, std::move(copy)});
        if (recorded) events_->publish(ExecutionErrorEvent{id_, std::move(*recorded)});
    }
}

bool ExecutionTracker::add_error(ExecutionError error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_terminal(execution_.status)) {
            spdlog::warn("[{}] rejected error after {}: {}", id_, to_string(execution_.status), error.message);
            return false;
        }
        execution_.errors.push_back(error);
    }
    if (events_) events_->publish(ExecutionErrorEvent{id_, std::move(error)});
    return true;
}

void ExecutionTracker::checkpoint() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return execution_.status != ExecutionStatus::PAUSED; });
    if (execution_.status == ExecutionStatus::CANCELLED) {
        throw CancelledError("Execution " + id_ + " was cancelled");
    }
}

bool ExecutionTracker::transition(ExecutionStatus to, std::unique_lock<std::mutex>& lock) {
    ExecutionStatus from = execution_.status;
    if (!is_legal_transition(from, to)) {
        return false;
    }
    execution_.status = to;
    if (is_terminal(to)) {
        execution_.completed_at = Clock::now();
    }
    lock.unlock();
    cv_.notify_all();
    if (events_) events_->publish(StatusChangedEvent{id_, from, to});
    return true;
}

bool ExecutionTracker::pause() {
    std::unique_lock<std::mutex> lock(mutex_);
    return transition(ExecutionStatus::PAUSED, lock);
}

bool ExecutionTracker::resume() {
    std::unique_lock<std::mutex> lock(mutex_);
    return transition(ExecutionStatus::RUNNING, lock);
}

bool ExecutionTracker::cancel() {
    std::unique_lock<std::mutex> lock(mutex_);
    return transition(ExecutionStatus::CANCELLED, lock);
}

bool ExecutionTracker::complete(const Value& output) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (is_terminal(execution_.status)) {
        spdlog::debug("[{}] completion ignored, already {}", id_, to_string(execution_.status));
        return false;
    }
    execution_.output = output;
    return transition(ExecutionStatus::COMPLETED, lock);
}

bool ExecutionTracker::fail(std::optional<ExecutionError> error) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (is_terminal(execution_.status)) {
        spdlog::debug("[{}] failure ignored, already {}", id_, to_string(execution_.status));
        return false;
    }
    if (error) {
        execution_.errors.push_back(*error);
    }
    ExecutionId id = id_;
    bool changed = transition(ExecutionStatus::FAILED, lock);
    if (changed && error && events_) {
        events_->publish(ExecutionErrorEvent{id, std::move(*error)});
    }
    return changed;
}

void ExecutionTracker::mark_finished() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
    }
    cv_.notify_all();
}

bool ExecutionTracker::wait_finished(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return finished_; });
}

bool ExecutionTracker::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

} // namespace agentorch
