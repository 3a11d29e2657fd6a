// src/execution/execution_service.cpp
#include "agentorch/execution/execution_service.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace agentorch {

ExecutionService::ExecutionService(Dependencies deps)
    : deps_(std::move(deps)),
      events_(deps_.events ? deps_.events : std::make_shared<ExecutionEvents>()),
      history_(deps_.history ? deps_.history : std::make_shared<ExecutionStore>()) {
    if (!deps_.workflows || !deps_.executor) {
        throw std::invalid_argument("ExecutionService requires a workflow repository and a node executor");
    }
    if (!deps_.strategies) {
        deps_.strategies = std::make_shared<StrategySelector>();
    }
}

ExecutionService::~ExecutionService() {
    std::vector<std::shared_ptr<ExecutionTracker>> running;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [_, tracker] : active_) {
            running.push_back(tracker);
        }
    }
    for (const auto& tracker : running) {
        tracker->cancel();
    }

    std::unordered_map<ExecutionId, std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers.swap(workers_);
    }
    for (auto& [_, worker] : workers) {
        if (worker.joinable()) worker.join();
    }
}

ExecutionId ExecutionService::start(const WorkflowId& workflow_id, const Value& input) {
    GraphSnapshot graph = deps_.workflows->find(workflow_id);
    if (!graph) {
        throw ValidationError("Workflow not found: " + workflow_id);
    }
    graph->validate();
    deps_.executor->validate(*graph);

    const ExecutionId id = generate_id("exec-");
    auto tracker = std::make_shared<ExecutionTracker>(id, graph, input, events_);

    std::lock_guard<std::mutex> lock(mutex_);
    reap_finished_workers();
    active_.emplace(id, tracker);
    try {
        workers_.emplace(id, spawn_worker(tracker));
    } catch (const std::exception& e) {
        active_.erase(id);
        spdlog::error("[{}] could not start worker for {}: {}", id, workflow_id, e.what());
        throw;
    }
    spdlog::info("[{}] started workflow {} ({})", id, workflow_id, to_string(graph->orchestration_type));
    return id;
}

std::thread ExecutionService::spawn_worker(std::shared_ptr<ExecutionTracker> tracker) {
    return std::thread(&ExecutionService::run_worker, this, std::move(tracker));
}

void ExecutionService::run_worker(std::shared_ptr<ExecutionTracker> tracker) {
    const auto strategy = deps_.strategies->resolve(tracker->graph()->orchestration_type);
    OrchestrationContext ctx(*tracker, *deps_.executor, deps_.hooks, deps_.settings,
                             tracker->snapshot().input);

    try {
        Value output = strategy->run(ctx);
        ctx.checkpoint(); // 暂停也挡住最终完成
        tracker->complete(output);
    } catch (const CancelledError& e) {
        spdlog::info("[{}] stopped: {}", tracker->id(), e.what());
    } catch (const StepFailedError&) {
        // 错误已记录在 step 上
        tracker->fail(std::nullopt);
    } catch (const EngineError& e) {
        tracker->fail(make_error(e));
    } catch (const std::exception& e) {
        tracker->fail(make_error(OrchestrationError(std::string("Unexpected failure: ") + e.what())));
    }

    finish(tracker);
}

void ExecutionService::finish(const std::shared_ptr<ExecutionTracker>& tracker) {
    Execution final_state = tracker->snapshot();
    if (!is_terminal(final_state.status)) {
        spdlog::error("[{}] worker stopped while {}", tracker->id(), to_string(final_state.status));
        tracker->fail(make_error(OrchestrationError("Worker stopped without a terminal status")));
        final_state = tracker->snapshot();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        history_->add(std::move(final_state));
        active_.erase(tracker->id());
        finished_workers_.push_back(tracker->id());
    }
    tracker->mark_finished();
}

void ExecutionService::reap_finished_workers() {
    for (const auto& id : finished_workers_) {
        auto it = workers_.find(id);
        if (it != workers_.end()) {
            if (it->second.joinable()) it->second.join();
            workers_.erase(it);
        }
    }
    finished_workers_.clear();
}

std::shared_ptr<ExecutionTracker> ExecutionService::find_active(const ExecutionId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(id);
    return it == active_.end() ? nullptr : it->second;
}

bool ExecutionService::pause(const ExecutionId& id) {
    auto tracker = find_active(id);
    return tracker && tracker->pause();
}

bool ExecutionService::resume(const ExecutionId& id) {
    auto tracker = find_active(id);
    return tracker && tracker->resume();
}

bool ExecutionService::cancel(const ExecutionId& id) {
    auto tracker = find_active(id);
    return tracker && tracker->cancel();
}

std::optional<Execution> ExecutionService::status(const ExecutionId& id) const {
    {
        // 同一把锁下查 active 和 history，避免 finish() 移交期间查不到
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(id);
        if (it != active_.end()) {
            return it->second->snapshot();
        }
        if (auto done = history_->find(id)) {
            return done;
        }
    }
    return std::nullopt;
}

std::vector<Step> ExecutionService::list_steps(const ExecutionId& id) const {
    auto execution = status(id);
    return execution ? execution->steps : std::vector<Step>{};
}

std::vector<ExecutionError> ExecutionService::list_errors(const ExecutionId& id) const {
    auto execution = status(id);
    return execution ? execution->errors : std::vector<ExecutionError>{};
}

std::vector<Execution> ExecutionService::list_workflow_executions(const WorkflowId& workflow_id) const {
    std::vector<Execution> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [_, tracker] : active_) {
            if (tracker->graph()->id == workflow_id) {
                result.push_back(tracker->snapshot());
            }
        }
        auto done = history_->list_by_workflow(workflow_id);
        result.insert(result.end(), done.begin(), done.end());
    }
    std::stable_sort(result.begin(), result.end(), [](const Execution& a, const Execution& b) {
        return a.started_at > b.started_at;
    });
    return result;
}

std::vector<Execution> ExecutionService::list_active() const {
    std::vector<Execution> result;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [_, tracker] : active_) {
        Execution snapshot = tracker->snapshot();
        if (!is_terminal(snapshot.status)) {
            result.push_back(std::move(snapshot));
        }
    }
    return result;
}

bool ExecutionService::wait(const ExecutionId& id, std::chrono::milliseconds timeout) {
    if (auto tracker = find_active(id)) {
        return tracker->wait_finished(timeout);
    }
    return history_->find(id).has_value();
}

} // namespace agentorch
