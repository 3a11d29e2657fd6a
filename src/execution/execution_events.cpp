// src/execution/execution_events.cpp
#include "agentorch/execution/execution_events.h"
#include <spdlog/spdlog.h>
#include <vector>

namespace agentorch {

ExecutionEvents::SubscriptionId ExecutionEvents::on_status_changed(StatusChangedHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    status_handlers_.emplace(id, std::move(handler));
    return id;
}

ExecutionEvents::SubscriptionId ExecutionEvents::on_step_completed(StepCompletedHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    step_handlers_.emplace(id, std::move(handler));
    return id;
}

ExecutionEvents::SubscriptionId ExecutionEvents::on_execution_error(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    error_handlers_.emplace(id, std::move(handler));
    return id;
}

bool ExecutionEvents::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_handlers_.erase(id) + step_handlers_.erase(id) + error_handlers_.erase(id) > 0;
}

template<typename Handler, typename Event>
void ExecutionEvents::dispatch(const std::map<SubscriptionId, Handler>& handlers,
                               const Event& event, const char* name) const {
    // 复制一份再回调，订阅者可以在回调里取消订阅
    std::vector<Handler> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.reserve(handlers.size());
        for (const auto& [_, handler] : handlers) {
            snapshot.push_back(handler);
        }
    }
    for (const auto& handler : snapshot) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            spdlog::error("[{}] {} subscriber threw: {}", event.execution_id, name, e.what());
        }
    }
}

void ExecutionEvents::publish(const StatusChangedEvent& event) const {
    spdlog::info("[{}] status {} -> {}", event.execution_id,
                 to_string(event.old_status), to_string(event.new_status));
    dispatch(status_handlers_, event, "status-changed");
}

void ExecutionEvents::publish(const StepCompletedEvent& event) const {
    spdlog::debug("[{}] step #{} {} ({}) {}", event.execution_id, event.step.sequence,
                  event.step.node_id, event.step.node_name, to_string(event.step.status));
    dispatch(step_handlers_, event, "step-completed");
}

void ExecutionEvents::publish(const ExecutionErrorEvent& event) const {
    spdlog::warn("[{}] {}: {}", event.execution_id, to_string(event.error.kind), event.error.message);
    dispatch(error_handlers_, event, "execution-error");
}

} // namespace agentorch
