// include/agentorch/execution/execution_events.h
#ifndef AGENTORCH_EXECUTION_EXECUTION_EVENTS_H
#define AGENTORCH_EXECUTION_EXECUTION_EVENTS_H

#include "agentorch/execution/execution.h"
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace agentorch {

struct StatusChangedEvent {
    ExecutionId execution_id;
    ExecutionStatus old_status;
    ExecutionStatus new_status;
};

struct StepCompletedEvent {
    ExecutionId execution_id;
    Step step;
};

struct ExecutionErrorEvent {
    ExecutionId execution_id;
    ExecutionError error;
};

// Notification channel for external subscribers (UI, persistence, logging).
// Callbacks run on the thread that produced the event, with no engine lock held;
// they may call back into the execution service.
class ExecutionEvents {
public:
    using SubscriptionId = uint64_t;
    using StatusChangedHandler = std::function<void(const StatusChangedEvent&)>;
    using StepCompletedHandler = std::function<void(const StepCompletedEvent&)>;
    using ErrorHandler = std::function<void(const ExecutionErrorEvent&)>;

    SubscriptionId on_status_changed(StatusChangedHandler handler);
    SubscriptionId on_step_completed(StepCompletedHandler handler);
    SubscriptionId on_execution_error(ErrorHandler handler);

    bool unsubscribe(SubscriptionId id);

    void publish(const StatusChangedEvent& event) const;
    void publish(const StepCompletedEvent& event) const;
    void publish(const ExecutionErrorEvent& event) const;

private:
    template<typename Handler, typename Event>
    void dispatch(const std::map<SubscriptionId, Handler>& handlers, const Event& event, const char* name) const;

    mutable std::mutex mutex_;
    SubscriptionId next_id_ = 1;
    std::map<SubscriptionId, StatusChangedHandler> status_handlers_;
    std::map<SubscriptionId, StepCompletedHandler> step_handlers_;
    std::map<SubscriptionId, ErrorHandler> error_handlers_;
};

} // namespace agentorch

#endif // AGENTORCH_EXECUTION_EXECUTION_EVENTS_H
