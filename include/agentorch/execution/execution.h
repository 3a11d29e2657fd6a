// include/agentorch/execution/execution.h
#ifndef AGENTORCH_EXECUTION_EXECUTION_H
#define AGENTORCH_EXECUTION_EXECUTION_H

#include "agentorch/common/errors.h"
#include "agentorch/common/types.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agentorch {

struct ExecutionError {
    std::string message;
    ErrorKind kind = ErrorKind::NODE_EXECUTION;
    TimePoint occurred_at = Clock::now();
    std::optional<NodeId> node_id;
    std::optional<std::string> step_id;   // execution step or script step id
};

// Record of one node run. status is RUNNING, COMPLETED or FAILED.
struct Step {
    std::string id;
    uint64_t sequence = 0;                // strictly increasing within an execution
    NodeId node_id;
    std::string node_name;
    ExecutionStatus status = ExecutionStatus::RUNNING;
    TimePoint started_at;
    std::optional<TimePoint> completed_at;
    Value input;
    Value output;
    std::vector<ExecutionError> errors;
};

struct Execution {
    ExecutionId id;
    WorkflowId workflow_id;
    OrchestrationType orchestration = OrchestrationType::SEQUENTIAL;
    ExecutionStatus status = ExecutionStatus::RUNNING;
    TimePoint started_at;
    std::optional<TimePoint> completed_at;
    Value input;
    Value output;
    std::vector<Step> steps;
    std::vector<ExecutionError> errors;
};

ExecutionError make_error(const EngineError& e,
                          std::optional<NodeId> node_id = std::nullopt,
                          std::optional<std::string> step_id = std::nullopt);

void to_json(Value& j, const ExecutionError& error);
void to_json(Value& j, const Step& step);
void to_json(Value& j, const Execution& execution);

} // namespace agentorch

#endif // AGENTORCH_EXECUTION_EXECUTION_H
