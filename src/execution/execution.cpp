// src/execution/execution.cpp
#include "agentorch/execution/execution.h"

namespace agentorch {

ExecutionError make_error(const EngineError& e,
                          std::optional<NodeId> node_id,
                          std::optional<std::string> step_id) {
    ExecutionError error;
    error.message = e.what();
    error.kind = e.kind();
    error.occurred_at = Clock::now();
    error.node_id = std::move(node_id);
    error.step_id = std::move(step_id);
    return error;
}

void to_json(Value& j, const ExecutionError& error) {
    j = Value{
        {"message", error.message},
        {"kind", to_string(error.kind)},
        {"occurred_at", to_epoch_ms(error.occurred_at)}
    };
    if (error.node_id) j["node_id"] = *error.node_id;
    if (error.step_id) j["step_id"] = *error.step_id;
}

void to_json(Value& j, const Step& step) {
    j = Value{
        {"id", step.id},
        {"sequence", step.sequence},
        {"node_id", step.node_id},
        {"node_name", step.node_name},
        {"status", to_string(step.status)},
        {"started_at", to_epoch_ms(step.started_at)},
        {"input", step.input},
        {"output", step.output},
        {"errors", step.errors}
    };
    j["completed_at"] = step.completed_at ? Value(to_epoch_ms(*step.completed_at)) : Value(nullptr);
}

void to_json(Value& j, const Execution& execution) {
    j = Value{
        {"id", execution.id},
        {"workflow_id", execution.workflow_id},
        {"orchestration", to_string(execution.orchestration)},
        {"status", to_string(execution.status)},
        {"started_at", to_epoch_ms(execution.started_at)},
        {"input", execution.input},
        {"output", execution.output},
        {"steps", execution.steps},
        {"errors", execution.errors}
    };
    j["completed_at"] = execution.completed_at ? Value(to_epoch_ms(*execution.completed_at)) : Value(nullptr);
}

} // namespace agentorch
