// include/agentorch/orchestration/custom_strategy.h
#ifndef AGENTORCH_ORCHESTRATION_CUSTOM_STRATEGY_H
#define AGENTORCH_ORCHESTRATION_CUSTOM_STRATEGY_H

#include "agentorch/orchestration/strategy.h"
#include <string>
#include <unordered_map>
#include <vector>

namespace agentorch {

// Step-script interpreter. Script steps run in `order`, disabled ones are skipped.
// A failing step is recorded with its script step id and never retried; the
// script then continues unless the step sets parameters.on_error = "abort".
// Without a script the graph is walked depth-first from its start nodes.
//
// Each step type has its own virtual hook so a subclass can replace it.
class CustomStrategy : public OrchestrationStrategy {
public:
    OrchestrationType type() const override { return OrchestrationType::CUSTOM; }
    Value run(OrchestrationContext& ctx) override;

protected:
    struct ScriptState {
        Value data;
        Value results = Value::object(); // script step id -> output
    };

    void execute_steps(OrchestrationContext& ctx, const std::vector<ScriptStep>& steps, ScriptState& state);

    // AgentExecution: run `node_ids` in order, chaining data.
    virtual void execute_agent_step(OrchestrationContext& ctx, const ScriptStep& step, ScriptState& state);
    // WaitCondition: poll the condition hook until true; parameters.timeout_ms,
    // parameters.poll_interval_ms override the configured defaults.
    virtual void execute_wait_step(OrchestrationContext& ctx, const ScriptStep& step, ScriptState& state);
    // MergeResults: parameters.sources (script step ids), parameters.strategy.
    virtual void execute_merge_step(OrchestrationContext& ctx, const ScriptStep& step, ScriptState& state);
    // Branch: `steps` when the condition holds, `else_steps` otherwise.
    virtual void execute_branch_step(OrchestrationContext& ctx, const ScriptStep& step, ScriptState& state);
    // Loop: repeat `steps` while the condition holds, parameters.max_iterations (10) at most.
    virtual void execute_loop_step(OrchestrationContext& ctx, const ScriptStep& step, ScriptState& state);

    bool evaluate(OrchestrationContext& ctx, const ScriptStep& step, const ScriptState& state) const;

private:
    Value run_graph(OrchestrationContext& ctx);
};

} // namespace agentorch

#endif // AGENTORCH_ORCHESTRATION_CUSTOM_STRATEGY_H
