// include/agentorch/core/engine.h
#ifndef AGENTORCH_CORE_ENGINE_H
#define AGENTORCH_CORE_ENGINE_H

#include "agentorch/core/config.h"
#include "agentorch/execution/execution_service.h"
#include "agentorch/executor/builtin_handlers.h"
#include "agentorch/graph/workflow_loader.h"
#include "agentorch/graph/workflow_repository.h"
#include "agentorch/orchestration/strategy_selector.h"
#include <memory>
#include <string>

namespace agentorch {

// Wires repository, node dispatch, strategies and the execution service together.
// Collaborators, hooks and strategies are configured before the first execution
// starts; afterwards those setters throw std::logic_error.
class WorkflowEngine {
public:
    // Reads the config file, applies its log level and loads the llama.cpp model
    // when an "llm" section is present.
    static std::unique_ptr<WorkflowEngine> from_config_file(const std::string& config_path = "agentorch_config.json");

    explicit WorkflowEngine(EngineConfig config = {}, std::shared_ptr<LlmProvider> llm = nullptr);
    ~WorkflowEngine();

    // ---- workflows ----
    WorkflowId add_workflow(WorkflowGraph graph);
    WorkflowId load_workflow_file(const std::string& path);
    WorkflowRepository& workflows() { return *workflows_; }

    // ---- collaborators & extension points ----
    template<typename Func>
    void register_tool(std::string name, Func&& func) {
        ensure_not_started("register_tool");
        tools_->register_tool(std::move(name), std::forward<Func>(func));
    }
    void register_function(const std::string& name, NodeFunction fn);
    void register_handler(std::shared_ptr<NodeHandler> handler);
    void add_protocol_server(const std::string& server_id, std::shared_ptr<const ToolRegistry> tools);
    void register_protocol_client(const std::string& server_id, std::shared_ptr<ProtocolClient> client);
    void register_strategy(std::shared_ptr<OrchestrationStrategy> strategy);

    void set_handoff_condition(std::shared_ptr<HandoffConditionHook> hook);
    void set_node_selector(std::shared_ptr<NodeSelector> selector);
    void set_group_chat_session(std::shared_ptr<GroupChatSession> session);
    void set_script_condition(std::shared_ptr<ScriptConditionHook> hook);

    LlmProvider* llm() { return llm_.get(); }
    const EngineConfig& config() const { return config_; }

    // ---- execution API ----
    ExecutionId start_execution(const WorkflowId& workflow_id, const Value& input = Value::object());
    bool pause_execution(const ExecutionId& id);
    bool resume_execution(const ExecutionId& id);
    bool stop_execution(const ExecutionId& id);
    std::optional<Execution> get_execution_status(const ExecutionId& id) const;
    std::vector<Execution> list_workflow_executions(const WorkflowId& workflow_id) const;
    std::vector<Step> list_execution_steps(const ExecutionId& id) const;
    std::vector<ExecutionError> list_execution_errors(const ExecutionId& id) const;
    bool wait_for_execution(const ExecutionId& id, std::chrono::milliseconds timeout);

    ExecutionEvents& events() { return *events_; }

private:
    void ensure_not_started(const char* what) const;
    ExecutionService& service();
    const ExecutionService* service_if_started() const;

    EngineConfig config_;
    std::shared_ptr<LlmProvider> llm_;
    std::shared_ptr<ToolRegistry> tools_;
    std::shared_ptr<FunctionRegistry> functions_;
    std::shared_ptr<ProtocolClientRegistry> protocols_;
    std::shared_ptr<LocalProtocolClient> local_protocol_;
    std::shared_ptr<InMemoryWorkflowRepository> workflows_;
    std::shared_ptr<NodeExecutor> executor_;
    std::shared_ptr<StrategySelector> strategies_;
    std::shared_ptr<ExecutionEvents> events_;
    std::shared_ptr<ExecutionStore> history_;
    OrchestrationHooks hooks_;

    mutable std::mutex service_mutex_;
    std::unique_ptr<ExecutionService> service_;
};

} // namespace agentorch

#endif // AGENTORCH_CORE_ENGINE_H
