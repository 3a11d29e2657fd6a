// src/core/engine.cpp
#include "agentorch/core/engine.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace agentorch {

std::unique_ptr<WorkflowEngine> WorkflowEngine::from_config_file(const std::string& config_path) {
    EngineConfig config = EngineConfig::load(config_path);
    apply_log_level(config.log_level);

    std::shared_ptr<LlmProvider> llm;
    if (config.llm) {
        try {
            llm = std::make_shared<LlamaAdapter>(*config.llm);
        } catch (const CollaboratorError& e) {
            // 模型加载失败时继续运行，LLMAgent 节点会以 CollaboratorError 失败
            spdlog::error("LLM disabled: {}", e.what());
        }
    }
    return std::make_unique<WorkflowEngine>(std::move(config), std::move(llm));
}

WorkflowEngine::WorkflowEngine(EngineConfig config, std::shared_ptr<LlmProvider> llm)
    : config_(std::move(config)),
      llm_(std::move(llm)),
      tools_(std::make_shared<ToolRegistry>()),
      functions_(std::make_shared<FunctionRegistry>()),
      protocols_(std::make_shared<ProtocolClientRegistry>()),
      local_protocol_(std::make_shared<LocalProtocolClient>()),
      workflows_(std::make_shared<InMemoryWorkflowRepository>()),
      executor_(std::make_shared<NodeExecutor>()),
      strategies_(std::make_shared<StrategySelector>()),
      events_(std::make_shared<ExecutionEvents>()),
      history_(std::make_shared<ExecutionStore>(static_cast<size_t>(config_.history_max_entries))) {
    register_builtin_handlers(*executor_, Collaborators{llm_, tools_, protocols_, functions_});

    hooks_.handoff_condition = std::make_shared<ExpressionHandoffCondition>();
    if (config_.magentic_selector == "llm" && llm_) {
        hooks_.node_selector = std::make_shared<LlmNodeSelector>(llm_);
    } else {
        if (config_.magentic_selector != "priority") {
            spdlog::warn("Magentic selector '{}' unavailable, using priority selection", config_.magentic_selector);
        }
        hooks_.node_selector = std::make_shared<PriorityNodeSelector>();
    }
    hooks_.group_chat = std::make_shared<RoundRobinGroupChat>(config_.orchestration.group_chat_max_rounds);
    hooks_.script_condition = std::make_shared<ExpressionScriptCondition>();
}

WorkflowEngine::~WorkflowEngine() = default;

void WorkflowEngine::ensure_not_started(const char* what) const {
    std::lock_guard<std::mutex> lock(service_mutex_);
    if (service_) {
        throw std::logic_error(std::string(what) + " must be called before the first execution starts");
    }
}

ExecutionService& WorkflowEngine::service() {
    std::lock_guard<std::mutex> lock(service_mutex_);
    if (!service_) {
        ExecutionService::Dependencies deps;
        deps.workflows = workflows_;
        deps.executor = executor_;
        deps.strategies = strategies_;
        deps.hooks = hooks_;
        deps.settings = config_.orchestration;
        deps.events = events_;
        deps.history = history_;
        service_ = std::make_unique<ExecutionService>(std::move(deps));
    }
    return *service_;
}

const ExecutionService* WorkflowEngine::service_if_started() const {
    std::lock_guard<std::mutex> lock(service_mutex_);
    return service_.get();
}

WorkflowId WorkflowEngine::add_workflow(WorkflowGraph graph) {
    WorkflowId id = graph.id;
    workflows_->save(std::move(graph));
    return id;
}

WorkflowId WorkflowEngine::load_workflow_file(const std::string& path) {
    WorkflowGraph graph = WorkflowLoader::from_file(path);
    spdlog::info("Loaded workflow {} ({} nodes, {} connections, {})", graph.id, graph.nodes.size(),
                 graph.connections.size(), to_string(graph.orchestration_type));
    return add_workflow(std::move(graph));
}

void WorkflowEngine::register_function(const std::string& name, NodeFunction fn) {
    functions_->register_function(name, std::move(fn));
}

void WorkflowEngine::register_handler(std::shared_ptr<NodeHandler> handler) {
    executor_->register_handler(std::move(handler));
}

void WorkflowEngine::add_protocol_server(const std::string& server_id, std::shared_ptr<const ToolRegistry> tools) {
    local_protocol_->add_server(server_id, std::move(tools));
    protocols_->register_client(server_id, local_protocol_);
}

void WorkflowEngine::register_protocol_client(const std::string& server_id, std::shared_ptr<ProtocolClient> client) {
    protocols_->register_client(server_id, std::move(client));
}

void WorkflowEngine::register_strategy(std::shared_ptr<OrchestrationStrategy> strategy) {
    ensure_not_started("register_strategy");
    strategies_->register_strategy(std::move(strategy));
}

void WorkflowEngine::set_handoff_condition(std::shared_ptr<HandoffConditionHook> hook) {
    ensure_not_started("set_handoff_condition");
    hooks_.handoff_condition = std::move(hook);
}

void WorkflowEngine::set_node_selector(std::shared_ptr<NodeSelector> selector) {
    ensure_not_started("set_node_selector");
    hooks_.node_selector = std::move(selector);
}

void WorkflowEngine::set_group_chat_session(std::shared_ptr<GroupChatSession> session) {
    ensure_not_started("set_group_chat_session");
    hooks_.group_chat = std::move(session);
}

void WorkflowEngine::set_script_condition(std::shared_ptr<ScriptConditionHook> hook) {
    ensure_not_started("set_script_condition");
    hooks_.script_condition = std::move(hook);
}

ExecutionId WorkflowEngine::start_execution(const WorkflowId& workflow_id, const Value& input) {
    return service().start(workflow_id, input);
}

bool WorkflowEngine::pause_execution(const ExecutionId& id) {
    return service().pause(id);
}

bool WorkflowEngine::resume_execution(const ExecutionId& id) {
    return service().resume(id);
}

bool WorkflowEngine::stop_execution(const ExecutionId& id) {
    return service().cancel(id);
}

std::optional<Execution> WorkflowEngine::get_execution_status(const ExecutionId& id) const {
    const ExecutionService* svc = service_if_started();
    return svc ? svc->status(id) : std::nullopt;
}

std::vector<Execution> WorkflowEngine::list_workflow_executions(const WorkflowId& workflow_id) const {
    const ExecutionService* svc = service_if_started();
    return svc ? svc->list_workflow_executions(workflow_id) : std::vector<Execution>{};
}

std::vector<Step> WorkflowEngine::list_execution_steps(const ExecutionId& id) const {
    const ExecutionService* svc = service_if_started();
    return svc ? svc->list_steps(id) : std::vector<Step>{};
}

std::vector<ExecutionError> WorkflowEngine::list_execution_errors(const ExecutionId& id) const {
    const ExecutionService* svc = service_if_started();
    return svc ? svc->list_errors(id) : std::vector<ExecutionError>{};
}

bool WorkflowEngine::wait_for_execution(const ExecutionId& id, std::chrono::milliseconds timeout) {
    return service().wait(id, timeout);
}

} // namespace agentorch
