// src/executor/builtin_handlers.cpp
#include "agentorch/executor/builtin_handlers.h"
#include "agentorch/common/errors.h"
#include "agentorch/utils/template_renderer.h"
#include "agentorch/utils/value_merge.h"
#include <spdlog/spdlog.h>

namespace agentorch {

namespace {

std::string string_property(const Node& node, const char* key, const std::string& fallback = {}) {
    auto it = node.properties.find(key);
    if (it == node.properties.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_string()) {
        throw ValidationError("Node '" + node.id + "': property '" + key + "' must be a string");
    }
    return it->get<std::string>();
}

void require_property(const Node& node, const char* key) {
    if (string_property(node, key).empty()) {
        throw ValidationError("Node '" + node.id + "' (" + node.type + ") requires property '" + key + "'");
    }
}

// 渲染 arguments 中的每个模板，非字符串值按 JSON 文本传入
ToolArguments render_arguments(const Node& node, const Value& data) {
    ToolArguments args;
    auto it = node.properties.find("arguments");
    if (it == node.properties.end() || it->is_null()) {
        return args;
    }
    if (!it->is_object()) {
        throw ValidationError("Node '" + node.id + "': 'arguments' must be an object");
    }
    for (const auto& [key, value] : it->items()) {
        if (value.is_string()) {
            args[key] = InjaTemplateRenderer::render(value.get<std::string>(), data);
        } else {
            args[key] = value.dump();
        }
    }
    return args;
}

} // namespace

// ---------------------------------------------------------------- passthrough

Value PassthroughHandler::execute(const Node&, const Value& input, ExecutionScope&) {
    return input;
}

// ---------------------------------------------------------------- LLMAgent

std::string LlmAgentHandler::node_type() const {
    return std::string(node_types::LLM_AGENT);
}

Value LlmAgentHandler::execute(const Node& node, const Value& input, ExecutionScope& scope) {
    if (!llm_ || !llm_->is_available()) {
        throw CollaboratorError("LLM provider not available for node: " + node.id);
    }

    Value data = as_object(input);
    auto handle = scope.agents().get_or_create(node);
    data["history"] = handle->transcript();
    data["node"] = {{"id", node.id}, {"name", node.name}};
    if (!data.contains("input")) {
        data["input"] = input;
    }

    std::string prompt = InjaTemplateRenderer::render(
        string_property(node, "prompt", "{{ input }}"), data);
    std::string system_prompt = string_property(node, "system_prompt");
    if (!system_prompt.empty()) {
        prompt = InjaTemplateRenderer::render(system_prompt, data) + "\n\n" + prompt;
    }

    std::string response = llm_->complete(prompt);
    handle->append("user", prompt);
    handle->append("assistant", response);

    Value output = as_object(input);
    output[string_property(node, "output_key", "response")] = response;
    return output;
}

// ---------------------------------------------------------------- ToolAgent

std::string ToolAgentHandler::node_type() const {
    return std::string(node_types::TOOL_AGENT);
}

void ToolAgentHandler::validate(const Node& node) const {
    require_property(node, "tool");
}

Value ToolAgentHandler::execute(const Node& node, const Value& input, ExecutionScope&) {
    if (!tools_) {
        throw CollaboratorError("Tool registry not available for node: " + node.id);
    }
    const std::string tool = string_property(node, "tool");
    Value output = as_object(input);
    ToolArguments args = render_arguments(node, output);

    Value result = tools_->call_tool(tool, args);
    output[string_property(node, "output_key", "tool_result")] = std::move(result);
    return output;
}

// ---------------------------------------------------------------- ConditionalAgent

std::string ConditionalAgentHandler::node_type() const {
    return std::string(node_types::CONDITIONAL_AGENT);
}

void ConditionalAgentHandler::validate(const Node& node) const {
    require_property(node, "condition");
}

Value ConditionalAgentHandler::execute(const Node& node, const Value& input, ExecutionScope&) {
    Value output = as_object(input);
    output["condition_result"] = evaluate_condition(string_property(node, "condition"), output);
    return output;
}

// ---------------------------------------------------------------- CheckpointAgent

std::string CheckpointAgentHandler::node_type() const {
    return std::string(node_types::CHECKPOINT_AGENT);
}

Value CheckpointAgentHandler::execute(const Node& node, const Value& input, ExecutionScope& scope) {
    const std::string key = string_property(node, "checkpoint_key", node.id);
    if (!scope.checkpoints().save(key, input)) {
        spdlog::warn("[{}] checkpoint '{}' was not stored", scope.execution_id(), key);
    }
    return input;
}

// ---------------------------------------------------------------- MCPAgent

std::string McpAgentHandler::node_type() const {
    return std::string(node_types::MCP_AGENT);
}

void McpAgentHandler::validate(const Node& node) const {
    require_property(node, "server_id");
    require_property(node, "tool");
}

Value McpAgentHandler::execute(const Node& node, const Value& input, ExecutionScope&) {
    if (!protocols_) {
        throw CollaboratorError("Protocol client registry not available for node: " + node.id);
    }
    const std::string server_id = string_property(node, "server_id");
    auto client = protocols_->client_for(server_id);

    bool auto_connect = node.properties.value("auto_connect", true);
    if (auto_connect && client->status(server_id).state != ConnectionState::CONNECTED) {
        client->connect(server_id);
    }

    Value output = as_object(input);
    ToolArguments args = render_arguments(node, output);
    Value result = client->call_tool(server_id, string_property(node, "tool"), args);
    output[string_property(node, "output_key", "mcp_result")] = std::move(result);
    return output;
}

// ---------------------------------------------------------------- FunctionNode

FunctionRegistry::FunctionRegistry() {
    functions_["identity"] = [](const Value& input) { return input; };
}

void FunctionRegistry::register_function(const std::string& name, NodeFunction fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    functions_[name] = std::move(fn);
}

bool FunctionRegistry::has_function(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return functions_.count(name) > 0;
}

Value FunctionRegistry::call(const std::string& name, const Value& input) const {
    NodeFunction fn;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = functions_.find(name);
        if (it == functions_.end()) {
            throw ValidationError("Function not registered: " + name);
        }
        fn = it->second;
    }
    return fn(input);
}

std::string FunctionNodeHandler::node_type() const {
    return std::string(node_types::FUNCTION);
}

void FunctionNodeHandler::validate(const Node& node) const {
    require_property(node, "function");
    if (functions_ && !functions_->has_function(string_property(node, "function"))) {
        throw ValidationError("Node '" + node.id + "' names unknown function: " +
                              string_property(node, "function"));
    }
}

Value FunctionNodeHandler::execute(const Node& node, const Value& input, ExecutionScope&) {
    if (!functions_) {
        throw CollaboratorError("Function registry not available for node: " + node.id);
    }
    return functions_->call(string_property(node, "function"), input);
}

// ----------------------------------------------------------------

void register_builtin_handlers(NodeExecutor& executor, const Collaborators& collaborators) {
    executor.register_handler(std::make_shared<PassthroughHandler>(std::string(node_types::START)));
    executor.register_handler(std::make_shared<PassthroughHandler>(std::string(node_types::END)));
    executor.register_handler(std::make_shared<PassthroughHandler>(std::string(node_types::PARALLEL_AGENT)));
    executor.register_handler(std::make_shared<LlmAgentHandler>(collaborators.llm));
    executor.register_handler(std::make_shared<ToolAgentHandler>(collaborators.tools));
    executor.register_handler(std::make_shared<ConditionalAgentHandler>());
    executor.register_handler(std::make_shared<CheckpointAgentHandler>());
    executor.register_handler(std::make_shared<McpAgentHandler>(collaborators.protocols));
    executor.register_handler(std::make_shared<FunctionNodeHandler>(collaborators.functions));
}

} // namespace agentorch
