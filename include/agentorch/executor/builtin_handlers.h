// include/agentorch/executor/builtin_handlers.h
#ifndef AGENTORCH_EXECUTOR_BUILTIN_HANDLERS_H
#define AGENTORCH_EXECUTOR_BUILTIN_HANDLERS_H

#include "agentorch/executor/node_executor.h"
#include "agentorch/llm/llm_provider.h"
#include "agentorch/protocol/protocol_client.h"
#include "agentorch/tools/registry.h"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentorch {

using NodeFunction = std::function<Value(const Value&)>;

// Named functions callable from FunctionNode ("function" property).
class FunctionRegistry {
public:
    FunctionRegistry(); // 注册 identity

    void register_function(const std::string& name, NodeFunction fn);
    bool has_function(const std::string& name) const;
    Value call(const std::string& name, const Value& input) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, NodeFunction> functions_;
};

// External collaborators the built-in handlers call out to. Any may be null;
// a node needing a missing collaborator fails with CollaboratorError.
struct Collaborators {
    std::shared_ptr<LlmProvider> llm;
    std::shared_ptr<const ToolRegistry> tools;
    std::shared_ptr<ProtocolClientRegistry> protocols;
    std::shared_ptr<FunctionRegistry> functions;
};

// StartNode, EndNode, ParallelAgent: output = input.
class PassthroughHandler : public NodeHandler {
public:
    explicit PassthroughHandler(std::string node_type) : node_type_(std::move(node_type)) {}

    std::string node_type() const override { return node_type_; }
    Value execute(const Node& node, const Value& input, ExecutionScope& scope) override;

private:
    std::string node_type_;
};

// properties: prompt (inja), system_prompt, output_key = "response"
class LlmAgentHandler : public NodeHandler {
public:
    explicit LlmAgentHandler(std::shared_ptr<LlmProvider> llm) : llm_(std::move(llm)) {}

    std::string node_type() const override;
    Value execute(const Node& node, const Value& input, ExecutionScope& scope) override;

private:
    std::shared_ptr<LlmProvider> llm_;
};

// properties: tool, arguments {name: inja template}, output_key = "tool_result"
class ToolAgentHandler : public NodeHandler {
public:
    explicit ToolAgentHandler(std::shared_ptr<const ToolRegistry> tools) : tools_(std::move(tools)) {}

    std::string node_type() const override;
    Value execute(const Node& node, const Value& input, ExecutionScope& scope) override;
    void validate(const Node& node) const override;

private:
    std::shared_ptr<const ToolRegistry> tools_;
};

// properties: condition (inja expression); adds "condition_result"
class ConditionalAgentHandler : public NodeHandler {
public:
    std::string node_type() const override;
    Value execute(const Node& node, const Value& input, ExecutionScope& scope) override;
    void validate(const Node& node) const override;
};

// properties: checkpoint_key = node id. Saves the input, returns it unchanged.
class CheckpointAgentHandler : public NodeHandler {
public:
    std::string node_type() const override;
    Value execute(const Node& node, const Value& input, ExecutionScope& scope) override;
};

// properties: server_id, tool, arguments, auto_connect = true, output_key = "mcp_result"
class McpAgentHandler : public NodeHandler {
public:
    explicit McpAgentHandler(std::shared_ptr<ProtocolClientRegistry> protocols)
        : protocols_(std::move(protocols)) {}

    std::string node_type() const override;
    Value execute(const Node& node, const Value& input, ExecutionScope& scope) override;
    void validate(const Node& node) const override;

private:
    std::shared_ptr<ProtocolClientRegistry> protocols_;
};

// properties: function. Output is whatever the function returns.
class FunctionNodeHandler : public NodeHandler {
public:
    explicit FunctionNodeHandler(std::shared_ptr<FunctionRegistry> functions)
        : functions_(std::move(functions)) {}

    std::string node_type() const override;
    Value execute(const Node& node, const Value& input, ExecutionScope& scope) override;
    void validate(const Node& node) const override;

private:
    std::shared_ptr<FunctionRegistry> functions_;
};

void register_builtin_handlers(NodeExecutor& executor, const Collaborators& collaborators);

} // namespace agentorch

#endif // AGENTORCH_EXECUTOR_BUILTIN_HANDLERS_H
