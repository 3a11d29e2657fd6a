#ifndef AGENTORCH_GRAPH_WORKFLOW_GRAPH_H
#define AGENTORCH_GRAPH_WORKFLOW_GRAPH_H

#include "agentorch/common/types.h"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentorch {

// 节点类型标签
namespace node_types {
inline constexpr std::string_view START = "StartNode";
inline constexpr std::string_view END = "EndNode";
inline constexpr std::string_view LLM_AGENT = "LLMAgent";
inline constexpr std::string_view TOOL_AGENT = "ToolAgent";
inline constexpr std::string_view CONDITIONAL_AGENT = "ConditionalAgent";
inline constexpr std::string_view PARALLEL_AGENT = "ParallelAgent";
inline constexpr std::string_view CHECKPOINT_AGENT = "CheckpointAgent";
inline constexpr std::string_view MCP_AGENT = "MCPAgent";
inline constexpr std::string_view FUNCTION = "FunctionNode";
} // namespace node_types

enum class NodeRole : uint8_t {
    PRIMARY_EXECUTOR,
    ASSISTANT,
    VALIDATOR,
    AGGREGATOR,
    COORDINATOR,
    OBSERVER,
    CUSTOM
};

std::optional<NodeRole> parse_node_role(std::string_view text);
std::string to_string(NodeRole role);

struct Port {
    std::string id;
    std::string name;
    std::string data_type = "any";
};

struct NodeOrchestrationSettings {
    bool participates = true;
    bool parallel = true;
    std::vector<NodeRole> roles;
    int priority = 0;

    bool has_role(NodeRole role) const;
};

struct Node {
    NodeId id;
    std::string name;
    std::string type;                              // e.g. "LLMAgent"
    Value properties = Value::object();
    std::vector<Port> input_ports;
    std::vector<Port> output_ports;
    double x = 0.0;                                // editor position, sequential tie-break
    double y = 0.0;
    NodeOrchestrationSettings orchestration;
};

enum class ConnectionKind : uint8_t {
    DATA_FLOW,
    CONTROL_FLOW,
    CONDITIONAL,
    PARALLEL,
    ERROR_FLOW,
    SIGNAL
};

std::optional<ConnectionKind> parse_connection_kind(std::string_view text);

struct Connection {
    std::string id;
    NodeId from_node;
    std::string from_port;
    NodeId to_node;
    std::string to_port;
    ConnectionKind kind = ConnectionKind::DATA_FLOW;
    std::optional<std::string> condition;          // inja expression over the source output
};

enum class ScriptStepType : uint8_t {
    AGENT_EXECUTION,
    WAIT_CONDITION,
    MERGE_RESULTS,
    BRANCH,
    LOOP
};

std::optional<ScriptStepType> parse_script_step_type(std::string_view text);
std::string to_string(ScriptStepType type);

// One entry of a custom orchestration script.
struct ScriptStep {
    std::string id;
    std::string name;
    ScriptStepType type = ScriptStepType::AGENT_EXECUTION;
    int order = 0;
    bool enabled = true;
    std::vector<NodeId> node_ids;                  // AGENT_EXECUTION
    std::optional<std::string> condition;          // WAIT_CONDITION / BRANCH / LOOP
    Value parameters = Value::object();
    std::vector<ScriptStep> steps;                 // BRANCH "then" / LOOP body
    std::vector<ScriptStep> else_steps;            // BRANCH "else"
};

struct WorkflowGraph {
    WorkflowId id;
    std::string name;
    OrchestrationType orchestration_type = OrchestrationType::SEQUENTIAL;
    std::string declared_orchestration;            // raw text as authored
    std::vector<Node> nodes;
    std::vector<Connection> connections;
    std::vector<ScriptStep> script;

    const Node* find_node(const NodeId& node_id) const;
    bool has_node(const NodeId& node_id) const { return find_node(node_id) != nullptr; }

    std::vector<const Connection*> outgoing(const NodeId& node_id) const;
    std::vector<const Connection*> incoming(const NodeId& node_id) const;

    // Throws ValidationError on duplicate ids, dangling connections or
    // script steps naming unknown nodes.
    void validate() const;
};

using GraphSnapshot = std::shared_ptr<const WorkflowGraph>;

} // namespace agentorch

#endif // AGENTORCH_GRAPH_WORKFLOW_GRAPH_H
