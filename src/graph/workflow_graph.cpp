// src/graph/workflow_graph.cpp
#include "agentorch/graph/workflow_graph.h"
#include "agentorch/common/errors.h"
#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace agentorch {

namespace {

std::string normalize(std::string_view text) {
    std::string s;
    s.reserve(text.size());
    for (char c : text) {
        if (c == '_' || c == '-' || c == ' ') continue;
        s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return s;
}

void validate_script(const WorkflowGraph& graph, const std::vector<ScriptStep>& steps) {
    for (const auto& step : steps) {
        for (const auto& node_id : step.node_ids) {
            if (!graph.has_node(node_id)) {
                throw ValidationError("Script step '" + step.id + "' references unknown node: " + node_id);
            }
        }
        validate_script(graph, step.steps);
        validate_script(graph, step.else_steps);
    }
}

} // namespace

std::optional<NodeRole> parse_node_role(std::string_view text) {
    const std::string s = normalize(text);
    if (s == "primaryexecutor") return NodeRole::PRIMARY_EXECUTOR;
    if (s == "assistant")       return NodeRole::ASSISTANT;
    if (s == "validator")       return NodeRole::VALIDATOR;
    if (s == "aggregator")      return NodeRole::AGGREGATOR;
    if (s == "coordinator")     return NodeRole::COORDINATOR;
    if (s == "observer")        return NodeRole::OBSERVER;
    if (s == "custom")          return NodeRole::CUSTOM;
    return std::nullopt;
}

std::string to_string(NodeRole role) {
    switch (role) {
        case NodeRole::PRIMARY_EXECUTOR: return "primary_executor";
        case NodeRole::ASSISTANT:        return "assistant";
        case NodeRole::VALIDATOR:        return "validator";
        case NodeRole::AGGREGATOR:       return "aggregator";
        case NodeRole::COORDINATOR:      return "coordinator";
        case NodeRole::OBSERVER:         return "observer";
        case NodeRole::CUSTOM:           return "custom";
    }
    return "custom";
}

std::optional<ConnectionKind> parse_connection_kind(std::string_view text) {
    const std::string s = normalize(text);
    if (s == "dataflow")    return ConnectionKind::DATA_FLOW;
    if (s == "controlflow") return ConnectionKind::CONTROL_FLOW;
    if (s == "conditional") return ConnectionKind::CONDITIONAL;
    if (s == "parallel")    return ConnectionKind::PARALLEL;
    if (s == "error")       return ConnectionKind::ERROR_FLOW;
    if (s == "signal")      return ConnectionKind::SIGNAL;
    return std::nullopt;
}

std::optional<ScriptStepType> parse_script_step_type(std::string_view text) {
    const std::string s = normalize(text);
    if (s == "agentexecution") return ScriptStepType::AGENT_EXECUTION;
    if (s == "waitcondition")  return ScriptStepType::WAIT_CONDITION;
    if (s == "mergeresults")   return ScriptStepType::MERGE_RESULTS;
    if (s == "branch")         return ScriptStepType::BRANCH;
    if (s == "loop")           return ScriptStepType::LOOP;
    return std::nullopt;
}

std::string to_string(ScriptStepType type) {
    switch (type) {
        case ScriptStepType::AGENT_EXECUTION: return "agent_execution";
        case ScriptStepType::WAIT_CONDITION:  return "wait_condition";
        case ScriptStepType::MERGE_RESULTS:   return "merge_results";
        case ScriptStepType::BRANCH:          return "branch";
        case ScriptStepType::LOOP:            return "loop";
    }
    return "agent_execution";
}

bool NodeOrchestrationSettings::has_role(NodeRole role) const {
    return std::find(roles.begin(), roles.end(), role) != roles.end();
}

const Node* WorkflowGraph::find_node(const NodeId& node_id) const {
    auto it = std::find_if(nodes.begin(), nodes.end(),
                           [&node_id](const Node& n) { return n.id == node_id; });
    return it != nodes.end() ? &*it : nullptr;
}

std::vector<const Connection*> WorkflowGraph::outgoing(const NodeId& node_id) const {
    std::vector<const Connection*> result;
    for (const auto& c : connections) {
        if (c.from_node == node_id) result.push_back(&c);
    }
    return result;
}

std::vector<const Connection*> WorkflowGraph::incoming(const NodeId& node_id) const {
    std::vector<const Connection*> result;
    for (const auto& c : connections) {
        if (c.to_node == node_id) result.push_back(&c);
    }
    return result;
}

void WorkflowGraph::validate() const {
    if (id.empty()) {
        throw ValidationError("Workflow has no id");
    }

    std::unordered_set<NodeId> seen;
    for (const auto& node : nodes) {
        if (node.id.empty()) {
            throw ValidationError("Workflow '" + id + "' contains a node without id");
        }
        if (node.type.empty()) {
            throw ValidationError("Node '" + node.id + "' has no type");
        }
        if (!seen.insert(node.id).second) {
            throw ValidationError("Duplicate node id in workflow '" + id + "': " + node.id);
        }
    }

    for (const auto& c : connections) {
        if (!has_node(c.from_node)) {
            throw ValidationError("Connection '" + c.id + "' starts at unknown node: " + c.from_node);
        }
        if (!has_node(c.to_node)) {
            throw ValidationError("Connection '" + c.id + "' ends at unknown node: " + c.to_node);
        }
    }

    validate_script(*this, script);
}

} // namespace agentorch
