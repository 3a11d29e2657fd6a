// tests/test_workflow_loader.cpp
#include <catch2/catch_test_macros.hpp>
#include "agentorch/common/errors.h"
#include "agentorch/graph/workflow_loader.h"

using namespace agentorch;

TEST_CASE("Load a workflow from YAML", "[loader]") {
    auto graph = WorkflowLoader::from_yaml_string(R"(
id: support
name: Support desk
orchestration: handoff
nodes:
  - id: triage
    type: ConditionalAgent
    position: {x: 10, y: 20}
    properties:
      condition: "urgent"
    orchestration:
      roles: [coordinator]
      priority: 5
      parallel: false
    inputs: [request]
    outputs:
      - {id: decision, name: Decision, type: bool}
  - id: agent
    type: LLMAgent
    properties:
      prompt: "Answer {{ request }}"
connections:
  - from: triage
    to: {node: agent, port: request}
    kind: conditional
    condition: "condition_result"
)");

    REQUIRE(graph.id == "support");
    REQUIRE(graph.orchestration_type == OrchestrationType::HANDOFF);
    REQUIRE(graph.nodes.size() == 2);

    const Node* triage = graph.find_node("triage");
    REQUIRE(triage != nullptr);
    REQUIRE(triage->x == 10.0);
    REQUIRE(triage->y == 20.0);
    REQUIRE(triage->orchestration.has_role(NodeRole::COORDINATOR));
    REQUIRE(triage->orchestration.priority == 5);
    REQUIRE_FALSE(triage->orchestration.parallel);
    REQUIRE(triage->orchestration.participates);
    REQUIRE(triage->input_ports.size() == 1);
    REQUIRE(triage->output_ports.at(0).data_type == "bool");
    REQUIRE(graph.find_node("agent")->name == "agent");

    REQUIRE(graph.connections.size() == 1);
    const auto& c = graph.connections[0];
    REQUIRE(c.id == "triage->agent");
    REQUIRE(c.to_port == "request");
    REQUIRE(c.kind == ConnectionKind::CONDITIONAL);
    REQUIRE(c.condition == std::optional<std::string>("condition_result"));
}

TEST_CASE("Load a custom script with nested steps", "[loader]") {
    auto graph = WorkflowLoader::from_yaml_string(R"(
id: scripted
orchestration: custom
nodes:
  - {id: a, type: FunctionNode, properties: {function: identity}}
script:
  - id: first
    type: agent_execution
    order: 2
    nodes: [a]
  - type: Loop
    order: 1
    condition: "count < 3"
    parameters: {max_iterations: 4}
    steps:
      - {type: AgentExecution, nodes: [a]}
  - id: off
    type: wait_condition
    enabled: false
)");

    REQUIRE(graph.script.size() == 3);
    REQUIRE(graph.script[0].order == 2);
    REQUIRE(graph.script[1].id == "step-1");
    REQUIRE(graph.script[1].type == ScriptStepType::LOOP);
    REQUIRE(graph.script[1].parameters["max_iterations"] == 4);
    REQUIRE(graph.script[1].steps.size() == 1);
    REQUIRE(graph.script[1].steps[0].id == "step-1.0");
    REQUIRE_FALSE(graph.script[2].enabled);
}

TEST_CASE("Orchestration names are tolerant, unknown ones are kept", "[loader]") {
    auto chat = WorkflowLoader::from_yaml_string("id: w\norchestration: group-chat\nnodes: []\n");
    REQUIRE(chat.orchestration_type == OrchestrationType::GROUP_CHAT);

    auto odd = WorkflowLoader::from_yaml_string("id: w\norchestration: swarm\nnodes: []\n");
    REQUIRE(odd.orchestration_type == OrchestrationType::UNKNOWN);
    REQUIRE(odd.declared_orchestration == "swarm");
}

TEST_CASE("Malformed workflow documents are rejected", "[loader]") {
    REQUIRE_THROWS_AS(WorkflowLoader::from_yaml_string("id: [unclosed"), ValidationError);
    REQUIRE_THROWS_AS(WorkflowLoader::from_yaml_string("name: no id\n"), ValidationError);
    REQUIRE_THROWS_AS(WorkflowLoader::from_yaml_string(R"(
id: w
nodes:
  - {id: a, type: FunctionNode}
connections:
  - {from: a, to: b}
)"), ValidationError);
    REQUIRE_THROWS_AS(WorkflowLoader::from_yaml_string(R"(
id: w
nodes:
  - {id: a, type: FunctionNode}
connections:
  - {from: a, to: a, kind: teleport}
)"), ValidationError);
    REQUIRE_THROWS_AS(WorkflowLoader::from_yaml_string(R"(
id: w
nodes:
  - {id: a, type: FunctionNode, orchestration: {roles: [overlord]}}
)"), ValidationError);
    REQUIRE_THROWS_AS(WorkflowLoader::from_file("/nonexistent/workflow.yaml"), ValidationError);
}
