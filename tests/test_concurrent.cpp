// tests/test_concurrent.cpp
#include <catch2/catch_test_macros.hpp>
#include "test_support.h"
#include <algorithm>

using namespace agentorch;
using namespace agentorch::test;

namespace {

WorkflowGraph fan_out(const std::string& id, size_t branches) {
    WorkflowGraph graph;
    graph.id = id;
    graph.orchestration_type = OrchestrationType::CONCURRENT;
    graph.nodes.push_back(make_node("start", node_types::START));
    for (size_t i = 0; i < branches; ++i) {
        graph.nodes.push_back(function_node("b" + std::to_string(i), "increment"));
        graph.connections.push_back(connect("start", "b" + std::to_string(i)));
    }
    return graph;
}

size_t count_status(const Execution& execution, ExecutionStatus status) {
    return static_cast<size_t>(std::count_if(execution.steps.begin(), execution.steps.end(),
                                             [&](const Step& s) { return s.status == status; }));
}

} // namespace

TEST_CASE("One failing branch does not abort the others", "[concurrent]") {
    Harness h;
    auto graph = fan_out("partial", 4);
    graph.nodes[2].properties["function"] = "fail";

    auto execution = h.run(graph, {{"count", 0}});

    REQUIRE(execution.status == ExecutionStatus::COMPLETED);
    REQUIRE(execution.errors.size() == 1);
    REQUIRE(execution.errors[0].node_id == std::optional<NodeId>("b1"));
    REQUIRE(count_status(execution, ExecutionStatus::COMPLETED) == 3);
    REQUIRE(count_status(execution, ExecutionStatus::FAILED) == 1);
    REQUIRE(h.increments.load() == 3);
}

TEST_CASE("Branch steps stay ordered across threads", "[concurrent]") {
    Harness h;
    auto graph = fan_out("ordered-branches", 8);
    for (size_t i = 1; i < graph.nodes.size(); i += 2) {
        graph.nodes[i].properties["function"] = "slow";
    }
    Node aggregator = function_node("collect");
    aggregator.orchestration.roles = {NodeRole::AGGREGATOR};
    graph.nodes.push_back(aggregator);

    auto execution = h.run(graph, {{"count", 0}});

    REQUIRE(execution.status == ExecutionStatus::COMPLETED);
    REQUIRE(execution.steps.size() == 9);
    REQUIRE(execution.steps.back().node_id == "collect");
    for (size_t i = 0; i < execution.steps.size(); ++i) {
        const auto& step = execution.steps[i];
        REQUIRE(graph.has_node(step.node_id));
        if (i > 0) {
            REQUIRE(execution.steps[i - 1].sequence < step.sequence);
            REQUIRE(execution.steps[i - 1].started_at <= step.started_at);
        }
    }
}

TEST_CASE("Branches see the same input; output is keyed by node id", "[concurrent]") {
    Harness h;
    auto execution = h.run(fan_out("keyed", 3), {{"count", 10}});

    REQUIRE(execution.status == ExecutionStatus::COMPLETED);
    REQUIRE(execution.steps.size() == 3);
    for (const auto* id : {"b0", "b1", "b2"}) {
        REQUIRE(execution.output[id]["count"] == 11);
    }
    REQUIRE_FALSE(execution.output.contains("start"));
}

TEST_CASE("An aggregator runs after the join", "[concurrent]") {
    Harness h;
    auto graph = fan_out("aggregated", 2);
    Node aggregator = function_node("collect");
    aggregator.orchestration.roles = {NodeRole::AGGREGATOR};
    graph.nodes.push_back(aggregator);

    auto execution = h.run(graph, {{"count", 1}});

    REQUIRE(execution.status == ExecutionStatus::COMPLETED);
    REQUIRE(execution.steps.size() == 3);
    REQUIRE(execution.steps.back().node_id == "collect");
    REQUIRE(execution.steps.back().input.contains("b0"));
    REQUIRE(execution.output["b1"]["count"] == 2);
}

TEST_CASE("Nodes opting out of parallel work are skipped", "[concurrent]") {
    Harness h;
    auto graph = fan_out("opt-out", 3);
    graph.nodes[1].orchestration.parallel = false;
    graph.nodes[2].orchestration.participates = false;

    auto execution = h.run(graph, {{"count", 0}});

    REQUIRE(execution.steps.size() == 1);
    REQUIRE(execution.steps[0].node_id == "b2");
}

TEST_CASE("No eligible branch is an orchestration failure", "[concurrent]") {
    Harness h;
    auto execution = h.run(fan_out("empty", 0));

    REQUIRE(execution.status == ExecutionStatus::FAILED);
    REQUIRE(execution.steps.empty());
    REQUIRE(execution.errors.size() == 1);
    REQUIRE(execution.errors[0].kind == ErrorKind::ORCHESTRATION);
}
