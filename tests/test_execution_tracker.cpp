// tests/test_execution_tracker.cpp
#include <catch2/catch_test_macros.hpp>
#include "agentorch/execution/execution_store.h"
#include "agentorch/execution/execution_tracker.h"
#include "test_support.h"
#include <future>
#include <thread>
#include <vector>

using namespace agentorch;

namespace {

struct Fixture {
    Fixture()
        : graph(std::make_shared<const WorkflowGraph>(test::linear_workflow("wf", 3))),
          events(std::make_shared<ExecutionEvents>()),
          tracker("exec-1", graph, Value{{"k", 1}}, events) {}

    GraphSnapshot graph;
    std::shared_ptr<ExecutionEvents> events;
    ExecutionTracker tracker;

    const Node& node(size_t i) const { return graph->nodes.at(i); }
};

} // namespace

TEST_CASE("Tracker records steps with increasing sequence", "[tracker]") {
    Fixture f;
    std::vector<uint64_t> completed;
    f.events->on_step_completed([&](const StepCompletedEvent& e) { completed.push_back(e.step.sequence); });

    auto s1 = f.tracker.begin_step(f.node(0), Value{{"k", 1}});
    auto s2 = f.tracker.begin_step(f.node(1), Value{{"k", 2}});
    REQUIRE(s1);
    REQUIRE(s2);
    f.tracker.complete_step(*s2, Value{{"out", 2}});
    f.tracker.complete_step(*s1, Value{{"out", 1}});

    auto execution = f.tracker.snapshot();
    REQUIRE(execution.workflow_id == "wf");
    REQUIRE(execution.status == ExecutionStatus::RUNNING);
    REQUIRE(execution.steps.size() == 2);
    REQUIRE(execution.steps[0].sequence == 1);
    REQUIRE(execution.steps[1].sequence == 2);
    REQUIRE(execution.steps[0].started_at <= execution.steps[1].started_at);
    REQUIRE(execution.steps[0].status == ExecutionStatus::COMPLETED);
    REQUIRE(execution.steps[0].completed_at.has_value());
    REQUIRE(completed == std::vector<uint64_t>{2, 1});
}

TEST_CASE("Steps for nodes outside the snapshot are rejected", "[tracker]") {
    Fixture f;
    Node stranger = test::function_node("stranger");
    REQUIRE_THROWS_AS(f.tracker.begin_step(stranger, Value::object()), ValidationError);
}

TEST_CASE("Failed steps attach the error to step and execution", "[tracker]") {
    Fixture f;
    std::vector<ExecutionError> errors;
    f.events->on_execution_error([&](const ExecutionErrorEvent& e) { errors.push_back(e.error); });

    auto s = f.tracker.begin_step(f.node(0), Value::object());
    f.tracker.fail_step(*s, NodeExecutionError("n0", "broken"));

    auto execution = f.tracker.snapshot();
    REQUIRE(execution.steps[0].status == ExecutionStatus::FAILED);
    REQUIRE(execution.steps[0].errors.size() == 1);
    REQUIRE(execution.errors.size() == 1);
    REQUIRE(execution.errors[0].node_id == std::optional<NodeId>("n0"));
    REQUIRE(execution.errors[0].step_id == s);
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].kind == ErrorKind::NODE_EXECUTION);
}

TEST_CASE("Status transitions follow the lifecycle", "[tracker]") {
    Fixture f;
    std::vector<std::pair<ExecutionStatus, ExecutionStatus>> changes;
    f.events->on_status_changed([&](const StatusChangedEvent& e) {
        changes.emplace_back(e.old_status, e.new_status);
    });

    REQUIRE_FALSE(f.tracker.resume());
    REQUIRE(f.tracker.pause());
    REQUIRE_FALSE(f.tracker.pause());
    REQUIRE(f.tracker.resume());
    REQUIRE(f.tracker.complete(Value{{"done", true}}));

    REQUIRE_FALSE(f.tracker.cancel());
    REQUIRE_FALSE(f.tracker.fail(std::nullopt));
    REQUIRE_FALSE(f.tracker.begin_step(f.node(0), Value::object()).has_value());
    REQUIRE_FALSE(f.tracker.add_error(ExecutionError{"late"}));

    auto execution = f.tracker.snapshot();
    REQUIRE(execution.status == ExecutionStatus::COMPLETED);
    REQUIRE(execution.output["done"] == true);
    REQUIRE(execution.completed_at.has_value());
    REQUIRE(changes.size() == 3);
    REQUIRE(changes.back().second == ExecutionStatus::COMPLETED);
}

TEST_CASE("Cancel is immediate; begun steps may still close", "[tracker]") {
    Fixture f;
    auto s = f.tracker.begin_step(f.node(0), Value::object());
    REQUIRE(f.tracker.cancel());
    REQUIRE(f.tracker.status() == ExecutionStatus::CANCELLED);

    f.tracker.complete_step(*s, Value{{"late", true}});
    REQUIRE(f.tracker.snapshot().steps[0].status == ExecutionStatus::COMPLETED);
    REQUIRE_THROWS_AS(f.tracker.checkpoint(), CancelledError);
    REQUIRE_FALSE(f.tracker.complete(Value::object()));
}

TEST_CASE("Checkpoint blocks while paused", "[tracker]") {
    Fixture f;
    REQUIRE(f.tracker.pause());

    auto waiter = std::async(std::launch::async, [&] { f.tracker.checkpoint(); });
    REQUIRE(waiter.wait_for(std::chrono::milliseconds(50)) == std::future_status::timeout);

    REQUIRE(f.tracker.resume());
    REQUIRE(waiter.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    waiter.get();
}

TEST_CASE("Cancel wakes a paused checkpoint", "[tracker]") {
    Fixture f;
    REQUIRE(f.tracker.pause());
    auto waiter = std::async(std::launch::async, [&] { f.tracker.checkpoint(); });
    REQUIRE(f.tracker.cancel());
    REQUIRE(waiter.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    REQUIRE_THROWS_AS(waiter.get(), CancelledError);
}

TEST_CASE("wait_finished observes mark_finished", "[tracker]") {
    Fixture f;
    REQUIRE_FALSE(f.tracker.wait_finished(std::chrono::milliseconds(10)));
    std::thread t([&] { f.tracker.mark_finished(); });
    REQUIRE(f.tracker.wait_finished(std::chrono::seconds(5)));
    t.join();
    REQUIRE(f.tracker.finished());
}

TEST_CASE("Execution store keeps terminal runs newest first", "[store]") {
    ExecutionStore store;
    Execution running;
    running.id = "r";
    REQUIRE_THROWS_AS(store.add(running), std::invalid_argument);

    auto now = Clock::now();
    for (int i = 0; i < 3; ++i) {
        Execution e;
        e.id = "e" + std::to_string(i);
        e.workflow_id = "wf";
        e.status = ExecutionStatus::COMPLETED;
        e.started_at = now + std::chrono::seconds(i);
        store.add(e);
    }
    Execution other;
    other.id = "x";
    other.workflow_id = "other";
    other.status = ExecutionStatus::FAILED;
    store.add(other);

    auto list = store.list_by_workflow("wf");
    REQUIRE(list.size() == 3);
    REQUIRE(list[0].id == "e2");
    REQUIRE(list[2].id == "e0");
    REQUIRE(store.find("x").has_value());
    REQUIRE(store.size() == 4);
}

TEST_CASE("Execution store evicts the oldest runs past its cap", "[store]") {
    ExecutionStore store(3);
    auto now = Clock::now();
    for (int i = 0; i < 5; ++i) {
        Execution e;
        e.id = "e" + std::to_string(i);
        e.workflow_id = "wf";
        e.status = ExecutionStatus::COMPLETED;
        e.started_at = now + std::chrono::seconds(i);
        store.add(e);
    }

    REQUIRE(store.size() == 3);
    REQUIRE_FALSE(store.find("e0").has_value());
    REQUIRE_FALSE(store.find("e1").has_value());
    REQUIRE(store.find("e2").has_value());
    REQUIRE(store.list_by_workflow("wf").back().id == "e2");

    // 重复写入同一个 id 不占新名额
    Execution again = *store.find("e4");
    again.status = ExecutionStatus::FAILED;
    store.add(again);
    REQUIRE(store.size() == 3);
    REQUIRE(store.find("e2").has_value());
    REQUIRE(store.find("e4")->status == ExecutionStatus::FAILED);
}

TEST_CASE("Execution serialises to JSON", "[tracker]") {
    Fixture f;
    auto s = f.tracker.begin_step(f.node(0), Value::object());
    f.tracker.complete_step(*s, Value{{"a", 1}});
    f.tracker.complete(Value{{"a", 1}});

    Value j = f.tracker.snapshot();
    REQUIRE(j["id"] == "exec-1");
    REQUIRE(j["status"] == "completed");
    REQUIRE(j["steps"].size() == 1);
    REQUIRE(j["steps"][0]["node_id"] == "n0");
}
