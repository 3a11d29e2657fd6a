// tests/test_execution_service.cpp
#include <catch2/catch_test_macros.hpp>
#include "test_support.h"
#include <atomic>
#include <chrono>
#include <system_error>
#include <thread>

using namespace agentorch;
using namespace agentorch::test;

namespace {

template<typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

} // namespace

TEST_CASE("Cancelling after the first step stops the pipeline", "[service]") {
    Harness h;
    h.workflows->save(linear_workflow("five", 5));
    auto& service = h.service();
    service.events().on_step_completed([&service](const StepCompletedEvent& e) {
        if (e.step.sequence == 1) {
            service.cancel(e.execution_id);
        }
    });

    auto id = service.start("five", {{"k", 1}});
    REQUIRE(service.wait(id, std::chrono::seconds(10)));

    auto execution = service.status(id);
    REQUIRE(execution);
    REQUIRE(execution->status == ExecutionStatus::CANCELLED);
    REQUIRE(execution->steps.size() == 1);
    REQUIRE(execution->steps[0].status == ExecutionStatus::COMPLETED);
    REQUIRE(execution->completed_at.has_value());
    REQUIRE_FALSE(service.cancel(id));
}

TEST_CASE("Unknown workflows are rejected without a record", "[service]") {
    Harness h;
    REQUIRE_THROWS_AS(h.service().start("missing", Value::object()), ValidationError);
    REQUIRE(h.service().list_workflow_executions("missing").empty());
    REQUIRE(h.service().list_active().empty());
    REQUIRE(h.service().history().size() == 0);
}

TEST_CASE("A run whose worker cannot start leaves no record", "[service]") {
    class NoThreadService : public ExecutionService {
    public:
        using ExecutionService::ExecutionService;

    protected:
        std::thread spawn_worker(std::shared_ptr<ExecutionTracker>) override {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
        }
    };

    Harness h;
    h.workflows->save(linear_workflow("starved", 2));
    ExecutionService::Dependencies deps;
    deps.workflows = h.workflows;
    deps.executor = h.executor;
    NoThreadService service(std::move(deps));

    REQUIRE_THROWS_AS(service.start("starved", Value::object()), std::system_error);
    REQUIRE(service.list_active().empty());
    REQUIRE(service.list_workflow_executions("starved").empty());
    REQUIRE(service.history().size() == 0);
}

TEST_CASE("Workflows with unknown node types are rejected at start", "[service]") {
    Harness h;
    WorkflowGraph graph = linear_workflow("alien", 2);
    graph.nodes[1].type = "Teleporter";
    h.workflows->save(graph);

    REQUIRE_THROWS_AS(h.service().start("alien", Value::object()), ValidationError);
    REQUIRE(h.service().list_workflow_executions("alien").empty());
}

TEST_CASE("Pause holds the run at the next node boundary", "[service]") {
    Harness h;
    h.workflows->save(linear_workflow("pausable", 5));
    auto& service = h.service();
    service.events().on_step_completed([&service](const StepCompletedEvent& e) {
        if (e.step.sequence == 1) {
            service.pause(e.execution_id);
        }
    });

    auto id = service.start("pausable", Value::object());
    REQUIRE(eventually([&] { return service.status(id)->status == ExecutionStatus::PAUSED; }));

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(service.list_steps(id).size() == 1);
    REQUIRE(service.list_active().size() == 1);
    REQUIRE_FALSE(service.wait(id, std::chrono::milliseconds(20)));

    REQUIRE(service.resume(id));
    REQUIRE(service.wait(id, std::chrono::seconds(10)));
    auto execution = service.status(id);
    REQUIRE(execution->status == ExecutionStatus::COMPLETED);
    REQUIRE(execution->steps.size() == 5);
}

TEST_CASE("Cancelling a paused run ends it", "[service]") {
    Harness h;
    h.workflows->save(linear_workflow("abandoned", 3));
    auto& service = h.service();
    service.events().on_step_completed([&service](const StepCompletedEvent& e) {
        service.pause(e.execution_id);
    });

    auto id = service.start("abandoned", Value::object());
    REQUIRE(eventually([&] { return service.status(id)->status == ExecutionStatus::PAUSED; }));
    REQUIRE(service.cancel(id));
    REQUIRE(service.wait(id, std::chrono::seconds(10)));
    REQUIRE(service.status(id)->status == ExecutionStatus::CANCELLED);
    REQUIRE(service.list_steps(id).size() == 1);
}

TEST_CASE("Status events trace the lifecycle", "[service]") {
    Harness h;
    std::mutex mutex;
    std::vector<ExecutionStatus> seen;
    h.events->on_status_changed([&](const StatusChangedEvent& e) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(e.new_status);
    });
    std::atomic<int> errors{0};
    h.events->on_execution_error([&](const ExecutionErrorEvent&) { ++errors; });

    auto graph = linear_workflow("eventful", 2);
    graph.nodes[1].properties["function"] = "fail";
    auto execution = h.run(graph);

    REQUIRE(execution.status == ExecutionStatus::FAILED);
    std::lock_guard<std::mutex> lock(mutex);
    REQUIRE(seen == std::vector<ExecutionStatus>{ExecutionStatus::FAILED});
    REQUIRE(errors.load() == 1);
}

TEST_CASE("A throwing subscriber does not break the run", "[service]") {
    Harness h;
    h.events->on_step_completed([](const StepCompletedEvent&) { throw std::runtime_error("listener bug"); });

    auto execution = h.run(linear_workflow("robust", 3));

    REQUIRE(execution.status == ExecutionStatus::COMPLETED);
    REQUIRE(execution.steps.size() == 3);
}

TEST_CASE("Executions of a workflow are listed newest first", "[service]") {
    Harness h;
    auto graph = linear_workflow("repeated", 2);
    std::vector<ExecutionId> ids;
    for (int i = 0; i < 3; ++i) {
        ids.push_back(h.run(graph, {{"i", i}}).id);
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    h.run(linear_workflow("unrelated", 1));

    auto list = h.service().list_workflow_executions("repeated");
    REQUIRE(list.size() == 3);
    REQUIRE(list[0].id == ids[2]);
    REQUIRE(list[2].id == ids[0]);
    REQUIRE(h.service().history().size() == 4);
    REQUIRE(h.service().list_errors(ids[0]).empty());
}

TEST_CASE("Concurrent executions do not share state", "[service]") {
    Harness h;
    Node writer = make_node("writer", node_types::LLM_AGENT, {{"prompt", "turn {{ length(history) }}"}});
    WorkflowGraph graph;
    graph.id = "chat";
    graph.nodes = {writer};
    h.workflows->save(graph);

    std::vector<ExecutionId> ids;
    for (int i = 0; i < 4; ++i) {
        ids.push_back(h.service().start("chat", Value::object()));
    }
    for (const auto& id : ids) {
        REQUIRE(h.service().wait(id, std::chrono::seconds(10)));
        REQUIRE(h.service().status(id)->status == ExecutionStatus::COMPLETED);
    }
    for (const auto& prompt : h.llm->prompts()) {
        REQUIRE(prompt == "turn 0");
    }
}

TEST_CASE("Control calls on unknown executions return false", "[service]") {
    Harness h;
    REQUIRE_FALSE(h.service().pause("nope"));
    REQUIRE_FALSE(h.service().resume("nope"));
    REQUIRE_FALSE(h.service().cancel("nope"));
    REQUIRE_FALSE(h.service().status("nope").has_value());
    REQUIRE(h.service().list_steps("nope").empty());
    REQUIRE_FALSE(h.service().wait("nope", std::chrono::milliseconds(1)));
}
