// tests/test_engine.cpp
#include <catch2/catch_test_macros.hpp>
#include "agentorch/core/engine.h"
#include "agentorch/orchestration/custom_strategy.h"
#include "test_support.h"
#include <cctype>
#include <filesystem>
#include <fstream>

using namespace agentorch;

namespace {

const char* kPipeline = R"(
id: review
name: Review pipeline
orchestration: sequential
nodes:
  - id: start
    type: StartNode
  - id: count
    type: ToolAgent
    position: {x: 1}
    properties:
      tool: word_count
      arguments: {text: "{{ text }}"}
  - id: draft
    type: LLMAgent
    position: {x: 2}
    properties:
      prompt: "Review {{ tool_result.words }} words"
      output_key: review
  - id: shout
    type: FunctionNode
    position: {x: 3}
    properties: {function: uppercase}
connections:
  - {from: start, to: count}
  - {from: count, to: draft}
  - {from: draft, to: shout}
)";

std::unique_ptr<WorkflowEngine> make_engine(std::shared_ptr<test::MockLlm> llm) {
    auto engine = std::make_unique<WorkflowEngine>(EngineConfig{}, llm);
    engine->register_tool("word_count", [](const ToolArguments& args) -> Value {
        const std::string& text = args.at("text");
        int words = 0;
        bool in_word = false;
        for (char c : text) {
            if (c == ' ') { in_word = false; }
            else if (!in_word) { in_word = true; ++words; }
        }
        return Value{{"words", words}};
    });
    engine->register_function("uppercase", [](const Value& input) {
        Value out = input;
        std::string review = out.value("review", "");
        for (auto& c : review) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        out["review"] = review;
        return out;
    });
    return engine;
}

} // namespace

TEST_CASE("Engine runs a YAML workflow end to end", "[engine]") {
    auto llm = std::make_shared<test::MockLlm>();
    llm->queue("looks good");
    auto engine = make_engine(llm);
    engine->add_workflow(WorkflowLoader::from_yaml_string(kPipeline));

    auto id = engine->start_execution("review", {{"text", "three small words"}});
    REQUIRE(engine->wait_for_execution(id, std::chrono::seconds(10)));

    auto execution = engine->get_execution_status(id);
    REQUIRE(execution);
    REQUIRE(execution->status == ExecutionStatus::COMPLETED);
    REQUIRE(execution->output["review"] == "LOOKS GOOD");
    REQUIRE(llm->prompts().at(0) == "Review 3 words");
    REQUIRE(engine->list_execution_steps(id).size() == 4);
    REQUIRE(engine->list_execution_errors(id).empty());
    REQUIRE(engine->list_workflow_executions("review").size() == 1);
}

TEST_CASE("Engine loads workflow files", "[engine]") {
    auto path = std::filesystem::temp_directory_path() / "agentorch_engine_test.yaml";
    {
        std::ofstream out(path);
        out << kPipeline;
    }
    auto engine = make_engine(std::make_shared<test::MockLlm>());
    REQUIRE(engine->load_workflow_file(path.string()) == "review");
    REQUIRE(engine->workflows().find("review") != nullptr);
    std::filesystem::remove(path);
}

TEST_CASE("Queries before the first execution are empty", "[engine]") {
    WorkflowEngine engine;
    REQUIRE_FALSE(engine.get_execution_status("x").has_value());
    REQUIRE(engine.list_workflow_executions("w").empty());
    REQUIRE(engine.list_execution_steps("x").empty());
    REQUIRE(engine.llm() == nullptr);
    REQUIRE_THROWS_AS(engine.start_execution("missing"), ValidationError);
}

TEST_CASE("Extension points are frozen once executions start", "[engine]") {
    auto engine = make_engine(std::make_shared<test::MockLlm>());
    engine->set_node_selector(std::make_shared<PriorityNodeSelector>());
    engine->add_workflow(test::linear_workflow("tiny", 1));
    auto id = engine->start_execution("tiny");
    REQUIRE(engine->wait_for_execution(id, std::chrono::seconds(10)));

    REQUIRE_THROWS_AS(engine->set_node_selector(std::make_shared<PriorityNodeSelector>()), std::logic_error);
    REQUIRE_THROWS_AS(engine->register_strategy(std::make_shared<CustomStrategy>()), std::logic_error);
    REQUIRE_THROWS_AS(engine->register_tool("late", [](const ToolArguments&) { return Value(); }),
                      std::logic_error);
}

TEST_CASE("Engine keeps a bounded history of finished runs", "[engine]") {
    EngineConfig config;
    config.history_max_entries = 2;
    WorkflowEngine engine(config);
    engine.add_workflow(test::linear_workflow("short", 1));

    std::vector<ExecutionId> ids;
    for (int i = 0; i < 3; ++i) {
        ids.push_back(engine.start_execution("short"));
        REQUIRE(engine.wait_for_execution(ids.back(), std::chrono::seconds(10)));
    }

    REQUIRE_FALSE(engine.get_execution_status(ids[0]).has_value());
    REQUIRE(engine.get_execution_status(ids[1]).has_value());
    REQUIRE(engine.get_execution_status(ids[2]).has_value());
    REQUIRE(engine.list_workflow_executions("short").size() == 2);
}

TEST_CASE("Engine exposes protocol servers to MCPAgent nodes", "[engine][protocol]") {
    auto engine = make_engine(std::make_shared<test::MockLlm>());
    engine->add_protocol_server("local", std::make_shared<ToolRegistry>());

    WorkflowGraph graph;
    graph.id = "mcp";
    graph.nodes = {test::make_node("call", node_types::MCP_AGENT,
                                   {{"server_id", "local"}, {"tool", "calculate"},
                                    {"arguments", {{"a", "6"}, {"b", "7"}, {"op", "*"}}}})};
    engine->add_workflow(graph);

    auto id = engine->start_execution("mcp");
    REQUIRE(engine->wait_for_execution(id, std::chrono::seconds(10)));
    REQUIRE(engine->get_execution_status(id)->output["mcp_result"]["result"] == 42.0);
}

TEST_CASE("Config values are read from JSON", "[config]") {
    auto config = EngineConfig::from_json(Value::parse(R"({
        "log_level": "debug",
        "llm": {"model_path": "models/tiny.gguf", "n_ctx": 1024, "n_threads": 2, "temperature": 0.2},
        "magentic": {"max_iterations": 4, "selector": "llm"},
        "group_chat": {"max_rounds": 0},
        "custom": {"wait_timeout_ms": 100, "poll_interval_ms": "fast"},
        "history": {"max_entries": 25}
    })"), "/opt/agents");

    REQUIRE(config.log_level == "debug");
    REQUIRE(config.llm);
    REQUIRE(config.llm->model_path == "/opt/agents/models/tiny.gguf");
    REQUIRE(config.llm->n_ctx == 1024);
    REQUIRE(config.llm->n_threads == 2);
    REQUIRE(config.orchestration.magentic_max_iterations == 4);
    REQUIRE(config.magentic_selector == "llm");
    REQUIRE(config.orchestration.group_chat_max_rounds == 1);
    REQUIRE(config.orchestration.wait_timeout_ms == 100);
    REQUIRE(config.orchestration.poll_interval_ms == 50);
    REQUIRE(config.history_max_entries == 25);

    auto defaults = EngineConfig::load("/nonexistent/agentorch_config.json");
    REQUIRE_FALSE(defaults.llm);
    REQUIRE(defaults.orchestration.magentic_max_iterations == 10);
    REQUIRE(defaults.history_max_entries == 500);
}

TEST_CASE("An LLM selector without a model falls back to priority", "[config]") {
    EngineConfig config;
    config.magentic_selector = "llm";
    WorkflowEngine engine(config);

    WorkflowGraph graph = test::linear_workflow("ranked", 2, OrchestrationType::MAGENTIC);
    graph.nodes[1].orchestration.priority = 1;
    engine.add_workflow(graph);
    auto id = engine.start_execution("ranked");
    REQUIRE(engine.wait_for_execution(id, std::chrono::seconds(10)));
    REQUIRE(engine.list_execution_steps(id).at(0).node_id == "n1");
}
