// tests/test_collaborators.cpp
#include <catch2/catch_test_macros.hpp>
#include "agentorch/common/errors.h"
#include "agentorch/executor/agent_handle_cache.h"
#include "agentorch/executor/checkpoint_store.h"
#include "agentorch/protocol/protocol_client.h"
#include "agentorch/tools/registry.h"
#include "test_support.h"

using namespace agentorch;

TEST_CASE("Tool registry built-ins and custom tools", "[tools]") {
    ToolRegistry tools;
    REQUIRE(tools.has_tool("calculate"));
    REQUIRE(tools.has_tool("echo"));

    REQUIRE(tools.call_tool("calculate", {{"a", "7"}, {"b", "2"}, {"op", "-"}})["result"] == 5.0);
    REQUIRE_THROWS_AS(tools.call_tool("calculate", {{"a", "1"}}), CollaboratorError);
    REQUIRE_THROWS_AS(tools.call_tool("calculate", {{"a", "1"}, {"b", "2"}, {"op", "%"}}), CollaboratorError);
    REQUIRE_THROWS_AS(tools.call_tool("missing", {}), CollaboratorError);

    tools.register_tool("shout", [](const ToolArguments& args) -> Value {
        return args.at("text") + "!";
    });
    REQUIRE(tools.call_tool("shout", {{"text", "hi"}}) == "hi!");
    REQUIRE(tools.list_tools() == std::vector<std::string>{"calculate", "echo", "shout"});
}

TEST_CASE("Local protocol client lifecycle", "[protocol]") {
    LocalProtocolClient client;
    client.add_server("math", std::make_shared<ToolRegistry>());
    client.add_server("broken", nullptr);

    REQUIRE(client.status("math").state == ConnectionState::DISCONNECTED);
    REQUIRE_THROWS_AS(client.call_tool("math", "calculate", {}), CollaboratorError);

    client.connect("math");
    auto status = client.status("math");
    REQUIRE(status.state == ConnectionState::CONNECTED);
    REQUIRE(status.tools == std::vector<std::string>{"calculate", "echo"});
    REQUIRE(client.call_tool("math", "calculate", {{"a", "2"}, {"b", "3"}, {"op", "+"}})["result"] == 5.0);

    REQUIRE_THROWS_AS(client.connect("broken"), CollaboratorError);
    REQUIRE(client.status("broken").state == ConnectionState::FAILED);
    REQUIRE(client.status("broken").last_error.has_value());

    REQUIRE_THROWS_AS(client.connect("nowhere"), CollaboratorError);
    REQUIRE(client.status("nowhere").last_error == std::optional<std::string>("unknown server"));
    REQUIRE(to_string(ConnectionState::FAILED) == "failed");
}

TEST_CASE("Protocol client registry routes by server id", "[protocol]") {
    ProtocolClientRegistry registry;
    auto client = std::make_shared<LocalProtocolClient>();
    registry.register_client("b", client);
    registry.register_client("a", client);

    REQUIRE(registry.client_for("a") == client);
    REQUIRE(registry.server_ids() == std::vector<std::string>{"a", "b"});
    REQUIRE_THROWS_AS(registry.client_for("c"), CollaboratorError);
}

TEST_CASE("Checkpoint store evicts oldest snapshots first", "[checkpoint]") {
    CheckpointStore store(2, 512);
    REQUIRE(store.save("one", {{"v", 1}}));
    REQUIRE(store.save("two", {{"v", 2}}));
    REQUIRE(store.save("three", {{"v", 3}}));

    REQUIRE(store.size() == 2);
    REQUIRE_FALSE(store.get("one").has_value());
    REQUIRE(store.keys() == std::vector<std::string>{"two", "three"});

    // 重写已有 key 会把它移到队尾
    REQUIRE(store.save("two", {{"v", 22}}));
    REQUIRE(store.keys() == std::vector<std::string>{"three", "two"});
    REQUIRE((*store.get("two"))["v"] == 22);

    store.set_limits(1, 512);
    REQUIRE(store.keys() == std::vector<std::string>{"two"});
}

TEST_CASE("Checkpoint store rejects snapshots larger than its budget", "[checkpoint]") {
    CheckpointStore store(10, 1);
    REQUIRE_FALSE(store.save("big", Value(std::string(4096, 'x'))));
    REQUIRE(store.size() == 0);
}

TEST_CASE("Agent handle cache keeps one handle per node", "[agents]") {
    AgentHandleCache cache;
    Node writer = test::make_node("writer", node_types::LLM_AGENT);

    auto first = cache.get_or_create(writer);
    auto second = cache.get_or_create(writer);
    REQUIRE(first == second);
    REQUIRE(first->agent_type() == "LLMAgent");

    first->append("user", "hello");
    REQUIRE(second->turns() == 1);
    REQUIRE(second->transcript()[0]["content"] == "hello");

    REQUIRE(cache.find("reviewer") == nullptr);
    REQUIRE(cache.size() == 1);
    cache.clear();
    REQUIRE(cache.size() == 0);
}
