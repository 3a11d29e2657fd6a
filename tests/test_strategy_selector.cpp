// tests/test_strategy_selector.cpp
#include <catch2/catch_test_macros.hpp>
#include "agentorch/orchestration/strategy_selector.h"
#include "test_support.h"

using namespace agentorch;
using namespace agentorch::test;

namespace {

class ReverseStrategy : public OrchestrationStrategy {
public:
    OrchestrationType type() const override { return OrchestrationType::SEQUENTIAL; }
    Value run(OrchestrationContext& ctx) override {
        Value data = ctx.input();
        const auto& nodes = ctx.graph().nodes;
        for (auto it = nodes.rbegin(); it != nodes.rend(); ++it) {
            data = ctx.run_node(*it, data);
        }
        return data;
    }
};

} // namespace

TEST_CASE("Every orchestration type resolves to its strategy", "[selector]") {
    StrategySelector selector;
    for (auto type : {OrchestrationType::SEQUENTIAL, OrchestrationType::CONCURRENT, OrchestrationType::HANDOFF,
                      OrchestrationType::MAGENTIC, OrchestrationType::GROUP_CHAT, OrchestrationType::CUSTOM}) {
        auto strategy = selector.resolve(type);
        REQUIRE(strategy);
        REQUIRE(strategy->type() == type);
    }
    REQUIRE(selector.resolve(OrchestrationType::UNKNOWN)->type() == OrchestrationType::CUSTOM);
}

TEST_CASE("Registered strategies replace the built-in ones", "[selector]") {
    auto selector = std::make_shared<StrategySelector>();
    auto reverse = std::make_shared<ReverseStrategy>();
    selector->register_strategy(reverse);
    REQUIRE(selector->resolve(OrchestrationType::SEQUENTIAL) == reverse);
    REQUIRE(reverse->name() == "sequential");
    REQUIRE_THROWS_AS(selector->register_strategy(nullptr), std::invalid_argument);

    Harness h;
    h.workflows->save(linear_workflow("backwards", 3));
    ExecutionService::Dependencies deps;
    deps.workflows = h.workflows;
    deps.executor = h.executor;
    deps.strategies = selector;
    deps.hooks = h.hooks;
    ExecutionService service(std::move(deps));

    auto id = service.start("backwards", Value::object());
    REQUIRE(service.wait(id, std::chrono::seconds(10)));
    auto steps = service.list_steps(id);
    REQUIRE(steps.size() == 3);
    REQUIRE(steps.front().node_id == "n2");
}
