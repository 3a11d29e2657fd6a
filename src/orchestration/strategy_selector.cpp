// src/orchestration/strategy_selector.cpp
#include "agentorch/orchestration/strategy_selector.h"
#include "agentorch/orchestration/concurrent_strategy.h"
#include "agentorch/orchestration/custom_strategy.h"
#include "agentorch/orchestration/group_chat_strategy.h"
#include "agentorch/orchestration/handoff_strategy.h"
#include "agentorch/orchestration/magentic_strategy.h"
#include "agentorch/orchestration/sequential_strategy.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace agentorch {

StrategySelector::StrategySelector() {
    register_strategy(std::make_shared<SequentialStrategy>());
    register_strategy(std::make_shared<ConcurrentStrategy>());
    register_strategy(std::make_shared<HandoffStrategy>());
    register_strategy(std::make_shared<MagenticStrategy>());
    register_strategy(std::make_shared<GroupChatStrategy>());
    register_strategy(std::make_shared<CustomStrategy>());
}

void StrategySelector::register_strategy(std::shared_ptr<OrchestrationStrategy> strategy) {
    if (!strategy) {
        throw std::invalid_argument("StrategySelector::register_strategy: null strategy");
    }
    strategies_[strategy->type()] = std::move(strategy);
}

std::shared_ptr<OrchestrationStrategy> StrategySelector::resolve(OrchestrationType type) const {
    auto it = strategies_.find(type);
    if (it != strategies_.end()) {
        return it->second;
    }
    spdlog::warn("No strategy for orchestration type '{}', falling back to custom", to_string(type));
    return strategies_.at(OrchestrationType::CUSTOM);
}

} // namespace agentorch
