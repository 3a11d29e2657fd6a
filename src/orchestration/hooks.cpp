// src/orchestration/hooks.cpp
#include "agentorch/orchestration/hooks.h"
#include "agentorch/utils/template_renderer.h"
#include "agentorch/utils/value_merge.h"
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>
#include <unordered_set>

namespace agentorch {

bool ExpressionHandoffCondition::should_follow(const Connection& connection, const Value& output) {
    if (!connection.condition || connection.condition->empty()) {
        return true;
    }
    return evaluate_condition(*connection.condition, as_object(output));
}

std::optional<NodeId> PriorityNodeSelector::select(const std::vector<const Node*>& candidates,
                                                   const Value&,
                                                   const std::vector<Step>& history) {
    std::unordered_set<NodeId> executed;
    for (const auto& step : history) {
        executed.insert(step.node_id);
    }

    const Node* best = nullptr;
    for (const Node* node : candidates) {
        if (executed.count(node->id)) continue;
        if (!best || node->orchestration.priority > best->orchestration.priority) {
            best = node;
        }
    }
    if (!best) return std::nullopt;
    return best->id;
}

LlmNodeSelector::LlmNodeSelector(std::shared_ptr<LlmProvider> llm, std::string prompt_template)
    : llm_(std::move(llm)),
      prompt_template_(prompt_template.empty() ? default_prompt() : std::move(prompt_template)) {}

const char* LlmNodeSelector::default_prompt() {
    return "You coordinate a team of agents.\n"
           "Current data: {{ data }}\n"
           "Agents already run: {% for s in history %}{{ s.node_id }} {% endfor %}\n"
           "Available agents:\n"
           "{% for c in candidates %}- {{ c.id }}: {{ c.name }} ({{ c.type }})\n{% endfor %}"
           "Reply with the id of the next agent, or DONE if the task is complete.";
}

std::optional<NodeId> LlmNodeSelector::select(const std::vector<const Node*>& candidates,
                                              const Value& data,
                                              const std::vector<Step>& history) {
    if (!llm_) {
        throw CollaboratorError("LlmNodeSelector has no LLM provider");
    }

    Value view;
    view["data"] = data;
    view["candidates"] = Value::array();
    for (const Node* node : candidates) {
        view["candidates"].push_back({{"id", node->id}, {"name", node->name}, {"type", node->type}});
    }
    view["history"] = Value::array();
    for (const auto& step : history) {
        view["history"].push_back({{"node_id", step.node_id}, {"status", to_string(step.status)}});
    }

    std::string reply = llm_->complete(InjaTemplateRenderer::render(prompt_template_, view));
    // 去掉首尾空白和引号
    auto is_trim = [](unsigned char c) { return std::isspace(c) || c == '"' || c == '\'' || c == '`'; };
    while (!reply.empty() && is_trim(reply.back())) reply.pop_back();
    size_t start = 0;
    while (start < reply.size() && is_trim(reply[start])) ++start;
    reply = reply.substr(start);

    if (reply == "DONE") {
        return std::nullopt;
    }
    for (const Node* node : candidates) {
        if (node->id == reply) return node->id;
    }
    spdlog::warn("LLM selector replied with unknown agent '{}', stopping", reply);
    return std::nullopt;
}

RoundRobinGroupChat::RoundRobinGroupChat(int max_rounds)
    : max_rounds_(std::max(1, max_rounds)) {}

Value RoundRobinGroupChat::run(const std::vector<GroupChatParticipant>& participants,
                               const Value& input,
                               const ParticipantInvoker& invoke) {
    Value transcript = Value::array();
    Value last_output = input;
    int rounds = 0;
    bool terminated = false;

    for (int round = 1; round <= max_rounds_ && !terminated; ++round) {
        rounds = round;
        for (const auto& participant : participants) {
            Value message = as_object(input);
            message["transcript"] = transcript;
            message["round"] = round;

            Value output = invoke(participant.id, message);
            transcript.push_back({
                {"participant", participant.id},
                {"name", participant.name},
                {"round", round},
                {"output", output}
            });
            last_output = output;

            if (output.is_object() && output.value("terminate", false)) {
                terminated = true;
                break;
            }
        }
    }

    Value ids = Value::array();
    for (const auto& p : participants) {
        ids.push_back(p.id);
    }
    return {
        {"participants", ids},
        {"rounds", rounds},
        {"terminated", terminated},
        {"transcript", transcript},
        {"final", last_output}
    };
}

bool ExpressionScriptCondition::evaluate(const ScriptStep& step, const Value& view) {
    if (!step.condition || step.condition->empty()) {
        return true;
    }
    return evaluate_condition(*step.condition, view);
}

} // namespace agentorch
