// src/common/types.cpp
#include "agentorch/common/types.h"
#include "agentorch/common/errors.h"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>

namespace agentorch {

std::string to_string(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::RUNNING:   return "running";
        case ExecutionStatus::PAUSED:    return "paused";
        case ExecutionStatus::COMPLETED: return "completed";
        case ExecutionStatus::FAILED:    return "failed";
        case ExecutionStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

std::string to_string(OrchestrationType type) {
    switch (type) {
        case OrchestrationType::SEQUENTIAL: return "sequential";
        case OrchestrationType::CONCURRENT: return "concurrent";
        case OrchestrationType::HANDOFF:    return "handoff";
        case OrchestrationType::MAGENTIC:   return "magentic";
        case OrchestrationType::GROUP_CHAT: return "group_chat";
        case OrchestrationType::CUSTOM:     return "custom";
        case OrchestrationType::UNKNOWN:    return "unknown";
    }
    return "unknown";
}

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION:     return "ValidationError";
        case ErrorKind::NODE_EXECUTION: return "NodeExecutionError";
        case ErrorKind::COLLABORATOR:   return "CollaboratorError";
        case ErrorKind::ORCHESTRATION:  return "OrchestrationError";
        case ErrorKind::CANCELLED:      return "Cancelled";
    }
    return "UnknownError";
}

OrchestrationType parse_orchestration_type(std::string_view text) {
    std::string s(text);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    // group_chat / groupchat / group-chat 都接受
    s.erase(std::remove_if(s.begin(), s.end(), [](char c) { return c == '_' || c == '-'; }), s.end());

    if (s == "sequential") return OrchestrationType::SEQUENTIAL;
    if (s == "concurrent") return OrchestrationType::CONCURRENT;
    if (s == "handoff")    return OrchestrationType::HANDOFF;
    if (s == "magentic")   return OrchestrationType::MAGENTIC;
    if (s == "groupchat")  return OrchestrationType::GROUP_CHAT;
    if (s == "custom")     return OrchestrationType::CUSTOM;
    return OrchestrationType::UNKNOWN;
}

int64_t to_epoch_ms(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string generate_id(std::string_view prefix) {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;

    std::ostringstream oss;
    if (!prefix.empty()) {
        oss << prefix << '-';
    }
    oss << std::hex << std::setfill('0')
        << std::setw(16) << dist(rng)
        << std::setw(8) << (dist(rng) & 0xffffffffULL);
    return oss.str();
}

} // namespace agentorch
