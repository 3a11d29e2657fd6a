#ifndef AGENTORCH_COMMON_TYPES_H
#define AGENTORCH_COMMON_TYPES_H

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace agentorch {

// 使用 nlohmann::json 作为统一的数据类型
using Value = nlohmann::json;

using NodeId = std::string;
using ExecutionId = std::string;
using WorkflowId = std::string;
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class ExecutionStatus : uint8_t {
    RUNNING,
    PAUSED,
    COMPLETED,
    FAILED,
    CANCELLED
};

enum class OrchestrationType : uint8_t {
    SEQUENTIAL,
    CONCURRENT,
    HANDOFF,
    MAGENTIC,
    GROUP_CHAT,
    CUSTOM,
    UNKNOWN
};

std::string to_string(ExecutionStatus status);
std::string to_string(OrchestrationType type);

// Case-insensitive; anything unrecognised maps to UNKNOWN.
OrchestrationType parse_orchestration_type(std::string_view text);

inline bool is_terminal(ExecutionStatus status) {
    return status == ExecutionStatus::COMPLETED ||
           status == ExecutionStatus::FAILED ||
           status == ExecutionStatus::CANCELLED;
}

// Milliseconds since epoch, used when records are serialised.
int64_t to_epoch_ms(TimePoint tp);

std::string generate_id(std::string_view prefix = {});

} // namespace agentorch

#endif // AGENTORCH_COMMON_TYPES_H
