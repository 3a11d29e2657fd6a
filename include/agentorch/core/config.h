// include/agentorch/core/config.h
#ifndef AGENTORCH_CORE_CONFIG_H
#define AGENTORCH_CORE_CONFIG_H

#include "agentorch/llm/llama_adapter.h"
#include "agentorch/orchestration/orchestration_context.h"
#include <filesystem>
#include <optional>
#include <string>

namespace agentorch {

// agentorch_config.json:
// {
//   "log_level": "info",
//   "llm": {"model_path": "models/qwen-0.6b.gguf", "n_ctx": 2048, "n_threads": 0,
//           "temperature": 0.7, "min_p": 0.05, "n_predict": 512},
//   "magentic": {"max_iterations": 10, "selector": "priority"},   # or "llm"
//   "group_chat": {"max_rounds": 1},
//   "custom": {"wait_timeout_ms": 5000, "poll_interval_ms": 50},
//   "history": {"max_entries": 500}
// }
struct EngineConfig {
    std::optional<LlamaAdapter::Config> llm;   // set only when the file has an "llm" section
    OrchestrationSettings orchestration;
    std::string magentic_selector = "priority";
    std::string log_level = "info";
    int history_max_entries = 500;              // finished runs kept for status queries

    // Missing file -> defaults. Keys with the wrong type are ignored.
    static EngineConfig load(const std::string& path = "agentorch_config.json");

    // Relative model paths are resolved against `base_dir`.
    static EngineConfig from_json(const Value& j, const std::filesystem::path& base_dir = ".");
};

// "trace", "debug", "info", "warn", "error", "critical", "off"
void apply_log_level(const std::string& level);

} // namespace agentorch

#endif // AGENTORCH_CORE_CONFIG_H
