// src/core/config.cpp
#include "agentorch/core/config.h"
#include <fstream>
#include <spdlog/spdlog.h>
#include <thread>

namespace agentorch {

namespace {

int default_threads() {
    unsigned n = std::thread::hardware_concurrency();
    return n > 0 ? static_cast<int>(n) : 4;
}

void read_int(const Value& section, const char* key, int& out, int min_value) {
    if (section.contains(key) && section[key].is_number_integer()) {
        int v = section[key].get<int>();
        if (v >= min_value) {
            out = v;
        } else {
            spdlog::warn("Config: '{}' must be >= {}, keeping {}", key, min_value, out);
        }
    }
}

LlamaAdapter::Config parse_llm(const Value& j, const std::filesystem::path& base_dir) {
    namespace fs = std::filesystem;

    LlamaAdapter::Config config;
    config.model_path = "models/qwen-0.6b.gguf"; // default
    config.n_threads = default_threads();

    if (j.contains("model_path") && j["model_path"].is_string()) {
        fs::path model = j["model_path"].get<std::string>();
        fs::path dir = base_dir.empty() ? fs::path(".") : base_dir;
        config.model_path = model.is_absolute() ? model.string() : fs::absolute(dir / model).string();
    }
    if (j.contains("n_ctx") && j["n_ctx"].is_number_integer()) {
        config.n_ctx = j["n_ctx"].get<int>();
    }
    if (j.contains("n_threads") && j["n_threads"].is_number_integer()) {
        int threads = j["n_threads"].get<int>();
        config.n_threads = (threads > 0) ? threads : default_threads();
    }
    if (j.contains("temperature") && j["temperature"].is_number()) {
        config.temperature = static_cast<float>(j["temperature"].get<double>());
    }
    if (j.contains("min_p") && j["min_p"].is_number()) {
        config.min_p = static_cast<float>(j["min_p"].get<double>());
    }
    if (j.contains("n_predict") && j["n_predict"].is_number_integer()) {
        config.n_predict = j["n_predict"].get<int>();
    }
    return config;
}

} // namespace

EngineConfig EngineConfig::from_json(const Value& j, const std::filesystem::path& base_dir) {
    EngineConfig config;
    if (!j.is_object()) {
        spdlog::warn("Config root is not an object, using defaults");
        return config;
    }

    if (j.contains("log_level") && j["log_level"].is_string()) {
        config.log_level = j["log_level"].get<std::string>();
    }
    if (j.contains("llm") && j["llm"].is_object()) {
        config.llm = parse_llm(j["llm"], base_dir);
    }
    if (j.contains("magentic") && j["magentic"].is_object()) {
        read_int(j["magentic"], "max_iterations", config.orchestration.magentic_max_iterations, 0);
        const auto& m = j["magentic"];
        if (m.contains("selector") && m["selector"].is_string()) {
            config.magentic_selector = m["selector"].get<std::string>();
        }
    }
    if (j.contains("group_chat") && j["group_chat"].is_object()) {
        read_int(j["group_chat"], "max_rounds", config.orchestration.group_chat_max_rounds, 1);
    }
    if (j.contains("custom") && j["custom"].is_object()) {
        read_int(j["custom"], "wait_timeout_ms", config.orchestration.wait_timeout_ms, 0);
        read_int(j["custom"], "poll_interval_ms", config.orchestration.poll_interval_ms, 1);
    }
    if (j.contains("history") && j["history"].is_object()) {
        read_int(j["history"], "max_entries", config.history_max_entries, 1);
    }
    return config;
}

EngineConfig EngineConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::info("Config file {} not found, using defaults", path);
        return EngineConfig{};
    }

    Value j = Value::parse(file, nullptr, false);
    if (j.is_discarded()) {
        spdlog::warn("Config file {} is not valid JSON, using defaults", path);
        return EngineConfig{};
    }
    return from_json(j, std::filesystem::path(path).parent_path());
}

void apply_log_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        spdlog::warn("Unknown log level '{}', keeping {}", level,
                     spdlog::level::to_string_view(spdlog::get_level()));
        return;
    }
    spdlog::set_level(parsed);
}

} // namespace agentorch
