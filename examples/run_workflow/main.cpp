// examples/run_workflow/main.cpp
#include "agentorch/core/engine.h"
#include <cctype>
#include <iostream>
#include <nlohmann/json.hpp>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <workflow.yaml> [input.json] [config.json]\n";
        return 1;
    }

    try {
        // 1. 创建引擎
        auto engine = agentorch::WorkflowEngine::from_config_file(argc > 3 ? argv[3] : "agentorch_config.json");

        // 2. 注册自定义工具
        engine->register_tool("word_count", [](const agentorch::ToolArguments& args) {
            const std::string& text = args.count("text") ? args.at("text") : std::string{};
            size_t words = 0;
            bool in_word = false;
            for (char c : text) {
                bool space = std::isspace(static_cast<unsigned char>(c));
                if (!space && !in_word) ++words;
                in_word = !space;
            }
            return nlohmann::json{{"words", words}};
        });
        engine->register_function("uppercase", [](const nlohmann::json& input) {
            nlohmann::json out = input;
            if (out.is_object() && out.contains("text") && out["text"].is_string()) {
                std::string text = out["text"];
                for (auto& c : text) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
                out["text"] = text;
            }
            return out;
        });

        engine->events().on_step_completed([](const agentorch::StepCompletedEvent& e) {
            std::cout << "  step #" << e.step.sequence << " " << e.step.node_id
                      << " -> " << agentorch::to_string(e.step.status) << "\n";
        });

        // 3. 执行
        auto workflow_id = engine->load_workflow_file(argv[1]);
        nlohmann::json input = nlohmann::json::object();
        if (argc > 2) {
            input = nlohmann::json::parse(argv[2]);
        }

        auto execution_id = engine->start_execution(workflow_id, input);
        engine->wait_for_execution(execution_id, std::chrono::minutes(10));

        // 4. 输出结果
        auto execution = engine->get_execution_status(execution_id);
        if (!execution) {
            std::cerr << "[ERROR] execution " << execution_id << " not found\n";
            return 1;
        }
        nlohmann::json report = *execution;
        std::cout << report.dump(2) << "\n";
        return execution->status == agentorch::ExecutionStatus::COMPLETED ? 0 : 2;

    } catch (const agentorch::EngineError& e) {
        std::cerr << "[" << agentorch::to_string(e.kind()) << "] " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }
}
