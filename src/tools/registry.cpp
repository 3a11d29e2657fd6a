// src/tools/registry.cpp
#include "agentorch/tools/registry.h"
#include "agentorch/common/errors.h"
#include <algorithm>
#include <stdexcept>

namespace agentorch {

ToolRegistry::ToolRegistry() {
    register_builtin_tools();
}

void ToolRegistry::register_builtin_tools() {
    register_tool("calculate", [](const ToolArguments& args) -> Value {
        auto a_it = args.find("a");
        auto b_it = args.find("b");
        auto op_it = args.find("op");
        if (a_it == args.end() || b_it == args.end() || op_it == args.end()) {
            throw std::invalid_argument("Missing arguments: a, b, op");
        }

        double a = std::stod(a_it->second);
        double b = std::stod(b_it->second);
        const std::string& op = op_it->second;

        if (op == "/" && b == 0.0) {
            throw std::invalid_argument("Division by zero");
        }

        double result = 0.0;
        if (op == "+") result = a + b;
        else if (op == "-") result = a - b;
        else if (op == "*") result = a * b;
        else if (op == "/") result = a / b;
        else throw std::invalid_argument("Unsupported operator: " + op);

        return Value{{"result", result}};
    });

    register_tool("echo", [](const ToolArguments& args) -> Value {
        Value out = Value::object();
        for (const auto& [key, value] : args) {
            out[key] = value;
        }
        return out;
    });
}

bool ToolRegistry::has_tool(const std::string& name) const {
    return tools_.count(name) > 0;
}

Value ToolRegistry::call_tool(const std::string& name, const ToolArguments& args) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        throw CollaboratorError("Tool not found: " + name);
    }

    try {
        return it->second(args);
    } catch (const EngineError&) {
        throw;
    } catch (const std::exception& e) {
        throw CollaboratorError("Tool '" + name + "' failed: " + e.what());
    }
}

std::vector<std::string> ToolRegistry::list_tools() const {
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& [name, _] : tools_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace agentorch
