#ifndef AGENTORCH_TOOLS_REGISTRY_H
#define AGENTORCH_TOOLS_REGISTRY_H

#include "agentorch/common/types.h"
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentorch {

using ToolArguments = std::unordered_map<std::string, std::string>;
using ToolFunction = std::function<Value(const ToolArguments&)>;

// Tool-invocation provider. Tools are registered before executions start;
// lookups and calls are then safe from concurrent branches.
class ToolRegistry {
public:
    ToolRegistry(); // 构造时注册内置工具

    template<typename Func>
    void register_tool(std::string name, Func&& func) {
        tools_[std::move(name)] = ToolFunction(std::forward<Func>(func));
    }

    bool has_tool(const std::string& name) const;

    // Throws CollaboratorError if the tool is missing or the tool itself throws.
    Value call_tool(const std::string& name, const ToolArguments& args) const;

    std::vector<std::string> list_tools() const;

private:
    void register_builtin_tools();
    std::unordered_map<std::string, ToolFunction> tools_;
};

} // namespace agentorch

#endif // AGENTORCH_TOOLS_REGISTRY_H
