#ifndef AGENTORCH_UTILS_TEMPLATE_RENDERER_H
#define AGENTORCH_UTILS_TEMPLATE_RENDERER_H

#include "agentorch/common/types.h"
#include <inja/inja.hpp>
#include <string>
#include <string_view>

namespace agentorch {

class InjaTemplateRenderer {
public:
    InjaTemplateRenderer();

    // 静态方法：使用默认环境渲染模板
    static std::string render(std::string_view template_str, const Value& data);

    std::string render_with_env(std::string_view template_str, const Value& data);

private:
    inja::Environment env_;
    void configure_security(); // include 被禁用
};

// Evaluates an inja expression (without braces) against `data`.
// "true" or a non-zero number is true; "false", "0" and "" are false.
// Any other rendering throws std::runtime_error.
bool evaluate_condition(const std::string& expression, const Value& data);

// Truthiness of a JSON value, used where a handler output decides a branch.
bool is_truthy(const Value& value);

} // namespace agentorch

#endif // AGENTORCH_UTILS_TEMPLATE_RENDERER_H
