// src/utils/template_renderer.cpp
#include "agentorch/utils/template_renderer.h"
#include <filesystem>
#include <mutex>
#include <stdexcept>

namespace agentorch {

InjaTemplateRenderer::InjaTemplateRenderer() : env_() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    env_.set_line_statement("##");

    configure_security();
}

void InjaTemplateRenderer::configure_security() {
    env_.set_search_included_templates_in_files(false);
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled for security.", inja::SourceLocation{});
    });
}

std::string InjaTemplateRenderer::render(std::string_view template_str, const Value& data) {
    // inja::Environment is not thread-safe; concurrent branches share this instance.
    static InjaTemplateRenderer renderer;
    static std::mutex renderer_mutex;
    std::lock_guard<std::mutex> lock(renderer_mutex);
    return renderer.render_with_env(template_str, data);
}

std::string InjaTemplateRenderer::render_with_env(std::string_view template_str, const Value& data) {
    try {
        return env_.render(template_str, data);
    } catch (const inja::InjaError& e) {
        throw std::runtime_error("Template render error: " + std::string(e.message));
    }
}

bool evaluate_condition(const std::string& expression, const Value& data) {
    const std::string rendered = InjaTemplateRenderer::render("{{ " + expression + " }}", data);
    if (rendered == "true") return true;
    if (rendered == "false" || rendered.empty()) return false;
    try {
        size_t consumed = 0;
        double num = std::stod(rendered, &consumed);
        if (consumed == rendered.size()) {
            return num != 0.0;
        }
    } catch (const std::invalid_argument&) {
        // falls through to the error below
    } catch (const std::out_of_range&) {
        return true;
    }
    throw std::runtime_error("Condition '" + expression + "' did not evaluate to a boolean: " + rendered);
}

bool is_truthy(const Value& value) {
    if (value.is_null()) return false;
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number()) return value.get<double>() != 0.0;
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        return !s.empty() && s != "false" && s != "0";
    }
    return !value.empty();
}

} // namespace agentorch
