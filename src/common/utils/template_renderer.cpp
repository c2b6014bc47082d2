// src/common/utils/template_renderer.cpp
#include "agentflow/common/utils/template_renderer.h"
#include <filesystem>
#include <stdexcept>

namespace agentflow {

InjaTemplateRenderer::InjaTemplateRenderer() : env_() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    env_.set_line_statement("##");

    configure_security();
}

void InjaTemplateRenderer::configure_security() {
    // Agent 参数来自调用方输入，禁止模板 include 文件
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled for security.", inja::SourceLocation{});
    });
}

std::string InjaTemplateRenderer::render(std::string_view template_str, const Value& data) {
    static InjaTemplateRenderer renderer;
    return renderer.render_with_env(template_str, data);
}

bool InjaTemplateRenderer::evaluate_condition(std::string_view condition, const Value& data) {
    const std::string rendered = render(condition, data);
    if (rendered == "true") return true;
    if (rendered == "false") return false;
    throw std::runtime_error("Condition '" + std::string(condition) +
                             "' must render to true or false, got: " + rendered);
}

std::string InjaTemplateRenderer::render_with_env(std::string_view template_str, const Value& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        return env_.render(template_str, data);
    } catch (const inja::InjaError& e) {
        throw std::runtime_error("Template render error: " + e.message);
    }
}

} // namespace agentflow
