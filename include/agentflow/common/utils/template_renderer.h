// agentflow/common/utils/template_renderer.h
#ifndef AGENTFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H
#define AGENTFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H

#include "agentflow/core/types/context.h"
#include <inja/inja.hpp>
#include <mutex>
#include <string>
#include <string_view>

namespace agentflow {

class InjaTemplateRenderer {
public:
    InjaTemplateRenderer();

    // 静态方法：使用共享的默认环境渲染模板（内部加锁）
    static std::string render(std::string_view template_str, const Value& data);

    // 渲染结果必须是 "true" 或 "false"，否则抛出 std::runtime_error
    static bool evaluate_condition(std::string_view condition, const Value& data);

    std::string render_with_env(std::string_view template_str, const Value& data);

private:
    inja::Environment env_;
    std::mutex mutex_;
    void configure_security(); // 禁用 include
};

} // namespace agentflow

#endif // AGENTFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H
