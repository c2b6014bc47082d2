// agentflow/core/engine_config.h
#ifndef AGENTFLOW_CORE_ENGINE_CONFIG_H
#define AGENTFLOW_CORE_ENGINE_CONFIG_H

#include "agentflow/common/utils/log.h"
#include "agentflow/core/types/context.h"
#include <cstdint>
#include <string>
#include <string_view>

namespace agentflow {

class ContextStore;

// 节点输入的传递方式
enum class InputMode : uint8_t {
    ORIGINAL, // 每个节点都收到流程的原始输入
    CHAINED   // 原始输入 + context["previous_result"] / context["previous_agent"]
};

std::string_view to_string(InputMode mode);

// 流程遍历实际读取的选项；日志级别和 flow_params 由 EngineConfig::apply 处理
struct FlowOptions {
    InputMode input_mode = InputMode::ORIGINAL;
    bool warn_on_implicit_default = true;
};

struct EngineConfig {
    InputMode input_mode = InputMode::ORIGINAL;
    log::Level log_level = log::Level::Warning;
    Params flow_params = Params::object();
    bool warn_on_implicit_default = true;

    // Unknown keys are ignored; invalid values throw ConfigError.
    static EngineConfig from_json(const Value& j);

    // .yaml / .yml → yaml-cpp, anything else → JSON
    static EngineConfig from_file(const std::string& path);

    // flow_params 作为 context flow 级参数的默认值（已有键优先），并设置日志级别
    void apply(ContextStore& context) const;

    FlowOptions flow_options() const { return FlowOptions{input_mode, warn_on_implicit_default}; }

    Value to_json() const;
};

} // namespace agentflow

#endif // AGENTFLOW_CORE_ENGINE_CONFIG_H
