// agentflow/core/types/agent_io.h
#ifndef AGENTFLOW_CORE_TYPES_AGENT_IO_H
#define AGENTFLOW_CORE_TYPES_AGENT_IO_H

#include "agentflow/core/types/context.h"
#include <string>
#include <vector>

namespace agentflow {

// Agent 输入
struct AgentInput {
    std::string query;
    Value context = Value::object();    // 附加上下文（chained 模式下包含 previous_result）
    std::vector<std::string> tools;     // 指定使用的工具
    Params parameters = Params::object();
};

// plan 阶段的产物，交给 run 阶段
struct PlanResult {
    std::string plan;
    std::vector<std::string> tools_to_use;
    Params parameters = Params::object();
    Value metadata = Value::object();
};

// Agent 输出；metadata["action"] 决定路由
struct AgentOutput {
    Value result;
    std::string plan;
    std::vector<std::string> tools_used;
    Value metadata = Value::object();
};

// Template data exposed to inja-based agents: {query, context, parameters}
Value to_template_data(const AgentInput& input);

} // namespace agentflow

#endif // AGENTFLOW_CORE_TYPES_AGENT_IO_H
