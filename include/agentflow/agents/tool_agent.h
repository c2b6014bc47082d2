// agentflow/agents/tool_agent.h
#ifndef AGENTFLOW_AGENTS_TOOL_AGENT_H
#define AGENTFLOW_AGENTS_TOOL_AGENT_H

#include "agentflow/core/agent_node.h"
#include "agentflow/tools/registry.h"
#include <string>
#include <unordered_map>

namespace agentflow {

// 调用注册表中的一个工具。参数是 inja 模板，数据为 {query, context, parameters}。
// 工具返回 {"error": ...} 时输出 action = "failure"，否则 "success"。
class ToolAgent : public AgentNode {
public:
    ToolAgent(std::string name,
              const ToolRegistry& registry,
              std::string tool_name,
              std::unordered_map<std::string, std::string> argument_templates = {},
              Params params = Params::object());

    PlanResult plan(const AgentInput& input) override;
    AgentOutput run(const PlanResult& plan_result) override;

    const std::string& tool_name() const { return tool_name_; }

private:
    const ToolRegistry& registry_;
    std::string tool_name_;
    std::unordered_map<std::string, std::string> argument_templates_;
};

} // namespace agentflow

#endif // AGENTFLOW_AGENTS_TOOL_AGENT_H
