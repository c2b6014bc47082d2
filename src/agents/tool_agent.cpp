// src/agents/tool_agent.cpp
#include "agentflow/agents/tool_agent.h"
#include "agentflow/common/utils/log.h"
#include "agentflow/common/utils/template_renderer.h"
#include "agentflow/core/types/action.h"

namespace agentflow {

ToolAgent::ToolAgent(std::string name,
                     const ToolRegistry& registry,
                     std::string tool_name,
                     std::unordered_map<std::string, std::string> argument_templates,
                     Params params)
    : AgentNode(std::move(name), std::move(params)),
      registry_(registry),
      tool_name_(std::move(tool_name)),
      argument_templates_(std::move(argument_templates)) {}

PlanResult ToolAgent::plan(const AgentInput& input) {
    PlanResult plan_result;

    std::string tool = tool_name_;
    if (input.parameters.is_object() && input.parameters.contains("tool") &&
        input.parameters["tool"].is_string()) {
        tool = input.parameters["tool"].get<std::string>(); // 参数中的 tool 覆盖构造时的配置
    }

    // 渲染参数模板：{{ query }}, {{ context.previous_result }}, {{ parameters.x }}
    const Value data = to_template_data(input);
    Value args = Value::object();
    for (const auto& [key, tmpl] : argument_templates_) {
        args[key] = InjaTemplateRenderer::render(tmpl, data);
    }

    plan_result.plan = "Call tool '" + tool + "' with query: " + input.query;
    plan_result.tools_to_use = {tool};
    plan_result.parameters = input.parameters;
    plan_result.parameters["arguments"] = std::move(args);
    plan_result.metadata["agent_type"] = "ToolAgent";
    return plan_result;
}

AgentOutput ToolAgent::run(const PlanResult& plan_result) {
    AgentOutput output;
    output.plan = plan_result.plan;

    const std::string tool = plan_result.tools_to_use.empty() ? tool_name_ : plan_result.tools_to_use.front();

    ToolArgs args;
    if (plan_result.parameters.contains("arguments")) {
        for (const auto& [key, value] : plan_result.parameters["arguments"].items()) {
            args[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    }

    output.result = registry_.call_tool(tool, args);
    const bool failed = output.result.is_object() && output.result.contains("error");

    output.metadata["agent_type"] = "ToolAgent";
    output.metadata["tool"] = tool;
    output.metadata[kActionKey] = Action::from_kind(failed ? ActionKind::FAILURE : ActionKind::SUCCESS).label;
    if (failed) {
        log::warning("Tool '" + tool + "' failed in agent '" + name() + "': " + output.result["error"].dump());
    } else {
        output.tools_used.push_back(tool);
    }
    return output;
}

} // namespace agentflow
