// src/agents/branch_agent.cpp
#include "agentflow/agents/branch_agent.h"
#include "agentflow/common/utils/template_renderer.h"
#include "agentflow/core/types/errors.h"

namespace agentflow {

BranchAgent::BranchAgent(std::string name,
                         std::vector<Route> routes,
                         std::string fallback_action,
                         Params params)
    : AgentNode(std::move(name), std::move(params)),
      fallback_action_(std::move(fallback_action)) {
    if (fallback_action_.empty()) {
        throw GraphError("BranchAgent '" + this->name() + "' requires a non-empty fallback action");
    }
    for (auto& route : routes) {
        add_route(std::move(route.condition), std::move(route.action));
    }
}

BranchAgent& BranchAgent::add_route(std::string condition, std::string action) {
    if (action.empty()) {
        throw GraphError("BranchAgent '" + name() + "' route action must not be empty");
    }
    routes_.push_back(Route{std::move(condition), std::move(action)});
    return *this;
}

PlanResult BranchAgent::plan(const AgentInput& input) {
    PlanResult plan_result;
    plan_result.plan = "Evaluate " + std::to_string(routes_.size()) + " route(s)";
    plan_result.parameters = input.parameters;
    plan_result.metadata["template_data"] = to_template_data(input);
    return plan_result;
}

AgentOutput BranchAgent::run(const PlanResult& plan_result) {
    const Value& data = plan_result.metadata.at("template_data");

    int matched = -1;
    for (std::size_t i = 0; i < routes_.size(); ++i) {
        if (InjaTemplateRenderer::evaluate_condition(routes_[i].condition, data)) {
            matched = static_cast<int>(i);
            break;
        }
    }

    const std::string& action = matched >= 0 ? routes_[static_cast<std::size_t>(matched)].action : fallback_action_;

    AgentOutput output;
    output.plan = plan_result.plan;
    output.result = action;
    output.metadata["agent_type"] = "BranchAgent";
    output.metadata["matched_condition"] = matched;
    output.metadata[kActionKey] = action;
    return output;
}

} // namespace agentflow
