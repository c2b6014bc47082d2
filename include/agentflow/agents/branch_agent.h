// agentflow/agents/branch_agent.h
#ifndef AGENTFLOW_AGENTS_BRANCH_AGENT_H
#define AGENTFLOW_AGENTS_BRANCH_AGENT_H

#include "agentflow/core/agent_node.h"
#include "agentflow/core/types/action.h"
#include <string>
#include <utility>
#include <vector>

namespace agentflow {

// 条件路由：按顺序求值 inja 布尔表达式，第一个为 true 的条件决定 action
class BranchAgent : public AgentNode {
public:
    struct Route {
        std::string condition; // e.g. "{{ length(query) > 40 }}"
        std::string action;
    };

    BranchAgent(std::string name,
                std::vector<Route> routes,
                std::string fallback_action = std::string(kDefaultAction),
                Params params = Params::object());

    BranchAgent& add_route(std::string condition, std::string action);

    PlanResult plan(const AgentInput& input) override;
    AgentOutput run(const PlanResult& plan_result) override;

    const std::vector<Route>& routes() const { return routes_; }

private:
    std::vector<Route> routes_;
    std::string fallback_action_;
};

} // namespace agentflow

#endif // AGENTFLOW_AGENTS_BRANCH_AGENT_H
