// agentflow/agents/function_agent.h
#ifndef AGENTFLOW_AGENTS_FUNCTION_AGENT_H
#define AGENTFLOW_AGENTS_FUNCTION_AGENT_H

#include "agentflow/core/agent_node.h"
#include <functional>
#include <string>

namespace agentflow {

// 由可调用对象提供 plan / run 的 Agent，无需继承
class FunctionAgent : public AgentNode {
public:
    using PlanFn = std::function<PlanResult(const AgentInput&)>;
    using RunFn = std::function<AgentOutput(const PlanResult&)>;

    // Without a plan function the plan copies query, tools and parameters.
    FunctionAgent(std::string name, RunFn run_fn, PlanFn plan_fn = nullptr, Params params = Params::object());

    PlanResult plan(const AgentInput& input) override;
    AgentOutput run(const PlanResult& plan_result) override;

    static PlanResult passthrough_plan(const AgentInput& input);

private:
    RunFn run_fn_;
    PlanFn plan_fn_;
};

} // namespace agentflow

#endif // AGENTFLOW_AGENTS_FUNCTION_AGENT_H
