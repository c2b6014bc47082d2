// src/agents/function_agent.cpp
#include "agentflow/agents/function_agent.h"
#include "agentflow/core/types/errors.h"

namespace agentflow {

FunctionAgent::FunctionAgent(std::string name, RunFn run_fn, PlanFn plan_fn, Params params)
    : AgentNode(std::move(name), std::move(params)),
      run_fn_(std::move(run_fn)),
      plan_fn_(std::move(plan_fn)) {
    if (!run_fn_) {
        throw GraphError("FunctionAgent '" + this->name() + "' requires a run function");
    }
}

PlanResult FunctionAgent::passthrough_plan(const AgentInput& input) {
    PlanResult plan_result;
    plan_result.plan = input.query;
    plan_result.tools_to_use = input.tools;
    plan_result.parameters = input.parameters;
    plan_result.metadata["context"] = input.context;
    return plan_result;
}

PlanResult FunctionAgent::plan(const AgentInput& input) {
    return plan_fn_ ? plan_fn_(input) : passthrough_plan(input);
}

AgentOutput FunctionAgent::run(const PlanResult& plan_result) {
    return run_fn_(plan_result);
}

} // namespace agentflow
