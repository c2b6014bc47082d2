// src/core/agent_node.cpp
#include "agentflow/core/agent_node.h"
#include "agentflow/core/context_store.h"
#include <stdexcept>

namespace agentflow {

AgentNode::AgentNode(std::string name, Params params)
    : name_(std::move(name)) {
    set_params(std::move(params));
}

void AgentNode::set_params(Params params) {
    if (params.is_null()) {
        params = Params::object();
    }
    if (!params.is_object()) {
        throw std::invalid_argument("Parameters of agent '" + name_ + "' must be a JSON object");
    }
    params_ = std::move(params);
}

AgentOutput AgentNode::execute(const AgentInput& input) {
    AgentInput merged = input;
    merge_params(merged.parameters, params_); // 节点参数优先
    PlanResult plan_result = plan(merged);
    return run(plan_result);
}

AgentOutput AgentNode::execute(ContextStore& /*context*/, const AgentInput& input) {
    return execute(input);
}

} // namespace agentflow
