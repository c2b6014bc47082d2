// src/core/flow_orchestrator.cpp
#include "agentflow/core/flow_orchestrator.h"
#include "agentflow/common/utils/log.h"
#include "agentflow/core/types/action.h"
#include "agentflow/core/types/errors.h"
#include <stdexcept>

namespace agentflow {

FlowOrchestrator::FlowOrchestrator(std::string name, std::shared_ptr<FlowGraph> graph)
    : name_(std::move(name)), graph_(std::move(graph)) {
    if (!graph_) {
        throw GraphError("Flow '" + name_ + "' requires a graph");
    }
}

NodeHandle FlowOrchestrator::start(NodeHandle node) {
    if (node.graph() != graph_.get() || !node.valid()) {
        throw GraphError("Start node of flow '" + name_ + "' must belong to the flow's graph");
    }
    start_ = node.id();
    return node;
}

void FlowOrchestrator::set_params(Params params) {
    if (params.is_null()) {
        params = Params::object();
    }
    if (!params.is_object()) {
        throw std::invalid_argument("Parameters of flow '" + name_ + "' must be a JSON object");
    }
    params_ = std::move(params);
}

AgentInput FlowOrchestrator::prepare_step_input(const ContextStore& context,
                                                const AgentInput& input,
                                                const AgentOutput* previous,
                                                const std::string& previous_agent) const {
    AgentInput step_input = input;

    // 参数优先级：context flow 级 < 输入参数 < 流程参数 < 节点参数（在 AgentNode::execute 中合并）
    Params merged = context.get_flow_params();
    merge_params(merged, input.parameters);
    merge_params(merged, params_);
    step_input.parameters = std::move(merged);

    if (options_.input_mode == InputMode::CHAINED && previous != nullptr) {
        if (!step_input.context.is_object()) {
            step_input.context = Value::object();
        }
        step_input.context["previous_result"] = previous->result;
        step_input.context["previous_agent"] = previous_agent;
    }
    return step_input;
}

AgentOutput FlowOrchestrator::run(ContextStore& context, const AgentInput& input) {
    if (!start_.has_value()) {
        throw FlowError("Flow '" + name_ + "' has no start node");
    }

    log::info("Flow '" + name_ + "' started (" + std::string(to_string(options_.input_mode)) + " input)");

    // 遍历游标只属于本次运行，不修改共享的图
    std::optional<NodeId> current = start_;
    std::optional<AgentOutput> last_output;
    std::string last_agent;

    while (current.has_value()) {
        Executable& unit = graph_->unit(*current);

        AgentInput step_input = prepare_step_input(
            context, input, last_output ? &*last_output : nullptr, last_agent);

        AgentOutput output = unit.execute(context, step_input);

        if (options_.warn_on_implicit_default && !has_explicit_action(output.metadata)) {
            log::warning("Agent '" + unit.name() + "' did not set an action, routing via 'default'");
        }
        const Action action = action_from_metadata(output.metadata);

        context.record_flow_step(unit.name(), action.label, output.result, output.metadata);
        log::debug("[" + name_ + "] " + unit.name() + " -> " + action.label);

        current = graph_->resolve(*current, action.label);
        if (!current && action.kind == ActionKind::FAILURE) {
            log::warning("Flow '" + name_ + "' ended on an unhandled failure from '" + unit.name() + "'");
        }
        last_agent = unit.name();
        last_output = std::move(output);
    }

    log::info("Flow '" + name_ + "' finished at '" + last_agent + "'");
    return std::move(*last_output);
}

std::future<AgentOutput> FlowOrchestrator::run_async(ContextStore& context, AgentInput input) {
    return std::async(std::launch::async, [this, &context, input = std::move(input)]() {
        return run(context, input);
    });
}

AgentOutput FlowOrchestrator::execute(ContextStore& context, const AgentInput& input) {
    // 作为子流程执行：整个遍历是父流程的一步，记录写入同一个 ContextStore
    return run(context, input);
}

} // namespace agentflow
