// agentflow/core/agent_node.h
#ifndef AGENTFLOW_CORE_AGENT_NODE_H
#define AGENTFLOW_CORE_AGENT_NODE_H

#include "agentflow/core/types/agent_io.h"
#include "agentflow/core/types/context.h"
#include <string>

namespace agentflow {

class ContextStore;

// 叶子 Agent 与子流程共同实现的执行能力
class Executable {
public:
    virtual ~Executable() = default;

    virtual const std::string& name() const = 0;

    // Executes one graph step. Failures propagate to the caller unmodified.
    [[nodiscard]] virtual AgentOutput execute(ContextStore& context, const AgentInput& input) = 0;
};

// Base Agent: two-phase plan → run contract.
// 节点名称不要求唯一；同一个 Agent 可以被多个图共享。
class AgentNode : public Executable {
public:
    explicit AgentNode(std::string name, Params params = Params::object());

    const std::string& name() const override { return name_; }

    void set_params(Params params);
    const Params& params() const { return params_; }

    virtual PlanResult plan(const AgentInput& input) = 0;
    virtual AgentOutput run(const PlanResult& plan_result) = 0;

    // 合并节点参数包（节点优先）后执行 plan → run
    [[nodiscard]] AgentOutput execute(const AgentInput& input);

    // 流程中的入口。默认忽略 context；需要读取流程历史的 Agent 覆盖此函数，
    // 再调用 AgentNode::execute(input) 完成 plan → run。
    [[nodiscard]] AgentOutput execute(ContextStore& context, const AgentInput& input) override;

private:
    std::string name_;
    Params params_;
};

} // namespace agentflow

#endif // AGENTFLOW_CORE_AGENT_NODE_H
