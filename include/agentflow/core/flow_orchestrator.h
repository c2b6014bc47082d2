// agentflow/core/flow_orchestrator.h
#ifndef AGENTFLOW_CORE_FLOW_ORCHESTRATOR_H
#define AGENTFLOW_CORE_FLOW_ORCHESTRATOR_H

#include "agentflow/core/agent_node.h"
#include "agentflow/core/context_store.h"
#include "agentflow/core/engine_config.h"
#include "agentflow/core/flow_graph.h"
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace agentflow {

// FlowOrchestrator 从 start 节点开始驱动遍历，按 action 选择后继，直到无后继为止。
// 它本身也是 Executable，因此可以作为子流程加入另一个图。
// All run-scoped state lives in the ContextStore passed to run().
class FlowOrchestrator : public Executable {
public:
    explicit FlowOrchestrator(std::string name,
                              std::shared_ptr<FlowGraph> graph = std::make_shared<FlowGraph>());

    const std::string& name() const override { return name_; }

    FlowGraph& graph() { return *graph_; }
    const std::shared_ptr<FlowGraph>& shared_graph() const { return graph_; }

    // 设置起始节点；node 必须属于本流程的图。返回 node 以便继续连接。
    NodeHandle start(NodeHandle node);
    std::optional<NodeId> start_node() const { return start_; }

    void set_params(Params params);
    const Params& params() const { return params_; }

    // 只影响本流程的遍历；子流程使用自己的 options
    void set_options(FlowOptions options) { options_ = options; }
    const FlowOptions& options() const { return options_; }

    // Traverses the graph and returns the last executed node's output.
    // Throws FlowError when no start node is set.
    AgentOutput run(ContextStore& context, const AgentInput& input);

    // context 和 orchestrator 必须在 future 就绪前保持有效
    std::future<AgentOutput> run_async(ContextStore& context, AgentInput input);

    [[nodiscard]] AgentOutput execute(ContextStore& context, const AgentInput& input) override;

private:
    AgentInput prepare_step_input(const ContextStore& context,
                                  const AgentInput& input,
                                  const AgentOutput* previous,
                                  const std::string& previous_agent) const;

    std::string name_;
    std::shared_ptr<FlowGraph> graph_;
    std::optional<NodeId> start_;
    Params params_ = Params::object();
    FlowOptions options_;
};

} // namespace agentflow

#endif // AGENTFLOW_CORE_FLOW_ORCHESTRATOR_H
