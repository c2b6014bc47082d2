// agentflow/core/context_store.h
#ifndef AGENTFLOW_CORE_CONTEXT_STORE_H
#define AGENTFLOW_CORE_CONTEXT_STORE_H

#include "agentflow/core/types/context.h"
#include "agentflow/core/types/flow_record.h"
#include <optional>
#include <string>
#include <vector>

namespace agentflow {

// ContextStore 记录一次流程运行的全部执行历史。
// 每次调用流程创建一个，以引用方式贯穿整个运行（包括子流程）。
// Not safe for concurrent mutation: use one store per concurrent invocation.
class ContextStore {
public:
    ContextStore() = default;
    explicit ContextStore(Params flow_params);

    // 追加一条记录，更新 current_agent 和 branch_decisions
    void record_flow_step(const std::string& agent_name,
                          const std::string& action,
                          Value result,
                          Value metadata = Value::object());

    FlowSummary get_flow_summary() const;

    // 清空历史，保留 flow 级参数
    void reset_flow();

    void set_flow_params(Params params);
    const Params& get_flow_params() const { return flow_params_; }

    const std::vector<FlowRecord>& flow_history() const { return flow_history_; }
    const std::vector<std::string>& branch_decisions() const { return branch_decisions_; }
    const std::optional<std::string>& current_agent() const { return current_agent_; }

    Value history_to_json() const;

private:
    std::vector<FlowRecord> flow_history_;
    std::vector<std::string> branch_decisions_;
    std::optional<std::string> current_agent_;
    Params flow_params_ = Params::object(); // 跨 reset 保留
};

} // namespace agentflow

#endif // AGENTFLOW_CORE_CONTEXT_STORE_H
