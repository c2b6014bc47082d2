// agentflow/core/types/flow_record.h
#ifndef AGENTFLOW_CORE_TYPES_FLOW_RECORD_H
#define AGENTFLOW_CORE_TYPES_FLOW_RECORD_H

#include "agentflow/core/types/action.h"
#include "agentflow/core/types/context.h"
#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace agentflow {

// 每执行一个节点产生一条记录，创建后不再修改
struct FlowRecord {
    std::size_t step = 0; // position in flow_history
    std::string agent_name;
    std::string action;
    ActionKind action_kind = ActionKind::DEFAULT; // Action::parse(action).kind
    Value result;
    Value metadata = Value::object();
    std::chrono::system_clock::time_point recorded_at;
};

struct FlowSummary {
    std::size_t total_steps = 0;
    std::optional<std::string> current_agent;
    std::vector<std::string> branch_decisions;
    std::vector<std::string> agents_visited; // distinct, first-visit order
    std::map<std::string, std::size_t> action_counts;
    std::map<ActionKind, std::size_t> kind_counts; // CUSTOM 汇总所有自定义标签
};

Value to_json(const FlowRecord& record);
Value to_json(const FlowSummary& summary);

} // namespace agentflow

#endif // AGENTFLOW_CORE_TYPES_FLOW_RECORD_H
