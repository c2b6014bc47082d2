// src/core/flow_record.cpp
#include "agentflow/core/types/flow_record.h"

namespace agentflow {

Value to_json(const FlowRecord& record) {
    Value j;
    j["step"] = record.step;
    j["agent_name"] = record.agent_name;
    j["action"] = record.action;
    j["action_kind"] = std::string(to_string(record.action_kind));
    j["result"] = record.result;
    j["metadata"] = record.metadata;
    j["recorded_at_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        record.recorded_at.time_since_epoch()).count();
    return j;
}

Value to_json(const FlowSummary& summary) {
    Value j;
    j["total_steps"] = summary.total_steps;
    j["current_agent"] = summary.current_agent.has_value() ? Value(*summary.current_agent) : Value(nullptr);
    j["branch_decisions"] = summary.branch_decisions;
    j["agents_visited"] = summary.agents_visited;
    j["action_counts"] = summary.action_counts;
    Value kinds = Value::object();
    for (const auto& [kind, count] : summary.kind_counts) {
        kinds[std::string(to_string(kind))] = count;
    }
    j["kind_counts"] = std::move(kinds);
    return j;
}

} // namespace agentflow
