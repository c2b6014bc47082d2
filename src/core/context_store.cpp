// src/core/context_store.cpp
#include "agentflow/core/context_store.h"
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace agentflow {

ContextStore::ContextStore(Params flow_params) {
    set_flow_params(std::move(flow_params));
}

void ContextStore::record_flow_step(const std::string& agent_name,
                                    const std::string& action,
                                    Value result,
                                    Value metadata) {
    FlowRecord record;
    record.step = flow_history_.size();
    record.agent_name = agent_name;
    record.action = action;
    record.action_kind = Action::parse(action).kind;
    record.result = std::move(result);
    record.metadata = metadata.is_null() ? Value::object() : std::move(metadata);
    record.recorded_at = std::chrono::system_clock::now();

    flow_history_.push_back(std::move(record));
    current_agent_ = agent_name;
    branch_decisions_.push_back(action);
}

FlowSummary ContextStore::get_flow_summary() const {
    FlowSummary summary;
    summary.total_steps = flow_history_.size();
    summary.current_agent = current_agent_;
    summary.branch_decisions = branch_decisions_;

    for (const auto& record : flow_history_) {
        if (std::find(summary.agents_visited.begin(), summary.agents_visited.end(), record.agent_name) ==
            summary.agents_visited.end()) {
            summary.agents_visited.push_back(record.agent_name);
        }
        ++summary.action_counts[record.action];
        ++summary.kind_counts[record.action_kind];
    }
    return summary;
}

void ContextStore::reset_flow() {
    flow_history_.clear();
    branch_decisions_.clear();
    current_agent_.reset();
    // flow_params_ 保留
}

void ContextStore::set_flow_params(Params params) {
    if (params.is_null()) {
        params = Params::object();
    }
    if (!params.is_object()) {
        throw std::invalid_argument("Flow parameters must be a JSON object, got: " + params.dump());
    }
    flow_params_ = std::move(params);
}

Value ContextStore::history_to_json() const {
    Value history = Value::array();
    for (const auto& record : flow_history_) {
        history.push_back(to_json(record));
    }
    return history;
}

} // namespace agentflow
