// src/core/agent_io.cpp
#include "agentflow/core/types/agent_io.h"

namespace agentflow {

Value to_template_data(const AgentInput& input) {
    Value data = Value::object();
    data["query"] = input.query;
    data["context"] = input.context.is_null() ? Value::object() : input.context;
    data["parameters"] = input.parameters.is_null() ? Value::object() : input.parameters;
    data["tools"] = input.tools;
    return data;
}

} // namespace agentflow
