// src/tools/registry.cpp
#include "agentflow/tools/registry.h"
#include <algorithm>
#include <stdexcept>

namespace agentflow {

bool ToolRegistry::has_tool(const std::string& name) const {
    return tools_.count(name) > 0;
}

nlohmann::json ToolRegistry::call_tool(const std::string& name, const ToolArgs& args) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return nlohmann::json{{"error", "Tool not found: " + name}};
    }

    try {
        return it->second(args);
    } catch (const std::exception& e) {
        return nlohmann::json{{"error", std::string("Tool execution failed: ") + e.what()}};
    }
}

std::vector<std::string> ToolRegistry::list_tools() const {
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& [name, _] : tools_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace agentflow
