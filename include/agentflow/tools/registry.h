// agentflow/tools/registry.h
#ifndef AGENTFLOW_TOOLS_REGISTRY_H
#define AGENTFLOW_TOOLS_REGISTRY_H

#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentflow {

using ToolArgs = std::unordered_map<std::string, std::string>;
using ToolFunction = std::function<nlohmann::json(const ToolArgs&)>;

// 工具注册表（实例，非单例）
class ToolRegistry {
public:
    template <typename Func>
    void register_tool(std::string name, Func&& func) {
        tools_[std::move(name)] = ToolFunction(std::forward<Func>(func));
    }

    bool has_tool(const std::string& name) const;

    // 未找到或执行失败时返回 {"error": ...}，不抛异常
    nlohmann::json call_tool(const std::string& name, const ToolArgs& args) const;

    std::vector<std::string> list_tools() const; // sorted

private:
    std::unordered_map<std::string, ToolFunction> tools_;
};

} // namespace agentflow

#endif // AGENTFLOW_TOOLS_REGISTRY_H
