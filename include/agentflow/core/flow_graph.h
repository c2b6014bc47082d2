// agentflow/core/flow_graph.h
#ifndef AGENTFLOW_CORE_FLOW_GRAPH_H
#define AGENTFLOW_CORE_FLOW_GRAPH_H

#include "agentflow/core/agent_node.h"
#include "agentflow/core/types/action.h"
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace agentflow {

using NodeId = std::size_t;

class FlowGraph;
class TransitionBinder;

// 图中节点的轻量句柄，用于构建连接（builder API）。
// Handles are only valid while their graph is alive.
class NodeHandle {
public:
    NodeHandle() = default;
    NodeHandle(FlowGraph* graph, NodeId id) : graph_(graph), id_(id) {}

    // 注册 target 为 action 的后继，返回 target 以便链式调用
    NodeHandle next(NodeHandle target, std::string_view action = kDefaultAction) const;
    NodeHandle on_default(NodeHandle target) const;
    NodeHandle on(std::string_view label, NodeHandle target) const;
    TransitionBinder on(std::string_view label) const;

    // exact action → "default" → nullopt
    std::optional<NodeHandle> get_next_node(std::string_view action) const;

    Executable& unit() const;
    const std::string& name() const;

    NodeId id() const { return id_; }
    FlowGraph* graph() const { return graph_; }
    bool valid() const;

    bool operator==(const NodeHandle& other) const = default;

private:
    FlowGraph* graph_ = nullptr;
    NodeId id_ = 0;
};

// 条件连接的中间绑定：source.on("x").to(target)
class TransitionBinder {
public:
    TransitionBinder(NodeHandle source, std::string label)
        : source_(source), label_(std::move(label)) {}

    NodeHandle to(NodeHandle target) const;

    NodeHandle source() const { return source_; }
    const std::string& label() const { return label_; }

private:
    NodeHandle source_;
    std::string label_;
};

// FlowGraph 持有节点（arena）及其后继映射；遍历游标由 FlowOrchestrator 在每次运行时单独持有。
class FlowGraph {
public:
    using SuccessorMap = std::map<std::string, NodeId, std::less<>>;

    FlowGraph() = default;
    FlowGraph(const FlowGraph&) = delete;
    FlowGraph& operator=(const FlowGraph&) = delete;

    NodeHandle add(std::shared_ptr<Executable> unit);

    template <typename T, typename... Args>
    NodeHandle emplace(Args&&... args) {
        return add(std::make_shared<T>(std::forward<Args>(args)...));
    }

    // Registers (or replaces) the successor of `from` for `action`.
    void connect(NodeId from, NodeId to, std::string_view action = kDefaultAction);

    std::optional<NodeId> resolve(NodeId from, std::string_view action) const;

    Executable& unit(NodeId id) const;
    const SuccessorMap& successors(NodeId id) const;

    NodeHandle handle(NodeId id);
    std::optional<NodeHandle> find(std::string_view name); // 第一个同名节点

    std::size_t size() const { return nodes_.size(); }
    bool contains(NodeId id) const { return id < nodes_.size(); }

private:
    struct Entry {
        std::shared_ptr<Executable> unit;
        SuccessorMap successors;
    };

    const Entry& entry(NodeId id) const;
    Entry& entry(NodeId id);

    std::vector<Entry> nodes_;
};

} // namespace agentflow

#endif // AGENTFLOW_CORE_FLOW_GRAPH_H
