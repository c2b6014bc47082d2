// src/core/flow_graph.cpp
#include "agentflow/core/flow_graph.h"
#include "agentflow/core/types/errors.h"
#include <string>

namespace agentflow {

// --- NodeHandle ---

NodeHandle NodeHandle::next(NodeHandle target, std::string_view action) const {
    if (!valid()) {
        throw GraphError("Cannot register a successor on an invalid node handle");
    }
    if (target.graph_ != graph_) {
        throw GraphError("Successor '" + (target.valid() ? target.name() : std::string("<invalid>")) +
                         "' does not belong to the graph of '" + name() + "'");
    }
    graph_->connect(id_, target.id_, action);
    return target;
}

NodeHandle NodeHandle::on_default(NodeHandle target) const {
    return next(target, kDefaultAction);
}

NodeHandle NodeHandle::on(std::string_view label, NodeHandle target) const {
    return next(target, label);
}

TransitionBinder NodeHandle::on(std::string_view label) const {
    if (label.empty()) {
        throw GraphError("Action label must not be empty");
    }
    return TransitionBinder(*this, std::string(label));
}

std::optional<NodeHandle> NodeHandle::get_next_node(std::string_view action) const {
    if (!valid()) {
        return std::nullopt;
    }
    auto next_id = graph_->resolve(id_, action);
    if (!next_id) {
        return std::nullopt;
    }
    return NodeHandle(graph_, *next_id);
}

Executable& NodeHandle::unit() const {
    if (!valid()) {
        throw GraphError("Invalid node handle");
    }
    return graph_->unit(id_);
}

const std::string& NodeHandle::name() const {
    return unit().name();
}

bool NodeHandle::valid() const {
    return graph_ != nullptr && graph_->contains(id_);
}

// --- TransitionBinder ---

NodeHandle TransitionBinder::to(NodeHandle target) const {
    return source_.next(target, label_);
}

// --- FlowGraph ---

NodeHandle FlowGraph::add(std::shared_ptr<Executable> unit) {
    if (!unit) {
        throw GraphError("Cannot add a null unit to a flow graph");
    }
    nodes_.push_back(Entry{std::move(unit), {}});
    return NodeHandle(this, nodes_.size() - 1);
}

void FlowGraph::connect(NodeId from, NodeId to, std::string_view action) {
    if (action.empty()) {
        throw GraphError("Action label must not be empty");
    }
    if (!contains(to)) {
        throw GraphError("Successor node id out of range: " + std::to_string(to));
    }
    auto& successors = entry(from).successors;
    auto it = successors.find(action);
    if (it != successors.end()) {
        it->second = to; // 同一 action 只保留最后一次注册
    } else {
        successors.emplace(std::string(action), to);
    }
}

std::optional<NodeId> FlowGraph::resolve(NodeId from, std::string_view action) const {
    const auto& successors = entry(from).successors;
    auto it = successors.find(action);
    if (it != successors.end()) {
        return it->second;
    }
    it = successors.find(kDefaultAction);
    if (it != successors.end()) {
        return it->second;
    }
    return std::nullopt; // 正常终止，不是错误
}

Executable& FlowGraph::unit(NodeId id) const {
    return *entry(id).unit;
}

const FlowGraph::SuccessorMap& FlowGraph::successors(NodeId id) const {
    return entry(id).successors;
}

NodeHandle FlowGraph::handle(NodeId id) {
    if (!contains(id)) {
        throw GraphError("Node id out of range: " + std::to_string(id));
    }
    return NodeHandle(this, id);
}

std::optional<NodeHandle> FlowGraph::find(std::string_view name) {
    for (NodeId id = 0; id < nodes_.size(); ++id) {
        if (nodes_[id].unit->name() == name) {
            return NodeHandle(this, id);
        }
    }
    return std::nullopt;
}

const FlowGraph::Entry& FlowGraph::entry(NodeId id) const {
    if (!contains(id)) {
        throw GraphError("Node id out of range: " + std::to_string(id));
    }
    return nodes_[id];
}

FlowGraph::Entry& FlowGraph::entry(NodeId id) {
    if (!contains(id)) {
        throw GraphError("Node id out of range: " + std::to_string(id));
    }
    return nodes_[id];
}

} // namespace agentflow
