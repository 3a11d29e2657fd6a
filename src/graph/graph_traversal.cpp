// src/graph/graph_traversal.cpp
#include "agentorch/graph/graph_traversal.h"
#include "agentorch/common/errors.h"
#include <algorithm>
#include <unordered_map>

namespace agentorch {

std::vector<const Node*> topological_order(const WorkflowGraph& graph) {
    std::unordered_map<NodeId, size_t> index;
    for (size_t i = 0; i < graph.nodes.size(); ++i) {
        index[graph.nodes[i].id] = i;
    }

    // 1. 入度 + 邻接表
    std::vector<int> in_degree(graph.nodes.size(), 0);
    std::vector<std::vector<size_t>> edges(graph.nodes.size());
    for (const auto& c : graph.connections) {
        auto from = index.find(c.from_node);
        auto to = index.find(c.to_node);
        if (from == index.end() || to == index.end()) {
            throw ValidationError("Connection references unknown node: " + c.from_node + " -> " + c.to_node);
        }
        edges[from->second].push_back(to->second);
        in_degree[to->second]++;
    }

    auto before = [&graph](size_t a, size_t b) {
        const Node& na = graph.nodes[a];
        const Node& nb = graph.nodes[b];
        if (na.x != nb.x) return na.x < nb.x;
        if (na.y != nb.y) return na.y < nb.y;
        return a < b;
    };

    // 2. ready 集合按位置排序
    std::vector<size_t> ready;
    for (size_t i = 0; i < graph.nodes.size(); ++i) {
        if (in_degree[i] == 0) ready.push_back(i);
    }

    std::vector<const Node*> order;
    order.reserve(graph.nodes.size());
    while (!ready.empty()) {
        auto next_it = std::min_element(ready.begin(), ready.end(), before);
        size_t current = *next_it;
        ready.erase(next_it);
        order.push_back(&graph.nodes[current]);

        for (size_t succ : edges[current]) {
            if (--in_degree[succ] == 0) {
                ready.push_back(succ);
            }
        }
    }

    if (order.size() != graph.nodes.size()) {
        throw OrchestrationError("Cycle detected in workflow '" + graph.id +
                                 "': pipeline order cannot be resolved");
    }
    return order;
}

std::vector<const Node*> successors(const WorkflowGraph& graph, const NodeId& node_id) {
    std::vector<const Node*> result;
    for (const Connection* c : graph.outgoing(node_id)) {
        if (const Node* n = graph.find_node(c->to_node)) {
            result.push_back(n);
        }
    }
    return result;
}

std::vector<const Node*> start_nodes(const WorkflowGraph& graph) {
    std::vector<const Node*> result;
    for (const auto& node : graph.nodes) {
        if (node.type == node_types::START) result.push_back(&node);
    }
    return result;
}

const Node* find_entry_node(const WorkflowGraph& graph) {
    auto starts = start_nodes(graph);
    if (!starts.empty()) return starts.front();
    for (const auto& node : graph.nodes) {
        if (node.orchestration.has_role(NodeRole::COORDINATOR)) return &node;
    }
    return nullptr;
}

} // namespace agentorch
