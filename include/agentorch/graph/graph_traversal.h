#ifndef AGENTORCH_GRAPH_GRAPH_TRAVERSAL_H
#define AGENTORCH_GRAPH_GRAPH_TRAVERSAL_H

#include "agentorch/graph/workflow_graph.h"
#include <vector>

namespace agentorch {

// Pipeline order: Kahn's algorithm over connections. Among nodes that are ready at
// the same time, lower x comes first, then lower y, then declaration order.
// Throws OrchestrationError if the connections form a cycle.
std::vector<const Node*> topological_order(const WorkflowGraph& graph);

std::vector<const Node*> successors(const WorkflowGraph& graph, const NodeId& node_id);

// Nodes typed StartNode, in declaration order.
std::vector<const Node*> start_nodes(const WorkflowGraph& graph);

// First StartNode, otherwise the first coordinator-role node, otherwise nullptr.
const Node* find_entry_node(const WorkflowGraph& graph);

} // namespace agentorch

#endif // AGENTORCH_GRAPH_GRAPH_TRAVERSAL_H
