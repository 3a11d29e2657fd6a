// include/agentorch/graph/workflow_loader.h
#ifndef AGENTORCH_GRAPH_WORKFLOW_LOADER_H
#define AGENTORCH_GRAPH_WORKFLOW_LOADER_H

#include "agentorch/graph/workflow_graph.h"
#include <string>

namespace agentorch {

// Workflow documents (YAML or JSON, same layout):
//
//   id: review-flow
//   orchestration: sequential        # concurrent | handoff | magentic | group_chat | custom
//   nodes:
//     - id: draft
//       type: LLMAgent
//       position: {x: 0, y: 0}
//       properties: {prompt: "..."}
//       orchestration: {roles: [primary_executor], priority: 2, parallel: true}
//   connections:
//     - {from: draft, to: review, kind: data_flow, condition: "approved"}
//   script:                          # custom orchestration only
//     - {id: s1, type: agent_execution, order: 1, nodes: [draft]}
//
// All loaders throw ValidationError on malformed documents.
class WorkflowLoader {
public:
    static WorkflowGraph from_json(const Value& doc);
    static WorkflowGraph from_yaml_string(const std::string& yaml);
    static WorkflowGraph from_file(const std::string& path);
};

} // namespace agentorch

#endif // AGENTORCH_GRAPH_WORKFLOW_LOADER_H
