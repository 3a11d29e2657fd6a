// include/agentorch/graph/workflow_repository.h
#ifndef AGENTORCH_GRAPH_WORKFLOW_REPOSITORY_H
#define AGENTORCH_GRAPH_WORKFLOW_REPOSITORY_H

#include "agentorch/graph/workflow_graph.h"
#include <mutex>
#include <unordered_map>
#include <vector>

namespace agentorch {

// Source of workflow snapshots. A returned snapshot never changes; saving a
// workflow again replaces the pointer, so running executions keep their copy.
class WorkflowRepository {
public:
    virtual ~WorkflowRepository() = default;

    virtual GraphSnapshot find(const WorkflowId& id) const = 0;
    virtual void save(WorkflowGraph graph) = 0;
    virtual bool remove(const WorkflowId& id) = 0;
    virtual std::vector<WorkflowId> list_ids() const = 0;
};

class InMemoryWorkflowRepository : public WorkflowRepository {
public:
    GraphSnapshot find(const WorkflowId& id) const override;
    // Throws ValidationError if the graph is invalid.
    void save(WorkflowGraph graph) override;
    bool remove(const WorkflowId& id) override;
    std::vector<WorkflowId> list_ids() const override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<WorkflowId, GraphSnapshot> workflows_;
};

} // namespace agentorch

#endif // AGENTORCH_GRAPH_WORKFLOW_REPOSITORY_H
