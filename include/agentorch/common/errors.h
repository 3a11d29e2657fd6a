#ifndef AGENTORCH_COMMON_ERRORS_H
#define AGENTORCH_COMMON_ERRORS_H

#include "agentorch/common/types.h"
#include <stdexcept>
#include <string>

namespace agentorch {

enum class ErrorKind : uint8_t {
    VALIDATION,      // workflow/node reference missing or malformed
    NODE_EXECUTION,  // a node handler itself failed
    COLLABORATOR,    // LLM / tool / protocol call failed
    ORCHESTRATION,   // no start node, cycle, iteration bound, wait timeout
    CANCELLED
};

std::string to_string(ErrorKind kind);

class EngineError : public std::runtime_error {
public:
    EngineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class ValidationError : public EngineError {
public:
    explicit ValidationError(const std::string& message)
        : EngineError(ErrorKind::VALIDATION, message) {}
};

class NodeExecutionError : public EngineError {
public:
    NodeExecutionError(NodeId node_id, const std::string& message)
        : EngineError(ErrorKind::NODE_EXECUTION, message), node_id_(std::move(node_id)) {}

    const NodeId& node_id() const noexcept { return node_id_; }

private:
    NodeId node_id_;
};

class CollaboratorError : public EngineError {
public:
    explicit CollaboratorError(const std::string& message)
        : EngineError(ErrorKind::COLLABORATOR, message) {}
};

class OrchestrationError : public EngineError {
public:
    explicit OrchestrationError(const std::string& message)
        : EngineError(ErrorKind::ORCHESTRATION, message) {}
};

// Raised at a node boundary once the execution has been cancelled.
class CancelledError : public EngineError {
public:
    explicit CancelledError(const std::string& message)
        : EngineError(ErrorKind::CANCELLED, message) {}
};

} // namespace agentorch

#endif // AGENTORCH_COMMON_ERRORS_H
