#ifndef AGENTFLOW_TYPES_ERRORS_H
#define AGENTFLOW_TYPES_ERRORS_H

#include "context.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace agentflow {

// 所有引擎异常的基类
class AgentFlowError : public std::runtime_error {
public:
    AgentFlowError(std::string code, const std::string& message)
        : std::runtime_error(message), code_(std::move(code)) {}

    const std::string& code() const noexcept { return code_; }

private:
    std::string code_;
};

class ConfigLoadError : public AgentFlowError {
public:
    explicit ConfigLoadError(const std::string& message)
        : AgentFlowError("ConfigLoadError", message) {}
};

// One validation finding. location names the offending element, e.g. "edges[2]".
struct Violation {
    std::string code;
    std::string message;
    std::string location;
    std::string suggestion; // empty when there is nothing to suggest

    std::string to_string() const;
};

class ConfigValidationError : public AgentFlowError {
public:
    explicit ConfigValidationError(std::vector<Violation> violations);

    const std::vector<Violation>& violations() const { return violations_; }

private:
    std::vector<Violation> violations_;
};

class StateInitializationError : public AgentFlowError {
public:
    explicit StateInitializationError(const std::string& message)
        : AgentFlowError("StateInitializationError", message) {}
};

class TemplateError : public AgentFlowError {
public:
    TemplateError(std::string field, const std::string& message)
        : AgentFlowError("TemplateError", message), field_(std::move(field)) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

class ToolExecutionError : public AgentFlowError {
public:
    ToolExecutionError(std::string tool, const std::string& message)
        : AgentFlowError("ToolExecutionError", "tool '" + tool + "' failed: " + message),
          tool_(std::move(tool)) {}

    const std::string& tool() const { return tool_; }

private:
    std::string tool_;
};

class OutputValidationError : public AgentFlowError {
public:
    OutputValidationError(NodeId node_id, int attempts, std::vector<std::string> errors);

    const NodeId& node_id() const { return node_id_; }
    int attempts() const { return attempts_; }
    const std::vector<std::string>& errors() const { return errors_; }

private:
    NodeId node_id_;
    int attempts_;
    std::vector<std::string> errors_;
};

class ControlFlowError : public AgentFlowError {
public:
    explicit ControlFlowError(const std::string& message)
        : AgentFlowError("ControlFlowError", message) {}
};

class TimeoutError : public AgentFlowError {
public:
    explicit TimeoutError(const std::string& message)
        : AgentFlowError("TimeoutError", message) {}
};

// Raised at a checkpoint after another branch has already failed the run.
class RunCancelledError : public AgentFlowError {
public:
    explicit RunCancelledError(const std::string& message)
        : AgentFlowError("RunCancelled", message) {}
};

class NodeExecutionError : public AgentFlowError {
public:
    NodeExecutionError(NodeId node_id, const std::string& message)
        : AgentFlowError("NodeExecutionError", "node '" + node_id + "': " + message),
          node_id_(std::move(node_id)) {}

    const NodeId& node_id() const { return node_id_; }

private:
    NodeId node_id_;
};

class QualityGateError : public AgentFlowError {
public:
    explicit QualityGateError(const std::string& message)
        : AgentFlowError("QualityGateError", message) {}
};

// Raised by LlmClient implementations (transport, model or parse failures).
class LlmError : public AgentFlowError {
public:
    explicit LlmError(const std::string& message)
        : AgentFlowError("LlmError", message) {}
};

} // namespace agentflow

#endif // AGENTFLOW_TYPES_ERRORS_H
