// core/types/errors.cpp
#include "core/types/errors.h"
#include <sstream>

namespace agentflow {

namespace {

std::string summarize(const std::vector<Violation>& violations) {
    std::ostringstream oss;
    oss << "config validation failed with " << violations.size() << " error(s)";
    for (const auto& v : violations) {
        oss << "\n  - " << v.to_string();
    }
    return oss.str();
}

std::string join_errors(const std::vector<std::string>& errors) {
    std::string out;
    for (size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) out += "; ";
        out += errors[i];
    }
    return out;
}

} // anonymous namespace

std::string Violation::to_string() const {
    std::string s;
    if (!location.empty()) s += location + ": ";
    s += message;
    if (!suggestion.empty()) s += " (" + suggestion + ")";
    return s;
}

ConfigValidationError::ConfigValidationError(std::vector<Violation> violations)
    : AgentFlowError("ConfigValidationError", summarize(violations)),
      violations_(std::move(violations)) {}

OutputValidationError::OutputValidationError(NodeId node_id, int attempts, std::vector<std::string> errors)
    : AgentFlowError("OutputValidationError",
                     "node '" + node_id + "' produced invalid structured output after " +
                     std::to_string(attempts) + " attempt(s): " + join_errors(errors)),
      node_id_(std::move(node_id)),
      attempts_(attempts),
      errors_(std::move(errors)) {}

} // namespace agentflow
