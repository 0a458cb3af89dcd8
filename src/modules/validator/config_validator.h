// modules/validator/config_validator.h
#ifndef AGENTFLOW_MODULES_VALIDATOR_CONFIG_VALIDATOR_H
#define AGENTFLOW_MODULES_VALIDATOR_CONFIG_VALIDATOR_H

#include "common/tools/registry.h"
#include "core/types/config.h"
#include "core/types/context.h"
#include "core/types/errors.h"
#include <vector>

namespace agentflow {

// Two-phase validation. Phase 1 (structural) runs in ConfigParser::build; phase 2
// (graph and business rules) only runs on a structurally clean config.
// Never calls a model.
class ConfigValidator {
public:
    // With a tool registry, unknown tool names are reported as well.
    explicit ConfigValidator(const ToolInvoker* tools = nullptr);

    // Throws ConfigValidationError carrying every violation of the failing phase.
    WorkflowConfig validate(const Value& document) const;

    std::vector<Violation> check_business_rules(const WorkflowConfig& config) const;

private:
    void check_edges(const WorkflowConfig& config, std::vector<Violation>& out) const;
    void check_nodes(const WorkflowConfig& config, std::vector<Violation>& out) const;
    void check_graph(const WorkflowConfig& config, std::vector<Violation>& out) const;

    const ToolInvoker* tools_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_VALIDATOR_CONFIG_VALIDATOR_H
