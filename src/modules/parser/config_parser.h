// modules/parser/config_parser.h
#ifndef AGENTFLOW_MODULES_PARSER_CONFIG_PARSER_H
#define AGENTFLOW_MODULES_PARSER_CONFIG_PARSER_H

#include "core/types/config.h"
#include "core/types/context.h"
#include "core/types/errors.h"
#include <string>
#include <vector>

namespace agentflow {

// Document loading and the structural validation phase: field types,
// required/default consistency, enum membership, numeric ranges.
class ConfigParser {
public:
    // YAML or JSON text -> document tree. Throws ConfigLoadError.
    static Value parse_text(const std::string& text);
    static Value parse_file(const std::string& path);

    // Builds the typed config, appending every structural problem to violations.
    // The result is only meaningful when no violation was added.
    static WorkflowConfig build(const Value& document, std::vector<Violation>& violations);

    static bool is_identifier(const std::string& s);
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_PARSER_CONFIG_PARSER_H
