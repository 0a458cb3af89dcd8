// tests/support/fixtures.h
#ifndef AGENTFLOW_TESTS_SUPPORT_FIXTURES_H
#define AGENTFLOW_TESTS_SUPPORT_FIXTURES_H

#include "core/types/config.h"
#include "modules/parser/config_parser.h"
#include "modules/validator/config_validator.h"
#include <initializer_list>
#include <string>
#include <utility>

namespace agentflow::testing {

// {name, type} pairs; every field optional with no default.
inline StateSchema schema_of(std::initializer_list<std::pair<std::string, std::string>> fields) {
    StateSchema schema;
    for (const auto& [name, type] : fields) {
        StateFieldConfig field;
        field.name = name;
        field.type_name = type;
        field.type = FieldType::parse(type);
        schema.fields.push_back(std::move(field));
    }
    return schema;
}

inline WorkflowConfig load_workflow(const std::string& yaml, const ToolInvoker* tools = nullptr) {
    return ConfigValidator(tools).validate(ConfigParser::parse_text(yaml));
}

} // namespace agentflow::testing

#endif // AGENTFLOW_TESTS_SUPPORT_FIXTURES_H
