// modules/template/template_resolver.h
#ifndef AGENTFLOW_MODULES_TEMPLATE_TEMPLATE_RESOLVER_H
#define AGENTFLOW_MODULES_TEMPLATE_TEMPLATE_RESOLVER_H

#include "core/types/context.h"
#include "modules/state/state_record.h"
#include <string>
#include <string_view>
#include <vector>

namespace agentflow {

// A {state.field} / {field} / {field.key.sub} reference inside a prompt.
struct Placeholder {
    std::string text;               // as written, braces included
    std::string field;              // top-level state field
    std::vector<std::string> path;  // nested keys below the field
};

class TemplateResolver {
public:
    static std::vector<Placeholder> placeholders(std::string_view tmpl);

    // Strings are substituted verbatim, null as "", everything else as compact JSON.
    // Throws TemplateError naming the field for undeclared fields or missing nested keys.
    static std::string resolve(std::string_view tmpl, const StateRecord& state);

    static std::string render_value(const Value& value);
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_TEMPLATE_TEMPLATE_RESOLVER_H
