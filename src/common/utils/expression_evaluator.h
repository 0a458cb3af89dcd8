#ifndef AGENTFLOW_COMMON_UTILS_EXPRESSION_EVALUATOR_H
#define AGENTFLOW_COMMON_UTILS_EXPRESSION_EVALUATOR_H

#include "core/types/context.h"
#include <inja/inja.hpp>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace agentflow {

// Safe boolean expression evaluation over a JSON data object, backed by inja.
// Supports comparisons, ==/!=, and/or/not (also &&, ||, !), literals and
// dotted lookups such as state.score. Includes and statements are disabled.
class InjaExpressionEvaluator {
public:
    InjaExpressionEvaluator();

    // Throws ControlFlowError when the expression cannot be rendered or
    // does not produce a boolean ("true"/"false") or a number.
    bool evaluate(std::string_view expression, const Value& data);

    // Throws std::invalid_argument on a syntax error; never evaluates.
    void check_syntax(std::string_view expression);

    // Names X of every state.X reference outside string literals, in order of appearance.
    static std::vector<std::string> referenced_state_fields(std::string_view expression);

    // Rewrites the accepted surface syntax into inja's ('x' -> "x", && -> and, True -> true).
    static std::string normalize(std::string_view expression);

private:
    inja::Environment env_;
    std::mutex mutex_;
    void configure_security(); // 禁用 include
};

} // namespace agentflow

#endif // AGENTFLOW_COMMON_UTILS_EXPRESSION_EVALUATOR_H
