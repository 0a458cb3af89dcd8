// common/utils/expression_evaluator.cpp
#include "common/utils/expression_evaluator.h"
#include "core/types/errors.h"
#include <cctype>
#include <stdexcept>

namespace agentflow {

namespace {

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

} // anonymous namespace

InjaExpressionEvaluator::InjaExpressionEvaluator() : env_() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    env_.set_line_statement("##");

    configure_security();
}

void InjaExpressionEvaluator::configure_security() {
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled for security.", inja::SourceLocation{});
    });
}

std::string InjaExpressionEvaluator::normalize(std::string_view expression) {
    std::string out;
    out.reserve(expression.size() + 8);

    size_t i = 0;
    while (i < expression.size()) {
        char c = expression[i];

        // String literals: single quotes become double quotes, content copied verbatim
        if (c == '\'' || c == '"') {
            char quote = c;
            out += '"';
            ++i;
            while (i < expression.size() && expression[i] != quote) {
                if (expression[i] == '\\' && i + 1 < expression.size()) {
                    out += expression[i];
                    out += expression[i + 1];
                    i += 2;
                    continue;
                }
                if (expression[i] == '"' && quote == '\'') out += '\\';
                out += expression[i];
                ++i;
            }
            out += '"';
            ++i;
            continue;
        }

        if (c == '&' && i + 1 < expression.size() && expression[i + 1] == '&') {
            out += " and ";
            i += 2;
            continue;
        }
        if (c == '|' && i + 1 < expression.size() && expression[i + 1] == '|') {
            out += " or ";
            i += 2;
            continue;
        }
        if (c == '!' && (i + 1 >= expression.size() || expression[i + 1] != '=')) {
            out += " not ";
            ++i;
            continue;
        }

        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            size_t start = i;
            while (i < expression.size() && (is_ident_char(expression[i]) || expression[i] == '.')) ++i;
            std::string word(expression.substr(start, i - start));
            if (word == "True") word = "true";
            else if (word == "False") word = "false";
            else if (word == "None") word = "null";
            out += word;
            continue;
        }

        out += c;
        ++i;
    }
    return out;
}

std::vector<std::string> InjaExpressionEvaluator::referenced_state_fields(std::string_view expression) {
    std::vector<std::string> fields;
    size_t i = 0;
    while (i < expression.size()) {
        char c = expression[i];
        if (c == '\'' || c == '"') {
            char quote = c;
            ++i;
            while (i < expression.size() && expression[i] != quote) {
                i += (expression[i] == '\\') ? 2 : 1;
            }
            ++i;
            continue;
        }
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            size_t start = i;
            while (i < expression.size() && is_ident_char(expression[i])) ++i;
            if (expression.substr(start, i - start) == "state" && i < expression.size() && expression[i] == '.') {
                size_t field_start = ++i;
                while (i < expression.size() && is_ident_char(expression[i])) ++i;
                if (i > field_start) {
                    fields.emplace_back(expression.substr(field_start, i - field_start));
                }
            }
            continue;
        }
        ++i;
    }
    return fields;
}

void InjaExpressionEvaluator::check_syntax(std::string_view expression) {
    std::string tmpl = "{{ " + normalize(expression) + " }}";
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        env_.parse(tmpl);
    } catch (const inja::InjaError& e) {
        throw std::invalid_argument("invalid expression '" + std::string(expression) + "': " + e.message);
    }
}

bool InjaExpressionEvaluator::evaluate(std::string_view expression, const Value& data) {
    std::string tmpl = "{{ " + normalize(expression) + " }}";
    std::string rendered;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        try {
            rendered = env_.render(tmpl, data);
        } catch (const inja::InjaError& e) {
            throw ControlFlowError("expression '" + std::string(expression) + "' failed: " + e.message);
        }
    }

    if (rendered == "true") return true;
    if (rendered == "false") return false;
    try {
        size_t consumed = 0;
        double num_val = std::stod(rendered, &consumed);
        if (consumed == rendered.size()) {
            return num_val != 0.0;
        }
    } catch (const std::logic_error&) {
        // fall through to the error below
    }
    throw ControlFlowError("expression '" + std::string(expression) +
                           "' did not evaluate to a boolean value: " + rendered);
}

} // namespace agentflow
