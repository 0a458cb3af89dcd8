// modules/template/template_resolver.cpp
#include "modules/template/template_resolver.h"
#include "common/utils/suggest.h"
#include "core/types/errors.h"
#include <optional>
#include <regex>
#include <sstream>

namespace agentflow {

namespace {

const std::regex& placeholder_pattern() {
    static const std::regex pattern(R"(\{([a-zA-Z_][a-zA-Z0-9_\.]*)\})");
    return pattern;
}

std::vector<std::string> split_path(const std::string& dotted) {
    std::vector<std::string> parts;
    std::stringstream ss(dotted);
    std::string part;
    while (std::getline(ss, part, '.')) {
        parts.push_back(part);
    }
    return parts;
}

std::optional<Placeholder> to_placeholder(const std::smatch& m) {
    auto parts = split_path(m[1].str());
    // {state.x} and {x} name the same field
    if (parts.size() > 1 && parts.front() == "state") {
        parts.erase(parts.begin());
    }
    if (parts.empty() || parts.front().empty()) return std::nullopt;

    Placeholder p;
    p.text = m[0].str();
    p.field = parts.front();
    p.path.assign(parts.begin() + 1, parts.end());
    return p;
}

std::string lookup(const Placeholder& p, const StateRecord& state) {
    const StateRecordType& type = state.type();
    if (!type.has_field(p.field)) {
        std::string hint = did_you_mean(p.field, type.field_names());
        throw TemplateError(p.field, "prompt references undeclared state field '" + p.field + "'" +
                                     (hint.empty() ? "" : ". " + hint));
    }

    const Value* current = &state.get(p.field);
    std::string walked = p.field;
    for (const auto& key : p.path) {
        walked += "." + key;
        if (!current->is_object() || !current->contains(key)) {
            throw TemplateError(p.field, "cannot resolve '" + walked + "' in prompt");
        }
        current = &current->at(key);
    }
    return TemplateResolver::render_value(*current);
}

} // anonymous namespace

std::vector<Placeholder> TemplateResolver::placeholders(std::string_view tmpl) {
    std::vector<Placeholder> result;
    std::string text(tmpl);
    for (auto it = std::sregex_iterator(text.begin(), text.end(), placeholder_pattern());
         it != std::sregex_iterator(); ++it) {
        if (auto p = to_placeholder(*it)) {
            result.push_back(std::move(*p));
        }
    }
    return result;
}

std::string TemplateResolver::render_value(const Value& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_null()) return "";
    return value.dump();
}

// Single pass: substituted text is never rescanned for placeholders.
std::string TemplateResolver::resolve(std::string_view tmpl, const StateRecord& state) {
    std::string text(tmpl);
    std::string out;
    out.reserve(text.size());

    auto last = text.cbegin();
    for (auto it = std::sregex_iterator(text.begin(), text.end(), placeholder_pattern());
         it != std::sregex_iterator(); ++it) {
        const std::smatch& m = *it;
        out.append(last, m[0].first);
        auto p = to_placeholder(m);
        out += p ? lookup(*p, state) : m[0].str();
        last = m[0].second;
    }
    out.append(last, text.cend());
    return out;
}

} // namespace agentflow
