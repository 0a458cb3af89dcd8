// modules/schema/output_schema.cpp
#include "modules/schema/output_schema.h"
#include <stdexcept>

namespace agentflow {

namespace {

constexpr const char* kWrappedKey = "result";

} // anonymous namespace

OutputContract OutputContract::build(const NodeConfig& node, const StateRecordType& state) {
    OutputContract contract;
    const auto& schema = node.output_schema;

    if (schema.declared && schema.is_object()) {
        for (const auto& f : schema.fields) {
            contract.fields_.push_back({f.name, f.type, f.description});
        }
    } else if (schema.declared) {
        if (node.outputs.size() != 1) {
            throw std::invalid_argument("node '" + node.id + "': simple output schema needs exactly one output");
        }
        contract.wrapped_ = true;
        contract.fields_.push_back({node.outputs.front(), schema.type, schema.description});
    } else if (node.outputs.size() == 1) {
        contract.wrapped_ = true;
        contract.fields_.push_back({node.outputs.front(), state.slot(node.outputs.front()).type, ""});
    } else {
        for (const auto& out : node.outputs) {
            contract.fields_.push_back({out, state.slot(out).type, ""});
        }
    }

    Value properties = Value::object();
    Value required = Value::array();
    for (const auto& f : contract.fields_) {
        Value prop = f.type.to_json_schema();
        if (!f.description.empty()) prop["description"] = f.description;
        const std::string key = contract.wrapped_ ? kWrappedKey : f.name;
        properties[key] = std::move(prop);
        required.push_back(key);
    }
    contract.schema_ = {
        {"type", "object"},
        {"properties", properties},
        {"required", required},
        {"additionalProperties", false}
    };
    if (!schema.description.empty()) {
        contract.schema_["description"] = schema.description;
    }
    return contract;
}

OutputValidation OutputContract::validate(const Value& raw) const {
    OutputValidation result;

    Value doc = raw;
    // Some clients hand back the JSON text instead of the parsed object
    if (doc.is_string() && !(wrapped_ && fields_.front().type.kind() == FieldKind::STRING)) {
        try {
            doc = Value::parse(doc.get<std::string>());
        } catch (const nlohmann::json::parse_error&) {
            // leave as string; reported below
        }
    }

    if (wrapped_) {
        const Field& f = fields_.front();
        const Value* candidate = &doc;
        if (doc.is_object()) {
            if (doc.contains(kWrappedKey)) candidate = &doc.at(kWrappedKey);
            else if (doc.contains(f.name)) candidate = &doc.at(f.name);
            else if (f.type.kind() != FieldKind::OBJECT && f.type.kind() != FieldKind::DICT) {
                result.errors.push_back("missing required field '" + std::string(kWrappedKey) + "'");
                return result;
            }
        }
        auto coerced = f.type.coerce(*candidate);
        if (!coerced) {
            result.errors.push_back("field '" + std::string(kWrappedKey) + "' expected " + f.type.to_string() +
                                    ", got " + candidate->dump());
            return result;
        }
        result.delta[f.name] = std::move(*coerced);
        result.ok = true;
        return result;
    }

    if (!doc.is_object()) {
        result.errors.push_back("expected a JSON object, got " + std::string(doc.type_name()));
        return result;
    }
    for (const auto& f : fields_) {
        if (!doc.contains(f.name) || doc.at(f.name).is_null()) {
            result.errors.push_back("missing required field '" + f.name + "'");
            continue;
        }
        auto coerced = f.type.coerce(doc.at(f.name));
        if (!coerced) {
            result.errors.push_back("field '" + f.name + "' expected " + f.type.to_string() +
                                    ", got " + doc.at(f.name).dump());
            continue;
        }
        result.delta[f.name] = std::move(*coerced);
    }
    result.ok = result.errors.empty();
    if (!result.ok) result.delta = Value::object();
    return result;
}

} // namespace agentflow
