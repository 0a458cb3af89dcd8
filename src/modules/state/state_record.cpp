// modules/state/state_record.cpp
#include "modules/state/state_record.h"
#include "common/utils/suggest.h"
#include "core/types/errors.h"
#include <stdexcept>

namespace agentflow {

std::shared_ptr<const StateRecordType> StateRecordType::build(const StateSchema& schema) {
    auto type = std::make_shared<StateRecordType>();
    type->slots_.reserve(schema.fields.size());

    for (const auto& field : schema.fields) {
        if (type->index_.count(field.name)) {
            throw StateInitializationError("duplicate state field '" + field.name + "'");
        }
        FieldSlot slot;
        slot.index = type->slots_.size();
        slot.name = field.name;
        slot.type = field.type;
        slot.required = field.required;
        slot.default_value = field.default_value;
        slot.policy = field.type.is_list() ? MergePolicy::ARRAY_CONCAT : MergePolicy::LAST_WRITE_WINS;

        type->index_[slot.name] = slot.index;
        type->slots_.push_back(std::move(slot));
    }
    return type;
}

const FieldSlot* StateRecordType::find(const std::string& name) const {
    auto it = index_.find(name);
    return it == index_.end() ? nullptr : &slots_[it->second];
}

const FieldSlot& StateRecordType::slot(const std::string& name) const {
    const FieldSlot* s = find(name);
    if (!s) {
        throw std::out_of_range("unknown state field '" + name + "'");
    }
    return *s;
}

std::vector<std::string> StateRecordType::field_names() const {
    std::vector<std::string> names;
    names.reserve(slots_.size());
    for (const auto& s : slots_) names.push_back(s.name);
    return names;
}

StateRecord StateRecordType::merge(const StateRecord& base, const Value& delta) const {
    StateRecord merged = base;
    merged.apply(delta);
    return merged;
}

StateRecord::StateRecord(std::shared_ptr<const StateRecordType> type)
    : type_(std::move(type)), values_(type_->fields().size()) {}

StateRecord StateRecord::create(std::shared_ptr<const StateRecordType> type, const Value& inputs) {
    if (!inputs.is_null() && !inputs.is_object()) {
        throw StateInitializationError("inputs must be an object, got " + std::string(inputs.type_name()));
    }

    StateRecord record(std::move(type));
    const auto& slots = record.type_->fields();

    if (inputs.is_object()) {
        for (const auto& [key, value] : inputs.items()) {
            if (!record.type_->has_field(key)) {
                std::string hint = did_you_mean(key, record.type_->field_names());
                throw StateInitializationError("unknown input field '" + key + "'" +
                                               (hint.empty() ? "" : ". " + hint));
            }
        }
    }

    std::vector<std::string> missing;
    for (const auto& slot : slots) {
        Value& target = record.values_[slot.index];
        if (inputs.is_object() && inputs.contains(slot.name)) {
            const Value& raw = inputs.at(slot.name);
            auto coerced = slot.type.coerce(raw);
            if (!coerced) {
                throw StateInitializationError("input '" + slot.name + "' expected " + slot.type.to_string() +
                                               ", got " + raw.dump());
            }
            target = std::move(*coerced);
        } else if (slot.default_value) {
            target = *slot.default_value;
        } else if (slot.required) {
            missing.push_back(slot.name);
        } else if (slot.type.is_list()) {
            target = Value::array();
        } else {
            target = nullptr;
        }
    }

    if (!missing.empty()) {
        std::string names;
        for (const auto& m : missing) names += (names.empty() ? "" : ", ") + m;
        throw StateInitializationError("missing required input(s): " + names);
    }
    return record;
}

const Value& StateRecord::get(const std::string& name) const {
    return values_[type_->slot(name).index];
}

bool StateRecord::is_set(const std::string& name) const {
    return !get(name).is_null();
}

const Value& StateRecord::typed(const std::string& name, FieldKind expected) const {
    const FieldSlot& s = type_->slot(name);
    if (s.type.kind() != expected) {
        throw std::invalid_argument("state field '" + name + "' is declared as " + s.type.to_string());
    }
    const Value& v = values_[s.index];
    if (v.is_null()) {
        throw std::invalid_argument("state field '" + name + "' is unset");
    }
    return v;
}

std::string StateRecord::get_string(const std::string& name) const {
    return typed(name, FieldKind::STRING).get<std::string>();
}

int64_t StateRecord::get_int(const std::string& name) const {
    return typed(name, FieldKind::INTEGER).get<int64_t>();
}

double StateRecord::get_number(const std::string& name) const {
    return typed(name, FieldKind::NUMBER).get<double>();
}

bool StateRecord::get_bool(const std::string& name) const {
    return typed(name, FieldKind::BOOLEAN).get<bool>();
}

const Value& StateRecord::get_list(const std::string& name) const {
    return typed(name, FieldKind::LIST);
}

void StateRecord::apply(const Value& delta) {
    if (delta.is_null()) return;
    if (!delta.is_object()) {
        throw std::invalid_argument("state delta must be an object");
    }

    for (const auto& [key, value] : delta.items()) {
        const FieldSlot* s = type_->find(key);
        if (!s) {
            throw std::invalid_argument("delta writes undeclared state field '" + key + "'");
        }
        Value& target = values_[s->index];

        if (s->policy == MergePolicy::ARRAY_CONCAT) {
            if (value.is_null()) continue;
            // A single item is appended as if it were a one-element list
            Value items = value.is_array() ? value : Value::array({value});
            auto coerced = s->type.coerce(items);
            if (!coerced) {
                throw std::invalid_argument("delta for '" + key + "' does not match " + s->type.to_string());
            }
            if (!target.is_array()) target = Value::array();
            for (auto& item : *coerced) target.push_back(std::move(item));
            continue;
        }

        if (value.is_null()) {
            target = nullptr;
            continue;
        }
        auto coerced = s->type.coerce(value);
        if (!coerced) {
            throw std::invalid_argument("delta for '" + key + "' does not match " + s->type.to_string() +
                                        ": " + value.dump());
        }
        target = std::move(*coerced);
    }
}

Value StateRecord::to_json() const {
    Value out = Value::object();
    for (const auto& s : type_->fields()) {
        out[s.name] = values_[s.index];
    }
    return out;
}

} // namespace agentflow
