// core/types/field_type.cpp
#include "core/types/field_type.h"
#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace agentflow {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

// Splits "K, V" at the top-level comma (nested brackets are skipped).
bool split_pair(std::string_view inner, std::string_view& first, std::string_view& second) {
    int depth = 0;
    for (size_t i = 0; i < inner.size(); ++i) {
        char c = inner[i];
        if (c == '[') ++depth;
        else if (c == ']') --depth;
        else if (c == ',' && depth == 0) {
            first = trim(inner.substr(0, i));
            second = trim(inner.substr(i + 1));
            return !first.empty() && !second.empty();
        }
    }
    return false;
}

// Exact int64 value of an integer, or of an integral float inside [-2^63, 2^63).
std::optional<int64_t> to_int64(const Value& v) {
    if (v.is_number_unsigned()) {
        auto u = v.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return std::nullopt;
        return static_cast<int64_t>(u);
    }
    if (v.is_number_integer()) return v.get<int64_t>();
    if (!v.is_number_float()) return std::nullopt;

    double d = v.get<double>();
    constexpr double kLimit = 9223372036854775808.0; // 2^63
    if (!std::isfinite(d) || std::floor(d) != d || d < -kLimit || d >= kLimit) return std::nullopt;
    return static_cast<int64_t>(d);
}

} // anonymous namespace

FieldType FieldType::parse(std::string_view text) {
    std::string_view t = trim(text);
    if (t.empty()) {
        throw std::invalid_argument("type string cannot be empty");
    }

    if (t == "str" || t == "string") return FieldType(FieldKind::STRING);
    if (t == "int" || t == "integer") return FieldType(FieldKind::INTEGER);
    if (t == "float" || t == "number") return FieldType(FieldKind::NUMBER);
    if (t == "bool" || t == "boolean") return FieldType(FieldKind::BOOLEAN);
    if (t == "object") return FieldType(FieldKind::OBJECT);
    if (t == "list") return FieldType(FieldKind::LIST);
    if (t == "dict") return FieldType(FieldKind::DICT);

    if (t.starts_with("list[") && t.ends_with("]")) {
        FieldType type(FieldKind::LIST);
        type.element_ = std::make_shared<const FieldType>(parse(t.substr(5, t.size() - 6)));
        return type;
    }
    if (t.starts_with("dict[") && t.ends_with("]")) {
        std::string_view key, value;
        if (!split_pair(t.substr(5, t.size() - 6), key, value)) {
            throw std::invalid_argument("dict type needs two parameters: '" + std::string(t) + "'");
        }
        FieldType type(FieldKind::DICT);
        type.key_ = std::make_shared<const FieldType>(parse(key));
        type.element_ = std::make_shared<const FieldType>(parse(value));
        return type;
    }

    throw std::invalid_argument("unknown type '" + std::string(t) +
                                "' (supported: str, int, float, bool, list, dict, list[T], dict[K,V], object)");
}

bool FieldType::is_valid(std::string_view text) {
    try {
        parse(text);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    }
}

std::string FieldType::to_string() const {
    switch (kind_) {
        case FieldKind::STRING: return "str";
        case FieldKind::INTEGER: return "int";
        case FieldKind::NUMBER: return "float";
        case FieldKind::BOOLEAN: return "bool";
        case FieldKind::OBJECT: return "object";
        case FieldKind::LIST:
            return element_ ? "list[" + element_->to_string() + "]" : "list";
        case FieldKind::DICT:
            if (key_ && element_) return "dict[" + key_->to_string() + ", " + element_->to_string() + "]";
            return "dict";
    }
    return "unknown";
}

bool FieldType::matches(const Value& value) const {
    switch (kind_) {
        case FieldKind::STRING: return value.is_string();
        case FieldKind::INTEGER: return value.is_number_integer();
        case FieldKind::NUMBER: return value.is_number();
        case FieldKind::BOOLEAN: return value.is_boolean();
        case FieldKind::OBJECT: return value.is_object();
        case FieldKind::LIST:
            if (!value.is_array()) return false;
            if (!element_) return true;
            for (const auto& item : value) {
                if (!element_->matches(item)) return false;
            }
            return true;
        case FieldKind::DICT:
            if (!value.is_object()) return false;
            if (!element_) return true;
            for (const auto& [k, v] : value.items()) {
                if (!element_->matches(v)) return false;
            }
            return true;
    }
    return false;
}

std::optional<Value> FieldType::coerce(const Value& value) const {
    switch (kind_) {
        case FieldKind::INTEGER:
            if (auto i = to_int64(value)) return Value(*i);
            return std::nullopt;
        case FieldKind::NUMBER:
            if (value.is_number()) return Value(value.get<double>());
            return std::nullopt;
        case FieldKind::LIST: {
            if (!value.is_array()) return std::nullopt;
            if (!element_) return value;
            Value out = Value::array();
            for (const auto& item : value) {
                auto c = element_->coerce(item);
                if (!c) return std::nullopt;
                out.push_back(std::move(*c));
            }
            return out;
        }
        case FieldKind::DICT: {
            if (!value.is_object()) return std::nullopt;
            if (!element_) return value;
            Value out = Value::object();
            for (const auto& [k, v] : value.items()) {
                auto c = element_->coerce(v);
                if (!c) return std::nullopt;
                out[k] = std::move(*c);
            }
            return out;
        }
        default:
            if (matches(value)) return value;
            return std::nullopt;
    }
}

Value FieldType::to_json_schema() const {
    switch (kind_) {
        case FieldKind::STRING: return {{"type", "string"}};
        case FieldKind::INTEGER: return {{"type", "integer"}};
        case FieldKind::NUMBER: return {{"type", "number"}};
        case FieldKind::BOOLEAN: return {{"type", "boolean"}};
        case FieldKind::OBJECT: return {{"type", "object"}};
        case FieldKind::LIST: {
            Value schema = {{"type", "array"}};
            if (element_) schema["items"] = element_->to_json_schema();
            return schema;
        }
        case FieldKind::DICT: {
            Value schema = {{"type", "object"}};
            if (element_) schema["additionalProperties"] = element_->to_json_schema();
            return schema;
        }
    }
    return Value::object();
}

bool FieldType::operator==(const FieldType& other) const {
    return to_string() == other.to_string();
}

} // namespace agentflow
