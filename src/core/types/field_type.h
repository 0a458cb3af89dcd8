#ifndef AGENTFLOW_TYPES_FIELD_TYPE_H
#define AGENTFLOW_TYPES_FIELD_TYPE_H

#include "context.h"
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace agentflow {

enum class FieldKind {
    STRING,
    INTEGER,
    NUMBER,
    BOOLEAN,
    LIST,
    DICT,
    OBJECT
};

// Parsed form of a type string such as "str", "list[int]" or "dict[str, float]".
class FieldType {
public:
    FieldType() = default;
    explicit FieldType(FieldKind kind) : kind_(kind) {}

    // Throws std::invalid_argument on an unknown type string.
    static FieldType parse(std::string_view text);
    static bool is_valid(std::string_view text);

    FieldKind kind() const { return kind_; }
    bool is_list() const { return kind_ == FieldKind::LIST; }
    bool is_scalar() const { return kind_ != FieldKind::LIST && kind_ != FieldKind::DICT && kind_ != FieldKind::OBJECT; }
    // Item type of list[T] / value type of dict[K,V]; nullptr when unconstrained.
    const FieldType* element() const { return element_.get(); }

    // Canonical spelling: aliases collapse ("string" -> "str").
    std::string to_string() const;

    bool matches(const Value& value) const;
    // Returns the value converted to this type (int <-> float where lossless), or nullopt.
    std::optional<Value> coerce(const Value& value) const;

    Value to_json_schema() const;

    bool operator==(const FieldType& other) const;
    bool operator!=(const FieldType& other) const { return !(*this == other); }

private:
    FieldKind kind_ = FieldKind::STRING;
    std::shared_ptr<const FieldType> element_;
    std::shared_ptr<const FieldType> key_; // dict only
};

} // namespace agentflow

#endif // AGENTFLOW_TYPES_FIELD_TYPE_H
