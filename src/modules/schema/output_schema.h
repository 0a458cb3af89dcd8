// modules/schema/output_schema.h
#ifndef AGENTFLOW_MODULES_SCHEMA_OUTPUT_SCHEMA_H
#define AGENTFLOW_MODULES_SCHEMA_OUTPUT_SCHEMA_H

#include "core/types/config.h"
#include "core/types/context.h"
#include "core/types/field_type.h"
#include "modules/state/state_record.h"
#include <string>
#include <vector>

namespace agentflow {

struct OutputValidation {
    bool ok = false;
    Value delta = Value::object();   // keyed by the node's output fields
    std::vector<std::string> errors;
};

// Typed result contract of one node, built once at compile time.
// A simple (non-object) schema is exchanged with the model as {"result": value}.
class OutputContract {
public:
    struct Field {
        std::string name;
        FieldType type;
        std::string description;
    };

    OutputContract() = default;

    // Without a declared schema the field types come from the state record.
    static OutputContract build(const NodeConfig& node, const StateRecordType& state);

    OutputValidation validate(const Value& raw) const;

    const Value& json_schema() const { return schema_; }
    const std::vector<Field>& fields() const { return fields_; }
    bool is_wrapped() const { return wrapped_; }

private:
    std::vector<Field> fields_;
    bool wrapped_ = false;
    Value schema_ = Value::object();
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_SCHEMA_OUTPUT_SCHEMA_H
