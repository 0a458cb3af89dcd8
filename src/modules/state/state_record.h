// modules/state/state_record.h
#ifndef AGENTFLOW_MODULES_STATE_STATE_RECORD_H
#define AGENTFLOW_MODULES_STATE_STATE_RECORD_H

#include "core/types/config.h"
#include "core/types/context.h"
#include "core/types/field_type.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentflow {

// 字段级合并策略
enum class MergePolicy {
    LAST_WRITE_WINS, // scalars and dicts: the delta overwrites
    ARRAY_CONCAT     // lists: base ++ delta
};

struct FieldSlot {
    size_t index = 0;
    std::string name;
    FieldType type;
    bool required = false;
    std::optional<Value> default_value;
    MergePolicy policy = MergePolicy::LAST_WRITE_WINS;
};

class StateRecord;

// Runtime record type derived from a StateSchema: a stable field-index table
// with one type tag and one merge policy per field. Immutable once built.
class StateRecordType {
public:
    static std::shared_ptr<const StateRecordType> build(const StateSchema& schema);

    const std::vector<FieldSlot>& fields() const { return slots_; }
    const FieldSlot* find(const std::string& name) const;
    // Throws std::out_of_range for undeclared fields.
    const FieldSlot& slot(const std::string& name) const;
    bool has_field(const std::string& name) const { return find(name) != nullptr; }
    std::vector<std::string> field_names() const;

    // merge(base, delta) -> merged. Throws std::invalid_argument when the delta
    // names an undeclared field or carries a value of the wrong type.
    StateRecord merge(const StateRecord& base, const Value& delta) const;

private:
    std::vector<FieldSlot> slots_;
    std::unordered_map<std::string, size_t> index_;
};

// One run's state: values indexed by the record type's field table.
// Nodes only ever see a const snapshot; the orchestrator applies deltas.
class StateRecord {
public:
    // Inputs plus declared defaults. Throws StateInitializationError on unknown
    // inputs, missing required inputs or type mismatches.
    static StateRecord create(std::shared_ptr<const StateRecordType> type, const Value& inputs);

    const StateRecordType& type() const { return *type_; }

    const Value& get(const std::string& name) const;
    std::string get_string(const std::string& name) const;
    int64_t get_int(const std::string& name) const;
    double get_number(const std::string& name) const;
    bool get_bool(const std::string& name) const;
    const Value& get_list(const std::string& name) const;
    bool is_set(const std::string& name) const;

    // In-place merge following each field's policy.
    void apply(const Value& delta);

    Value to_json() const;

private:
    explicit StateRecord(std::shared_ptr<const StateRecordType> type);

    const Value& typed(const std::string& name, FieldKind expected) const;

    std::shared_ptr<const StateRecordType> type_;
    std::vector<Value> values_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_STATE_STATE_RECORD_H
