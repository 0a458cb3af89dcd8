// modules/graph/execution_plan.cpp
#include "modules/graph/execution_plan.h"
#include <stdexcept>

namespace agentflow {

namespace {

EdgeKind edge_kind_from_string(const std::string& s) {
    if (s == "linear") return EdgeKind::LINEAR;
    if (s == "conditional") return EdgeKind::CONDITIONAL;
    if (s == "loop") return EdgeKind::LOOP;
    if (s == "fork_join") return EdgeKind::FORK_JOIN;
    throw std::invalid_argument("unknown edge kind: " + s);
}

} // anonymous namespace

Value EdgeDescriptor::to_json() const {
    Value j;
    j["kind"] = to_string(kind);
    j["from"] = from;
    j["on_error"] = on_error == EdgeErrorPolicy::CONTINUE ? "continue" : "fail";

    switch (kind) {
        case EdgeKind::LINEAR:
            j["to"] = target;
            break;
        case EdgeKind::CONDITIONAL:
            j["routes"] = Value::array();
            for (const auto& r : routes) {
                j["routes"].push_back({{"condition", r.condition}, {"to", r.target}});
            }
            break;
        case EdgeKind::LOOP:
            j["max_iterations"] = max_iterations;
            j["condition_field"] = condition_field;
            j["exit_to"] = exit_to;
            break;
        case EdgeKind::FORK_JOIN:
            j["branches"] = branches;
            j["join"] = join;
            break;
    }
    return j;
}

EdgeDescriptor EdgeDescriptor::from_json(const Value& j) {
    EdgeDescriptor e;
    e.kind = edge_kind_from_string(j.at("kind").get<std::string>());
    e.from = j.at("from").get<std::string>();
    e.on_error = j.value("on_error", "fail") == "continue" ? EdgeErrorPolicy::CONTINUE : EdgeErrorPolicy::FAIL;

    switch (e.kind) {
        case EdgeKind::LINEAR:
            e.target = j.at("to").get<std::string>();
            break;
        case EdgeKind::CONDITIONAL:
            for (const auto& r : j.at("routes")) {
                e.routes.push_back({r.at("condition").get<std::string>(), r.at("to").get<std::string>()});
            }
            break;
        case EdgeKind::LOOP:
            e.max_iterations = j.at("max_iterations").get<int>();
            e.condition_field = j.at("condition_field").get<std::string>();
            e.exit_to = j.at("exit_to").get<std::string>();
            break;
        case EdgeKind::FORK_JOIN:
            e.branches = j.at("branches").get<std::vector<NodeId>>();
            e.join = j.at("join").get<std::string>();
            break;
    }
    return e;
}

const NodeDescriptor& ExecutionPlan::node(const NodeId& id) const {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        throw std::out_of_range("plan has no node '" + id + "'");
    }
    return it->second;
}

const EdgeDescriptor& ExecutionPlan::edge_from(const NodeId& id) const {
    auto it = edge_index_.find(id);
    if (it == edge_index_.end()) {
        throw std::out_of_range("plan has no edge leaving '" + id + "'");
    }
    return edges_[it->second];
}

Value ExecutionPlan::describe() const {
    Value j;
    j["flow"] = {{"name", flow_name_}, {"version", flow_version_}};

    j["state"] = Value::array();
    for (const auto& slot : state_type_->fields()) {
        j["state"].push_back({
            {"name", slot.name},
            {"type", slot.type.to_string()},
            {"merge", slot.policy == MergePolicy::ARRAY_CONCAT ? "concat" : "last_write_wins"}
        });
    }

    j["nodes"] = Value::array();
    for (const auto& id : node_order_) {
        const NodeDescriptor& n = nodes_.at(id);
        Value tools = Value::array();
        for (const auto& t : n.tools) {
            tools.push_back({{"name", t.name}, {"on_error", t.on_error == ToolErrorPolicy::FAIL ? "fail" : "continue"}});
        }
        j["nodes"].push_back({
            {"id", n.id},
            {"outputs", n.outputs},
            {"output_schema", n.contract.json_schema()},
            {"tools", tools},
            {"llm", n.llm.to_json()},
            {"max_retries", n.max_retries},
            {"max_tool_iterations", n.max_tool_iterations}
        });
    }

    j["edges"] = Value::array();
    for (const auto& e : edges_) {
        j["edges"].push_back(e.to_json());
    }
    return j;
}

} // namespace agentflow
