// modules/validator/config_validator.cpp
#include "modules/validator/config_validator.h"
#include "common/utils/expression_evaluator.h"
#include "common/utils/suggest.h"
#include "modules/graph/graph_analysis.h"
#include "modules/parser/config_parser.h"
#include "modules/template/template_resolver.h"
#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace agentflow {

namespace {

void add(std::vector<Violation>& out, std::string code, std::string location,
         std::string message, std::string suggestion = "") {
    out.push_back(Violation{std::move(code), std::move(message), std::move(location), std::move(suggestion)});
}

std::vector<std::string> node_ids(const WorkflowConfig& config) {
    std::vector<std::string> ids;
    for (const auto& n : config.nodes) ids.push_back(n.id);
    return ids;
}

std::vector<std::string> state_names(const WorkflowConfig& config) {
    std::vector<std::string> names;
    for (const auto& f : config.state.fields) names.push_back(f.name);
    return names;
}

// Output type written by a node vs. the state field receiving it
bool assignable(const FieldType& out, const FieldType& state) {
    if (out == state) return true;
    if (state.kind() == FieldKind::NUMBER && out.kind() == FieldKind::INTEGER) return true;
    if (out.kind() != state.kind()) return false;
    if (state.kind() == FieldKind::LIST || state.kind() == FieldKind::DICT) {
        if (!state.element() || !out.element()) return true;
        return assignable(*out.element(), *state.element());
    }
    return false;
}

class ReferenceChecker {
public:
    ReferenceChecker(const WorkflowConfig& config, std::vector<Violation>& out)
        : ids_(node_ids(config)), out_(out) {}

    bool is_node(const std::string& id) const {
        return std::find(ids_.begin(), ids_.end(), id) != ids_.end();
    }

    // Target of a transition: a node or END.
    void target(const std::string& id, const std::string& location, const std::string& role) {
        if (id == END_NODE || is_node(id)) return;
        if (id == START_NODE) {
            add(out_, "start_as_target", location, "START cannot be the " + role + " of an edge");
            return;
        }
        std::vector<std::string> candidates = ids_;
        candidates.push_back(END_NODE);
        add(out_, "unknown_reference", location,
            role + " '" + id + "' does not exist", did_you_mean(id, candidates));
    }

    void source(const std::string& id, const std::string& location) {
        if (id == START_NODE || is_node(id)) return;
        if (id == END_NODE) {
            add(out_, "end_as_source", location, "END cannot have outgoing edges");
            return;
        }
        std::vector<std::string> candidates = ids_;
        candidates.push_back(START_NODE);
        add(out_, "unknown_reference", location,
            "source '" + id + "' does not exist", did_you_mean(id, candidates));
    }

private:
    std::vector<std::string> ids_;
    std::vector<Violation>& out_;
};

} // anonymous namespace

ConfigValidator::ConfigValidator(const ToolInvoker* tools) : tools_(tools) {}

WorkflowConfig ConfigValidator::validate(const Value& document) const {
    std::vector<Violation> violations;
    WorkflowConfig config = ConfigParser::build(document, violations);
    if (!violations.empty()) {
        throw ConfigValidationError(std::move(violations));
    }

    violations = check_business_rules(config);
    if (!violations.empty()) {
        throw ConfigValidationError(std::move(violations));
    }
    return config;
}

std::vector<Violation> ConfigValidator::check_business_rules(const WorkflowConfig& config) const {
    std::vector<Violation> out;
    check_edges(config, out);
    check_nodes(config, out);
    // Reachability and fork analysis are meaningless over dangling references
    if (out.empty()) {
        check_graph(config, out);
    }
    return out;
}

void ConfigValidator::check_edges(const WorkflowConfig& config, std::vector<Violation>& out) const {
    ReferenceChecker refs(config, out);
    const auto fields = state_names(config);
    InjaExpressionEvaluator evaluator;

    std::unordered_map<std::string, std::vector<const EdgeConfig*>> outgoing;

    for (const auto& edge : config.edges) {
        refs.source(edge.from, edge.location);
        outgoing[edge.from].push_back(&edge);

        switch (edge.kind()) {
            case EdgeKind::LINEAR:
                refs.target(edge.to.front(), edge.location, "target");
                break;

            case EdgeKind::FORK_JOIN: {
                if (edge.to.size() < 2) {
                    add(out, "fork_targets", edge.location, "fork-join edge needs at least 2 targets",
                        edge.to.size() == 1 ? "Use 'to: " + edge.to.front() + "' for a linear edge" : "");
                }
                std::unordered_set<std::string> seen;
                for (const auto& t : edge.to) {
                    if (!seen.insert(t).second) {
                        add(out, "fork_targets", edge.location, "fork target '" + t + "' is listed twice");
                    }
                    if (t == END_NODE) {
                        add(out, "fork_targets", edge.location, "END cannot be a fork branch");
                        continue;
                    }
                    refs.target(t, edge.location, "fork target");
                }
                break;
            }

            case EdgeKind::CONDITIONAL: {
                int defaults = 0;
                for (const auto& route : edge.routes) {
                    refs.target(route.to, edge.location, "route target");
                    if (route.is_default()) {
                        ++defaults;
                        continue;
                    }
                    for (const auto& name : InjaExpressionEvaluator::referenced_state_fields(route.condition)) {
                        if (std::find(fields.begin(), fields.end(), name) == fields.end()) {
                            add(out, "unknown_state_reference", edge.location,
                                "condition '" + route.condition + "' references undeclared field 'state." + name + "'",
                                did_you_mean(name, fields));
                        }
                    }
                    try {
                        evaluator.check_syntax(route.condition);
                    } catch (const std::invalid_argument& e) {
                        add(out, "invalid_condition", edge.location, e.what());
                    }
                }
                if (defaults == 0) {
                    add(out, "missing_default_route", edge.location,
                        "conditional edge has no 'default' route",
                        "Add {condition: {logic: default}, to: <node or END>}");
                } else if (defaults > 1) {
                    add(out, "duplicate_default_route", edge.location, "conditional edge has more than one 'default' route");
                }
                break;
            }

            case EdgeKind::LOOP: {
                const LoopConfig& loop = *edge.loop;
                if (edge.from == START_NODE) {
                    add(out, "invalid_loop", edge.location, "START cannot carry a loop edge");
                }
                refs.target(loop.exit_to, edge.location, "exit_to");
                const StateFieldConfig* field = config.state.find(loop.condition_field);
                if (!field) {
                    add(out, "unknown_state_reference", edge.location,
                        "loop condition_field '" + loop.condition_field + "' is not a state field",
                        did_you_mean(loop.condition_field, fields));
                } else if (field->type.kind() != FieldKind::BOOLEAN) {
                    add(out, "loop_condition_type", edge.location,
                        "loop condition_field '" + loop.condition_field + "' must be bool, not " +
                        field->type.to_string());
                }
                break;
            }
        }
    }

    auto start = outgoing.find(START_NODE);
    if (start == outgoing.end()) {
        add(out, "missing_start", "edges", "no edge leaves START", "Add an edge 'from: START'");
    } else if (start->second.size() > 1) {
        for (size_t i = 1; i < start->second.size(); ++i) {
            add(out, "multiple_start_edges", start->second[i]->location,
                "START already has an outgoing edge (" + start->second.front()->location + ")");
        }
    }

    for (const auto& node : config.nodes) {
        auto it = outgoing.find(node.id);
        if (it == outgoing.end()) {
            add(out, "missing_edge", "nodes." + node.id, "node '" + node.id + "' has no outgoing edge",
                "Add an edge from '" + node.id + "' (e.g. to END)");
        } else if (it->second.size() > 1) {
            for (size_t i = 1; i < it->second.size(); ++i) {
                add(out, "multiple_edges", it->second[i]->location,
                    "node '" + node.id + "' already has an outgoing edge (" + it->second.front()->location +
                    "); use routes or a fork list instead");
            }
        }
    }
}

void ConfigValidator::check_nodes(const WorkflowConfig& config, std::vector<Violation>& out) const {
    const auto fields = state_names(config);
    std::vector<std::string> tool_names;
    if (tools_) tool_names = tools_->list_tools();

    for (size_t i = 0; i < config.nodes.size(); ++i) {
        const NodeConfig& node = config.nodes[i];
        const std::string loc = "nodes[" + std::to_string(i) + "] ('" + node.id + "')";

        for (const auto& output : node.outputs) {
            if (!config.state.find(output)) {
                add(out, "unknown_output", loc, "output '" + output + "' is not a state field",
                    did_you_mean(output, fields));
            }
        }

        const OutputSchemaConfig& schema = node.output_schema;
        if (schema.declared && schema.is_object()) {
            std::vector<std::string> names;
            for (const auto& f : schema.fields) names.push_back(f.name);
            std::vector<std::string> a = names, b = node.outputs;
            std::sort(a.begin(), a.end());
            std::sort(b.begin(), b.end());
            if (a != b) {
                add(out, "schema_mismatch", loc, "output_schema fields must match the node's outputs exactly");
            }
            for (const auto& f : schema.fields) {
                const StateFieldConfig* target = config.state.find(f.name);
                if (target && !assignable(f.type, target->type)) {
                    add(out, "type_mismatch", loc, "output '" + f.name + "' is " + f.type.to_string() +
                                                   " but state field is " + target->type.to_string());
                }
            }
        } else if (schema.declared) {
            if (node.outputs.size() != 1) {
                add(out, "schema_mismatch", loc,
                    "simple output_schema type '" + schema.type.to_string() + "' needs exactly one output",
                    "Use type: object with one field per output");
            } else if (const StateFieldConfig* target = config.state.find(node.outputs.front())) {
                if (!assignable(schema.type, target->type)) {
                    add(out, "type_mismatch", loc, "output '" + node.outputs.front() + "' is " +
                                                   schema.type.to_string() + " but state field is " +
                                                   target->type.to_string());
                }
            }
        }

        for (const auto& p : TemplateResolver::placeholders(node.prompt)) {
            if (!config.state.find(p.field)) {
                add(out, "unknown_placeholder", loc, "prompt placeholder '" + p.text + "' names no state field",
                    did_you_mean(p.field, fields));
            }
        }

        if (tools_) {
            for (const auto& tool : node.tools) {
                if (!tools_->has_tool(tool.name)) {
                    add(out, "unknown_tool", loc, "tool '" + tool.name + "' is not registered",
                        did_you_mean(tool.name, tool_names));
                }
            }
        }
    }
}

void ConfigValidator::check_graph(const WorkflowConfig& config, std::vector<Violation>& out) const {
    const Adjacency adj = build_adjacency(config.edges);
    const Adjacency reverse = reverse_adjacency(adj);

    const auto from_start = reachable_from(adj, START_NODE);
    const auto to_end = reachable_from(reverse, END_NODE);

    for (const auto& node : config.nodes) {
        if (!from_start.count(node.id)) {
            add(out, "unreachable_node", "nodes." + node.id, "node '" + node.id + "' is not reachable from START");
        }
        if (!to_end.count(node.id)) {
            add(out, "no_path_to_end", "nodes." + node.id, "node '" + node.id + "' has no path to END");
        }
    }

    for (const auto& edge : config.edges) {
        if (edge.kind() == EdgeKind::FORK_JOIN) {
            // 经由 fork 源节点回到另一分支的路径（重试环）不算依赖
            Adjacency without_source = adj;
            without_source.erase(edge.from);
            bool independent = true;
            for (const auto& a : edge.to) {
                const auto reach = reachable_from(without_source, a);
                for (const auto& b : edge.to) {
                    if (a != b && reach.count(b)) {
                        add(out, "fork_not_independent", edge.location,
                            "fork branch '" + b + "' is reachable from branch '" + a + "'");
                        independent = false;
                    }
                }
            }
            // END counts as a join, so this fires only when some branch can never finish
            if (independent && !find_join(adj, edge.to)) {
                add(out, "fork_without_join", edge.location, "fork branches never reach a common node");
            }
        }

        if (edge.kind() == EdgeKind::LOOP) {
            const std::string& field = edge.loop->condition_field;
            bool produced = false;
            for (const auto& id : reachable_from(reverse, edge.from)) {
                const NodeConfig* n = config.find_node(id);
                if (n && std::find(n->outputs.begin(), n->outputs.end(), field) != n->outputs.end()) {
                    produced = true;
                    break;
                }
            }
            if (!produced) {
                add(out, "loop_condition_not_produced", edge.location,
                    "loop condition_field '" + field + "' is not an output of '" + edge.from +
                    "' or any node upstream of it");
            }
        }
    }
}

} // namespace agentflow
