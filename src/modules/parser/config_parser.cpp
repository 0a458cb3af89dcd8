// modules/parser/config_parser.cpp
#include "modules/parser/config_parser.h"
#include "common/utils/log.h"
#include "common/utils/suggest.h"
#include "common/utils/yaml_json.h"
#include <algorithm>
#include <fstream>
#include <regex>
#include <sstream>
#include <unordered_set>

namespace agentflow {

namespace {

const std::vector<std::string> kProviders = {"openai", "anthropic", "google", "ollama", "llama"};
const std::vector<std::string> kLogLevels = {"DEBUG", "INFO", "WARNING", "ERROR"};
const std::vector<std::string> kTopLevelKeys = {"schema_version", "flow", "state", "nodes", "edges", "config"};

std::string at(const std::string& loc, const std::string& key) {
    return loc.empty() ? key : loc + "." + key;
}

std::string index_loc(const std::string& loc, size_t i) {
    return loc + "[" + std::to_string(i) + "]";
}

std::string one_of(const std::vector<std::string>& values) {
    std::string s;
    for (const auto& v : values) s += (s.empty() ? "" : ", ") + v;
    return s;
}

// Reads one section of the document, reporting problems instead of throwing.
class StructureReader {
public:
    explicit StructureReader(std::vector<Violation>& out) : out_(out) {}

    void error(const std::string& code, const std::string& location,
               const std::string& message, const std::string& suggestion = "") {
        out_.push_back(Violation{code, message, location, suggestion});
    }

    const Value* member(const Value& obj, const char* key) {
        if (!obj.is_object()) return nullptr;
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) return nullptr;
        return &*it;
    }

    std::optional<std::string> read_string(const Value& obj, const char* key,
                                           const std::string& loc, bool required) {
        const Value* v = member(obj, key);
        if (!v) {
            if (required) error("missing_field", at(loc, key), "required field is missing");
            return std::nullopt;
        }
        if (!v->is_string()) {
            error("invalid_type", at(loc, key), std::string("expected a string, got ") + v->type_name());
            return std::nullopt;
        }
        return v->get<std::string>();
    }

    std::optional<bool> read_bool(const Value& obj, const char* key, const std::string& loc) {
        const Value* v = member(obj, key);
        if (!v) return std::nullopt;
        if (!v->is_boolean()) {
            error("invalid_type", at(loc, key), std::string("expected a boolean, got ") + v->type_name());
            return std::nullopt;
        }
        return v->get<bool>();
    }

    std::optional<int> read_int(const Value& obj, const char* key, const std::string& loc,
                                int min_value, int max_value) {
        const Value* v = member(obj, key);
        if (!v) return std::nullopt;
        if (!v->is_number_integer()) {
            error("invalid_type", at(loc, key), std::string("expected an integer, got ") + v->type_name());
            return std::nullopt;
        }
        int64_t n = v->get<int64_t>();
        if (n < min_value || n > max_value) {
            error("out_of_range", at(loc, key),
                  "value " + std::to_string(n) + " outside [" + std::to_string(min_value) + ", " +
                  std::to_string(max_value) + "]");
            return std::nullopt;
        }
        return static_cast<int>(n);
    }

    std::optional<double> read_number(const Value& obj, const char* key, const std::string& loc,
                                      double min_value, double max_value, bool exclusive_min = false) {
        const Value* v = member(obj, key);
        if (!v) return std::nullopt;
        if (!v->is_number()) {
            error("invalid_type", at(loc, key), std::string("expected a number, got ") + v->type_name());
            return std::nullopt;
        }
        double d = v->get<double>();
        bool low = exclusive_min ? d <= min_value : d < min_value;
        if (low || d > max_value) {
            std::ostringstream oss;
            oss << "value " << d << " outside " << (exclusive_min ? "(" : "[") << min_value << ", " << max_value << "]";
            error("out_of_range", at(loc, key), oss.str());
            return std::nullopt;
        }
        return d;
    }

    std::optional<std::string> read_enum(const Value& obj, const char* key, const std::string& loc,
                                         const std::vector<std::string>& allowed) {
        auto s = read_string(obj, key, loc, false);
        if (!s) return std::nullopt;
        if (std::find(allowed.begin(), allowed.end(), *s) == allowed.end()) {
            error("invalid_enum", at(loc, key), "'" + *s + "' is not one of: " + one_of(allowed),
                  did_you_mean(*s, allowed));
            return std::nullopt;
        }
        return s;
    }

    // Optional type string; reports unparseable ones.
    std::optional<FieldType> read_type(const Value& obj, const char* key, const std::string& loc,
                                       std::string& type_name) {
        auto s = read_string(obj, key, loc, false);
        if (!s) return std::nullopt;
        try {
            FieldType t = FieldType::parse(*s);
            type_name = *s;
            return t;
        } catch (const std::invalid_argument& e) {
            error("invalid_type_string", at(loc, key), e.what());
            return std::nullopt;
        }
    }

    FlowMetadata read_flow(const Value& doc);
    StateSchema read_state(const Value& doc);
    std::vector<NodeConfig> read_nodes(const Value& doc);
    std::vector<EdgeConfig> read_edges(const Value& doc);
    GlobalConfig read_global(const Value& doc);

private:
    OutputSchemaConfig read_output_schema(const Value& v, const std::string& loc);
    ToolBinding read_tool(const Value& v, const std::string& loc);
    LlmConfig read_llm(const Value& v, const std::string& loc);
    LoopConfig read_loop(const Value& v, const std::string& loc);
    EdgeConfig read_edge(const Value& v, const std::string& loc);

    std::vector<Violation>& out_;
};

FlowMetadata StructureReader::read_flow(const Value& doc) {
    FlowMetadata flow;
    const Value* f = member(doc, "flow");
    if (!f) {
        error("missing_field", "flow", "required section is missing");
        return flow;
    }
    if (!f->is_object()) {
        error("invalid_type", "flow", "expected a mapping");
        return flow;
    }
    if (auto name = read_string(*f, "name", "flow", true)) {
        if (name->empty()) error("invalid_value", "flow.name", "flow name must not be empty");
        flow.name = *name;
    }
    flow.description = read_string(*f, "description", "flow", false).value_or("");
    // version may be written as a bare number (1.0)
    if (const Value* v = member(*f, "version")) {
        flow.version = v->is_string() ? v->get<std::string>() : v->dump();
    }
    return flow;
}

StateSchema StructureReader::read_state(const Value& doc) {
    StateSchema schema;
    const Value* s = member(doc, "state");
    const Value* fields = s ? member(*s, "fields") : nullptr;
    if (!fields) {
        error("missing_field", "state.fields", "a workflow needs at least one state field");
        return schema;
    }
    if (!fields->is_array() || fields->empty()) {
        error("invalid_value", "state.fields", "expected a non-empty list of fields");
        return schema;
    }

    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < fields->size(); ++i) {
        const Value& f = (*fields)[i];
        const std::string loc = index_loc("state.fields", i);
        if (!f.is_object()) {
            error("invalid_type", loc, "expected a mapping");
            continue;
        }

        StateFieldConfig field;
        if (auto name = read_string(f, "name", loc, true)) {
            if (!ConfigParser::is_identifier(*name)) {
                error("invalid_identifier", at(loc, "name"), "'" + *name + "' is not a valid identifier");
            } else if (!seen.insert(*name).second) {
                error("duplicate_field", at(loc, "name"), "state field '" + *name + "' is declared twice");
            }
            field.name = *name;
        }

        if (!member(f, "type")) {
            error("missing_field", at(loc, "type"), "required field is missing");
        }
        auto type = read_type(f, "type", loc, field.type_name);
        if (type) {
            if (type->kind() == FieldKind::OBJECT) {
                error("invalid_type_string", at(loc, "type"), "'object' is only valid in output schemas (use dict)");
            }
            field.type = *type;
        }

        field.required = read_bool(f, "required", loc).value_or(false);
        field.description = read_string(f, "description", loc, false).value_or("");

        if (const Value* def = member(f, "default")) {
            if (field.required) {
                error("required_with_default", loc,
                      "field '" + field.name + "' is required but also declares a default",
                      "Remove 'default' or set 'required: false'");
            }
            if (type) {
                auto coerced = type->coerce(*def);
                if (!coerced) {
                    error("invalid_default", at(loc, "default"),
                          "default " + def->dump() + " does not match type " + type->to_string());
                } else {
                    field.default_value = *coerced;
                }
            }
        }
        schema.fields.push_back(std::move(field));
    }
    return schema;
}

OutputSchemaConfig StructureReader::read_output_schema(const Value& v, const std::string& loc) {
    OutputSchemaConfig schema;
    schema.declared = true;
    if (!v.is_object()) {
        error("invalid_type", loc, "expected a mapping");
        return schema;
    }

    schema.description = read_string(v, "description", loc, false).value_or("");
    const Value* fields = member(v, "fields");

    std::string type_name;
    if (auto t = read_type(v, "type", loc, type_name)) {
        schema.type = *t;
        schema.type_name = type_name;
    } else if (!member(v, "type")) {
        // fields without a type means an object schema
        schema.type = fields ? FieldType(FieldKind::OBJECT) : FieldType(FieldKind::STRING);
        schema.type_name = fields ? "object" : "str";
    }

    if (!schema.is_object()) {
        return schema;
    }
    if (!fields || !fields->is_array() || fields->empty()) {
        error("missing_field", at(loc, "fields"), "object output schema needs a non-empty 'fields' list");
        return schema;
    }

    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < fields->size(); ++i) {
        const Value& f = (*fields)[i];
        const std::string floc = index_loc(at(loc, "fields"), i);
        if (!f.is_object()) {
            error("invalid_type", floc, "expected a mapping");
            continue;
        }
        OutputFieldConfig field;
        field.name = read_string(f, "name", floc, true).value_or("");
        if (!field.name.empty() && !seen.insert(field.name).second) {
            error("duplicate_field", at(floc, "name"), "output field '" + field.name + "' is declared twice");
        }
        if (!member(f, "type")) {
            error("missing_field", at(floc, "type"), "required field is missing");
        }
        if (auto t = read_type(f, "type", floc, field.type_name)) field.type = *t;
        field.description = read_string(f, "description", floc, false).value_or("");
        schema.fields.push_back(std::move(field));
    }
    return schema;
}

ToolBinding StructureReader::read_tool(const Value& v, const std::string& loc) {
    ToolBinding binding;
    if (v.is_string()) {
        binding.name = v.get<std::string>();
        return binding;
    }
    if (!v.is_object()) {
        error("invalid_type", loc, "expected a tool name or {name, on_error}");
        return binding;
    }
    binding.name = read_string(v, "name", loc, true).value_or("");
    if (auto policy = read_enum(v, "on_error", loc, {"fail", "continue"})) {
        binding.on_error = (*policy == "fail") ? ToolErrorPolicy::FAIL : ToolErrorPolicy::CONTINUE;
    }
    return binding;
}

LlmConfig StructureReader::read_llm(const Value& v, const std::string& loc) {
    LlmConfig llm;
    if (!v.is_object()) {
        error("invalid_type", loc, "expected a mapping");
        return llm;
    }
    llm.provider = read_enum(v, "provider", loc, kProviders);
    llm.model = read_string(v, "model", loc, false);
    llm.temperature = read_number(v, "temperature", loc, 0.0, 1.0);
    llm.max_tokens = read_int(v, "max_tokens", loc, 1, 1000000);
    llm.api_base = read_string(v, "api_base", loc, false);
    return llm;
}

LoopConfig StructureReader::read_loop(const Value& v, const std::string& loc) {
    LoopConfig loop;
    if (!v.is_object()) {
        error("invalid_type", loc, "expected a mapping");
        return loop;
    }
    loop.max_iterations = read_int(v, "max_iterations", loc, 1, 100).value_or(10);
    loop.condition_field = read_string(v, "condition_field", loc, true).value_or("");
    loop.exit_to = read_string(v, "exit_to", loc, false).value_or(END_NODE);
    return loop;
}

std::vector<NodeConfig> StructureReader::read_nodes(const Value& doc) {
    std::vector<NodeConfig> nodes;
    const Value* list = member(doc, "nodes");
    if (!list || !list->is_array() || list->empty()) {
        error("missing_field", "nodes", "a workflow needs a non-empty list of nodes");
        return nodes;
    }

    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < list->size(); ++i) {
        const Value& n = (*list)[i];
        const std::string loc = index_loc("nodes", i);
        if (!n.is_object()) {
            error("invalid_type", loc, "expected a mapping");
            continue;
        }

        NodeConfig node;
        if (auto id = read_string(n, "id", loc, true)) {
            if (*id == START_NODE || *id == END_NODE) {
                error("reserved_id", at(loc, "id"), "'" + *id + "' is reserved");
            } else if (!ConfigParser::is_identifier(*id)) {
                error("invalid_identifier", at(loc, "id"), "node id '" + *id + "' is not a valid identifier");
            } else if (!seen.insert(*id).second) {
                error("duplicate_node", at(loc, "id"), "node id '" + *id + "' is declared twice");
            }
            node.id = *id;
        }
        node.description = read_string(n, "description", loc, false).value_or("");
        node.prompt = read_string(n, "prompt", loc, true).value_or("");

        const Value* outputs = member(n, "outputs");
        if (!outputs || !outputs->is_array() || outputs->empty()) {
            error("missing_outputs", at(loc, "outputs"), "node must declare at least one output field");
        } else {
            for (size_t k = 0; k < outputs->size(); ++k) {
                if (!(*outputs)[k].is_string()) {
                    error("invalid_type", index_loc(at(loc, "outputs"), k), "expected a field name");
                    continue;
                }
                node.outputs.push_back((*outputs)[k].get<std::string>());
            }
        }

        if (const Value* schema = member(n, "output_schema")) {
            node.output_schema = read_output_schema(*schema, at(loc, "output_schema"));
        }

        if (const Value* tools = member(n, "tools")) {
            if (!tools->is_array()) {
                error("invalid_type", at(loc, "tools"), "expected a list");
            } else {
                for (size_t k = 0; k < tools->size(); ++k) {
                    node.tools.push_back(read_tool((*tools)[k], index_loc(at(loc, "tools"), k)));
                }
            }
        }

        if (const Value* llm = member(n, "llm")) {
            node.llm = read_llm(*llm, at(loc, "llm"));
        }
        if (const Value* loop = member(n, "loop")) {
            node.loop = read_loop(*loop, at(loc, "loop"));
        }
        nodes.push_back(std::move(node));
    }
    return nodes;
}

EdgeConfig StructureReader::read_edge(const Value& e, const std::string& loc) {
    EdgeConfig edge;
    edge.location = loc;
    edge.from = read_string(e, "from", loc, true).value_or("");
    if (!edge.from.empty()) edge.location += " (from '" + edge.from + "')";

    const Value* to = member(e, "to");
    const Value* routes = member(e, "routes");
    const Value* loop = member(e, "loop");
    int kinds = (to ? 1 : 0) + (routes ? 1 : 0) + (loop ? 1 : 0);
    if (kinds != 1) {
        error("invalid_edge", edge.location,
              kinds == 0 ? "edge declares none of 'to', 'routes', 'loop'"
                         : "edge must declare exactly one of 'to', 'routes', 'loop'");
        return edge;
    }

    if (auto policy = read_enum(e, "on_error", loc, {"fail", "continue"})) {
        edge.on_error = (*policy == "continue") ? EdgeErrorPolicy::CONTINUE : EdgeErrorPolicy::FAIL;
    }

    if (to) {
        if (to->is_string()) {
            edge.to.push_back(to->get<std::string>());
        } else if (to->is_array()) {
            edge.to_is_list = true;
            for (size_t k = 0; k < to->size(); ++k) {
                if (!(*to)[k].is_string()) {
                    error("invalid_type", index_loc(at(loc, "to"), k), "expected a node id");
                    continue;
                }
                edge.to.push_back((*to)[k].get<std::string>());
            }
        } else {
            error("invalid_type", at(loc, "to"), "expected a node id or a list of node ids");
        }
    } else if (routes) {
        if (!routes->is_array() || routes->empty()) {
            error("invalid_value", at(loc, "routes"), "expected a non-empty list of routes");
            return edge;
        }
        for (size_t k = 0; k < routes->size(); ++k) {
            const Value& r = (*routes)[k];
            const std::string rloc = index_loc(at(loc, "routes"), k);
            RouteConfig route;
            const Value* cond = member(r, "condition");
            if (cond && cond->is_string()) {
                route.condition = cond->get<std::string>();
            } else if (cond && cond->is_object()) {
                route.condition = read_string(*cond, "logic", at(rloc, "condition"), true).value_or("");
            } else {
                error("missing_field", at(rloc, "condition"), "route needs a condition ({logic: ...} or a string)");
            }
            route.to = read_string(r, "to", rloc, true).value_or("");
            edge.routes.push_back(std::move(route));
        }
    } else {
        edge.loop = read_loop(*loop, at(loc, "loop"));
    }
    return edge;
}

std::vector<EdgeConfig> StructureReader::read_edges(const Value& doc) {
    std::vector<EdgeConfig> edges;
    const Value* list = member(doc, "edges");
    if (!list || !list->is_array() || list->empty()) {
        error("missing_field", "edges", "a workflow needs a non-empty list of edges");
        return edges;
    }
    for (size_t i = 0; i < list->size(); ++i) {
        const Value& e = (*list)[i];
        if (!e.is_object()) {
            error("invalid_type", index_loc("edges", i), "expected a mapping");
            continue;
        }
        edges.push_back(read_edge(e, index_loc("edges", i)));
    }
    return edges;
}

GlobalConfig StructureReader::read_global(const Value& doc) {
    GlobalConfig global;
    const Value* cfg = member(doc, "config");
    if (!cfg) return global;
    if (!cfg->is_object()) {
        error("invalid_type", "config", "expected a mapping");
        return global;
    }

    if (const Value* llm = member(*cfg, "llm")) {
        global.llm = read_llm(*llm, "config.llm");
    }

    if (const Value* ex = member(*cfg, "execution")) {
        const std::string loc = "config.execution";
        auto& e = global.execution;
        e.timeout_sec = read_number(*ex, "timeout", loc, 0.0, 86400.0, true).value_or(e.timeout_sec);
        e.max_retries = read_int(*ex, "max_retries", loc, 0, 20).value_or(e.max_retries);
        e.max_tool_iterations = read_int(*ex, "max_tool_iterations", loc, 1, 1000).value_or(e.max_tool_iterations);
        e.max_llm_calls = read_int(*ex, "max_llm_calls", loc, -1, 1000000).value_or(e.max_llm_calls);
        e.max_node_executions = read_int(*ex, "max_node_executions", loc, 1, 1000000).value_or(e.max_node_executions);
    }

    if (const Value* gates = member(*cfg, "gates")) {
        const std::string loc = "config.gates";
        if (auto action = read_enum(*gates, "on_fail", loc, {"warn", "fail", "block_deploy"})) {
            if (*action == "fail") global.gates.on_fail = GateAction::FAIL;
            else if (*action == "block_deploy") global.gates.on_fail = GateAction::BLOCK_DEPLOY;
            else global.gates.on_fail = GateAction::WARN;
        }
        if (const Value* list = member(*gates, "gates")) {
            if (!list->is_array()) {
                error("invalid_type", at(loc, "gates"), "expected a list");
            } else {
                for (size_t i = 0; i < list->size(); ++i) {
                    const std::string gloc = index_loc(at(loc, "gates"), i);
                    QualityGate gate;
                    gate.metric = read_string((*list)[i], "metric", gloc, true).value_or("");
                    gate.max = read_number((*list)[i], "max", gloc, -1e18, 1e18);
                    gate.min = read_number((*list)[i], "min", gloc, -1e18, 1e18);
                    if (!gate.max && !gate.min) {
                        error("invalid_gate", gloc, "gate needs 'max' and/or 'min'");
                    }
                    global.gates.gates.push_back(std::move(gate));
                }
            }
        }
    }

    if (const Value* obs = member(*cfg, "observability")) {
        if (const Value* logging = member(*obs, "logging")) {
            if (auto level = read_string(*logging, "level", "config.observability.logging", false)) {
                auto parsed = parse_log_level(*level);
                if (!parsed) {
                    error("invalid_enum", "config.observability.logging.level",
                          "'" + *level + "' is not one of: " + one_of(kLogLevels));
                } else {
                    global.observability.log_level = kLogLevels[static_cast<size_t>(*parsed)];
                }
            }
        }
    }
    return global;
}

} // anonymous namespace

bool ConfigParser::is_identifier(const std::string& s) {
    static const std::regex pattern("^[A-Za-z_][A-Za-z0-9_]*$");
    return std::regex_match(s, pattern);
}

Value ConfigParser::parse_text(const std::string& text) {
    Value doc;
    try {
        doc = parse_yaml_document(text);
    } catch (const YAML::Exception& e) {
        throw ConfigLoadError(std::string("cannot parse workflow document: ") + e.what());
    }
    if (!doc.is_object()) {
        throw ConfigLoadError("workflow document must be a mapping at the top level");
    }
    return doc;
}

Value ConfigParser::parse_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigLoadError("cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_text(buffer.str());
}

WorkflowConfig ConfigParser::build(const Value& document, std::vector<Violation>& violations) {
    WorkflowConfig config;
    StructureReader reader(violations);

    if (!document.is_object()) {
        reader.error("invalid_type", "", "workflow document must be a mapping");
        return config;
    }
    for (const auto& [key, _] : document.items()) {
        if (std::find(kTopLevelKeys.begin(), kTopLevelKeys.end(), key) == kTopLevelKeys.end()) {
            std::string hint = did_you_mean(key, kTopLevelKeys);
            log_warning("ignoring unknown top-level key '" + key + "'" + (hint.empty() ? "" : ". " + hint));
        }
    }

    if (const Value* v = reader.member(document, "schema_version")) {
        config.schema_version = v->is_string() ? v->get<std::string>() : v->dump();
    }
    config.flow = reader.read_flow(document);
    config.state = reader.read_state(document);
    config.nodes = reader.read_nodes(document);
    config.edges = reader.read_edges(document);
    config.config = reader.read_global(document);

    // Node-level loop blocks become that node's outgoing loop edge
    for (size_t i = 0; i < config.nodes.size(); ++i) {
        const NodeConfig& node = config.nodes[i];
        if (!node.loop) continue;
        const std::string loc = index_loc("nodes", i) + ".loop";
        auto clash = std::find_if(config.edges.begin(), config.edges.end(),
                                  [&](const EdgeConfig& e) { return e.from == node.id; });
        if (clash != config.edges.end()) {
            reader.error("conflicting_loop", loc, "node '" + node.id + "' declares a loop block and also has " +
                                                  clash->location + " as its outgoing edge",
                         "Move the loop into the edge or remove the edge");
            continue;
        }
        EdgeConfig edge;
        edge.from = node.id;
        edge.loop = node.loop;
        edge.location = loc;
        config.edges.push_back(std::move(edge));
    }
    return config;
}

} // namespace agentflow
