#ifndef AGENTFLOW_TYPES_CONFIG_H
#define AGENTFLOW_TYPES_CONFIG_H

#include "context.h"
#include "field_type.h"
#include <optional>
#include <string>
#include <vector>

namespace agentflow {

// Parsed, immutable view of a workflow document. Built by ConfigParser.

struct FlowMetadata {
    std::string name;
    std::string description;
    std::string version;
};

struct StateFieldConfig {
    std::string name;
    std::string type_name;
    FieldType type;
    bool required = false;
    std::optional<Value> default_value;
    std::string description;
};

struct StateSchema {
    std::vector<StateFieldConfig> fields;

    const StateFieldConfig* find(const std::string& name) const;
};

struct OutputFieldConfig {
    std::string name;
    std::string type_name;
    FieldType type;
    std::string description;
};

struct OutputSchemaConfig {
    std::string type_name = "str";
    FieldType type;
    std::vector<OutputFieldConfig> fields; // object schemas only
    std::string description;
    bool declared = false;                 // false when derived from outputs

    bool is_object() const { return type.kind() == FieldKind::OBJECT; }
};

enum class ToolErrorPolicy {
    CONTINUE, // 错误作为观察结果回传给模型
    FAIL
};

struct ToolBinding {
    std::string name;
    ToolErrorPolicy on_error = ToolErrorPolicy::CONTINUE;
};

struct LlmConfig {
    std::optional<std::string> provider;
    std::optional<std::string> model;
    std::optional<double> temperature;
    std::optional<int> max_tokens;
    std::optional<std::string> api_base;

    // Field-wise override: values set here win over base.
    LlmConfig merged_over(const LlmConfig& base) const;
    Value to_json() const;
};

struct LoopConfig {
    int max_iterations = 10;
    std::string condition_field;
    std::string exit_to = END_NODE;
};

struct NodeConfig {
    NodeId id;
    std::string description;
    std::string prompt;
    std::vector<std::string> outputs;
    OutputSchemaConfig output_schema;
    std::vector<ToolBinding> tools;
    std::optional<LlmConfig> llm;
    std::optional<LoopConfig> loop; // shorthand for the node's outgoing loop edge
};

struct RouteConfig {
    std::string condition;
    NodeId to;

    bool is_default() const { return condition == "default"; }
};

enum class EdgeKind {
    LINEAR,
    CONDITIONAL,
    LOOP,
    FORK_JOIN
};

enum class EdgeErrorPolicy {
    FAIL,
    CONTINUE
};

struct EdgeConfig {
    NodeId from;
    std::vector<NodeId> to;          // one entry (linear) or >= 2 (fork-join)
    bool to_is_list = false;
    std::vector<RouteConfig> routes;
    std::optional<LoopConfig> loop;
    EdgeErrorPolicy on_error = EdgeErrorPolicy::FAIL;
    std::string location;            // "edges[3]" or "nodes[1].loop"

    EdgeKind kind() const;
};

struct ExecutionConfig {
    double timeout_sec = 120.0;
    int max_retries = 2;
    int max_tool_iterations = 10;
    int max_llm_calls = -1;          // -1 表示无限制
    int max_node_executions = 1000;
};

enum class GateAction {
    WARN,
    FAIL,
    BLOCK_DEPLOY
};

struct QualityGate {
    std::string metric;
    std::optional<double> max;
    std::optional<double> min;
};

struct GatesConfig {
    std::vector<QualityGate> gates;
    GateAction on_fail = GateAction::WARN;
};

struct ObservabilityConfig {
    std::string log_level = "INFO";
};

struct GlobalConfig {
    LlmConfig llm;
    ExecutionConfig execution;
    GatesConfig gates;
    ObservabilityConfig observability;
};

struct WorkflowConfig {
    std::string schema_version = "1.0";
    FlowMetadata flow;
    StateSchema state;
    std::vector<NodeConfig> nodes;
    std::vector<EdgeConfig> edges;
    GlobalConfig config;

    const NodeConfig* find_node(const NodeId& id) const;
};

std::string to_string(EdgeKind kind);
std::string to_string(GateAction action);

} // namespace agentflow

#endif // AGENTFLOW_TYPES_CONFIG_H
