#ifndef AGENTFLOW_TYPES_RESULT_H
#define AGENTFLOW_TYPES_RESULT_H

#include "context.h"
#include <optional>
#include <string>
#include <vector>

namespace agentflow {

struct NodeMetrics {
    long long duration_ms = 0;
    int input_tokens = 0;
    int output_tokens = 0;
    int llm_calls = 0;
    int tool_calls = 0;
    int tool_iterations = 0;
    int retries = 0;          // structured-output re-invocations
    double cost_usd = 0.0;

    int total_tokens() const { return input_tokens + output_tokens; }
    Value to_json() const;
};

// 节点输出：仅包含节点声明的输出字段
struct NodeResult {
    NodeId node_id;
    Value delta = Value::object();
    NodeMetrics metrics;
};

struct RunMetrics {
    long long duration_ms = 0;
    int input_tokens = 0;
    int output_tokens = 0;
    int llm_calls = 0;
    int tool_calls = 0;
    int retries = 0;
    int node_executions = 0;
    double cost_usd = 0.0;

    void add(const NodeMetrics& node);
    int total_tokens() const { return input_tokens + output_tokens; }
    // Flat metric-name -> number document, the input of quality gates.
    Value to_json() const;
};

enum class RunStatus {
    COMPLETED,
    FAILED
};

enum class RunPhase {
    LOADED,
    VALIDATED,
    STATE_INITIALIZED,
    RUNNING,
    COMPLETED,
    FAILED
};

struct RunError {
    std::string code;
    std::string message;
    std::optional<NodeId> node_id;
    Value details = Value::object();

    Value to_json() const;
};

struct GateResult {
    std::string metric;
    bool passed = true;
    std::optional<double> actual;
    std::optional<double> min;
    std::optional<double> max;
    std::string message;

    Value to_json() const;
};

struct LoopReport {
    NodeId node_id;
    int iterations = 0;
    bool cap_hit = false;
};

// 运行结果；由 RunOrchestrator 创建一次，之后不再修改
struct RunOutcome {
    std::string run_id;
    RunStatus status = RunStatus::FAILED;
    RunPhase phase = RunPhase::LOADED;   // last phase reached
    Value state = Value::object();       // terminal (or partial) state
    RunMetrics metrics;
    std::optional<RunError> error;
    std::vector<RunError> node_errors;   // recorded non-fatal node failures
    std::vector<NodeResult> node_results;
    std::vector<LoopReport> loops;
    std::vector<GateResult> gate_results;
    bool deploy_blocked = false;

    bool succeeded() const { return status == RunStatus::COMPLETED; }
    bool loop_cap_hit(const NodeId& node_id) const;
    Value to_json() const;
};

std::string to_string(RunStatus status);
std::string to_string(RunPhase phase);

} // namespace agentflow

#endif // AGENTFLOW_TYPES_RESULT_H
