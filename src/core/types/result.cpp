// core/types/result.cpp
#include "core/types/result.h"

namespace agentflow {

Value NodeMetrics::to_json() const {
    return Value{
        {"duration_ms", duration_ms},
        {"input_tokens", input_tokens},
        {"output_tokens", output_tokens},
        {"total_tokens", total_tokens()},
        {"llm_calls", llm_calls},
        {"tool_calls", tool_calls},
        {"tool_iterations", tool_iterations},
        {"retries", retries},
        {"cost_usd", cost_usd}
    };
}

void RunMetrics::add(const NodeMetrics& node) {
    input_tokens += node.input_tokens;
    output_tokens += node.output_tokens;
    llm_calls += node.llm_calls;
    tool_calls += node.tool_calls;
    retries += node.retries;
    cost_usd += node.cost_usd;
}

Value RunMetrics::to_json() const {
    return Value{
        {"duration_ms", duration_ms},
        {"input_tokens", input_tokens},
        {"output_tokens", output_tokens},
        {"total_tokens", total_tokens()},
        {"llm_calls", llm_calls},
        {"tool_calls", tool_calls},
        {"retries", retries},
        {"node_executions", node_executions},
        {"cost_usd", cost_usd}
    };
}

Value RunError::to_json() const {
    Value j = {{"code", code}, {"message", message}};
    if (node_id) j["node_id"] = *node_id;
    if (!details.empty()) j["details"] = details;
    return j;
}

Value GateResult::to_json() const {
    Value j = {{"metric", metric}, {"passed", passed}, {"message", message}};
    j["actual"] = actual ? Value(*actual) : Value(nullptr);
    if (min) j["min"] = *min;
    if (max) j["max"] = *max;
    return j;
}

bool RunOutcome::loop_cap_hit(const NodeId& node_id) const {
    for (const auto& l : loops) {
        if (l.node_id == node_id && l.cap_hit) return true;
    }
    return false;
}

Value RunOutcome::to_json() const {
    Value j;
    j["run_id"] = run_id;
    j["status"] = to_string(status);
    j["phase"] = to_string(phase);
    j["state"] = state;
    j["metrics"] = metrics.to_json();
    j["error"] = error ? error->to_json() : Value(nullptr);

    j["node_errors"] = Value::array();
    for (const auto& e : node_errors) j["node_errors"].push_back(e.to_json());

    j["nodes"] = Value::array();
    for (const auto& r : node_results) {
        j["nodes"].push_back({{"node_id", r.node_id}, {"metrics", r.metrics.to_json()}});
    }

    j["loops"] = Value::array();
    for (const auto& l : loops) {
        j["loops"].push_back({{"node_id", l.node_id}, {"iterations", l.iterations}, {"cap_hit", l.cap_hit}});
    }

    j["gates"] = Value::array();
    for (const auto& g : gate_results) j["gates"].push_back(g.to_json());
    j["deploy_blocked"] = deploy_blocked;
    return j;
}

std::string to_string(RunStatus status) {
    return status == RunStatus::COMPLETED ? "completed" : "failed";
}

std::string to_string(RunPhase phase) {
    switch (phase) {
        case RunPhase::LOADED: return "loaded";
        case RunPhase::VALIDATED: return "validated";
        case RunPhase::STATE_INITIALIZED: return "state_initialized";
        case RunPhase::RUNNING: return "running";
        case RunPhase::COMPLETED: return "completed";
        case RunPhase::FAILED: return "failed";
    }
    return "unknown";
}

} // namespace agentflow
