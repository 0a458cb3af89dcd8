// modules/scheduler/run_orchestrator.h
#ifndef AGENTFLOW_MODULES_SCHEDULER_RUN_ORCHESTRATOR_H
#define AGENTFLOW_MODULES_SCHEDULER_RUN_ORCHESTRATOR_H

#include "common/llm/cost_estimator.h"
#include "common/llm/llm_client.h"
#include "common/tools/registry.h"
#include "core/types/budget.h"
#include "core/types/config.h"
#include "core/types/result.h"
#include "modules/graph/execution_plan.h"
#include "modules/scheduler/run_collaborators.h"
#include "modules/state/state_record.h"
#include <string>
#include <unordered_map>
#include <vector>

namespace agentflow {

struct RunOrchestratorCollaborators {
    RunRepository* repository = nullptr;
    ObservabilityTracker* tracker = nullptr;
};

// 顶层驱动：Loaded -> Validated -> StateInitialized -> Running -> {Completed | Failed}
// run() never lets an exception escape; every failure becomes RunOutcome{FAILED}.
class RunOrchestrator {
public:
    using Collaborators = RunOrchestratorCollaborators;

    RunOrchestrator(LlmClient& llm, const ToolInvoker& tools, Collaborators collaborators = {});

    RunOutcome run(const Value& document, const Value& inputs);
    // For configs already through ConfigParser::build; business rules are re-checked.
    RunOutcome run(const WorkflowConfig& config, const Value& inputs);

    void set_cost_estimator(CostEstimator costs) { costs_ = std::move(costs); }

private:
    // Per-branch traversal state. Branch scopes start as copies of the pre-fork scope.
    struct Scope {
        StateRecord state;
        Value pending = Value::object();   // deltas applied since the scope began
        std::unordered_map<NodeId, int> loop_counters;
        std::vector<NodeResult> results;
        std::vector<RunError> node_errors;
        std::vector<LoopReport> loops;
    };

    struct RunContext;

    RunOutcome execute(const WorkflowConfig& config, const Value& inputs, RunOutcome outcome,
                       std::chrono::steady_clock::time_point started);

    // Walks edges from `from` until END or stop_at is reached; returns where it stopped.
    NodeId drive(RunContext& ctx, Scope& scope, NodeId from, const NodeId& stop_at);
    void execute_node(RunContext& ctx, Scope& scope, const NodeId& node_id);
    NodeId select_route(RunContext& ctx, const EdgeDescriptor& edge, const Scope& scope);
    NodeId route_loop(const EdgeDescriptor& edge, Scope& scope);
    void run_fork(RunContext& ctx, Scope& scope, const EdgeDescriptor& edge);

    static void merge_pending(Value& pending, const Value& delta, const StateRecordType& type);

    LlmClient& llm_;
    const ToolInvoker& tools_;
    Collaborators collaborators_;
    CostEstimator costs_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_SCHEDULER_RUN_ORCHESTRATOR_H
