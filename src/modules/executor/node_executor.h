// modules/executor/node_executor.h
#ifndef AGENTFLOW_MODULES_EXECUTOR_NODE_EXECUTOR_H
#define AGENTFLOW_MODULES_EXECUTOR_NODE_EXECUTOR_H

#include "common/llm/cost_estimator.h"
#include "common/llm/llm_client.h"
#include "common/tools/registry.h"
#include "core/types/budget.h"
#include "core/types/config.h"
#include "core/types/result.h"
#include "modules/schema/output_schema.h"
#include "modules/state/state_record.h"
#include <string>
#include <vector>

namespace agentflow {

// Everything needed to run one node; built by GraphCompiler, never mutated.
struct NodeDescriptor {
    NodeId id;
    std::string prompt;
    std::vector<std::string> outputs;
    OutputContract contract;
    std::vector<ToolBinding> tools;
    std::vector<ToolSpec> tool_specs;  // same order as tools
    LlmConfig llm;                     // node override merged over global settings
    int max_tool_iterations = 10;
    int max_retries = 2;

    const ToolBinding* find_tool(const std::string& name) const;
};

inline constexpr const char* kCorrectionPrompt =
    "Previous attempt failed validation. Please ensure the response matches the required schema exactly.";

// Stateless handler: execute(snapshot) -> NodeResult. Safe to call from
// several branch threads at once as long as the LlmClient is.
class NodeExecutor {
public:
    NodeExecutor(LlmClient& llm, const ToolInvoker& tools, const CostEstimator& costs);

    // Throws TemplateError, ToolExecutionError (on_error: fail), OutputValidationError,
    // NodeExecutionError, TimeoutError or RunCancelledError.
    NodeResult execute(const NodeDescriptor& node, const StateRecord& snapshot, ExecutionBudget& budget) const;

private:
    // Phase A: bounded request / execute / feed-back cycle.
    void run_tool_loop(const NodeDescriptor& node, LlmRequest& request,
                       NodeMetrics& metrics, ExecutionBudget& budget) const;
    // Phase B: schema-constrained call with correction retries.
    Value extract_structured(const NodeDescriptor& node, LlmRequest& request,
                             NodeMetrics& metrics, ExecutionBudget& budget) const;

    ChatMessage call_tool(const NodeDescriptor& node, const ToolCall& call,
                          NodeMetrics& metrics, ExecutionBudget& budget) const;
    // Runs the tool on its own thread and waits while the budget allows.
    Value run_tool(const NodeDescriptor& node, const ToolCall& call, ExecutionBudget& budget) const;
    void before_llm_call(const NodeDescriptor& node, ExecutionBudget& budget) const;
    void account(const NodeDescriptor& node, const TokenUsage& usage, NodeMetrics& metrics) const;

    LlmClient& llm_;
    const ToolInvoker& tools_;
    const CostEstimator& costs_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_EXECUTOR_NODE_EXECUTOR_H
