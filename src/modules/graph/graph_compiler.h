// modules/graph/graph_compiler.h
#ifndef AGENTFLOW_MODULES_GRAPH_GRAPH_COMPILER_H
#define AGENTFLOW_MODULES_GRAPH_GRAPH_COMPILER_H

#include "common/tools/registry.h"
#include "core/types/config.h"
#include "modules/graph/execution_plan.h"
#include "modules/state/state_record.h"
#include <memory>

namespace agentflow {

// Turns a validated WorkflowConfig into an ExecutionPlan. Pure: no I/O, no model calls.
class GraphCompiler {
public:
    // tools may be null; tool specs then carry only the tool names.
    explicit GraphCompiler(const ToolInvoker* tools = nullptr);

    // Throws ControlFlowError when the config violates a graph invariant that
    // validation should have caught (missing edge, fork without join).
    ExecutionPlan compile(const WorkflowConfig& config,
                          std::shared_ptr<const StateRecordType> state_type) const;

private:
    NodeDescriptor compile_node(const NodeConfig& node, const WorkflowConfig& config,
                                const StateRecordType& state_type) const;

    const ToolInvoker* tools_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_GRAPH_GRAPH_COMPILER_H
