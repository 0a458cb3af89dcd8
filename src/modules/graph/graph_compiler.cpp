// modules/graph/graph_compiler.cpp
#include "modules/graph/graph_compiler.h"
#include "common/utils/log.h"
#include "core/types/errors.h"
#include "modules/graph/graph_analysis.h"

namespace agentflow {

GraphCompiler::GraphCompiler(const ToolInvoker* tools) : tools_(tools) {}

NodeDescriptor GraphCompiler::compile_node(const NodeConfig& node, const WorkflowConfig& config,
                                           const StateRecordType& state_type) const {
    NodeDescriptor d;
    d.id = node.id;
    d.prompt = node.prompt;
    d.outputs = node.outputs;
    d.contract = OutputContract::build(node, state_type);
    d.tools = node.tools;
    d.llm = node.llm ? node.llm->merged_over(config.config.llm) : config.config.llm;
    d.max_tool_iterations = config.config.execution.max_tool_iterations;
    d.max_retries = config.config.execution.max_retries;

    for (const auto& binding : node.tools) {
        std::optional<ToolSpec> spec = tools_ ? tools_->spec(binding.name) : std::nullopt;
        if (!spec) {
            spec = ToolSpec{binding.name, "", Value::object()};
        }
        d.tool_specs.push_back(std::move(*spec));
    }
    return d;
}

ExecutionPlan GraphCompiler::compile(const WorkflowConfig& config,
                                     std::shared_ptr<const StateRecordType> state_type) const {
    ExecutionPlan plan;
    plan.flow_name_ = config.flow.name;
    plan.flow_version_ = config.flow.version;
    plan.execution_ = config.config.execution;
    plan.gates_ = config.config.gates;

    for (const auto& node : config.nodes) {
        plan.node_order_.push_back(node.id);
        plan.nodes_.emplace(node.id, compile_node(node, config, *state_type));
    }
    plan.state_type_ = std::move(state_type);

    const Adjacency adj = build_adjacency(config.edges);

    for (const auto& edge : config.edges) {
        if (plan.edge_index_.count(edge.from)) {
            throw ControlFlowError(edge.location + ": second outgoing edge for '" + edge.from + "'");
        }

        EdgeDescriptor e;
        e.kind = edge.kind();
        e.from = edge.from;
        e.on_error = edge.on_error;

        switch (e.kind) {
            case EdgeKind::LINEAR:
                e.target = edge.to.front();
                break;
            case EdgeKind::CONDITIONAL:
                for (const auto& r : edge.routes) {
                    e.routes.push_back({r.condition, r.to});
                }
                break;
            case EdgeKind::LOOP:
                e.max_iterations = edge.loop->max_iterations;
                e.condition_field = edge.loop->condition_field;
                e.exit_to = edge.loop->exit_to;
                break;
            case EdgeKind::FORK_JOIN: {
                e.branches = edge.to;
                auto join = find_join(adj, edge.to);
                if (!join) {
                    throw ControlFlowError(edge.location + ": fork branches never rejoin");
                }
                e.join = *join;
                log_debug("fork at '" + edge.from + "' joins at '" + e.join + "'");
                break;
            }
        }

        plan.edge_index_[e.from] = plan.edges_.size();
        plan.edges_.push_back(std::move(e));
    }

    if (!plan.edge_index_.count(START_NODE)) {
        throw ControlFlowError("no edge leaves START");
    }
    for (const auto& id : plan.node_order_) {
        if (!plan.edge_index_.count(id)) {
            throw ControlFlowError("node '" + id + "' has no outgoing edge");
        }
    }
    return plan;
}

} // namespace agentflow
