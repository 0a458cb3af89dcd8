// modules/graph/execution_plan.h
#ifndef AGENTFLOW_MODULES_GRAPH_EXECUTION_PLAN_H
#define AGENTFLOW_MODULES_GRAPH_EXECUTION_PLAN_H

#include "core/types/config.h"
#include "core/types/context.h"
#include "modules/executor/node_executor.h"
#include "modules/state/state_record.h"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentflow {

struct RouteDescriptor {
    std::string condition;   // "default" for the unconditional fallback
    NodeId target;

    bool is_default() const { return condition == "default"; }
    bool operator==(const RouteDescriptor& other) const = default;
};

// One outgoing control-flow edge. Only the members of its kind are meaningful.
struct EdgeDescriptor {
    EdgeKind kind = EdgeKind::LINEAR;
    NodeId from;
    EdgeErrorPolicy on_error = EdgeErrorPolicy::FAIL;

    NodeId target;                        // LINEAR
    std::vector<RouteDescriptor> routes;  // CONDITIONAL, declaration order
    int max_iterations = 0;               // LOOP (body is `from`)
    std::string condition_field;
    NodeId exit_to;
    std::vector<NodeId> branches;         // FORK_JOIN, declaration order
    NodeId join;

    Value to_json() const;
    static EdgeDescriptor from_json(const Value& j);
    bool operator==(const EdgeDescriptor& other) const = default;
};

// Compiled, immutable form of a workflow. Produced by GraphCompiler only.
class ExecutionPlan {
public:
    const std::string& flow_name() const { return flow_name_; }
    const std::string& flow_version() const { return flow_version_; }
    const std::shared_ptr<const StateRecordType>& state_type() const { return state_type_; }
    const ExecutionConfig& execution() const { return execution_; }
    const GatesConfig& gates() const { return gates_; }

    bool has_node(const NodeId& id) const { return nodes_.count(id) > 0; }
    // Throws std::out_of_range for unknown ids.
    const NodeDescriptor& node(const NodeId& id) const;
    const EdgeDescriptor& edge_from(const NodeId& id) const;
    const std::vector<NodeId>& node_order() const { return node_order_; }
    const std::vector<EdgeDescriptor>& edges() const { return edges_; }

    // Stable JSON rendering of the node and edge descriptors.
    Value describe() const;

private:
    friend class GraphCompiler;

    std::string flow_name_;
    std::string flow_version_;
    std::shared_ptr<const StateRecordType> state_type_;
    ExecutionConfig execution_;
    GatesConfig gates_;
    std::vector<NodeId> node_order_;
    std::unordered_map<NodeId, NodeDescriptor> nodes_;
    std::vector<EdgeDescriptor> edges_;           // config order
    std::unordered_map<NodeId, size_t> edge_index_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_GRAPH_EXECUTION_PLAN_H
