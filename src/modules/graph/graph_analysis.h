// modules/graph/graph_analysis.h
#ifndef AGENTFLOW_MODULES_GRAPH_GRAPH_ANALYSIS_H
#define AGENTFLOW_MODULES_GRAPH_GRAPH_ANALYSIS_H

#include "core/types/config.h"
#include "core/types/context.h"
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace agentflow {

// Successor lists over node ids (START and END included), in declaration order.
// A loop edge contributes both its self-edge and exit_to.
using Adjacency = std::unordered_map<NodeId, std::vector<NodeId>>;

Adjacency build_adjacency(const std::vector<EdgeConfig>& edges);
Adjacency reverse_adjacency(const Adjacency& forward);

// Breadth-first visit order starting at (and including) from.
std::vector<NodeId> bfs_order(const Adjacency& adj, const NodeId& from);
std::unordered_set<NodeId> reachable_from(const Adjacency& adj, const NodeId& from);

// Join point of a fork: the earliest node reachable from every branch that is
// not itself a branch. END qualifies when nothing earlier does.
std::optional<NodeId> find_join(const Adjacency& adj, const std::vector<NodeId>& branches);

} // namespace agentflow

#endif // AGENTFLOW_MODULES_GRAPH_GRAPH_ANALYSIS_H
