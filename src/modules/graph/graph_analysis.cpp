// modules/graph/graph_analysis.cpp
#include "modules/graph/graph_analysis.h"
#include <algorithm>
#include <deque>

namespace agentflow {

namespace {

void add_successor(Adjacency& adj, const NodeId& from, const NodeId& to) {
    auto& succ = adj[from];
    if (std::find(succ.begin(), succ.end(), to) == succ.end()) {
        succ.push_back(to);
    }
}

} // anonymous namespace

Adjacency build_adjacency(const std::vector<EdgeConfig>& edges) {
    Adjacency adj;
    for (const auto& edge : edges) {
        adj[edge.from];
        switch (edge.kind()) {
            case EdgeKind::LINEAR:
            case EdgeKind::FORK_JOIN:
                for (const auto& t : edge.to) add_successor(adj, edge.from, t);
                break;
            case EdgeKind::CONDITIONAL:
                for (const auto& r : edge.routes) add_successor(adj, edge.from, r.to);
                break;
            case EdgeKind::LOOP:
                add_successor(adj, edge.from, edge.from);
                add_successor(adj, edge.from, edge.loop->exit_to);
                break;
        }
    }
    return adj;
}

Adjacency reverse_adjacency(const Adjacency& forward) {
    Adjacency reverse;
    for (const auto& [from, succ] : forward) {
        reverse[from];
        for (const auto& to : succ) add_successor(reverse, to, from);
    }
    return reverse;
}

std::vector<NodeId> bfs_order(const Adjacency& adj, const NodeId& from) {
    std::vector<NodeId> order;
    std::unordered_set<NodeId> seen{from};
    std::deque<NodeId> queue{from};
    while (!queue.empty()) {
        NodeId current = queue.front();
        queue.pop_front();
        order.push_back(current);
        auto it = adj.find(current);
        if (it == adj.end()) continue;
        for (const auto& next : it->second) {
            if (seen.insert(next).second) queue.push_back(next);
        }
    }
    return order;
}

std::unordered_set<NodeId> reachable_from(const Adjacency& adj, const NodeId& from) {
    auto order = bfs_order(adj, from);
    return std::unordered_set<NodeId>(order.begin(), order.end());
}

std::optional<NodeId> find_join(const Adjacency& adj, const std::vector<NodeId>& branches) {
    if (branches.empty()) return std::nullopt;

    std::vector<std::unordered_set<NodeId>> reach;
    reach.reserve(branches.size());
    for (const auto& b : branches) reach.push_back(reachable_from(adj, b));

    std::vector<NodeId> candidates;
    for (const auto& node : bfs_order(adj, branches.front())) {
        if (std::find(branches.begin(), branches.end(), node) != branches.end()) continue;
        bool common = std::all_of(reach.begin(), reach.end(),
                                  [&](const auto& r) { return r.count(node) > 0; });
        if (common) candidates.push_back(node);
    }
    if (candidates.empty()) return std::nullopt;

    // Earliest candidate: every other candidate lies downstream of it
    for (const auto& c : candidates) {
        auto downstream = reachable_from(adj, c);
        bool dominates = std::all_of(candidates.begin(), candidates.end(),
                                     [&](const NodeId& other) { return downstream.count(other) > 0; });
        if (dominates) return c;
    }
    return candidates.front();
}

} // namespace agentflow
