// graph/cycle_detection.h - Cycle test for undirected graphs
// Part of the ugraph undirected graph library (C++20)
//
// ALGORITHM: edge-consuming depth-first traversal on a working copy.
// Complexity: O(V + E) traversal steps, plus the cost of copying the graph
// and of removing every consumed edge from it.
//
// SEMANTICS: returns true iff the undirected graph has at least one cycle.
// A self-loop is a cycle.
//
// DESIGN RATIONALE:
// Before a node's neighbors are expanded, every edge incident to it is
// removed from the working copy.  A neighbor therefore never sees the edge
// back to the node that discovered it, and no parent-exclusion rule is
// needed: reaching an already-visited node can only happen through a
// second route, i.e. a cycle.  A self-loop shows up as current listing
// itself, and current is already visited.
//
// The copy is an owned value; the caller's graph is never touched.
// Which edge of a cycle triggers the early return depends on traversal
// order and is not part of the contract.

#ifndef UGRAPH_GRAPH_CYCLE_DETECTION_H
#define UGRAPH_GRAPH_CYCLE_DETECTION_H

#include "graph_concepts.h"

#include <cstddef>
#include <vector>

namespace ugraph::graph {

/// Cycle test via destructive traversal of a copy of g.
///
/// Example:
/// ```cpp
/// graph g(3);
/// g.add_edge(node_id{0}, node_id{1});
/// g.add_edge(node_id{1}, node_id{2});
/// assert(!has_cycle(g));
/// g.add_edge(node_id{2}, node_id{0});
/// assert(has_cycle(g));
/// ```
template<mutable_graph G>
[[nodiscard]] bool has_cycle(G const& g) {
    G work = g;
    auto const V = work.size();

    std::vector<bool> visited(V, false);
    std::vector<node_id> open;
    open.reserve(V);

    for (std::size_t root = 0; root < V; ++root) {
        if (visited[root]) continue;

        visited[root] = true;
        open.push_back(to_node(root));

        while (!open.empty()) {
            auto const current = open.back();
            open.pop_back();

            // Snapshot, then consume: current's edges are gone before any
            // neighbor is expanded.
            auto const nbrs = work.neighbors(current);
            work.remove_edges(current);

            for (auto const n : nbrs) {
                auto const idx = to_index(n);
                if (visited[idx]) {
                    return true;
                }
                visited[idx] = true;
                open.push_back(n);
            }
        }
        open.clear();
    }
    return false;
}

} // namespace ugraph::graph

#endif // UGRAPH_GRAPH_CYCLE_DETECTION_H
