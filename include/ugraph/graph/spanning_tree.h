// graph/spanning_tree.h - Randomized spanning tree / spanning forest
// Part of the ugraph undirected graph library (C++20)
//
// ALGORITHM: randomized greedy construction.
//   1. Collect the source's canonical edge list.
//   2. Shuffle it with the caller's random engine.
//   3. Starting from an empty graph of the same size, add each edge in
//      turn and take it back out again if the result became cyclic.
//
// The accept/reject decision for edge i depends on the graph left by
// edges 0..i-1, so the loop is strictly sequential.
//
// SEMANTICS:
// - The result is acyclic and a subgraph of the source.
// - Connected source with N nodes: exactly N-1 edges (a spanning tree).
// - Disconnected source: one spanning tree per component (a spanning
//   forest), N - components edges in total.
// - Self-loops are always rejected.
//
// The result is uniform over shuffle orders, NOT over spanning trees.
//
// Randomness is a parameter.  Passing a seeded engine makes the result
// reproducible; the one-argument overload seeds a std::mt19937 from
// std::random_device at the call site.

#ifndef UGRAPH_GRAPH_SPANNING_TREE_H
#define UGRAPH_GRAPH_SPANNING_TREE_H

#include "cycle_detection.h"
#include "graph_concepts.h"

#include <algorithm>
#include <random>

namespace ugraph::graph {

/// Spanning tree (or forest) of g, edge order drawn from rng.
///
/// Example:
/// ```cpp
/// std::mt19937 rng(42);
/// auto tree = make_spanning_tree(g, rng);
/// assert(tree.is_acyclic());
/// ```
template<mutable_graph G, std::uniform_random_bit_generator URBG>
[[nodiscard]] G make_spanning_tree(G const& g, URBG& rng) {
    G tree(g.size());

    auto order = g.edges();
    std::shuffle(order.begin(), order.end(), rng);

    for (auto const& e : order) {
        tree.add_edge(e.lo, e.hi);
        if (has_cycle(tree)) {
            tree.remove_edge(e.lo, e.hi);
        }
    }
    return tree;
}

/// Spanning tree (or forest) of g using a freshly seeded std::mt19937.
template<mutable_graph G>
[[nodiscard]] G make_spanning_tree(G const& g) {
    std::mt19937 rng(std::random_device{}());
    return make_spanning_tree(g, rng);
}

} // namespace ugraph::graph

#endif // UGRAPH_GRAPH_SPANNING_TREE_H
