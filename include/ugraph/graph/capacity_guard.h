// graph/capacity_guard.h — Uniform range and capacity checks
// Part of the ugraph undirected graph library (C++20)
//
// Every indexed operation on a graph funnels its precondition checks
// through this header:
//
//   require_node(u, size(), "adjacency_graph::add_edge: source not in graph");
//   require_capacity(n, Cap::max_v, "adjacency_graph: n exceeds max_v");
//
// Node index violations throw std::out_of_range.  Capacity violations throw
// std::length_error.  Neither is ever clamped or ignored.

#ifndef UGRAPH_GRAPH_CAPACITY_GUARD_H
#define UGRAPH_GRAPH_CAPACITY_GUARD_H

#include <cstddef>
#include <stdexcept>

namespace ugraph::graph {

// =========================================================================
// Capacity check
// =========================================================================

/// Check that an actual count does not exceed the fixed capacity.
/// Throws std::length_error(msg) when it does.
constexpr void require_capacity(std::size_t actual,
                                std::size_t limit,
                                char const* msg)
{
    if (actual > limit) {
        throw std::length_error(msg);
    }
}

// =========================================================================
// Node index check
// =========================================================================

/// Check that a node index lies in [0, node_count).
/// Throws std::out_of_range(msg) when it does not.
constexpr void require_node(std::size_t index,
                            std::size_t node_count,
                            char const* msg)
{
    if (index >= node_count) {
        throw std::out_of_range(msg);
    }
}

} // namespace ugraph::graph

#endif // UGRAPH_GRAPH_CAPACITY_GUARD_H
