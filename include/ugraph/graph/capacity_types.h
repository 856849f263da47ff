// graph/capacity_types.h — Capacity policies for adjacency_graph
// Part of the ugraph undirected graph library (C++20)
//
// A capacity policy is a struct with two compile-time bounds:
//
//   max_v  largest node count adjacency_graph(n) accepts
//   max_e  largest number of distinct undirected edges the graph may hold
//
// Both bounds are enforced at runtime, through capacity_guard.h: the
// constructor rejects n > max_v, and add_edge rejects the edge that would
// push count_edges() past max_e.  Either way std::length_error is thrown
// and the graph is left as it was.
//
//   adjacency_graph<>             g(5000);   // cap::full_range
//   adjacency_graph<cap::small>   g2(10);    // at most 16 nodes, 64 edges
//   adjacency_graph<cap_from<8>>  g3(8);     // at most 8 nodes, 32 edges

#ifndef UGRAPH_GRAPH_CAPACITY_TYPES_H
#define UGRAPH_GRAPH_CAPACITY_TYPES_H

#include <concepts>
#include <cstddef>

namespace ugraph::graph {

/// Both bounds present, convertible to std::size_t, and positive.
template<typename C>
concept capacity_policy = requires {
    { C::max_v } -> std::convertible_to<std::size_t>;
    { C::max_e } -> std::convertible_to<std::size_t>;
} && (C::max_v > 0) && (C::max_e > 0);

namespace cap {

/// Whole node_id range.  max_e counts every pair plus every self-loop, so
/// the edge bound can never be the one that trips.
struct full_range {
    static constexpr std::size_t max_v = 65535;
    static constexpr std::size_t max_e = max_v * (max_v + 1) / 2;
};

/// Small fixed bounds for unit tests and examples.
struct tiny {
    static constexpr std::size_t max_v = 8;
    static constexpr std::size_t max_e = 24;
};

struct small {
    static constexpr std::size_t max_v = 16;
    static constexpr std::size_t max_e = 64;
};

} // namespace cap

/// Ad-hoc policy; the edge bound defaults to four edges per node.
template<std::size_t MaxV, std::size_t MaxE = 4 * MaxV>
struct cap_from {
    static constexpr std::size_t max_v = MaxV;
    static constexpr std::size_t max_e = MaxE;
};

} // namespace ugraph::graph

#endif // UGRAPH_GRAPH_CAPACITY_TYPES_H
