// graph/graph_concepts.h - Descriptor types and graph concepts
// Part of the ugraph undirected graph library (C++20)
//
// DESIGN RATIONALE:
// node_id is an opaque handle over a dense index in [0, N).  Edges are
// never stored on their own: edge_pair is the canonical (lo, hi) view of
// an undirected adjacency, produced on demand by edges().
//
// Algorithms are written against concepts rather than adjacency_graph so
// that the cycle check and the spanning-tree builder stay free functions.
//
// DESIGN LIMIT: uint16_t constrains all graphs to <= 65,535 nodes.

#ifndef UGRAPH_GRAPH_CONCEPTS_H
#define UGRAPH_GRAPH_CONCEPTS_H

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace ugraph::graph {

// =============================================================================
// Descriptor types
// =============================================================================

/// Opaque node identifier.
struct node_id {
    std::uint16_t value{};

    friend constexpr bool operator==(node_id, node_id) = default;
    friend constexpr auto operator<=>(node_id, node_id) = default;
};

/// Convert node_id to index for array access.
[[nodiscard]] constexpr std::size_t to_index(node_id n) noexcept {
    return static_cast<std::size_t>(n.value);
}

/// Sentinel value for invalid/unassigned node references.
inline constexpr node_id invalid_node{std::uint16_t{0xFFFF}};

/// Convert a dense index to a node_id.
/// Throws std::out_of_range if the index collides with invalid_node or
/// does not fit in a uint16_t.
[[nodiscard]] constexpr node_id to_node(std::size_t index) {
    if (index >= to_index(invalid_node)) {
        throw std::out_of_range("to_node: index exceeds node_id range");
    }
    return node_id{static_cast<std::uint16_t>(index)};
}

/// Undirected edge in canonical form: lo <= hi.  A self-loop has lo == hi.
struct edge_pair {
    node_id lo;
    node_id hi;

    friend constexpr bool operator==(edge_pair, edge_pair) = default;
    friend constexpr auto operator<=>(edge_pair, edge_pair) = default;
};

/// Canonicalise {s, t} into (min, max).
[[nodiscard]] constexpr edge_pair make_edge(node_id s, node_id t) noexcept {
    return s < t ? edge_pair{s, t} : edge_pair{t, s};
}

/// Sorted, duplicate-free list of canonical edges.
using edge_list = std::vector<edge_pair>;

/// Ascending, duplicate-free neighbor set of one node.
using neighbor_set = std::vector<node_id>;

// =============================================================================
// Graph concepts
// =============================================================================

/// A graph_queryable provides adjacency queries.
///
/// Requirements:
/// - size(): number of nodes
/// - neighbors(u): neighbor set of u, iterable as node_id
/// - edges(): canonical edge list
template<typename G>
concept graph_queryable =
    requires(G const& g, node_id u) {
        { g.size() } -> std::convertible_to<std::size_t>;
        { g.neighbors(u) };
        { g.edges() } -> std::convertible_to<edge_list>;
    };

/// A mutable_graph can be copied, created empty with a given node count,
/// and edited edge by edge.  The cycle check consumes a copy of one; the
/// spanning-tree builder grows a fresh one.
template<typename G>
concept mutable_graph =
    graph_queryable<G> &&
    std::copy_constructible<G> &&
    std::constructible_from<G, std::size_t> &&
    requires(G& g, node_id u, node_id v) {
        g.add_edge(u, v);
        g.remove_edge(u, v);
        g.remove_edges(u);
    };

} // namespace ugraph::graph

#endif // UGRAPH_GRAPH_CONCEPTS_H
