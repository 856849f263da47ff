// graph/adjacency_graph.h - Mutable undirected adjacency graph
// Part of the ugraph undirected graph library (C++20)
//
// DESIGN RATIONALE:
// The node set is fixed at construction; only edges change.  Each node
// owns a sorted, duplicate-free vector of neighbor ids, so membership is a
// binary search and iteration order is deterministic.  add_edge(u, v)
// writes both records, which keeps adjacency symmetric by construction.
// A self-loop (u, u) is recorded once in u's own record.
//
// Cap::max_v bounds the node count accepted at construction and
// Cap::max_e bounds the number of distinct undirected edges.  The running
// edge count is kept in step with the records, so count_edges() is O(1).
//
// Every indexed operation validates its node ids through capacity_guard.h
// and throws std::out_of_range on a miss.
//
// Cycle testing delegates to has_cycle() (cycle_detection.h), which works
// on a value copy: is_cyclic() is const in fact as well as in signature.

#ifndef UGRAPH_GRAPH_ADJACENCY_GRAPH_H
#define UGRAPH_GRAPH_ADJACENCY_GRAPH_H

#include "capacity_guard.h"
#include "capacity_types.h"
#include "cycle_detection.h"
#include "graph_concepts.h"

#include <algorithm>
#include <cstddef>
#include <vector>

namespace ugraph::graph {

// =============================================================================
// adjacency_graph<Cap>
// =============================================================================

/// Undirected graph over a fixed set of nodes [0, N) with mutable edges.
///
/// Template parameter:
/// - Cap: a capacity_policy bounding node and edge counts.
///
/// Example:
/// ```cpp
/// adjacency_graph<cap::small> g(4);
/// g.add_edge(node_id{0}, node_id{1});
/// g.add_edge(node_id{1}, node_id{2});
/// assert(g.count_edges() == 2);
/// assert(g.is_acyclic());
/// ```
template<capacity_policy Cap = cap::full_range>
class adjacency_graph {
    static constexpr std::size_t MaxV = Cap::max_v;
    static constexpr std::size_t MaxE = Cap::max_e;

    static_assert(MaxV <= 65535,
        "adjacency_graph: Cap::max_v exceeds uint16_t range (65535)");
public:
    using capacity_type = Cap;

    static constexpr std::size_t max_vertices = MaxV;
    static constexpr std::size_t max_edges = MaxE;

    adjacency_graph() = default;

    /// n isolated nodes.  Throws std::length_error if n > Cap::max_v.
    explicit adjacency_graph(std::size_t n) {
        require_capacity(n, MaxV, "adjacency_graph: node count exceeds max_v");
        adj_.resize(n);
    }

    // =========================================================================
    // Size queries
    // =========================================================================

    [[nodiscard]] std::size_t size() const noexcept { return adj_.size(); }
    [[nodiscard]] bool empty() const noexcept { return adj_.empty(); }

    /// Number of distinct undirected edges, self-loops included.
    [[nodiscard]] std::size_t count_edges() const noexcept { return E_; }

    // =========================================================================
    // Adjacency access
    // =========================================================================

    /// Copy of u's neighbor set, ascending.
    [[nodiscard]] neighbor_set neighbors(node_id u) const {
        require_node(to_index(u), size(),
            "adjacency_graph::neighbors: node not in graph");
        return adj_[to_index(u)];
    }

    [[nodiscard]] std::size_t degree(node_id u) const {
        require_node(to_index(u), size(),
            "adjacency_graph::degree: node not in graph");
        return adj_[to_index(u)].size();
    }

    [[nodiscard]] bool adjacent(node_id s, node_id t) const {
        require_node(to_index(s), size(),
            "adjacency_graph::adjacent: source not in graph");
        require_node(to_index(t), size(),
            "adjacency_graph::adjacent: target not in graph");
        auto const& rec = adj_[to_index(s)];
        return std::binary_search(rec.begin(), rec.end(), t);
    }

    /// All distinct edges in canonical (lo, hi) form, sorted.
    /// Each edge is stored once per endpoint; only the lo side emits it.
    [[nodiscard]] edge_list edges() const {
        edge_list out;
        out.reserve(E_);
        for (std::size_t u = 0; u < adj_.size(); ++u) {
            auto const un = to_node(u);
            for (auto const v : adj_[u]) {
                if (v < un) continue;
                out.push_back(make_edge(un, v));
            }
        }
        return out;
    }

    // =========================================================================
    // Mutation
    // =========================================================================

    /// Insert the undirected edge {s, t}.  No-op if already present.
    /// Throws std::length_error if a new edge would exceed Cap::max_e.
    void add_edge(node_id s, node_id t) {
        require_node(to_index(s), size(),
            "adjacency_graph::add_edge: source not in graph");
        require_node(to_index(t), size(),
            "adjacency_graph::add_edge: target not in graph");

        auto& rec = adj_[to_index(s)];
        auto const it = std::lower_bound(rec.begin(), rec.end(), t);
        if (it != rec.end() && *it == t) return;

        require_capacity(E_ + 1, MaxE,
            "adjacency_graph::add_edge: edge count exceeds max_e");

        // Grow both records first: once both have room, the inserts below
        // cannot throw, so a failed allocation never leaves a one-sided edge.
        auto const pos = it - rec.begin();
        reserve_one(rec);
        if (s != t) {
            reserve_one(adj_[to_index(t)]);
        }

        rec.insert(rec.begin() + pos, t);
        if (s != t) {
            insert_sorted(adj_[to_index(t)], s);
        }
        ++E_;
    }

    /// Remove the undirected edge {s, t}.  No-op if absent.
    void remove_edge(node_id s, node_id t) {
        require_node(to_index(s), size(),
            "adjacency_graph::remove_edge: source not in graph");
        require_node(to_index(t), size(),
            "adjacency_graph::remove_edge: target not in graph");

        if (!erase_sorted(adj_[to_index(s)], t)) return;
        if (s != t) {
            erase_sorted(adj_[to_index(t)], s);
        }
        --E_;
    }

    /// Remove every edge incident to u, leaving it isolated.
    void remove_edges(node_id u) {
        require_node(to_index(u), size(),
            "adjacency_graph::remove_edges: node not in graph");
        // remove_edge edits adj_[u]; iterate a snapshot.
        auto const snapshot = adj_[to_index(u)];
        for (auto const v : snapshot) {
            remove_edge(u, v);
        }
    }

    // =========================================================================
    // Cycle queries
    // =========================================================================

    [[nodiscard]] bool is_cyclic() const { return has_cycle(*this); }
    [[nodiscard]] bool is_acyclic() const { return !is_cyclic(); }

    friend bool operator==(adjacency_graph const&, adjacency_graph const&) = default;

private:
    static void reserve_one(neighbor_set& rec) {
        if (rec.size() == rec.capacity()) {
            rec.reserve(rec.empty() ? 4 : 2 * rec.size());
        }
    }

    static void insert_sorted(neighbor_set& rec, node_id v) {
        auto const it = std::lower_bound(rec.begin(), rec.end(), v);
        if (it == rec.end() || *it != v) {
            rec.insert(it, v);
        }
    }

    static bool erase_sorted(neighbor_set& rec, node_id v) {
        auto const it = std::lower_bound(rec.begin(), rec.end(), v);
        if (it == rec.end() || *it != v) return false;
        rec.erase(it);
        return true;
    }

    std::vector<neighbor_set> adj_;
    std::size_t E_ = 0;
};

// Verify concept satisfaction.
static_assert(graph_queryable<adjacency_graph<cap_from<8, 16>>>);
static_assert(mutable_graph<adjacency_graph<cap_from<8, 16>>>);

/// Default undirected graph: accepts any node count up to the node_id limit.
using graph = adjacency_graph<>;

} // namespace ugraph::graph

#endif // UGRAPH_GRAPH_ADJACENCY_GRAPH_H
