// tests/graph/test_spanning_tree.cc
// Tests for graph/spanning_tree.h — randomized spanning tree / forest.

#include "ugraph/graph/adjacency_graph.h"
#include "ugraph/graph/spanning_tree.h"
#include "component_count.h"
#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <random>
#include <set>

using namespace ugraph::graph;
using ugraph::graph::testing::component_count;

namespace {

node_id n(std::size_t i) { return to_node(i); }

graph make_complete(std::size_t count) {
    graph g(count);
    for (std::size_t s = 0; s < count; ++s) {
        for (std::size_t t = s + 1; t < count; ++t) {
            g.add_edge(n(s), n(t));
        }
    }
    return g;
}

graph make_grid(std::size_t rows, std::size_t cols) {
    graph g(rows * cols);
    for (std::size_t r = 0; r < rows; ++r) {
        for (std::size_t c = 0; c < cols; ++c) {
            auto const u = r * cols + c;
            if (c + 1 < cols) g.add_edge(n(u), n(u + 1));
            if (r + 1 < rows) g.add_edge(n(u), n(u + cols));
        }
    }
    return g;
}

bool is_subgraph(graph const& sub, graph const& super) {
    auto const a = sub.edges();
    auto const b = super.edges();
    return sub.size() == super.size() &&
           std::includes(b.begin(), b.end(), a.begin(), a.end());
}

} // namespace

// =============================================================================
// Connected sources: spanning tree
// =============================================================================

TEST(SpanningTree, Triangle) {
    graph g(3);
    g.add_edge(n(0), n(1));
    g.add_edge(n(1), n(2));
    g.add_edge(n(2), n(0));

    std::mt19937 rng(42);
    auto const tree = make_spanning_tree(g, rng);

    EXPECT_EQ(tree.size(), 3u);
    EXPECT_EQ(tree.count_edges(), 2u);
    EXPECT_TRUE(tree.is_acyclic());
    EXPECT_TRUE(is_subgraph(tree, g));
    EXPECT_EQ(component_count(tree), 1u);
}

TEST(SpanningTree, CompleteGraphManySeeds) {
    auto const g = make_complete(7);
    ASSERT_EQ(g.count_edges(), 21u);

    for (std::uint32_t seed = 0; seed < 50; ++seed) {
        std::mt19937 rng(seed);
        auto const tree = make_spanning_tree(g, rng);
        EXPECT_EQ(tree.count_edges(), 6u) << "seed=" << seed;
        EXPECT_TRUE(tree.is_acyclic()) << "seed=" << seed;
        EXPECT_TRUE(is_subgraph(tree, g)) << "seed=" << seed;
        EXPECT_EQ(component_count(tree), 1u) << "seed=" << seed;
    }
}

TEST(SpanningTree, Grid) {
    auto const g = make_grid(5, 6);
    ASSERT_EQ(component_count(g), 1u);

    std::mt19937 rng(7);
    auto const tree = make_spanning_tree(g, rng);

    EXPECT_EQ(tree.count_edges(), 29u);
    EXPECT_TRUE(tree.is_acyclic());
    EXPECT_TRUE(is_subgraph(tree, g));
}

TEST(SpanningTree, TreeSourceIsReturnedWhole) {
    graph g(6);
    g.add_edge(n(0), n(1));
    g.add_edge(n(0), n(2));
    g.add_edge(n(2), n(3));
    g.add_edge(n(2), n(4));
    g.add_edge(n(4), n(5));

    std::mt19937 rng(3);
    EXPECT_EQ(make_spanning_tree(g, rng), g);
}

TEST(SpanningTree, SelfLoopsNeverKept) {
    graph g(4);
    for (std::size_t i = 0; i < 4; ++i) {
        g.add_edge(n(i), n(i));
    }
    g.add_edge(n(0), n(1));
    g.add_edge(n(1), n(2));
    g.add_edge(n(2), n(3));
    g.add_edge(n(3), n(0));

    for (std::uint32_t seed = 0; seed < 20; ++seed) {
        std::mt19937 rng(seed);
        auto const tree = make_spanning_tree(g, rng);
        EXPECT_EQ(tree.count_edges(), 3u);
        for (auto const& e : tree.edges()) {
            EXPECT_NE(e.lo, e.hi) << "seed=" << seed;
        }
    }
}

// =============================================================================
// Disconnected sources: spanning forest
// =============================================================================

TEST(SpanningTree, ForestOfComponents) {
    // Triangle {0,1,2}, square with chord {3,4,5,6}, isolated 7,
    // self-loop on isolated 8.
    graph g(9);
    g.add_edge(n(0), n(1));
    g.add_edge(n(1), n(2));
    g.add_edge(n(2), n(0));
    g.add_edge(n(3), n(4));
    g.add_edge(n(4), n(5));
    g.add_edge(n(5), n(6));
    g.add_edge(n(6), n(3));
    g.add_edge(n(3), n(5));
    g.add_edge(n(8), n(8));
    ASSERT_EQ(component_count(g), 4u);

    for (std::uint32_t seed = 0; seed < 20; ++seed) {
        std::mt19937 rng(seed);
        auto const forest = make_spanning_tree(g, rng);
        EXPECT_TRUE(forest.is_acyclic());
        EXPECT_TRUE(is_subgraph(forest, g));
        EXPECT_EQ(forest.count_edges(), g.size() - component_count(g));
        EXPECT_EQ(component_count(forest), component_count(g));
    }
}

TEST(SpanningTree, NoEdges) {
    graph g(5);
    std::mt19937 rng(1);
    auto const forest = make_spanning_tree(g, rng);
    EXPECT_EQ(forest, graph(5));
}

// =============================================================================
// Degenerate sizes
// =============================================================================

TEST(SpanningTree, ZeroNodes) {
    graph g(0);
    std::mt19937 rng(1);
    auto const tree = make_spanning_tree(g, rng);
    EXPECT_EQ(tree.size(), 0u);
    EXPECT_EQ(tree.count_edges(), 0u);
}

TEST(SpanningTree, SingleNode) {
    graph g(1);
    g.add_edge(n(0), n(0));
    std::mt19937 rng(1);
    auto const tree = make_spanning_tree(g, rng);
    EXPECT_EQ(tree.size(), 1u);
    EXPECT_EQ(tree.count_edges(), 0u);
}

// =============================================================================
// Purity, reproducibility, randomness
// =============================================================================

TEST(SpanningTree, SourceUnchanged) {
    auto g = make_complete(5);
    auto const before = g;
    std::mt19937 rng(11);
    (void)make_spanning_tree(g, rng);
    EXPECT_EQ(g, before);
}

TEST(SpanningTree, SameSeedSameTree) {
    auto const g = make_grid(4, 4);
    std::mt19937 a(2024);
    std::mt19937 b(2024);
    EXPECT_EQ(make_spanning_tree(g, a), make_spanning_tree(g, b));
}

TEST(SpanningTree, SeedsChooseDifferentTrees) {
    auto const g = make_complete(5);
    std::set<edge_list> seen;
    for (std::uint32_t seed = 0; seed < 50; ++seed) {
        std::mt19937 rng(seed);
        seen.insert(make_spanning_tree(g, rng).edges());
    }
    // K5 has 125 spanning trees; 50 shuffles landing on one is not plausible.
    EXPECT_GT(seen.size(), 1u);
}

TEST(SpanningTree, DefaultEngine) {
    auto const g = make_grid(3, 3);
    auto const tree = make_spanning_tree(g);
    EXPECT_EQ(tree.count_edges(), 8u);
    EXPECT_TRUE(tree.is_acyclic());
    EXPECT_TRUE(is_subgraph(tree, g));
}

TEST(SpanningTree, KeepsCapacityPolicy) {
    adjacency_graph<cap::small> g(4);
    g.add_edge(n(0), n(1));
    g.add_edge(n(1), n(2));
    g.add_edge(n(2), n(3));
    g.add_edge(n(3), n(0));

    std::minstd_rand rng(5);
    adjacency_graph<cap::small> const tree = make_spanning_tree(g, rng);
    EXPECT_EQ(tree.count_edges(), 3u);
}
