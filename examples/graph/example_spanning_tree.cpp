// examples/graph/example_spanning_tree.cpp — Random spanning tree of a grid
//
// Draw a random spanning tree over a small rectangular mesh, e.g. to pick
// a cable layout that reaches every junction without redundant runs:
// - The mesh itself is full of cycles
// - The spanning tree keeps rows*cols - 1 of its edges and no cycle
// - Dropping a junction's links splits the tree into a forest
//
// Compile:
//   g++ -std=c++20 -O2 -I include -o example_spanning_tree examples/graph/example_spanning_tree.cpp

#include <ugraph/graph/adjacency_graph.h>
#include <ugraph/graph/spanning_tree.h>
#include <cstddef>
#include <iostream>
#include <random>

using namespace ugraph::graph;

constexpr std::size_t rows = 4;
constexpr std::size_t cols = 5;

graph make_mesh() {
    graph g(rows * cols);
    for (std::size_t r = 0; r < rows; ++r) {
        for (std::size_t c = 0; c < cols; ++c) {
            auto const u = r * cols + c;
            if (c + 1 < cols) g.add_edge(to_node(u), to_node(u + 1));
            if (r + 1 < rows) g.add_edge(to_node(u), to_node(u + cols));
        }
    }
    return g;
}

void print_edges(graph const& g) {
    for (auto const& e : g.edges()) {
        std::cout << "    " << to_index(e.lo) << " -- " << to_index(e.hi) << '\n';
    }
}

int main() {
    auto const mesh = make_mesh();
    std::cout << "Mesh: " << mesh.size() << " junctions, "
              << mesh.count_edges() << " links, "
              << (mesh.is_cyclic() ? "cyclic" : "acyclic") << '\n';

    std::mt19937 rng(42);
    auto tree = make_spanning_tree(mesh, rng);
    std::cout << "Spanning tree (seed 42): " << tree.count_edges() << " links, "
              << (tree.is_cyclic() ? "cyclic" : "acyclic") << '\n';
    print_edges(tree);

    // Cut junction 7 out of the layout.
    tree.remove_edges(to_node(7));
    std::cout << "After isolating junction 7: " << tree.count_edges()
              << " links remain\n";

    return 0;
}
