// graph/graph.h — Umbrella header for the ugraph library
// Part of the ugraph undirected graph library (C++20)
//
// Single-include convenience header: representation, cycle detection and
// spanning-tree construction.
//
// Usage:
//   #include <ugraph/graph/graph.h>

#ifndef UGRAPH_GRAPH_GRAPH_H
#define UGRAPH_GRAPH_GRAPH_H

// --- Core types & concepts ---
#include "graph_concepts.h"
#include "capacity_types.h"
#include "capacity_guard.h"

// --- Representation ---
#include "adjacency_graph.h"

// --- Algorithms ---
#include "cycle_detection.h"
#include "spanning_tree.h"

#endif // UGRAPH_GRAPH_GRAPH_H
