#pragma once
#include "graph/Graph.hpp"      // Graph
#include "algo/Results.hpp"     // ArticulationResult, BiconnectedResult

// Articulation points and bridges of an undirected graph.
// Adjacency is read as an undirected relation; on a directed graph the
// result describes the stored arcs only. Points are ascending; bridges are
// listed in the order the DFS proves them.
ArticulationResult articulationPoints(const Graph& g);

// Biconnected components via the edge-stack variant of the same search.
// Every non-loop edge lies in exactly one component; isolated nodes and
// self-loops belong to none. Each component is sorted ascending.
BiconnectedResult biconnectedComponents(const Graph& g);
