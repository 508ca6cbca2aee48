#pragma once
#include "graph/Graph.hpp"      // Graph
#include "algo/Results.hpp"     // ComponentList, SCCResult

// Connected components: BFS from each still-undiscovered node in ascending id
// order. Each component is sorted ascending; components appear in seed order.
// On a directed graph adjacency is followed only in stored direction.
ComponentList connectedComponents(const Graph& g);

// Kosaraju's strongly connected components (directed graphs only).
// Throws NotApplicable on an undirected graph. Each component is sorted
// ascending; components appear in the order the transpose pass finds them.
SCCResult stronglyConnectedComponents(const Graph& g);
