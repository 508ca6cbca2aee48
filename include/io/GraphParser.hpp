#pragma once
#include "graph/Graph.hpp"      // Graph
#include <string>               // std::string

// Build a Graph from text.
//
// adjacency: one "node: n1 n2 ..." per line (blank lines ignored). Directed:
//            a later line for the same node replaces its list. Undirected:
//            lists are sets, each edge is stored once per endpoint no matter
//            which side lists it (parallel edges cannot be written). Every id
//            mentioned becomes a node.
// edges:     directed graphs only (non-blank text for an undirected graph is an
//            error); one "from to [capacity]" per line. The arc
//            must exist in the adjacency; capacity defaults to 1. When empty,
//            each adjacency arc becomes a capacity-1 edge.
//
// Returns false and sets `err` on malformed input; `out` is only assigned on
// success.
bool parseGraph(const std::string& adjacency, Graph::Kind kind,
                const std::string& edges, Graph& out, std::string& err);
