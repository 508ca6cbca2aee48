#pragma once
#include "graph/Graph.hpp"   // Graph::Vertex, Graph::Capacity
#include <set>               // std::set for snapshots and point sets
#include <utility>           // std::pair for bridges
#include <vector>            // std::vector

// ==========================
// Analysis result values
// ==========================
// Plain values returned by the analyses. None of them refers back to the
// Graph they were computed from, so they outlive it freely.
// ==========================

// One unit of a traversal: the node just marked, plus an owned copy of
// everything marked so far (including `node`).
struct TraversalStep {
    Graph::Vertex node;
    std::set<Graph::Vertex> visitedSoFar;
};

inline bool operator==(const TraversalStep& a, const TraversalStep& b) {
    return a.node == b.node && a.visitedSoFar == b.visitedSoFar;
}
inline bool operator!=(const TraversalStep& a, const TraversalStep& b) { return !(a == b); }

using Component      = std::vector<Graph::Vertex>;   // node ids, ascending
using ComponentList  = std::vector<Component>;       // connected components
using BiconnectedResult = std::vector<Component>;    // biconnected components
using SCCResult      = std::vector<Component>;       // strongly connected components
using Bridge         = std::pair<Graph::Vertex, Graph::Vertex>;

struct ArticulationResult {
    std::set<Graph::Vertex> points;   // cut vertices, ascending
    std::vector<Bridge> bridges;      // cut edges (u,v) in discovery order
};

inline bool operator==(const ArticulationResult& a, const ArticulationResult& b) {
    return a.points == b.points && a.bridges == b.bridges;
}
inline bool operator!=(const ArticulationResult& a, const ArticulationResult& b) { return !(a == b); }

struct MaxFlowResult {
    Graph::Capacity value = 0;        // total flow, never negative
    Graph::Vertex source = 0;
    Graph::Vertex sink = 0;
};

inline bool operator==(const MaxFlowResult& a, const MaxFlowResult& b) {
    return a.value == b.value && a.source == b.source && a.sink == b.sink;
}
inline bool operator!=(const MaxFlowResult& a, const MaxFlowResult& b) { return !(a == b); }
