#pragma once
#include "graph/Graph.hpp"      // Graph
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Per-run parameters; which fields matter depends on the algorithm.
struct AlgorithmQuery {
    std::optional<Graph::Vertex> start;    // BFS/DFS start (absent = cover the whole graph)
    std::optional<Graph::Vertex> source;   // MAXFLOW source
    std::optional<Graph::Vertex> sink;     // MAXFLOW sink
};

// Strategy interface all algorithms implement.
// run() returns one human-readable result line; engine errors propagate.
struct IGraphAlgorithm {
    virtual ~IGraphAlgorithm() = default;
    virtual std::string run(const Graph& g, const AlgorithmQuery& q) = 0;
};

// Factory that returns a concrete strategy by name
// Accepts: "BFS", "DFS", "COMPONENTS", "ARTICULATION", "BICONNECTED",
//          "SCC", "MAXFLOW" (case-insensitive)
struct AlgorithmFactory {
    static std::unique_ptr<IGraphAlgorithm> create(const std::string& name);
    static std::vector<std::string> names();
};
