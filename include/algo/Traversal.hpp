#pragma once                              // ensure this header is included only once per translation unit
#include "graph/Graph.hpp"                // Graph
#include "algo/Results.hpp"               // TraversalStep
#include <vector>                         // step sequences

/**
 * @brief Breadth-first and depth-first traversals that record every step.
 *
 * A step is emitted when its node is marked visited, and carries a snapshot of
 * the visited set at that moment, so snapshot sizes grow by exactly one per
 * step. Neighbors that are not nodes of the graph are visited but have no
 * outgoing edges. Each call computes a fresh sequence.
 */

// Order in which traverseAll() explores each start.
enum class TraversalOrder { BreadthFirst, DepthFirst };

// BFS from `start` (FIFO frontier). Throws NodeNotFound if `start` is not a node.
std::vector<TraversalStep> breadthFirst(const Graph& g, Graph::Vertex start);

// Pre-order DFS from `start` in adjacency order. Throws NodeNotFound if `start` is not a node.
std::vector<TraversalStep> depthFirst(const Graph& g, Graph::Vertex start);

// Cover the whole graph: start from every still-unvisited node in ascending id
// order, sharing one visited set, and concatenate the steps. Every node
// appears exactly once.
std::vector<TraversalStep> traverseAll(const Graph& g, TraversalOrder order);
