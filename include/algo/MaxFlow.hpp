#pragma once
#include "graph/Graph.hpp"      // Graph
#include "algo/Results.hpp"     // MaxFlowResult

/**
 * @brief Maximum flow from `source` to `sink` by Edmonds–Karp.
 *
 * Capacities come from Graph::edges(); when the same (from,to) pair appears
 * more than once, the last capacity listed is used. Validation, in order:
 *   - undirected graph          -> NotApplicable
 *   - source or sink not a node -> NodeNotFound
 *   - source == sink            -> InvalidRequest
 * A sink that cannot be reached yields value 0. A flow value (or a residual
 * entry) that would exceed the Graph::Capacity range throws std::overflow_error.
 */
MaxFlowResult maxFlow(const Graph& g, Graph::Vertex source, Graph::Vertex sink);
