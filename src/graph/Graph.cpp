// ==========================
// Graph.cpp
// ==========================
// This file implements the out-of-line methods of the Graph class.
// Specifically: neighbors(), nodes(), m(), reversed(), and label().
// All other methods are inline in Graph.hpp.
// ==========================

#include "graph/Graph.hpp"   // include the Graph class declaration
#include <algorithm>         // std::count for self-loops in m()
#include <sstream>           // used for building strings in label()

// --------------------------
// neighbors
// --------------------------
// Purpose:
//   Look up the neighbor list of u.
//   A node that is not a key (a dangling reference) has no outgoing edges,
//   so an empty list is returned instead of throwing.
const std::vector<Graph::Vertex>& Graph::neighbors(Vertex u) const {
    static const std::vector<Vertex> kNone;   // shared empty list for absent nodes
    auto it = m_adj.find(u);                  // locate the key
    return it == m_adj.end() ? kNone : it->second;
}

// --------------------------
// nodes
// --------------------------
// Returns:
//   Every key of the adjacency mapping, ascending (std::map order).
std::vector<Graph::Vertex> Graph::nodes() const {
    std::vector<Vertex> out;                  // result buffer
    out.reserve(m_adj.size());                // one slot per key
    for (const auto& kv : m_adj) out.push_back(kv.first);
    return out;
}

// --------------------------
// m
// --------------------------
// Purpose:
//   Count logical edges from the adjacency lists.
//   - Directed: one per arc.
//   - Undirected: each edge is stored from both sides, except a
//     self-loop which is stored once.
std::size_t Graph::m() const {
    std::size_t arcs = 0, loops = 0;          // arc total and self-loop total
    for (const auto& kv : m_adj) {
        arcs += kv.second.size();
        loops += static_cast<std::size_t>(
            std::count(kv.second.begin(), kv.second.end(), kv.first));
    }
    if (directed()) return arcs;
    return (arcs - loops) / 2 + loops;
}

// --------------------------
// reversed
// --------------------------
// Purpose:
//   Build and return a new graph with reversed arcs.
//   - For directed graphs: every arc u->v becomes v->u.
//   - For undirected graphs: adjacency is symmetric, so just copy.
//   Every node of the original (and every dangling neighbor) is a key
//   of the result, so the transpose never has dangling references.
// Returns:
//   A new Graph object with reversed adjacency and reversed capacity entries.
Graph Graph::reversed() const {
    Graph rev(m_kind, m_opts);              // same kind and settings

    if (directed()) {                       // if graph is directed
        for (const auto& kv : m_adj) rev.addNode(kv.first);
        for (const auto& kv : m_adj) {      // iterate over all nodes
            for (Vertex v : kv.second) {    // iterate over adjacency of u
                rev.addNode(v);             // dangling heads become keys
                rev.m_adj[v].push_back(kv.first); // insert v->u
            }
        }
        for (const auto& e : m_edges) {     // flip capacity entries too
            rev.m_edges.push_back(FlowEdge{e.to, e.from, e.capacity});
        }
    } else {
        // For undirected graphs, reversing has no effect
        rev.m_adj = m_adj;                  // copy adjacency as-is
        rev.m_edges = m_edges;              // and the capacity list
    }

    return rev;                             // return the reversed/copy graph
}

// --------------------------
// label
// --------------------------
// Format:
//   "DirectedGraph(VV,EE)" or "UndirectedGraph(VV,EE)"
//   where VV = number of nodes, EE = number of logical edges.
std::string Graph::label() const {
    std::ostringstream oss;                         // create a string stream
    oss << (directed() ? "Directed" : "Undirected");// write graph type
    oss << "Graph(" << n() << "V," << m() << "E)";  // add node and edge counts
    return oss.str();                               // return composed string
}
