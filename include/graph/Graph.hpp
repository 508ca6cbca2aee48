#pragma once                              // ensure this header is included only once per translation unit

#include <map>           // ordered adjacency map (stable ascending node order)
#include <vector>        // used for adjacency lists and the edge list
#include <cstddef>       // defines std::size_t type
#include <stdexcept>     // defines exceptions like invalid_argument
#include <algorithm>     // used for std::any_of and std::find
#include <string>        // used for std::string in label()

// ==========================
// Analysis graph
// ==========================
// This class supports:
// - Directed and undirected graphs over sparse integer node ids
// - An adjacency mapping read by every traversal-based analysis
// - A separate capacity edge list read only by max-flow
// - reversed() builder (for SCC)
// - Optional guards against self-loops and multi-edges
// The graph is filled once by its builder and then only read by analyses.
// ==========================

class Graph {
public:
    // Enumeration to specify whether the graph is Undirected or Directed
    enum class Kind { Undirected, Directed };

    // Options to control behavior for self-loops and multi-edges.
    // Both are allowed by default: analyses must cope with them.
    // addEdge() and addArc() apply them; addFlowEdge() does not.
    struct Options {
        bool allowSelfLoops  = true;  // if false, edges u->u are forbidden
        bool allowMultiEdges = true;  // if false, parallel edges are dropped
    };

    // Type aliases for readability
    using Vertex   = long long;               // node id (sparse, may be negative)
    using Capacity = long long;               // edge capacity for max-flow

    // One entry of the capacity edge list
    struct FlowEdge {
        Vertex from;                          // tail of the arc
        Vertex to;                            // head of the arc
        Capacity capacity;                    // positive capacity, default 1
    };

    // ---- Constructors ----

    // Primary constructor taking explicit Options
    Graph(Kind kind, Options opts)
        : m_kind(kind), m_opts(opts) {}

    // Convenience constructor: uses default Options{}
    explicit Graph(Kind kind = Kind::Undirected)
        : m_kind(kind), m_opts(Options{}) {}

    // ---- Public API ----

    // Return the number of nodes (adjacency keys)
    std::size_t n() const noexcept { return m_adj.size(); }

    // Return whether the graph is Undirected or Directed
    Kind kind() const noexcept { return m_kind; }

    // Convenience: return true if the graph is Directed
    bool directed() const noexcept { return m_kind == Kind::Directed; }

    // Return the number of logical edges (an undirected edge counts once)
    std::size_t m() const;

    // Return true if `u` is a key of the adjacency mapping
    bool hasNode(Vertex u) const { return m_adj.count(u) != 0; }

    // Neighbors of `u` in insertion order; empty if `u` is not a node
    const std::vector<Vertex>& neighbors(Vertex u) const;

    // All node ids in ascending order
    std::vector<Vertex> nodes() const;

    // Capacity edge list in insertion order
    const std::vector<FlowEdge>& edges() const noexcept { return m_edges; }

    // Ensure `u` exists as a node (possibly with no neighbors)
    void addNode(Vertex u) { m_adj[u]; }

    // Append `v` to the neighbor list of `u` only, under the same Options
    // guards as addEdge(). `v` is not registered as a node; builders that
    // want it call addNode().
    void addArc(Vertex u, Vertex v) {
        if (!m_opts.allowSelfLoops && u == v) {
            throw std::invalid_argument("self-loops are disabled in this graph");
        }
        auto& lst = m_adj[u];
        if (!m_opts.allowMultiEdges &&
            std::find(lst.begin(), lst.end(), v) != lst.end()) return;
        lst.push_back(v);
    }

    // Append a capacity entry without touching adjacency
    void addFlowEdge(Vertex u, Vertex v, Capacity c = 1) {
        if (c <= 0) {
            throw std::invalid_argument("edge capacity must be positive");
        }
        m_edges.push_back(FlowEdge{u, v, c});
    }

    // Add edge u->v with capacity c (default = 1).
    // Registers both endpoints, mirrors the arc for undirected graphs,
    // and records the matching capacity entries.
    void addEdge(Vertex u, Vertex v, Capacity c = 1) {
        if (!m_opts.allowSelfLoops && u == v) {
            throw std::invalid_argument("self-loops are disabled in this graph");
        }
        if (c <= 0) {
            throw std::invalid_argument("edge capacity must be positive");
        }

        if (!m_opts.allowMultiEdges) {
            if (hasArc(u, v)) return;
            if (!directed() && hasArc(v, u)) return;
        }

        addNode(u);
        addNode(v);
        m_adj[u].push_back(v);
        m_edges.push_back(FlowEdge{u, v, c});

        if (!directed() && u != v) {          // a loop is listed once
            m_adj[v].push_back(u);
            m_edges.push_back(FlowEdge{v, u, c});
        }
    }

    // Return true if arc u->v exists
    bool hasArc(Vertex u, Vertex v) const {
        const auto& lst = neighbors(u);
        return std::any_of(lst.begin(), lst.end(),
                           [v](Vertex w){ return w == v; });
    }

    // Build and return the transpose graph (implemented in Graph.cpp)
    Graph reversed() const;

    // Return a human-readable summary of the graph (implemented in Graph.cpp)
    std::string label() const;

private:
    Kind m_kind;                               // directed or undirected
    Options m_opts;                            // options (loops, multi-edges)
    std::map<Vertex, std::vector<Vertex>> m_adj; // adjacency mapping
    std::vector<FlowEdge> m_edges;             // capacity edge list
}; // end class Graph
