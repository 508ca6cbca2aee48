// ==========================================================
// MaxFlow.cpp
// Edmonds–Karp over a residual map keyed by ordered node pairs.
// ==========================================================

#include "algo/MaxFlow.hpp"              // declaration
#include "graph/GraphErrors.hpp"         // NotApplicable, NodeNotFound, InvalidRequest
#include <algorithm>                     // std::min
#include <limits>                        // numeric_limits for the bottleneck seed
#include <map>                           // residual map
#include <queue>                         // BFS queue
#include <stdexcept>                     // std::overflow_error
#include <string>                        // error messages
#include <unordered_map>                 // BFS parent links
#include <utility>                       // std::pair keys

// residual[u][v] = remaining capacity on u->v (reverse "undo" entries included)
using Residual = std::map<Graph::Vertex, std::map<Graph::Vertex, Graph::Capacity>>;

// ---------- build the residual graph from the edge list ----------
static Residual build_residual(const Graph& g) {
    std::map<std::pair<Graph::Vertex, Graph::Vertex>, Graph::Capacity> cap;  // (from,to) -> capacity
    for (const auto& e : g.edges()) {
        cap[{e.from, e.to}] = e.capacity;                     // last write wins
    }

    Residual res;
    for (Graph::Vertex u : g.nodes()) res[u];                  // every node gets a row
    for (const auto& kv : cap) {
        res[kv.first.first][kv.first.second] = kv.second;       // forward capacity
    }
    for (const auto& kv : cap) {
        auto& back = res[kv.first.second];
        back.emplace(kv.first.first, 0);                        // reverse pair only if absent
    }
    return res;
}

// ---------- a + b for non-negative capacities, refusing to wrap ----------
static Graph::Capacity add_capacity(Graph::Capacity a, Graph::Capacity b) {
    if (a > std::numeric_limits<Graph::Capacity>::max() - b)
        throw std::overflow_error("max flow exceeds the capacity range");
    return a + b;
}

// ---------- BFS for a shortest augmenting path ----------
// Returns true and fills `parent` if sink is reachable over positive residuals.
static bool find_path(const Residual& res, Graph::Vertex s, Graph::Vertex t,
                      std::unordered_map<Graph::Vertex, Graph::Vertex>& parent) {
    parent.clear();
    parent[s] = s;                                             // source is its own parent
    std::queue<Graph::Vertex> q;
    q.push(s);

    while (!q.empty()) {
        Graph::Vertex u = q.front(); q.pop();
        if (u == t) return true;                               // reached sink
        auto row = res.find(u);
        if (row == res.end()) continue;
        for (const auto& nv : row->second) {                   // neighbors with residual
            if (nv.second <= 0 || parent.count(nv.first)) continue;
            parent[nv.first] = u;                              // record predecessor
            q.push(nv.first);
        }
    }
    return false;
}

MaxFlowResult maxFlow(const Graph& g, Graph::Vertex source, Graph::Vertex sink) {
    if (!g.directed())
        throw NotApplicable("max flow requires a directed graph");
    if (!g.hasNode(source))
        throw NodeNotFound("source node " + std::to_string(source) + " is not in the graph");
    if (!g.hasNode(sink))
        throw NodeNotFound("sink node " + std::to_string(sink) + " is not in the graph");
    if (source == sink)
        throw InvalidRequest("source and sink must be different nodes");

    Residual res = build_residual(g);
    std::unordered_map<Graph::Vertex, Graph::Vertex> parent;
    MaxFlowResult out;
    out.source = source;
    out.sink = sink;

    while (find_path(res, source, sink, parent)) {             // repeat while a path exists
        Graph::Capacity add = std::numeric_limits<Graph::Capacity>::max();
        for (Graph::Vertex v = sink; v != source; v = parent[v]) {  // walk back sink→source
            add = std::min(add, res[parent[v]][v]);            // bottleneck
        }
        for (Graph::Vertex v = sink; v != source; v = parent[v]) {
            Graph::Vertex u = parent[v];
            res[u][v] -= add;                                  // consume forward capacity
            res[v][u] = add_capacity(res[v][u], add);          // grow undo capacity
        }
        out.value = add_capacity(out.value, add);              // accumulate flow
    }
    return out;
}
