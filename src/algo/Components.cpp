// ===============================================
// Components.cpp
// Reachability partitions of a graph:
//   * connected components (BFS per seed)
//   * strongly connected components (Kosaraju, two iterative DFS passes)
// ===============================================

#include "algo/Components.hpp"        // declarations
#include "graph/GraphErrors.hpp"      // NotApplicable
#include <algorithm>                  // std::sort
#include <queue>                      // BFS queue
#include <unordered_set>              // visited sets over sparse ids
#include <vector>                     // std::vector

// =====================================================
// 1) Connected components
// =====================================================
ComponentList connectedComponents(const Graph& g) {
    std::unordered_set<Graph::Vertex> seen;                 // discovered nodes
    ComponentList comps;                                    // output

    for (Graph::Vertex seed : g.nodes()) {                  // ascending seeds
        if (seen.count(seed)) continue;                     // already in a component

        Component comp;                                     // nodes of this component
        std::queue<Graph::Vertex> q;
        seen.insert(seed);
        q.push(seed);
        while (!q.empty()) {
            Graph::Vertex u = q.front(); q.pop();
            comp.push_back(u);
            for (Graph::Vertex v : g.neighbors(u)) {
                if (seen.insert(v).second) q.push(v);       // confine to undiscovered
            }
        }

        std::sort(comp.begin(), comp.end());
        comps.push_back(std::move(comp));
    }
    return comps;
}

// ================================================
// 2) Strongly connected components (Kosaraju)
// ================================================

// First pass: post-order finishing sequence over g, iterative.
// A node is appended to `order` once all of its neighbors are exhausted.
static void finish_order(const Graph& g, Graph::Vertex root,
                         std::unordered_set<Graph::Vertex>& seen,
                         std::vector<Graph::Vertex>& order) {
    struct Frame { Graph::Vertex node; std::size_t next; };
    std::vector<Frame> st;
    seen.insert(root);
    st.push_back({root, 0});

    while (!st.empty()) {
        Frame& f = st.back();
        const auto& adj = g.neighbors(f.node);
        if (f.next < adj.size()) {
            Graph::Vertex v = adj[f.next++];
            if (seen.insert(v).second) st.push_back({v, 0});  // descend into new node
            continue;
        }
        order.push_back(f.node);                              // post-order completion
        st.pop_back();
    }
}

// Second pass: everything reachable from root in the transpose that no
// earlier component has claimed.
static Component collect(const Graph& tr, Graph::Vertex root,
                         std::unordered_set<Graph::Vertex>& seen) {
    Component comp;
    std::vector<Graph::Vertex> st{root};
    seen.insert(root);
    while (!st.empty()) {
        Graph::Vertex u = st.back(); st.pop_back();
        comp.push_back(u);
        for (Graph::Vertex v : tr.neighbors(u)) {
            if (seen.insert(v).second) st.push_back(v);
        }
    }
    std::sort(comp.begin(), comp.end());
    return comp;
}

SCCResult stronglyConnectedComponents(const Graph& g) {
    if (!g.directed())
        throw NotApplicable("strongly connected components require a directed graph");

    std::unordered_set<Graph::Vertex> seen;                 // visited flags for first pass
    std::vector<Graph::Vertex> order;                       // finishing stack
    order.reserve(g.n());

    for (Graph::Vertex u : g.nodes())                       // every unvisited node, ascending
        if (!seen.count(u)) finish_order(g, u, seen, order);

    Graph tr = g.reversed();                                // transpose for second pass
    seen.clear();                                           // reset visited flags
    SCCResult sccs;

    for (auto it = order.rbegin(); it != order.rend(); ++it) { // pop finishing stack
        if (!seen.count(*it)) sccs.push_back(collect(tr, *it, seen));
    }
    return sccs;
}
