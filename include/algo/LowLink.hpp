#pragma once
#include "graph/Graph.hpp"   // Graph
#include <algorithm>         // std::min
#include <cstddef>           // std::size_t
#include <unordered_map>     // disc/low over sparse ids
#include <vector>            // explicit DFS stack

// ==========================
// Tarjan discovery-time / low-link search
// ==========================
// Iterative DFS from every undiscovered node in ascending id order, keeping
// disc[] and low[] per node. Shared by the cut-vertex and biconnected
// analyses; each supplies a visitor with these hooks:
//
//   void treeEdge(Vertex u, Vertex v);            // v discovered from u
//   void backEdge(Vertex u, Vertex v, bool up);   // v already discovered; up == (disc[v] < disc[u])
//   void childDone(Vertex u, Vertex v, bool separates, bool bridge);
//   void rootDone(Vertex root);                   // DFS tree of root complete
//
// `separates` is the articulation condition for u at the moment child v
// finishes: u is a root with more than one DFS child, or u is not a root and
// low[v] >= disc[u]. `bridge` is low[v] > disc[u].
//
// Exactly one adjacency entry of a node that names its DFS parent is skipped
// (the mirror of the tree edge). Any further parallel edge to the parent is
// treated as a back edge.
// ==========================

template <typename Visitor>
void lowLinkSearch(const Graph& g, Visitor& vis) {
    using Vertex = Graph::Vertex;

    struct Frame {
        Vertex node;            // node being expanded
        std::size_t next;       // index of the next neighbor to examine
        bool hasParent;         // false for the DFS root
        Vertex parent;          // DFS parent (valid when hasParent)
        bool parentSkipped;     // the tree-edge mirror has been consumed
        std::size_t children;   // DFS children discovered so far
    };

    std::unordered_map<Vertex, std::size_t> disc, low;
    std::size_t time = 0;

    for (Vertex root : g.nodes()) {
        if (disc.count(root)) continue;

        std::vector<Frame> st;
        disc[root] = low[root] = time++;
        st.push_back(Frame{root, 0, false, root, false, 0});

        while (!st.empty()) {
            Frame& f = st.back();
            const Vertex u = f.node;
            const auto& adj = g.neighbors(u);

            if (f.next < adj.size()) {
                const Vertex v = adj[f.next++];
                if (f.hasParent && !f.parentSkipped && v == f.parent) {
                    f.parentSkipped = true;
                    continue;
                }
                auto it = disc.find(v);
                if (it == disc.end()) {
                    ++f.children;
                    vis.treeEdge(u, v);
                    disc[v] = low[v] = time++;
                    st.push_back(Frame{v, 0, true, u, false, 0});  // f is invalid from here on
                } else {
                    const std::size_t dv = it->second;
                    low[u] = std::min(low[u], dv);
                    vis.backEdge(u, v, dv < disc[u]);
                }
                continue;
            }

            // u exhausted: finalize it against its parent
            st.pop_back();
            if (st.empty()) {
                vis.rootDone(u);
                break;
            }
            const Frame& up = st.back();
            const Vertex p = up.node;
            low[p] = std::min(low[p], low[u]);
            const bool separates = up.hasParent ? low[u] >= disc[p] : up.children > 1;
            const bool bridge = low[u] > disc[p];
            vis.childDone(p, u, separates, bridge);
        }
    }
}
