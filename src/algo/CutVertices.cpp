// ===============================================
// CutVertices.cpp
// Visitors over lowLinkSearch():
//   * articulation points + bridges
//   * biconnected components (edge stack)
// ===============================================

#include "algo/CutVertices.hpp"       // declarations
#include "algo/LowLink.hpp"           // lowLinkSearch
#include <set>                        // distinct node ids per component
#include <utility>                    // std::pair
#include <vector>                     // edge stack

namespace {

// ---------- articulation points and bridges ----------
struct CutCollector {
    ArticulationResult out;

    void treeEdge(Graph::Vertex, Graph::Vertex) {}
    void backEdge(Graph::Vertex, Graph::Vertex, bool) {}
    void childDone(Graph::Vertex u, Graph::Vertex v, bool separates, bool bridge) {
        if (separates) out.points.insert(u);            // u splits v's subtree off
        if (bridge) out.bridges.emplace_back(u, v);     // nothing in v's subtree climbs past u
    }
    void rootDone(Graph::Vertex) {}
};

// ---------- biconnected components ----------
struct BlockCollector {
    using Edge = std::pair<Graph::Vertex, Graph::Vertex>;

    std::vector<Edge> stack;                            // edges of the open blocks
    BiconnectedResult out;

    void treeEdge(Graph::Vertex u, Graph::Vertex v) { stack.emplace_back(u, v); }

    void backEdge(Graph::Vertex u, Graph::Vertex v, bool up) {
        if (up) stack.emplace_back(u, v);               // only the descendant side records it
    }

    void childDone(Graph::Vertex u, Graph::Vertex v, bool separates, bool) {
        if (!separates) return;
        std::set<Graph::Vertex> nodes;
        while (!stack.empty()) {                        // pop down to and including (u,v)
            Edge e = stack.back();
            stack.pop_back();
            nodes.insert(e.first);
            nodes.insert(e.second);
            if (e.first == u && e.second == v) break;
        }
        emit(nodes);
    }

    void rootDone(Graph::Vertex) {
        if (stack.empty()) return;
        std::set<Graph::Vertex> nodes;                  // leftovers of this DFS tree
        for (const Edge& e : stack) {
            nodes.insert(e.first);
            nodes.insert(e.second);
        }
        stack.clear();
        emit(nodes);
    }

    void emit(const std::set<Graph::Vertex>& nodes) {
        out.emplace_back(nodes.begin(), nodes.end());   // std::set is already ascending
    }
};

} // namespace

ArticulationResult articulationPoints(const Graph& g) {
    CutCollector c;
    lowLinkSearch(g, c);
    return c.out;
}

BiconnectedResult biconnectedComponents(const Graph& g) {
    BlockCollector c;
    lowLinkSearch(g, c);
    return c.out;
}
