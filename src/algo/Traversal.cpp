#include "algo/Traversal.hpp"             // declarations
#include "graph/GraphErrors.hpp"          // NodeNotFound
#include <cstddef>                        // std::size_t
#include <queue>                          // FIFO frontier for BFS
#include <set>                            // visited set
#include <string>                         // error message

// -----------------------------
// Helper: throw NodeNotFound unless `start` is a node of g
// -----------------------------
static void require_node(const Graph& g, Graph::Vertex start) {
    if (!g.hasNode(start))
        throw NodeNotFound("start node " + std::to_string(start) + " is not in the graph");
}

// -----------------------------
// Helper: mark u and emit its step with a copy of the visited set
// -----------------------------
static void mark(Graph::Vertex u, std::set<Graph::Vertex>& visited,
                 std::vector<TraversalStep>& steps) {
    visited.insert(u);                                        // mark
    steps.push_back(TraversalStep{u, visited});               // emit snapshot (copy)
}

// -----------------------------
// BFS over nodes not yet in `visited`; appends to `steps`.
// Nodes are marked when enqueued, so emission order equals dequeue order.
// -----------------------------
static void bfs_from(const Graph& g, Graph::Vertex start,
                     std::set<Graph::Vertex>& visited,
                     std::vector<TraversalStep>& steps) {
    std::queue<Graph::Vertex> q;                              // frontier
    mark(start, visited, steps);                              // seed with start
    q.push(start);

    while (!q.empty()) {                                      // until frontier drains
        Graph::Vertex u = q.front(); q.pop();                 // next node
        for (Graph::Vertex v : g.neighbors(u)) {              // adjacency order
            if (visited.count(v)) continue;                   // already marked
            mark(v, visited, steps);                          // mark on discovery
            q.push(v);
        }
    }
}

// -----------------------------
// Pre-order DFS with an explicit stack of (node, next neighbor index) frames.
// Produces the same order as the recursive mark-emit-descend formulation.
// -----------------------------
static void dfs_from(const Graph& g, Graph::Vertex start,
                     std::set<Graph::Vertex>& visited,
                     std::vector<TraversalStep>& steps) {
    struct Frame { Graph::Vertex node; std::size_t next; };
    std::vector<Frame> st;                                    // work stack
    mark(start, visited, steps);
    st.push_back({start, 0});

    while (!st.empty()) {
        Frame& f = st.back();                                 // current frame
        const auto& adj = g.neighbors(f.node);
        if (f.next == adj.size()) { st.pop_back(); continue; } // exhausted → backtrack
        Graph::Vertex v = adj[f.next++];                      // advance iterator first
        if (visited.count(v)) continue;                       // skip marked neighbors
        mark(v, visited, steps);                              // pre-order emit
        st.push_back({v, 0});                                 // descend
    }
}

std::vector<TraversalStep> breadthFirst(const Graph& g, Graph::Vertex start) {
    require_node(g, start);
    std::set<Graph::Vertex> visited;
    std::vector<TraversalStep> steps;
    bfs_from(g, start, visited, steps);
    return steps;
}

std::vector<TraversalStep> depthFirst(const Graph& g, Graph::Vertex start) {
    require_node(g, start);
    std::set<Graph::Vertex> visited;
    std::vector<TraversalStep> steps;
    dfs_from(g, start, visited, steps);
    return steps;
}

std::vector<TraversalStep> traverseAll(const Graph& g, TraversalOrder order) {
    std::set<Graph::Vertex> visited;                          // shared across starts
    std::vector<TraversalStep> steps;
    for (Graph::Vertex s : g.nodes()) {                       // ascending ids
        if (visited.count(s)) continue;                       // covered by an earlier start
        if (order == TraversalOrder::BreadthFirst) bfs_from(g, s, visited, steps);
        else                                       dfs_from(g, s, visited, steps);
    }
    return steps;
}
