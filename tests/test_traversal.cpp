// tests/test_traversal.cpp
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "graph/Graph.hpp"
#include "graph/GraphErrors.hpp"
#include "algo/Traversal.hpp"

#include <set>
#include <stdexcept>
#include <vector>

// Node ids of a step sequence, in order
static std::vector<Graph::Vertex> order_of(const std::vector<TraversalStep>& steps) {
    std::vector<Graph::Vertex> out;
    for (const auto& s : steps) out.push_back(s.node);
    return out;
}

// Every snapshot holds its own node and is exactly one larger than the previous one
static void check_snapshots(const std::vector<TraversalStep>& steps) {
    for (std::size_t i = 0; i < steps.size(); ++i) {
        CHECK(steps[i].visitedSoFar.size() == i + 1);
        CHECK(steps[i].visitedSoFar.count(steps[i].node) == 1);
        if (i > 0) {
            for (Graph::Vertex v : steps[i - 1].visitedSoFar)
                CHECK(steps[i].visitedSoFar.count(v) == 1);
        }
    }
}

// 0: 1 2 / 1: 0 2 3 / 2: 0 1 3 / 3: 1 2, plus a separate edge 4-5
static Graph sample() {
    Graph g(Graph::Kind::Undirected);
    g.addEdge(0, 1); g.addEdge(0, 2);
    g.addEdge(1, 2); g.addEdge(1, 3);
    g.addEdge(2, 3);
    g.addEdge(4, 5);
    return g;
}

// ---------------- BFS ----------------

TEST_CASE("BFS visits the reachable part in FIFO order") {
    Graph g = sample();
    auto steps = breadthFirst(g, 0);
    const std::vector<Graph::Vertex> expected{0, 1, 2, 3};
    CHECK(order_of(steps) == expected);
    check_snapshots(steps);
}

TEST_CASE("BFS layer order on a path") {
    Graph g(Graph::Kind::Undirected);
    g.addEdge(0, 1); g.addEdge(1, 2); g.addEdge(0, 3);
    const std::vector<Graph::Vertex> expected{1, 0, 2, 3};
    CHECK(order_of(breadthFirst(g, 1)) == expected);
}

TEST_CASE("BFS from a missing node throws NodeNotFound") {
    Graph g = sample();
    CHECK_THROWS_AS(breadthFirst(g, 99), NodeNotFound);
    CHECK_THROWS_AS(breadthFirst(g, 99), std::out_of_range);
}

// ---------------- DFS ----------------

TEST_CASE("DFS is pre-order in adjacency order") {
    Graph g = sample();
    auto steps = depthFirst(g, 0);
    // 0 -> 1 -> (0 seen) 2 -> (0,1 seen) 3
    const std::vector<Graph::Vertex> expected{0, 1, 2, 3};
    CHECK(order_of(steps) == expected);
    check_snapshots(steps);
}

TEST_CASE("DFS backtracks to later neighbors") {
    Graph g(Graph::Kind::Directed);
    g.addEdge(0, 1); g.addEdge(0, 3);
    g.addEdge(1, 2);
    g.addEdge(3, 4);
    const std::vector<Graph::Vertex> expected{0, 1, 2, 3, 4};
    CHECK(order_of(depthFirst(g, 0)) == expected);
}

TEST_CASE("DFS from a missing node throws NodeNotFound") {
    Graph g = sample();
    CHECK_THROWS_AS(depthFirst(g, -1), NodeNotFound);
}

// ---------------- edge cases ----------------

TEST_CASE("Dangling neighbors are visited but have no out-edges") {
    Graph g(Graph::Kind::Directed);
    g.addNode(0);
    g.addArc(0, 7);                       // 7 is not a key
    const std::vector<Graph::Vertex> expected{0, 7};
    CHECK(order_of(breadthFirst(g, 0)) == expected);
    CHECK(order_of(depthFirst(g, 0)) == expected);
}

TEST_CASE("Self-loops and parallel edges do not repeat nodes") {
    Graph g(Graph::Kind::Undirected);
    g.addEdge(0, 0); g.addEdge(0, 1); g.addEdge(0, 1);
    CHECK(breadthFirst(g, 0).size() == 2);
    CHECK(depthFirst(g, 0).size() == 2);
}

TEST_CASE("Earlier snapshots are unaffected by later steps") {
    Graph g = sample();
    auto steps = breadthFirst(g, 0);
    const std::set<Graph::Vertex> first{0};
    CHECK(steps.front().visitedSoFar == first);
}

TEST_CASE("Traversals are idempotent") {
    Graph g = sample();
    CHECK(breadthFirst(g, 2) == breadthFirst(g, 2));
    CHECK(depthFirst(g, 2) == depthFirst(g, 2));
}

// ---------------- whole-graph coverage ----------------

TEST_CASE("traverseAll covers every component in ascending start order") {
    Graph g = sample();
    g.addNode(-1);                        // isolated node, smallest id
    auto steps = traverseAll(g, TraversalOrder::BreadthFirst);
    const std::vector<Graph::Vertex> expected{-1, 0, 1, 2, 3, 4, 5};
    CHECK(order_of(steps) == expected);
    check_snapshots(steps);               // one shared visited set
}

TEST_CASE("traverseAll does not revisit nodes reached from an earlier start") {
    Graph g(Graph::Kind::Directed);
    g.addEdge(2, 0);
    g.addEdge(0, 1);                      // start 0 reaches 1; start 2 then only adds 2
    auto steps = traverseAll(g, TraversalOrder::DepthFirst);
    const std::vector<Graph::Vertex> expected{0, 1, 2};
    CHECK(order_of(steps) == expected);
}
