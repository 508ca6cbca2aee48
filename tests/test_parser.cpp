// ==========================
// tests/test_parser.cpp
// ==========================
// Adjacency / edge-capacity text -> Graph.
// ==========================

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "graph/Graph.hpp"
#include "io/GraphParser.hpp"
#include "algo/MaxFlow.hpp"

#include <string>
#include <vector>

// ---------------------------
// Undirected input is mirrored and deduplicated
// ---------------------------
TEST_CASE("Undirected adjacency is symmetric") {
    Graph g; std::string err;
    REQUIRE(parseGraph("0: 1 2\n1: 0 2 3\n2: 0 1 3\n3: 1 2", Graph::Kind::Undirected, "", g, err));
    CHECK(err.empty());
    CHECK(g.n() == 4);
    CHECK(g.m() == 5);
    const std::vector<Graph::Vertex> n1{0, 2, 3};
    CHECK(g.neighbors(1) == n1);
    CHECK(g.hasArc(3, 1));
}

TEST_CASE("Undirected edge listed on one side only") {
    Graph g; std::string err;
    REQUIRE(parseGraph("0: 1\n2: 0", Graph::Kind::Undirected, "", g, err));
    const std::vector<Graph::Vertex> n0{1, 2};
    CHECK(g.neighbors(0) == n0);
    CHECK(g.hasArc(1, 0));
    CHECK(g.m() == 2);
}

TEST_CASE("Neighbor ids become nodes") {
    Graph g; std::string err;
    REQUIRE(parseGraph("5: 9", Graph::Kind::Directed, "", g, err));
    CHECK(g.hasNode(9));
    CHECK(g.neighbors(9).empty());
}

TEST_CASE("Blank lines, spacing and empty lists are accepted") {
    Graph g; std::string err;
    REQUIRE(parseGraph("\n  0 :  1 \n\n 4:\n", Graph::Kind::Undirected, "", g, err));
    const std::vector<Graph::Vertex> nodes{0, 1, 4};
    CHECK(g.nodes() == nodes);
}

TEST_CASE("Directed: later line replaces the list") {
    Graph g; std::string err;
    REQUIRE(parseGraph("0: 1\n0: 2 2", Graph::Kind::Directed, "", g, err));
    const std::vector<Graph::Vertex> n0{2, 2};
    CHECK(g.neighbors(0) == n0);
    CHECK_FALSE(g.hasNode(1));                    // no list mentions 1 any more
}

// ---------------------------
// Capacities
// ---------------------------
TEST_CASE("Directed without edge text: unit capacity per arc") {
    Graph g; std::string err;
    REQUIRE(parseGraph("0: 1 2\n1: 3\n2: 3\n3:", Graph::Kind::Directed, "", g, err));
    CHECK(g.edges().size() == 4);
    CHECK(maxFlow(g, 0, 3).value == 2);
}

TEST_CASE("Directed with explicit capacities") {
    Graph g; std::string err;
    REQUIRE(parseGraph("0: 1\n1: 2\n2: 3\n3:", Graph::Kind::Directed,
                       "0 1 10\n1 2 5\n2 3\n", g, err));
    REQUIRE(g.edges().size() == 3);
    CHECK(g.edges()[2].capacity == 1);            // default
    CHECK(maxFlow(g, 0, 3).value == 1);
}

// ---------------------------
// Errors
// ---------------------------
TEST_CASE("Parse errors are reported, not thrown") {
    Graph g; std::string err;

    CHECK_FALSE(parseGraph("0 1 2", Graph::Kind::Undirected, "", g, err));
    CHECK(err.find("Invalid format") != std::string::npos);

    CHECK_FALSE(parseGraph("x: 1", Graph::Kind::Undirected, "", g, err));
    CHECK(err.find("Invalid node number") != std::string::npos);

    CHECK_FALSE(parseGraph("0: 1 b", Graph::Kind::Undirected, "", g, err));
    CHECK(err.find("Invalid neighbor: b") != std::string::npos);

    CHECK_FALSE(parseGraph("0: 1: 2", Graph::Kind::Undirected, "", g, err));

    CHECK_FALSE(parseGraph("   \n", Graph::Kind::Undirected, "", g, err));
    CHECK(err.find("at least one node") != std::string::npos);
}

TEST_CASE("Edge text errors") {
    Graph g; std::string err;
    const std::string adj = "0: 1\n1:";

    CHECK_FALSE(parseGraph(adj, Graph::Kind::Directed, "1 0", g, err));
    CHECK(err.find("not in the adjacency") != std::string::npos);

    CHECK_FALSE(parseGraph(adj, Graph::Kind::Directed, "0 1 0", g, err));
    CHECK(err.find("positive") != std::string::npos);

    CHECK_FALSE(parseGraph(adj, Graph::Kind::Directed, "0", g, err));
    CHECK(err.find("Bad edge line") != std::string::npos);

    CHECK_FALSE(parseGraph(adj, Graph::Kind::Directed, "0 1 2 3", g, err));

    CHECK_FALSE(parseGraph("0: 1\n1: 2", Graph::Kind::Undirected, "garbage line here x", g, err));
    CHECK(err.find("directed graphs only") != std::string::npos);
    CHECK_FALSE(parseGraph("0: 1", Graph::Kind::Undirected, "0 1 5", g, err));  // even well-formed
    CHECK(parseGraph("0: 1", Graph::Kind::Undirected, " \n\n", g, err));       // blank edge text is fine
}

TEST_CASE("Output graph untouched on failure") {
    Graph g(Graph::Kind::Directed); std::string err;
    g.addEdge(7, 8);
    CHECK_FALSE(parseGraph("0: q", Graph::Kind::Undirected, "", g, err));
    CHECK(g.directed());
    CHECK(g.hasArc(7, 8));
}
