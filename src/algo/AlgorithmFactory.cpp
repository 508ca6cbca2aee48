// ===============================================
// AlgorithmFactory.cpp
// Wraps each analysis in a strategy that formats its result:
//   * BFS / DFS traversal order
//   * connected components
//   * articulation points + bridges
//   * biconnected components
//   * strongly connected components (Kosaraju)
//   * max flow (Edmonds–Karp) between a chosen source and sink
// Exposes AlgorithmFactory::create(name) to instantiate a strategy.
// ===============================================

#include "algo/GraphAlgorithm.hpp"    // interface and factory declaration
#include "algo/Components.hpp"        // connectedComponents, stronglyConnectedComponents
#include "algo/CutVertices.hpp"       // articulationPoints, biconnectedComponents
#include "algo/MaxFlow.hpp"           // maxFlow
#include "algo/Traversal.hpp"         // breadthFirst, depthFirst, traverseAll
#include "graph/GraphErrors.hpp"      // InvalidRequest
#include <cctype>                     // std::tolower for case-insensitive names
#include <memory>                     // std::make_unique for factory
#include <sstream>                    // std::ostringstream to build responses
#include <string>                     // std::string
#include <vector>                     // std::vector

// ---------- helper: to-lower a string (safe cast to unsigned char) ----------
static std::string to_lower(std::string s) {                       // Copy input string.
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c))); // Lowercase each byte.
    return s;                                                      // Return transformed string.
}

// ---------- helper: "[0 1 2] [3]" ----------
static std::string format_groups(const std::vector<Component>& groups) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < groups.size(); ++i) {
        if (i) oss << ' ';
        oss << '[';
        for (std::size_t j = 0; j < groups[i].size(); ++j) {
            if (j) oss << ' ';
            oss << groups[i][j];
        }
        oss << ']';
    }
    return oss.str();
}

// =====================================================
// 1) Traversal order (BFS or DFS)
// =====================================================
struct AlgoTraversal final : IGraphAlgorithm {
    explicit AlgoTraversal(TraversalOrder order) : m_order(order) {}

    std::string run(const Graph& g, const AlgorithmQuery& q) override {
        std::vector<TraversalStep> steps;
        if (q.start) {                                             // single start
            steps = m_order == TraversalOrder::BreadthFirst ? breadthFirst(g, *q.start)
                                                            : depthFirst(g, *q.start);
        } else {                                                   // every component
            steps = traverseAll(g, m_order);
        }

        std::ostringstream oss;
        oss << (m_order == TraversalOrder::BreadthFirst ? "BFS" : "DFS") << " order: ";
        for (std::size_t i = 0; i < steps.size(); ++i) {
            oss << steps[i].node;
            if (i + 1 < steps.size()) oss << " -> ";
        }
        return oss.str();
    }

private:
    TraversalOrder m_order;
};

// =====================================================
// 2) Connected components
// =====================================================
struct AlgoComponents final : IGraphAlgorithm {
    std::string run(const Graph& g, const AlgorithmQuery&) override {
        ComponentList comps = connectedComponents(g);
        std::ostringstream oss;
        oss << "Connected components (" << comps.size() << "): " << format_groups(comps);
        return oss.str();
    }
};

// =====================================================
// 3) Articulation points and bridges
// =====================================================
struct AlgoArticulation final : IGraphAlgorithm {
    std::string run(const Graph& g, const AlgorithmQuery&) override {
        ArticulationResult r = articulationPoints(g);
        std::ostringstream oss;
        oss << "Articulation points:";
        if (r.points.empty()) oss << " none";
        for (Graph::Vertex p : r.points) oss << ' ' << p;
        oss << "; bridges:";
        if (r.bridges.empty()) oss << " none";
        for (const Bridge& b : r.bridges) oss << ' ' << b.first << '-' << b.second;
        return oss.str();
    }
};

// =====================================================
// 4) Biconnected components
// =====================================================
struct AlgoBiconnected final : IGraphAlgorithm {
    std::string run(const Graph& g, const AlgorithmQuery&) override {
        BiconnectedResult r = biconnectedComponents(g);
        std::ostringstream oss;
        oss << "Biconnected components (" << r.size() << "): " << format_groups(r);
        return oss.str();
    }
};

// ================================================
// 5) Strongly connected components (Kosaraju)
// ================================================
struct AlgoScc final : IGraphAlgorithm {
    std::string run(const Graph& g, const AlgorithmQuery&) override {
        SCCResult r = stronglyConnectedComponents(g);            // throws NotApplicable if undirected
        std::ostringstream oss;
        oss << "SCC count: " << r.size() << ": " << format_groups(r);
        return oss.str();
    }
};

// ==========================================================
// 6) Max flow (Edmonds–Karp) between chosen source and sink
// ==========================================================
struct AlgoMaxFlow final : IGraphAlgorithm {
    std::string run(const Graph& g, const AlgorithmQuery& q) override {
        if (!q.source || !q.sink)
            throw InvalidRequest("max flow needs both a source and a sink");
        MaxFlowResult r = maxFlow(g, *q.source, *q.sink);
        std::ostringstream oss;
        oss << "Max flow (" << r.source << " -> " << r.sink << "): " << r.value << ".";
        return oss.str();
    }
};

// =====================================================
// Factory definition (matches header declaration)
// =====================================================
std::unique_ptr<IGraphAlgorithm>
AlgorithmFactory::create(const std::string& name) {
    const auto n = to_lower(name);                                  // Normalize the name to lowercase.
    if (n == "bfs")          return std::make_unique<AlgoTraversal>(TraversalOrder::BreadthFirst);
    if (n == "dfs")          return std::make_unique<AlgoTraversal>(TraversalOrder::DepthFirst);
    if (n == "components")   return std::make_unique<AlgoComponents>();
    if (n == "articulation") return std::make_unique<AlgoArticulation>();
    if (n == "biconnected")  return std::make_unique<AlgoBiconnected>();
    if (n == "scc")          return std::make_unique<AlgoScc>();
    if (n == "maxflow")      return std::make_unique<AlgoMaxFlow>();
    return nullptr;                                                 // Unknown name → caller handles error.
}

std::vector<std::string> AlgorithmFactory::names() {
    return {"BFS", "DFS", "COMPONENTS", "ARTICULATION", "BICONNECTED", "SCC", "MAXFLOW"};
}
