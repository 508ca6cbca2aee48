// ==================== GraphParser.cpp ====================
// Text -> Graph. Formats:
//   adjacency:  "<node>: <n1> <n2> ..."     one node per line
//   edges:      "<from> <to> [capacity]"     directed capacities, one per line
// Errors are reported through `err`; nothing throws out of parseGraph().
// =========================================================

#include "io/GraphParser.hpp"         // declaration

#include <algorithm>                  // std::find
#include <map>                        // ordered adjacency while parsing
#include <sstream>                    // std::istringstream
#include <string>                     // std::string
#include <utility>                    // std::move
#include <vector>                     // std::vector

// --------- tiny helpers ---------
static std::string trim(const std::string& s) {              // strip surrounding whitespace
    const auto b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    const auto e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

static bool to_id(const std::string& tok, long long& out) {  // whole token must be an integer
    std::istringstream iss(tok);
    long long v = 0; char extra = 0;
    if (!(iss >> v) || (iss >> extra)) return false;
    out = v;
    return true;
}

static void add_once(std::vector<Graph::Vertex>& lst, Graph::Vertex v) {  // set-style append
    if (std::find(lst.begin(), lst.end(), v) == lst.end()) lst.push_back(v);
}

bool parseGraph(const std::string& adjacency, Graph::Kind kind,
                const std::string& edges, Graph& out, std::string& err) {
    using Vertex = Graph::Vertex;
    const bool directed = kind == Graph::Kind::Directed;

    std::map<Vertex, std::vector<Vertex>> adj;                // node -> neighbors
    std::istringstream lines(adjacency);
    std::string line;
    while (std::getline(lines, line)) {                        // one node per line
        line = trim(line);
        if (line.empty()) continue;

        const auto colon = line.find(':');
        if (colon == std::string::npos || line.find(':', colon + 1) != std::string::npos) {
            err = "Invalid format. Each line should be: node: neighbor1 neighbor2 ...";
            return false;
        }
        Vertex node = 0;
        const std::string head = trim(line.substr(0, colon));
        if (!to_id(head, node)) { err = "Invalid node number: " + head; return false; }

        std::vector<Vertex> nbrs;
        std::istringstream rest(line.substr(colon + 1));
        std::string tok;
        while (rest >> tok) {
            Vertex v = 0;
            if (!to_id(tok, v)) { err = "Invalid neighbor: " + tok; return false; }
            nbrs.push_back(v);
        }
        if (directed) {
            adj[node] = nbrs;                                 // later line replaces earlier
            continue;
        }

        for (Vertex v : nbrs) {                               // undirected: union, then mirror
            add_once(adj[node], v);
            add_once(adj[v], node);
        }
        adj[node];                                            // "n:" alone still declares n
    }

    for (const auto& kv : adj)                                // dangling ids become nodes
        for (Vertex v : kv.second) adj[v];
    if (adj.empty()) { err = "Please enter at least one node"; return false; }

    Graph g(kind);
    for (const auto& kv : adj) {
        g.addNode(kv.first);
        for (Vertex v : kv.second) g.addArc(kv.first, v);
    }

    if (!directed && !trim(edges).empty()) {
        err = "edge capacities apply to directed graphs only";
        return false;
    }
    if (trim(edges).empty()) {                                // one unit edge per arc
        for (const auto& kv : adj)
            for (Vertex v : kv.second) g.addFlowEdge(kv.first, v, 1);
        out = std::move(g);
        return true;
    }

    std::istringstream elines(edges);                         // explicit directed capacities
    while (std::getline(elines, line)) {
        line = trim(line);
        if (line.empty()) continue;
        std::istringstream iss(line);
        std::vector<std::string> toks;
        std::string t;
        while (iss >> t) toks.push_back(t);
        Vertex u = 0, v = 0, c = 1;
        if (toks.size() < 2 || toks.size() > 3 || !to_id(toks[0], u) || !to_id(toks[1], v) ||
            (toks.size() == 3 && !to_id(toks[2], c))) {
            err = "Bad edge line: " + line + " (expected: from to [capacity])";
            return false;
        }
        if (!g.hasArc(u, v)) {
            err = "Edge " + std::to_string(u) + " -> " + std::to_string(v) +
                  " is not in the adjacency list";
            return false;
        }
        if (c <= 0) { err = "Capacity must be positive: " + line; return false; }
        g.addFlowEdge(u, v, c);
    }

    out = std::move(g);
    return true;
}
