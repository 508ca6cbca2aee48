// ==========================
// graphlens: command-line driver
// ==========================
// Reads an adjacency list (file or stdin), builds a Graph, and runs the
// requested analyses through AlgorithmFactory. One result line per analysis.
//
//   graphlens [-f FILE] [-e FILE] [--directed] [-a NAME]... [-s N]
//             [--source N] [--sink N] [-v] [-h]
//
// Exit status: 0 ok, 1 usage/parse error, 2 at least one analysis failed.
// ==========================

#include "graph/Graph.hpp"            // Graph API
#include "algo/GraphAlgorithm.hpp"    // IGraphAlgorithm + AlgorithmFactory
#include "io/GraphParser.hpp"         // parseGraph
#include <getopt.h>                   // getopt_long for command-line parsing
#include <cctype>                     // std::tolower
#include <cstdlib>                    // std::exit
#include <exception>                  // std::exception
#include <fstream>                    // std::ifstream
#include <iostream>                   // I/O
#include <iterator>                   // std::istreambuf_iterator
#include <optional>                   // std::optional
#include <sstream>                    // std::istringstream
#include <string>                     // std::string
#include <vector>                     // std::vector

static constexpr const char* kTag = "[graphlens] ";   // prefix for diagnostics

static void usage(const char* prog) {                         // print usage and exit
    std::cerr << "Usage: " << prog
              << " [-f <adjacency file>] [-e <edge file>] [--directed]"
                 " [-a <algorithm|all>]... [-s <start>] [--source <n>] [--sink <n>] [-v]\n"
              << "Algorithms:";
    for (const auto& n : AlgorithmFactory::names()) std::cerr << ' ' << n;
    std::cerr << "\n";
    std::exit(1);
}

// Slurp a whole stream into a string
static std::string read_all(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Lowercase copy, matching the factory's case-insensitive names
static std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// Read a file; false if it cannot be opened
static bool read_file(const std::string& path, std::string& out) {
    std::ifstream f(path);
    if (!f) return false;
    out = read_all(f);
    return true;
}

// Parse a node id argument; exits through usage() on garbage
static Graph::Vertex parse_id(const char* arg, const char* prog) {
    std::istringstream iss(arg);
    Graph::Vertex v = 0; char extra = 0;
    if (!(iss >> v) || (iss >> extra)) {
        std::cerr << kTag << "not a node id: " << arg << "\n";
        usage(prog);
    }
    return v;
}

int main(int argc, char* argv[]) {                            // entry point
    std::string adjPath, edgePath;                            // input files ("" = stdin / none)
    std::vector<std::string> algos;                           // requested analyses
    AlgorithmQuery query;                                     // start/source/sink
    bool dir = false, verbose = false;
    int li = 0;
    option lo[] = {{"file", required_argument, nullptr, 'f'},
                   {"edges", required_argument, nullptr, 'e'},
                   {"directed", no_argument, nullptr, 'D'},
                   {"algo", required_argument, nullptr, 'a'},
                   {"start", required_argument, nullptr, 's'},
                   {"source", required_argument, nullptr, 'S'},
                   {"sink", required_argument, nullptr, 'T'},
                   {"verbose", no_argument, nullptr, 'v'},
                   {"help", no_argument, nullptr, 'h'},
                   {nullptr, 0, nullptr, 0}};

    for (int opt; (opt = getopt_long(argc, argv, "f:e:a:s:vh", lo, &li)) != -1; ) { // parse flags
        if (opt == 'f') adjPath = optarg;
        else if (opt == 'e') edgePath = optarg;
        else if (opt == 'D') dir = true;
        else if (opt == 'a') algos.emplace_back(optarg);
        else if (opt == 's') query.start = parse_id(optarg, argv[0]);
        else if (opt == 'S') query.source = parse_id(optarg, argv[0]);
        else if (opt == 'T') query.sink = parse_id(optarg, argv[0]);
        else if (opt == 'v') verbose = true;
        else usage(argv[0]);                                  // -h or invalid flag
    }
    if (optind != argc) usage(argv[0]);                       // no positional arguments
    if (algos.empty()) algos.emplace_back("all");
    for (const auto& a : algos) {                             // reject unknown names before reading input
        if (to_lower(a) != "all" && !AlgorithmFactory::create(a)) {
            std::cerr << kTag << "unknown algorithm: " << a << "\n";
            usage(argv[0]);
        }
    }

    std::string adjText, edgeText;
    if (adjPath.empty()) {
        adjText = read_all(std::cin);
    } else if (!read_file(adjPath, adjText)) {
        std::cerr << kTag << "cannot read " << adjPath << "\n";
        return 1;
    }
    if (!edgePath.empty() && !read_file(edgePath, edgeText)) {
        std::cerr << kTag << "cannot read " << edgePath << "\n";
        return 1;
    }

    Graph g;
    std::string err;
    if (!parseGraph(adjText, dir ? Graph::Kind::Directed : Graph::Kind::Undirected,
                    edgeText, g, err)) {
        std::cerr << kTag << "parse error: " << err << "\n";
        return 1;
    }
    if (verbose) std::cerr << kTag << "loaded " << g.label() << "\n";

    // Expand "all" to every analysis that applies to this graph
    std::vector<std::string> run;
    for (const auto& a : algos) {
        if (to_lower(a) != "all") { run.push_back(a); continue; }
        for (const auto& n : AlgorithmFactory::names()) {
            if (n == "SCC" && !g.directed()) continue;                          // directed only
            if (n == "MAXFLOW" && (!g.directed() || !query.source || !query.sink)) continue;
            run.push_back(n);
        }
    }

    int status = 0;
    for (const auto& name : run) {
        auto algo = AlgorithmFactory::create(name);          // strategy from factory
        if (verbose) std::cerr << kTag << "running " << name << "\n";
        try {
            std::cout << algo->run(g, query) << "\n";
        } catch (const std::exception& ex) {                 // report and keep going
            std::cerr << kTag << name << " failed: " << ex.what() << "\n";
            status = 2;
        }
    }
    return status;                                            // 0 when every analysis ran
}
