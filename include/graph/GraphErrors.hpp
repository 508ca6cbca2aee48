#pragma once
#include <stdexcept>   // std::out_of_range, std::invalid_argument, std::logic_error
#include <string>      // std::string

// Failures reported by the analyses. Each one derives from the standard
// exception that the Graph API already uses for the same kind of mistake,
// so callers may catch either the specific type or the std:: base.

// A start, source, or sink id is not a node of the graph.
struct NodeNotFound : std::out_of_range {
    explicit NodeNotFound(const std::string& what) : std::out_of_range(what) {}
};

// The request itself is malformed (e.g. source == sink).
struct InvalidRequest : std::invalid_argument {
    explicit InvalidRequest(const std::string& what) : std::invalid_argument(what) {}
};

// The analysis needs a directedness the graph does not have.
struct NotApplicable : std::logic_error {
    explicit NotApplicable(const std::string& what) : std::logic_error(what) {}
};
