#pragma once
// Planner errors
//
// Only a missing query vector and bad configuration are fatal. Expansion
// and graph-access failures are raised by collaborators and recovered
// inside the planner; they exist as types so adapters can signal them.

#include <stdexcept>
#include <string>

namespace marga {

class PlannerError : public std::runtime_error {
public:
    explicit PlannerError(const std::string& message)
        : std::runtime_error(message) {}
};

// Mandatory query input is missing (no query vector)
class InvalidQueryError : public PlannerError {
public:
    explicit InvalidQueryError(const std::string& message)
        : PlannerError("invalid query: " + message) {}
};

// Malformed weight overrides or out-of-range budgets
class ConfigurationError : public PlannerError {
public:
    explicit ConfigurationError(const std::string& message)
        : PlannerError("configuration error: " + message) {}
};

// External similarity search failed
class ExpansionFailure : public PlannerError {
public:
    explicit ExpansionFailure(const std::string& message)
        : PlannerError("expansion failure: " + message) {}
};

// Entity or category lookup against the knowledge graph failed
class GraphAccessFailure : public PlannerError {
public:
    explicit GraphAccessFailure(const std::string& message)
        : PlannerError("graph access failure: " + message) {}
};

} // namespace marga
