#pragma once
// ExecutionPlan: everything an executor needs to run one retrieval
//
// The plan is advisory. It names what to search and walk, in what order,
// and within which ceilings; enforcing them is the executor's job.

#include "version.hpp"
#include "hints.hpp"
#include "budget.hpp"
#include "traversal_planner.hpp"
#include "query_expansion.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace marga {

using json = nlohmann::json;

// How vector similarity and graph evidence are mixed when ranking
struct Weights {
    float vector = 0.7f;
    float graph = 0.3f;
    float hierarchical_bonus = 0.0f;

    json to_json() const {
        return {{"vector", vector}, {"graph", graph}, {"hierarchical_bonus", hierarchical_bonus}};
    }
};

struct EntityPriority {
    std::string id;
    float importance = 0.0f;
};

struct ExecutionPlan {
    VectorParams vector_params;
    TraversalHints hints;
    TraversalPlan traversal;
    Budget budget;
    Weights weights;

    std::optional<ExpansionResult> expansion;
    std::optional<PatternMatch> pattern;
    std::vector<EntityPriority> entity_priorities;  // most important first
    std::string graph_type = "unknown";
    Priority priority = Priority::Normal;

    std::optional<std::string> plan_id;  // correlates with execution metrics

    bool graph_enabled() const { return !traversal.empty(); }

    json to_json() const {
        json j;
        j["format_version"] = std::to_string(MARGA_PLAN_FORMAT_VERSION_MAJOR) + "." +
                              std::to_string(MARGA_PLAN_FORMAT_VERSION_MINOR);
        j["vector_search_params"] = vector_params.to_json();
        j["traversal_hints"] = hints.to_json();
        j["traversal"] = traversal.to_json();
        j["budget"] = budget.to_json();
        j["weights"] = weights.to_json();
        j["graph_type"] = graph_type;
        j["priority"] = priority_name(priority);

        if (expansion) j["query_expansion"] = expansion->to_json();
        if (pattern) j["query_pattern"] = pattern->to_json();
        if (!entity_priorities.empty()) {
            json priorities = json::array();
            for (const auto& p : entity_priorities) {
                priorities.push_back({{"id", p.id}, {"importance", p.importance}});
            }
            j["entity_priorities"] = priorities;
        }
        if (plan_id) j["plan_id"] = *plan_id;
        return j;
    }
};

} // namespace marga
