#pragma once
// Traversal planner: turn edge priorities into a depth schedule
//
// Node budget is front-loaded: level 0 gets 40% of the total, level d > 0
// gets total * 0.2 * 0.7^d, each clipped to what is left. Highest-priority
// edge types stay active to the full depth, the lowest only at depth 1.
// Depth is clamped to max_depth_limit.

#include "types.hpp"
#include "error.hpp"
#include "relationship_weights.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <map>
#include <string>
#include <unordered_set>
#include <vector>

namespace marga {

using json = nlohmann::json;

struct TraversalConfig {
    float first_level_share = 0.4f;  // Fraction of node budget for level 0
    float level_share = 0.2f;        // Base fraction for deeper levels
    float level_decay = 0.7f;        // Per-level geometric decay
    int max_depth_limit = 16;        // Deepest traversal a query may ask for

    void validate() const {
        if (first_level_share <= 0.0f || first_level_share > 1.0f) {
            throw ConfigurationError("first level share must be in (0, 1]");
        }
        if (level_share < 0.0f || level_share > 1.0f) {
            throw ConfigurationError("level share must be in [0, 1]");
        }
        if (level_decay <= 0.0f || level_decay > 1.0f) {
            throw ConfigurationError("level decay must be in (0, 1]");
        }
        if (max_depth_limit < 1) {
            throw ConfigurationError("max depth limit must be at least 1");
        }
        if (level_share * level_decay > first_level_share) {
            throw ConfigurationError("level 1 share would exceed level 0 share");
        }
    }
};

// Relative cost of walking one edge of a type, keyed by normalized type
inline const std::map<std::string, float>& builtin_traversal_costs() {
    static const std::map<std::string, float> table = {
        // Hierarchical: low fan-out, high signal
        {"subclass_of", 0.6f},
        {"instance_of", 0.6f},
        {"part_of", 0.7f},
        {"has_part", 0.7f},
        {"category_contains", 0.7f},
        {"in_category", 0.7f},
        // Topical
        {"related_to", 1.0f},
        {"similar_to", 1.0f},
        {"refers_to", 1.1f},
        // Authorship
        {"created_by", 1.2f},
        {"authored_by", 1.2f},
        {"developed_by", 1.2f},
        // High branching factor
        {"mentions", 1.5f},
        {"mentioned_in", 1.5f},
    };
    return table;
}

constexpr float DEFAULT_TRAVERSAL_COST = 1.0f;

inline float traversal_cost(const std::string& edge_type) {
    const auto& table = builtin_traversal_costs();
    auto it = table.find(normalize_edge_type(edge_type));
    return it != table.end() ? it->second : DEFAULT_TRAVERSAL_COST;
}

struct TraversalPlan {
    std::vector<std::string> edge_types;           // highest weight first
    std::vector<size_t> level_budgets;             // one per level, non-increasing
    std::map<std::string, int> activation_depth;   // deepest level an edge type is followed
    std::map<std::string, float> traversal_cost;
    int max_depth = 0;
    size_t total_node_budget = 0;

    bool empty() const { return edge_types.empty(); }

    size_t planned_nodes() const {
        size_t sum = 0;
        for (size_t b : level_budgets) sum += b;
        return sum;
    }

    // Edge types to follow when expanding nodes at `level` (1-based hop count)
    std::vector<std::string> active_at(int level) const {
        std::vector<std::string> active;
        for (const auto& e : edge_types) {
            auto it = activation_depth.find(e);
            if (it != activation_depth.end() && level <= it->second) active.push_back(e);
        }
        return active;
    }

    json to_json() const {
        return {
            {"edge_types", edge_types},
            {"level_budgets", level_budgets},
            {"activation_depth", activation_depth},
            {"traversal_cost", traversal_cost},
            {"max_depth", max_depth},
            {"total_node_budget", total_node_budget}
        };
    }
};

class TraversalPlanner {
public:
    explicit TraversalPlanner(const RelationshipWeightTable& weights,
                              TraversalConfig config = {})
        : weights_(weights), config_(config)
    {
        config_.validate();
    }

    TraversalPlan plan(const std::vector<std::string>& edge_types,
                       int max_depth, size_t total_node_budget) const {
        TraversalPlan plan;
        plan.max_depth = std::clamp(max_depth, 0, config_.max_depth_limit);
        plan.total_node_budget = total_node_budget;

        // "SubclassOf" and "subclass_of" are one edge type; first spelling wins
        std::vector<std::string> unique;
        std::unordered_set<std::string> seen;
        for (const auto& e : edge_types) {
            if (!e.empty() && seen.insert(normalize_edge_type(e)).second) unique.push_back(e);
        }
        if (unique.empty() || plan.max_depth == 0) return plan;

        plan.edge_types = weights_.prioritize(unique);
        plan.level_budgets = level_budgets(plan.max_depth, total_node_budget);

        const size_t n = plan.edge_types.size();
        for (size_t i = 0; i < n; ++i) {
            const auto& e = plan.edge_types[i];
            int active = plan.max_depth;
            if (n > 1) {
                double rank = static_cast<double>(i) / static_cast<double>(n - 1);
                active = static_cast<int>(std::lround((1.0 - rank) * plan.max_depth));
            }
            plan.activation_depth[e] = std::clamp(active, 1, plan.max_depth);
            plan.traversal_cost[e] = traversal_cost(e);
        }
        return plan;
    }

    std::vector<size_t> level_budgets(int max_depth, size_t total) const {
        max_depth = std::clamp(max_depth, 0, config_.max_depth_limit);
        std::vector<size_t> budgets;
        budgets.reserve(static_cast<size_t>(max_depth));
        size_t remaining = total;
        for (int level = 0; level < max_depth; ++level) {
            double share = level == 0
                ? config_.first_level_share
                : config_.level_share * std::pow(static_cast<double>(config_.level_decay), level);
            // epsilon absorbs float representation error (0.2f * 0.7f < 0.14)
            size_t budget = std::min(remaining,
                static_cast<size_t>(static_cast<double>(total) * share * (1.0 + 1e-6)));
            budgets.push_back(budget);
            remaining -= budget;
        }
        return budgets;
    }

private:
    const RelationshipWeightTable& weights_;
    TraversalConfig config_;
};

} // namespace marga
