#pragma once
// Planner configuration
//
// Every section is optional in the JSON document; missing keys keep the
// in-class defaults. Example:
// {
//   "weights":    {"default": 0.5, "overrides": {"subclass_of": 1.6}},
//   "budget":     {"priority_multipliers": {"low": 0.5, "normal": 1.0, "high": 1.5},
//                  "defaults": {"max_nodes": 2000},
//                  "early_stopping": {"high_confidence": 0.85}},
//   "expansion":  {"similarity_threshold": 0.7, "max_expansions": 5},
//   "importance": {"recency_horizon_days": 180},
//   "traversal":  {"first_level_share": 0.4, "max_depth_limit": 16},
//   "learning":   {"learning_rate": 0.05, "min_outcomes": 10},
//   "rewriter":   {"max_pattern_text": 512},
//   "planner":    {"node_budget": 1000, "entity_sample": 50}
// }

#include "types.hpp"
#include "error.hpp"
#include "relationship_weights.hpp"
#include "entity_importance.hpp"
#include "query_expansion.hpp"
#include "traversal_planner.hpp"
#include "budget.hpp"
#include "learning.hpp"
#include "query_rewriter.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <string>
#include <vector>

namespace marga {

using json = nlohmann::json;

// Used when neither the query nor the graph names any edge types
inline const std::vector<std::string>& default_edge_vocabulary() {
    static const std::vector<std::string> vocab = {
        "subclass_of", "instance_of", "part_of", "related_to",
        "mentions", "category_contains", "similar_to"
    };
    return vocab;
}

struct PlannerConfig {
    WeightConfig weights;
    ImportanceConfig importance;
    ExpansionConfig expansion;
    TraversalConfig traversal;
    BudgetConfig budget;
    LearningConfig learning;
    RewriterConfig rewriter;

    // Base weighting
    float vector_weight = 0.7f;
    float graph_weight = 0.3f;
    float hierarchical_weight = 1.5f;    // hint for hierarchical graphs
    float hierarchical_bonus = 0.2f;     // ranking bonus for hierarchical graphs

    size_t node_budget = 1000;           // split across traversal levels
    size_t entity_sample = 50;           // entities scored for priorities
    size_t entity_priorities = 10;       // kept in the plan
    bool adapt_parameters = true;        // let history tune top_k and depth
    size_t history_limit = 1000;         // planning history entries kept

    std::vector<std::string> default_edge_types = default_edge_vocabulary();

    void validate() const {
        weights.validate();
        importance.validate();
        expansion.validate();
        traversal.validate();
        budget.validate();
        learning.validate();
        rewriter.validate();
        if (vector_weight < 0.0f || graph_weight < 0.0f) {
            throw ConfigurationError("vector and graph weights must be non-negative");
        }
        if (vector_weight + graph_weight <= 0.0f) {
            throw ConfigurationError("vector and graph weights must not both be zero");
        }
        if (hierarchical_bonus < 0.0f || hierarchical_bonus > 1.0f) {
            throw ConfigurationError("hierarchical bonus must be in [0, 1]");
        }
        if (hierarchical_weight < MIN_EDGE_WEIGHT || hierarchical_weight > MAX_EDGE_WEIGHT) {
            throw ConfigurationError("hierarchical weight must be in [0.1, 2.0]");
        }
    }

    static PlannerConfig from_json(const json& j);
};

namespace detail {

// Counts must be non-negative integers; get<size_t>() would wrap -1
inline void read_count(const json& j, const char* key, size_t& out) {
    if (!j.contains(key)) return;
    if (!j[key].is_number_integer() || j[key].get<int64_t>() < 0) {
        throw ConfigurationError(std::string("'") + key + "' must be a non-negative integer");
    }
    out = static_cast<size_t>(j[key].get<int64_t>());
}

inline void read_budget(Budget& b, const json& j) {
    b.vector_search_ms = j.value("vector_search_ms", b.vector_search_ms);
    b.graph_traversal_ms = j.value("graph_traversal_ms", b.graph_traversal_ms);
    b.ranking_ms = j.value("ranking_ms", b.ranking_ms);
    b.timeout_ms = j.value("timeout_ms", b.timeout_ms);
    b.category_traversal_ms = j.value("category_traversal_ms", b.category_traversal_ms);
    b.topic_expansion_ms = j.value("topic_expansion_ms", b.topic_expansion_ms);

    read_count(j, "max_nodes", b.max_nodes);
    read_count(j, "max_edges", b.max_edges);
    read_count(j, "max_categories", b.max_categories);
    read_count(j, "max_topics", b.max_topics);
}

inline const json& section(const json& j, const char* name) {
    static const json empty = json::object();
    if (!j.contains(name)) return empty;
    if (!j[name].is_object()) {
        throw ConfigurationError(std::string("section '") + name + "' must be an object");
    }
    return j[name];
}

} // namespace detail

inline PlannerConfig PlannerConfig::from_json(const json& j) {
    if (!j.is_object()) throw ConfigurationError("configuration must be a JSON object");

    PlannerConfig c;
    try {
        const json& w = detail::section(j, "weights");
        c.weights.default_weight = w.value("default", c.weights.default_weight);
        c.weights.high_value_threshold = w.value("high_value_threshold", c.weights.high_value_threshold);
        if (w.contains("overrides")) {
            if (!w["overrides"].is_object()) {
                throw ConfigurationError("weight overrides must be an object of edge type -> weight");
            }
            for (const auto& [edge_type, value] : w["overrides"].items()) {
                if (!value.is_number()) {
                    throw ConfigurationError("weight override for '" + edge_type + "' is not a number");
                }
                c.weights.overrides[edge_type] = value.get<float>();
            }
        }

        const json& imp = detail::section(j, "importance");
        c.importance.connection_weight = imp.value("connection_weight", c.importance.connection_weight);
        c.importance.reference_weight = imp.value("reference_weight", c.importance.reference_weight);
        c.importance.category_weight = imp.value("category_weight", c.importance.category_weight);
        c.importance.explicitness_weight = imp.value("explicitness_weight", c.importance.explicitness_weight);
        c.importance.recency_weight = imp.value("recency_weight", c.importance.recency_weight);
        c.importance.recency_horizon_days = imp.value("recency_horizon_days", c.importance.recency_horizon_days);
        c.importance.neutral = imp.value("neutral", c.importance.neutral);

        const json& ex = detail::section(j, "expansion");
        c.expansion.similarity_threshold = ex.value("similarity_threshold", c.expansion.similarity_threshold);
        detail::read_count(ex, "max_expansions", c.expansion.max_expansions);
        detail::read_count(ex, "candidate_multiplier", c.expansion.candidate_multiplier);
        c.expansion.category_overlap_threshold =
            ex.value("category_overlap_threshold", c.expansion.category_overlap_threshold);
        c.expansion.related_distance = ex.value("related_distance", c.expansion.related_distance);
        c.expansion.topic_type = ex.value("topic_type", c.expansion.topic_type);

        const json& tr = detail::section(j, "traversal");
        c.traversal.first_level_share = tr.value("first_level_share", c.traversal.first_level_share);
        c.traversal.level_share = tr.value("level_share", c.traversal.level_share);
        c.traversal.level_decay = tr.value("level_decay", c.traversal.level_decay);
        c.traversal.max_depth_limit = tr.value("max_depth_limit", c.traversal.max_depth_limit);

        const json& bu = detail::section(j, "budget");
        detail::read_budget(c.budget.defaults, detail::section(bu, "defaults"));
        const json& pm = detail::section(bu, "priority_multipliers");
        c.budget.low_multiplier = pm.value("low", c.budget.low_multiplier);
        c.budget.normal_multiplier = pm.value("normal", c.budget.normal_multiplier);
        c.budget.high_multiplier = pm.value("high", c.budget.high_multiplier);
        c.budget.scale_by_complexity = bu.value("scale_by_complexity", c.budget.scale_by_complexity);
        c.budget.category_focus = bu.value("category_focus", c.budget.category_focus);
        c.budget.hierarchical_graph_bonus =
            bu.value("hierarchical_graph_bonus", c.budget.hierarchical_graph_bonus);
        c.budget.topic_vector_bonus = bu.value("topic_vector_bonus", c.budget.topic_vector_bonus);
        c.budget.comparison_bonus = bu.value("comparison_bonus", c.budget.comparison_bonus);

        const json& es = detail::section(bu, "early_stopping");
        c.budget.high_confidence = es.value("high_confidence", c.budget.high_confidence);
        detail::read_count(es, "min_confident_categories", c.budget.min_confident_categories);
        c.budget.confident_consumed_ratio =
            es.value("confident_consumed_ratio", c.budget.confident_consumed_ratio);
        detail::read_count(es, "diversity_min_results", c.budget.diversity_min_results);
        c.budget.diversity_floor = es.value("diversity_floor", c.budget.diversity_floor);
        c.budget.diversity_consumed_ratio =
            es.value("diversity_consumed_ratio", c.budget.diversity_consumed_ratio);

        const json& le = detail::section(j, "learning");
        c.learning.learning_rate = le.value("learning_rate", c.learning.learning_rate);
        c.learning.neutral_effectiveness =
            le.value("neutral_effectiveness", c.learning.neutral_effectiveness);
        detail::read_count(le, "min_outcomes", c.learning.min_outcomes);
        c.learning.slow_query_seconds = le.value("slow_query_seconds", c.learning.slow_query_seconds);
        c.learning.fast_query_seconds = le.value("fast_query_seconds", c.learning.fast_query_seconds);
        detail::read_count(le, "top_k_step", c.learning.top_k_step);
        detail::read_count(le, "min_top_k", c.learning.min_top_k);
        detail::read_count(le, "max_top_k", c.learning.max_top_k);

        const json& rw = detail::section(j, "rewriter");
        detail::read_count(rw, "max_pattern_text", c.rewriter.max_pattern_text);

        const json& pl = detail::section(j, "planner");
        c.vector_weight = pl.value("vector_weight", c.vector_weight);
        c.graph_weight = pl.value("graph_weight", c.graph_weight);
        c.hierarchical_weight = pl.value("hierarchical_weight", c.hierarchical_weight);
        c.hierarchical_bonus = pl.value("hierarchical_bonus", c.hierarchical_bonus);
        detail::read_count(pl, "node_budget", c.node_budget);
        detail::read_count(pl, "entity_sample", c.entity_sample);
        detail::read_count(pl, "entity_priorities", c.entity_priorities);
        detail::read_count(pl, "history_limit", c.history_limit);
        c.adapt_parameters = pl.value("adapt_parameters", c.adapt_parameters);
        if (pl.contains("default_edge_types")) {
            c.default_edge_types = pl["default_edge_types"].get<std::vector<std::string>>();
        }
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("malformed value: ") + e.what());
    }

    c.validate();
    return c;
}

inline PlannerConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigurationError("cannot open " + path);
    json doc;
    try {
        doc = json::parse(in);
    } catch (const json::parse_error& e) {
        throw ConfigurationError("cannot parse " + path + ": " + e.what());
    }
    return PlannerConfig::from_json(doc);
}

} // namespace marga
