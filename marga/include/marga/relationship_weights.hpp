#pragma once
// Relationship weights: traversal priority per edge type
//
// Hierarchical edges (subclass_of, instance_of) outrank associative ones
// (related_to), which outrank high fan-out edges (mentions). Weights live
// for the whole process and are nudged in place by the learning loop, so
// every write is clamped to [MIN_EDGE_WEIGHT, MAX_EDGE_WEIGHT].

#include "types.hpp"
#include "error.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <map>
#include <numeric>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace marga {

struct WeightConfig {
    float default_weight = 0.5f;   // Unknown edge types
    float high_value_threshold = 0.7f;  // filter_above() default

    // Replace or extend the built-in table (keys are normalized on load)
    std::unordered_map<std::string, float> overrides;

    void validate() const {
        auto in_range = [](float w) {
            return w >= MIN_EDGE_WEIGHT && w <= MAX_EDGE_WEIGHT;
        };
        if (!in_range(default_weight)) {
            throw ConfigurationError("default edge weight " + std::to_string(default_weight) +
                                     " outside [0.1, 2.0]");
        }
        for (const auto& [edge_type, w] : overrides) {
            if (normalize_edge_type(edge_type).empty()) {
                throw ConfigurationError("weight override with empty edge type");
            }
            if (!in_range(w)) {
                throw ConfigurationError("weight override for '" + edge_type + "' = " +
                                         std::to_string(w) + " outside [0.1, 2.0]");
            }
        }
    }
};

// Built-in weights, keyed by normalized edge type
inline const std::map<std::string, float>& builtin_edge_weights() {
    static const std::map<std::string, float> table = {
        // Hierarchical
        {"subclass_of", 1.5f},
        {"instance_of", 1.4f},
        {"part_of", 1.3f},
        {"has_part", 1.2f},
        // Category membership
        {"category_contains", 1.3f},
        {"in_category", 1.3f},
        // Topical
        {"related_to", 1.0f},
        {"similar_to", 0.9f},
        {"refers_to", 0.8f},
        // Authorship
        {"created_by", 0.7f},
        {"authored_by", 0.7f},
        {"developed_by", 0.7f},
        // Temporal
        {"preceded_by", 0.6f},
        {"succeeded_by", 0.6f},
        // Causal
        {"causes", 1.1f},
        {"caused_by", 1.1f},
        // High fan-out
        {"mentions", 0.5f},
        {"mentioned_in", 0.5f},
    };
    return table;
}

class RelationshipWeightTable {
public:
    explicit RelationshipWeightTable(WeightConfig config = {})
        : config_(std::move(config))
    {
        config_.validate();
        for (const auto& [edge_type, w] : builtin_edge_weights()) {
            weights_[edge_type] = w;
        }
        for (const auto& [edge_type, w] : config_.overrides) {
            weights_[normalize_edge_type(edge_type)] = w;
        }
    }

    // Weight for an edge type in any spelling; unknown types get the default
    float weight(const std::string& edge_type) const {
        std::shared_lock lock(mutex_);
        return lookup(normalize_edge_type(edge_type));
    }

    float default_weight() const { return config_.default_weight; }

    bool has_explicit_weight(const std::string& edge_type) const {
        std::shared_lock lock(mutex_);
        return weights_.count(normalize_edge_type(edge_type)) > 0;
    }

    // Highest weight first; equal weights keep their input order
    std::vector<std::string> prioritize(const std::vector<std::string>& edge_types) const {
        std::vector<float> w(edge_types.size());
        {
            std::shared_lock lock(mutex_);
            for (size_t i = 0; i < edge_types.size(); ++i) {
                w[i] = lookup(normalize_edge_type(edge_types[i]));
            }
        }

        std::vector<size_t> order(edge_types.size());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(),
                         [&w](size_t a, size_t b) { return w[a] > w[b]; });

        std::vector<std::string> result;
        result.reserve(order.size());
        for (size_t i : order) result.push_back(edge_types[i]);
        return result;
    }

    std::vector<std::string> filter_above(const std::vector<std::string>& edge_types,
                                          float min_weight) const {
        std::vector<std::string> result;
        std::shared_lock lock(mutex_);
        for (const auto& edge_type : edge_types) {
            if (lookup(normalize_edge_type(edge_type)) >= min_weight) {
                result.push_back(edge_type);
            }
        }
        return result;
    }

    std::vector<std::string> filter_above(const std::vector<std::string>& edge_types) const {
        return filter_above(edge_types, config_.high_value_threshold);
    }

    // Shift a weight by delta, clamped. Returns the new weight.
    float adjust(const std::string& edge_type, float delta) {
        std::string key = normalize_edge_type(edge_type);
        std::unique_lock lock(mutex_);
        float updated = std::clamp(lookup(key) + delta, MIN_EDGE_WEIGHT, MAX_EDGE_WEIGHT);
        weights_[key] = updated;
        return updated;
    }

    void set(const std::string& edge_type, float w) {
        if (w < MIN_EDGE_WEIGHT || w > MAX_EDGE_WEIGHT) {
            throw ConfigurationError("edge weight for '" + edge_type + "' = " +
                                     std::to_string(w) + " outside [0.1, 2.0]");
        }
        std::string key = normalize_edge_type(edge_type);
        std::unique_lock lock(mutex_);
        weights_[key] = w;
    }

    std::map<std::string, float> snapshot() const {
        std::shared_lock lock(mutex_);
        return std::map<std::string, float>(weights_.begin(), weights_.end());
    }

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["default"] = config_.default_weight;
        j["weights"] = snapshot();
        return j;
    }

private:
    float lookup(const std::string& normalized) const {
        auto it = weights_.find(normalized);
        return it != weights_.end() ? it->second : config_.default_weight;
    }

    WeightConfig config_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, float> weights_;
};

} // namespace marga
