#pragma once
// Learning: nudge edge weights from execution outcomes
//
// For every edge type seen on a result path:
//   effectiveness = results whose path used it / max(1, result_count)
//   weight += 0.05 * (effectiveness - 0.5)      (clamped to [0.1, 2.0])
//
// Online only. Nothing is batched or persisted; the query-time history is
// append-only until the caller truncates it.

#include "types.hpp"
#include "error.hpp"
#include "plan.hpp"
#include "relationship_weights.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace marga {

using json = nlohmann::json;

struct LearningConfig {
    float learning_rate = 0.05f;
    float neutral_effectiveness = 0.5f;   // No change at this effectiveness

    // Adaptive vector/traversal parameters
    size_t min_outcomes = 10;             // History needed before adapting
    float slow_query_seconds = 1.0f;
    float fast_query_seconds = 0.1f;
    size_t top_k_step = 2;
    size_t min_top_k = 3;
    size_t max_top_k = 10;

    void validate() const {
        if (learning_rate < 0.0f) throw ConfigurationError("learning rate must be non-negative");
        if (neutral_effectiveness < 0.0f || neutral_effectiveness > 1.0f) {
            throw ConfigurationError("neutral effectiveness must be in [0, 1]");
        }
        if (fast_query_seconds < 0.0f || fast_query_seconds > slow_query_seconds) {
            throw ConfigurationError("fast query threshold must be in [0, slow threshold]");
        }
        if (min_top_k == 0 || min_top_k > max_top_k) {
            throw ConfigurationError("top_k bounds must satisfy 1 <= min <= max");
        }
    }
};

// Shape of a plan, for counting which shapes recur
struct QueryPattern {
    std::vector<std::string> edge_types;  // sorted
    int max_depth = 0;
    Strategy strategy = Strategy::Standard;

    std::string key() const {
        std::string k = strategy_name(strategy) + "|" + std::to_string(max_depth) + "|";
        for (const auto& e : edge_types) k += e + ",";
        return k;
    }

    json to_json() const {
        return {{"edge_types", edge_types}, {"max_depth", max_depth},
                {"strategy", strategy_name(strategy)}};
    }
};

struct TimedQuery {
    std::string query_id;
    float seconds = 0.0f;
    Timestamp at = 0;
};

// Query-time history and pattern counts
class QueryStats {
public:
    void record_time(const std::string& query_id, float seconds) {
        std::lock_guard<std::mutex> lock(mutex_);
        history_.push_back({query_id, seconds, now()});
    }

    void record_pattern(const QueryPattern& pattern) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = patterns_[pattern.key()];
        slot.first = pattern;
        slot.second++;
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return history_.size();
    }

    float mean() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (history_.empty()) return 0.0f;
        double sum = 0.0;
        for (const auto& q : history_) sum += q.seconds;
        return static_cast<float>(sum / history_.size());
    }

    // Least-squares slope of query time over history order (seconds per query)
    float trend() const {
        std::lock_guard<std::mutex> lock(mutex_);
        const size_t n = history_.size();
        if (n < 2) return 0.0f;
        double mean_x = (n - 1) / 2.0;
        double mean_y = 0.0;
        for (const auto& q : history_) mean_y += q.seconds;
        mean_y /= n;

        double num = 0.0, den = 0.0;
        for (size_t i = 0; i < n; ++i) {
            double dx = static_cast<double>(i) - mean_x;
            num += dx * (history_[i].seconds - mean_y);
            den += dx * dx;
        }
        return den > 0.0 ? static_cast<float>(num / den) : 0.0f;
    }

    std::vector<TimedQuery> recent(size_t window) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t start = history_.size() > window ? history_.size() - window : 0;
        return std::vector<TimedQuery>(history_.begin() + start, history_.end());
    }

    // Keep only the newest n entries
    void truncate(size_t n) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (history_.size() > n) {
            history_.erase(history_.begin(), history_.end() - n);
        }
    }

    std::vector<std::pair<QueryPattern, size_t>> common_patterns(size_t top_n = 5) const {
        std::vector<std::pair<QueryPattern, size_t>> out;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [_, slot] : patterns_) out.push_back(slot);
        }
        std::stable_sort(out.begin(), out.end(),
                         [](const auto& a, const auto& b) { return a.second > b.second; });
        if (out.size() > top_n) out.resize(top_n);
        return out;
    }

    // Depth used by the most queries across all patterns; ties go to the shallower
    std::optional<int> most_common_depth() const {
        std::map<int, size_t> by_depth;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [_, slot] : patterns_) by_depth[slot.first.max_depth] += slot.second;
        }
        std::optional<int> best;
        size_t best_count = 0;
        for (const auto& [depth, c] : by_depth) {
            if (c > best_count) {
                best = depth;
                best_count = c;
            }
        }
        return best;
    }

    json to_json() const {
        json patterns = json::array();
        for (const auto& [p, c] : common_patterns()) {
            json pj = p.to_json();
            pj["count"] = c;
            patterns.push_back(pj);
        }
        return {{"query_count", count()}, {"mean_seconds", mean()},
                {"trend", trend()}, {"common_patterns", patterns}};
    }

private:
    mutable std::mutex mutex_;
    std::vector<TimedQuery> history_;
    std::map<std::string, std::pair<QueryPattern, size_t>> patterns_;
};

struct OutcomeSummary {
    std::string query_id;
    size_t result_count = 0;
    float mean_score = 0.0f;
    std::map<std::string, float> effectiveness;   // per observed edge type
    std::map<std::string, float> updated_weights;
    Strategy strategy = Strategy::Standard;

    json to_json() const {
        return {
            {"query_id", query_id},
            {"result_count", result_count},
            {"mean_score", mean_score},
            {"effectiveness", effectiveness},
            {"updated_weights", updated_weights},
            {"strategy", strategy_name(strategy)}
        };
    }
};

struct AdaptedParams {
    size_t top_k = 5;
    int max_depth = 2;
};

class LearningFeedbackLoop {
public:
    explicit LearningFeedbackLoop(RelationshipWeightTable& weights, LearningConfig config = {})
        : weights_(weights), config_(config)
    {
        config_.validate();
    }

    OutcomeSummary record_outcome(const std::string& query_id,
                                  const std::vector<RetrievalResult>& results,
                                  float elapsed_seconds,
                                  const ExecutionPlan& plan_used) {
        OutcomeSummary summary;
        summary.query_id = query_id;
        summary.result_count = results.size();
        summary.strategy = plan_used.hints.strategy;

        std::map<std::string, size_t> occurrences;
        float score_sum = 0.0f;
        for (const auto& r : results) {
            score_sum += r.score;
            // Each result counts once per edge type on its path
            std::unordered_set<std::string> seen;
            for (const auto& e : r.path_edge_types) {
                std::string key = normalize_edge_type(e);
                if (!key.empty() && seen.insert(key).second) occurrences[key]++;
            }
        }
        if (!results.empty()) summary.mean_score = score_sum / results.size();

        const float denom = static_cast<float>(std::max<size_t>(1, results.size()));
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [edge_type, n] : occurrences) {
                float effectiveness = static_cast<float>(n) / denom;
                summary.effectiveness[edge_type] = effectiveness;
                summary.updated_weights[edge_type] = weights_.adjust(
                    edge_type, config_.learning_rate * (effectiveness - config_.neutral_effectiveness));
            }
        }

        stats_.record_time(query_id, elapsed_seconds);

        QueryPattern pattern;
        pattern.edge_types = plan_used.traversal.edge_types;
        std::sort(pattern.edge_types.begin(), pattern.edge_types.end());
        pattern.max_depth = plan_used.traversal.max_depth;
        pattern.strategy = plan_used.hints.strategy;
        stats_.record_pattern(pattern);

        return summary;
    }

    // Tune vector top_k and traversal depth from history once enough has been seen
    AdaptedParams adapt(size_t top_k, int max_depth) const {
        AdaptedParams params{top_k, max_depth};
        if (stats_.count() < config_.min_outcomes) return params;

        float mean = stats_.mean();
        if (mean > config_.slow_query_seconds) {
            params.top_k = top_k > config_.min_top_k + config_.top_k_step
                ? top_k - config_.top_k_step
                : config_.min_top_k;
            params.top_k = std::min(params.top_k, top_k);
        } else if (mean < config_.fast_query_seconds) {
            params.top_k = std::max(top_k, std::min(top_k + config_.top_k_step, config_.max_top_k));
        }

        auto depth = stats_.most_common_depth();
        if (depth && *depth > 0) {
            params.max_depth = *depth;
        }
        return params;
    }

    QueryStats& stats() { return stats_; }
    const QueryStats& stats() const { return stats_; }
    const LearningConfig& config() const { return config_; }

private:
    RelationshipWeightTable& weights_;
    LearningConfig config_;
    QueryStats stats_;
    std::mutex mutex_;
};

} // namespace marga
