#pragma once
// Budget allocation: advisory ceilings for the executor
//
// default budget
//   x complexity (0.7 / 1.0 / 1.5 / 2.0 from top_k, depth, edge count)
//   x priority   (0.5 / 1.0 / 1.5)
//   x category focus 1.5 on category fields when category edges are walked
//   x topic expansion factor on topic fields when expansion is requested
//   x strategy bonus (hierarchical +30% graph, topic +40% vector,
//     comparison +20% both)
//
// Every step multiplies by a factor that does not depend on priority, so
// raising priority never lowers any field.

#include "types.hpp"
#include "error.hpp"
#include "hints.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <array>
#include <functional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace marga {

using json = nlohmann::json;

struct Budget {
    float vector_search_ms = 500.0f;
    float graph_traversal_ms = 1000.0f;
    float ranking_ms = 200.0f;
    float timeout_ms = 2000.0f;
    size_t max_nodes = 1000;
    size_t max_edges = 5000;

    float category_traversal_ms = 5000.0f;
    float topic_expansion_ms = 3000.0f;
    size_t max_categories = 20;
    size_t max_topics = 15;

    void scale(float m) {
        scale_graph(m);
        scale_category(m);
        scale_topic(m);
        vector_search_ms *= m;
        ranking_ms *= m;
        timeout_ms *= m;
    }

    void scale_graph(float m) {
        graph_traversal_ms *= m;
        max_nodes = scaled(max_nodes, m);
        max_edges = scaled(max_edges, m);
    }

    void scale_category(float m) {
        category_traversal_ms *= m;
        max_categories = scaled(max_categories, m);
    }

    void scale_topic(float m) {
        topic_expansion_ms *= m;
        max_topics = scaled(max_topics, m);
    }

    // Nothing left for graph or category work
    void make_vector_only() {
        graph_traversal_ms = 0.0f;
        max_nodes = 0;
        max_edges = 0;
        category_traversal_ms = 0.0f;
        max_categories = 0;
    }

    bool vector_only() const {
        return max_nodes == 0 && graph_traversal_ms == 0.0f && category_traversal_ms == 0.0f;
    }

    json to_json() const {
        return {
            {"vector_search_ms", vector_search_ms},
            {"graph_traversal_ms", graph_traversal_ms},
            {"ranking_ms", ranking_ms},
            {"timeout_ms", timeout_ms},
            {"max_nodes", max_nodes},
            {"max_edges", max_edges},
            {"category_traversal_ms", category_traversal_ms},
            {"topic_expansion_ms", topic_expansion_ms},
            {"max_categories", max_categories},
            {"max_topics", max_topics}
        };
    }

private:
    static size_t scaled(size_t v, float m) {
        return static_cast<size_t>(static_cast<double>(v) * std::max(0.0f, m) * (1.0 + 1e-6));
    }
};

struct BudgetConfig {
    Budget defaults;

    float low_multiplier = 0.5f;
    float normal_multiplier = 1.0f;
    float high_multiplier = 1.5f;

    bool scale_by_complexity = true;

    float category_focus = 1.5f;
    float hierarchical_graph_bonus = 1.3f;
    float topic_vector_bonus = 1.4f;
    float comparison_bonus = 1.2f;

    // Early stopping
    float high_confidence = 0.85f;          // score above which a category hit counts
    size_t min_confident_categories = 3;
    float confident_consumed_ratio = 0.6f;
    size_t diversity_min_results = 10;      // diversity rule needs more results than this
    float diversity_floor = 0.3f;           // unique categories / results
    float diversity_consumed_ratio = 0.7f;

    void validate() const {
        const float ms[] = {defaults.vector_search_ms, defaults.graph_traversal_ms,
                            defaults.ranking_ms, defaults.timeout_ms,
                            defaults.category_traversal_ms, defaults.topic_expansion_ms};
        for (float v : ms) {
            if (v < 0.0f) throw ConfigurationError("budget time ceilings must be non-negative");
        }
        if (low_multiplier <= 0.0f || normal_multiplier <= 0.0f || high_multiplier <= 0.0f) {
            throw ConfigurationError("priority multipliers must be positive");
        }
        if (low_multiplier > normal_multiplier || normal_multiplier > high_multiplier) {
            throw ConfigurationError("priority multipliers must satisfy low <= normal <= high");
        }
        const float bonuses[] = {category_focus, hierarchical_graph_bonus,
                                 topic_vector_bonus, comparison_bonus};
        for (float b : bonuses) {
            if (b <= 0.0f) throw ConfigurationError("budget bonuses must be positive");
        }
        const float ratios[] = {high_confidence, confident_consumed_ratio,
                                diversity_floor, diversity_consumed_ratio};
        for (float r : ratios) {
            if (r < 0.0f || r > 1.0f) throw ConfigurationError("early stopping ratios must be in [0, 1]");
        }
    }
};

enum class Complexity { Low, Medium, High, VeryHigh };

inline std::string complexity_name(Complexity c) {
    switch (c) {
        case Complexity::Low: return "low";
        case Complexity::Medium: return "medium";
        case Complexity::High: return "high";
        case Complexity::VeryHigh: return "very_high";
    }
    return "medium";
}

inline Complexity estimate_complexity(size_t top_k, int max_depth, size_t edge_type_count) {
    float score = static_cast<float>(top_k) * 0.5f +
                  static_cast<float>(std::max(0, max_depth)) * 2.0f +
                  static_cast<float>(edge_type_count) * 0.3f;
    if (score < 5.0f) return Complexity::Low;
    if (score < 10.0f) return Complexity::Medium;
    if (score < 20.0f) return Complexity::High;
    return Complexity::VeryHigh;
}

inline float complexity_multiplier(Complexity c) {
    switch (c) {
        case Complexity::Low: return 0.7f;
        case Complexity::Medium: return 1.0f;
        case Complexity::High: return 1.5f;
        case Complexity::VeryHigh: return 2.0f;
    }
    return 1.0f;
}

using EarlyStopHeuristic =
    std::function<bool(const std::vector<RetrievalResult>&, float budget_consumed_ratio)>;

// Generic quality/plateau rule used when no category-specific rule fires
inline bool default_early_stopping(const std::vector<RetrievalResult>& results,
                                   float budget_consumed_ratio) {
    if (results.size() < 3) return false;

    if (budget_consumed_ratio >= 0.7f) {
        float top = (results[0].score + results[1].score + results[2].score) / 3.0f;
        if (top > 0.85f) return true;
    }

    // Steep drop between first and fifth result: the tail is not worth it
    if (results.size() > 5 && results[0].score - results[4].score > 0.3f) {
        return true;
    }
    return false;
}

class BudgetAllocator {
public:
    explicit BudgetAllocator(BudgetConfig config = {},
                             EarlyStopHeuristic base = default_early_stopping)
        : config_(config), base_(std::move(base))
    {
        config_.validate();
        if (!base_) base_ = default_early_stopping;
    }

    const BudgetConfig& config() const { return config_; }

    void set_base_heuristic(EarlyStopHeuristic base) {
        base_ = base ? std::move(base) : EarlyStopHeuristic(default_early_stopping);
    }

    float priority_multiplier(Priority p) const {
        switch (p) {
            case Priority::Low: return config_.low_multiplier;
            case Priority::High: return config_.high_multiplier;
            default: return config_.normal_multiplier;
        }
    }

    Budget allocate(const TraversalHints& hints, Priority priority,
                    size_t vector_top_k = 5) const {
        Budget budget = config_.defaults;

        if (config_.scale_by_complexity) {
            budget.scale(complexity_multiplier(
                estimate_complexity(vector_top_k, hints.max_depth, hints.edge_types.size())));
        }
        budget.scale(priority_multiplier(priority));

        if (is_category_heavy(hints.edge_types)) {
            budget.scale_category(config_.category_focus);
        }
        if (hints.expand_topics) {
            budget.scale_topic(std::max(0.0f, hints.topic_expansion_factor));
        }

        switch (hints.strategy) {
            case Strategy::Hierarchical:
                budget.scale_graph(config_.hierarchical_graph_bonus);
                break;
            case Strategy::TopicFocused:
                budget.vector_search_ms *= config_.topic_vector_bonus;
                break;
            case Strategy::Comparison:
                budget.vector_search_ms *= config_.comparison_bonus;
                budget.graph_traversal_ms *= config_.comparison_bonus;
                break;
            default:
                break;
        }
        return budget;
    }

    bool should_stop_early(const std::vector<RetrievalResult>& results,
                           float budget_consumed_ratio) const {
        if (!results.empty()) {
            size_t confident_categories = 0;
            for (const auto& r : results) {
                if (r.type == "category" && r.score > config_.high_confidence) {
                    confident_categories++;
                }
            }
            if (confident_categories >= config_.min_confident_categories &&
                budget_consumed_ratio >= config_.confident_consumed_ratio) {
                return true;
            }

            // Results keep landing in the same few categories
            if (results.size() > config_.diversity_min_results) {
                std::unordered_set<std::string> unique;
                for (const auto& r : results) {
                    if (!r.category.empty()) unique.insert(r.category);
                }
                float fraction = static_cast<float>(unique.size()) /
                                 static_cast<float>(results.size());
                if (fraction < config_.diversity_floor &&
                    budget_consumed_ratio >= config_.diversity_consumed_ratio) {
                    return true;
                }
            }
        }
        return base_(results, budget_consumed_ratio);
    }

    static bool is_category_heavy(const std::vector<std::string>& edge_types) {
        for (const auto& e : edge_types) {
            std::string n = normalize_edge_type(e);
            if (n == "category_contains" || n == "in_category") return true;
        }
        return false;
    }

private:
    BudgetConfig config_;
    EarlyStopHeuristic base_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Consumption tracking during execution
// ═══════════════════════════════════════════════════════════════════════════

enum class Resource {
    VectorSearchMs,
    GraphTraversalMs,
    RankingMs,
    NodesVisited,
    EdgesTraversed,
    CategoryTraversalMs,
    TopicExpansionMs
};

constexpr size_t RESOURCE_COUNT = 7;

inline std::string resource_name(Resource r) {
    switch (r) {
        case Resource::VectorSearchMs: return "vector_search_ms";
        case Resource::GraphTraversalMs: return "graph_traversal_ms";
        case Resource::RankingMs: return "ranking_ms";
        case Resource::NodesVisited: return "nodes_visited";
        case Resource::EdgesTraversed: return "edges_traversed";
        case Resource::CategoryTraversalMs: return "category_traversal_ms";
        case Resource::TopicExpansionMs: return "topic_expansion_ms";
    }
    return "unknown";
}

// Executor-side bookkeeping against an allocated Budget
class BudgetTracker {
public:
    explicit BudgetTracker(Budget budget) : budget_(budget) {}

    void track(Resource r, float amount) {
        consumed_[index(r)] += std::max(0.0f, amount);
    }

    float consumed(Resource r) const { return consumed_[index(r)]; }

    float limit(Resource r) const {
        switch (r) {
            case Resource::VectorSearchMs: return budget_.vector_search_ms;
            case Resource::GraphTraversalMs: return budget_.graph_traversal_ms;
            case Resource::RankingMs: return budget_.ranking_ms;
            case Resource::NodesVisited: return static_cast<float>(budget_.max_nodes);
            case Resource::EdgesTraversed: return static_cast<float>(budget_.max_edges);
            case Resource::CategoryTraversalMs: return budget_.category_traversal_ms;
            case Resource::TopicExpansionMs: return budget_.topic_expansion_ms;
        }
        return 0.0f;
    }

    bool exceeded(Resource r) const {
        return consumed(r) > limit(r);
    }

    // Mean consumed/limit over resources that have a non-zero limit
    float consumed_ratio() const {
        float sum = 0.0f;
        size_t n = 0;
        for (size_t i = 0; i < RESOURCE_COUNT; ++i) {
            float l = limit(static_cast<Resource>(i));
            if (l <= 0.0f) continue;
            sum += consumed_[i] / l;
            n++;
        }
        return n == 0 ? 0.0f : sum / static_cast<float>(n);
    }

    const Budget& budget() const { return budget_; }

    json report() const {
        json consumed_json = json::object();
        json ratios = json::object();
        for (size_t i = 0; i < RESOURCE_COUNT; ++i) {
            auto r = static_cast<Resource>(i);
            consumed_json[resource_name(r)] = consumed_[i];
            float l = limit(r);
            ratios[resource_name(r)] = l > 0.0f ? consumed_[i] / l : 0.0f;
        }
        return {
            {"consumed", consumed_json},
            {"ratios", ratios},
            {"budget", budget_.to_json()},
            {"overall_consumption_ratio", consumed_ratio()}
        };
    }

private:
    static size_t index(Resource r) { return static_cast<size_t>(r); }

    Budget budget_;
    std::array<float, RESOURCE_COUNT> consumed_{};
};

} // namespace marga
