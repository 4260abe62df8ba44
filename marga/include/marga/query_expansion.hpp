#pragma once
// Query expansion: widen recall before the plan is fixed
//
// Two independent sources:
// - Topics: nearest "topic" hits from the caller's vector store
// - Categories: hierarchy nodes whose name tokens overlap the query text,
//   plus their immediate neighbours, most specific first
//
// Expansion is best effort. A failing vector store yields no topics and
// is reported; it never aborts planning.

#include "types.hpp"
#include "error.hpp"
#include "category_graph.hpp"
#include "tracer.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace marga {

using json = nlohmann::json;

// One hit from the external similarity search
struct SearchHit {
    std::string id;
    float score = 0.0f;
    json metadata;  // expected keys: "type", "name", "category"
};

using SearchFilter = std::function<bool(const SearchHit&)>;

// search(vector, top_k, filter) -> hits, best first
using VectorSearchFn =
    std::function<std::vector<SearchHit>(const Vector&, size_t, const SearchFilter&)>;

struct ExpansionConfig {
    float similarity_threshold = 0.65f;      // Minimum topic similarity
    size_t max_expansions = 5;               // Per source
    size_t candidate_multiplier = 2;         // Ask the store for this many x max_expansions
    float category_overlap_threshold = 0.5f; // Fraction of category tokens found in query
    int related_distance = 1;                // Neighbourhood added around direct matches
    std::string topic_type = "topic";        // metadata["type"] of topic hits

    void validate() const {
        if (similarity_threshold < 0.0f || similarity_threshold > 1.0f) {
            throw ConfigurationError("expansion similarity threshold must be in [0, 1]");
        }
        if (category_overlap_threshold <= 0.0f || category_overlap_threshold > 1.0f) {
            throw ConfigurationError("category overlap threshold must be in (0, 1]");
        }
        if (candidate_multiplier == 0) {
            throw ConfigurationError("candidate multiplier must be at least 1");
        }
        if (related_distance < 0) {
            throw ConfigurationError("related distance must be non-negative");
        }
    }
};

struct TopicExpansion {
    std::string topic_id;
    std::string name;
    float similarity = 0.0f;
};

struct CategoryExpansion {
    std::string category;
    int depth = 0;
};

struct ExpansionResult {
    Vector query_vector;
    std::string query_text;
    std::vector<TopicExpansion> topics;        // similarity >= threshold, best first
    std::vector<CategoryExpansion> categories; // depth descending
    bool has_expansions = false;

    json to_json() const {
        json topics_json = json::array();
        for (const auto& t : topics) {
            topics_json.push_back({{"id", t.topic_id}, {"name", t.name}, {"similarity", t.similarity}});
        }
        json categories_json = json::array();
        for (const auto& c : categories) {
            categories_json.push_back({{"name", c.category}, {"depth", c.depth}});
        }
        return {
            {"original_query_text", query_text},
            {"topics", topics_json},
            {"categories", categories_json},
            {"has_expansions", has_expansions}
        };
    }
};

class QueryExpansionEngine {
public:
    explicit QueryExpansionEngine(ExpansionConfig config = {}, Tracer* tracer = nullptr)
        : config_(std::move(config)), tracer_(tracer)
    {
        config_.validate();
    }

    void set_tracer(Tracer* tracer) { tracer_ = tracer; }

    const ExpansionConfig& config() const { return config_; }

    ExpansionResult expand(const Vector& query_vector,
                           const std::string& query_text,
                           const VectorSearchFn& search,
                           const CategoryGraph& categories,
                           const std::string& trace_id = "") const
    {
        ExpansionResult result;
        result.query_vector = query_vector;
        result.query_text = query_text;

        if (search) {
            result.topics = expand_topics(query_vector, search, trace_id);
        }
        result.categories = expand_categories(query_text, categories);
        result.has_expansions = !result.topics.empty() || !result.categories.empty();

        if (tracer_) {
            json payload = result.to_json();
            payload["trace_id"] = trace_id;
            tracer_->log_event("query_expansion", payload);
        }
        return result;
    }

    // Category names whose tokens overlap the query text enough to count
    std::vector<std::string> match_categories(const std::string& query_text,
                                              const CategoryGraph& categories) const {
        std::vector<std::string> matches;
        auto query_tokens_vec = tokenize(query_text);
        std::unordered_set<std::string> query_tokens(query_tokens_vec.begin(), query_tokens_vec.end());
        if (query_tokens.empty()) return matches;

        for (const auto& category : categories.categories()) {
            auto cat_vec = tokenize(category);
            std::set<std::string> cat_tokens(cat_vec.begin(), cat_vec.end());
            if (cat_tokens.empty()) continue;

            size_t overlap = 0;
            for (const auto& t : cat_tokens) {
                if (query_tokens.count(t)) overlap++;
            }
            float ratio = static_cast<float>(overlap) / static_cast<float>(cat_tokens.size());
            if (overlap > 0 && ratio >= config_.category_overlap_threshold) {
                matches.push_back(category);
            }
        }
        return matches;
    }

private:
    std::vector<TopicExpansion> expand_topics(const Vector& query_vector,
                                              const VectorSearchFn& search,
                                              const std::string& trace_id) const {
        std::vector<TopicExpansion> topics;
        const std::string topic_type = config_.topic_type;
        SearchFilter is_topic = [topic_type](const SearchHit& hit) {
            return hit.metadata.is_object() &&
                   hit.metadata.contains("type") &&
                   hit.metadata["type"].is_string() &&
                   hit.metadata["type"].get<std::string>() == topic_type;
        };

        try {
            auto hits = search(query_vector,
                               config_.max_expansions * config_.candidate_multiplier,
                               is_topic);

            // Stores are not trusted to honour the filter or the ordering
            hits.erase(std::remove_if(hits.begin(), hits.end(),
                           [&](const SearchHit& h) {
                               return !is_topic(h) || h.score < config_.similarity_threshold;
                           }),
                       hits.end());
            std::stable_sort(hits.begin(), hits.end(),
                             [](const SearchHit& a, const SearchHit& b) { return a.score > b.score; });
            if (hits.size() > config_.max_expansions) hits.resize(config_.max_expansions);

            for (const auto& hit : hits) {
                std::string name;
                if (hit.metadata.contains("name") && hit.metadata["name"].is_string()) {
                    name = hit.metadata["name"].get<std::string>();
                }
                topics.push_back({hit.id, name, std::min(hit.score, 1.0f)});
            }
        } catch (const std::exception& e) {
            report_failure(tracer_, "QueryExpansion", "expansion_failure",
                           std::string("topic expansion failed: ") + e.what(),
                           {{"trace_id", trace_id}});
            topics.clear();
        }
        return topics;
    }

    std::vector<CategoryExpansion> expand_categories(const std::string& query_text,
                                                     const CategoryGraph& categories) const {
        auto direct = match_categories(query_text, categories);

        std::set<std::string> all(direct.begin(), direct.end());
        for (const auto& category : direct) {
            for (const auto& [name, _] : categories.related(category, config_.related_distance)) {
                all.insert(name);
            }
        }

        std::vector<CategoryExpansion> expanded;
        expanded.reserve(all.size());
        for (const auto& name : all) {
            expanded.push_back({name, categories.depth(name)});
        }
        // Most specific first; names break ties (set order is already by name)
        std::stable_sort(expanded.begin(), expanded.end(),
                         [](const CategoryExpansion& a, const CategoryExpansion& b) {
                             return a.depth > b.depth;
                         });
        if (expanded.size() > config_.max_expansions) expanded.resize(config_.max_expansions);
        return expanded;
    }

    ExpansionConfig config_;
    Tracer* tracer_ = nullptr;
};

} // namespace marga
