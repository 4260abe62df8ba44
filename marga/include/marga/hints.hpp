#pragma once
// Plan hints: the parts of a plan that steer, rather than bound, execution

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace marga {

using json = nlohmann::json;

// Query intent recognized from text
enum class PatternKind {
    TopicLookup,   // "information about X"
    Comparison,    // "compare X and Y"
    Definition,    // "what is X"
    Causal,        // "effects of X"
    Enumeration    // "types of X"
};

inline std::string pattern_name(PatternKind kind) {
    switch (kind) {
        case PatternKind::TopicLookup: return "topic_lookup";
        case PatternKind::Comparison: return "comparison";
        case PatternKind::Definition: return "definition";
        case PatternKind::Causal: return "causal";
        case PatternKind::Enumeration: return "enumeration";
    }
    return "unknown";
}

struct PatternMatch {
    PatternKind kind;
    std::vector<std::string> entities;

    json to_json() const {
        return {{"kind", pattern_name(kind)}, {"entities", entities}};
    }
};

struct VectorParams {
    size_t top_k = 5;
    float min_score = 0.5f;
    std::vector<std::string> categories;  // restrict hits to these categories

    json to_json() const {
        json j = {{"top_k", top_k}, {"min_score", min_score}};
        if (!categories.empty()) j["categories"] = categories;
        return j;
    }
};

struct TraversalHints {
    Strategy strategy = Strategy::Hierarchical;
    std::vector<std::string> edge_types;     // prioritized
    int max_depth = 2;
    float hierarchical_weight = 1.0f;
    std::string entity_importance_strategy = "hierarchical_and_reference_based";

    bool expand_topics = false;
    float topic_expansion_factor = 1.0f;

    // Set by intent rewriting
    bool prioritize_relationships = false;
    std::vector<std::string> target_entities;
    std::vector<std::string> comparison_entities;
    bool find_common_categories = false;
    bool find_relationships_between = false;
    std::vector<std::string> prioritize_edge_types;
    std::string collection_target;

    json to_json() const {
        json j = {
            {"strategy", strategy_name(strategy)},
            {"edge_types", edge_types},
            {"max_depth", max_depth},
            {"hierarchical_weight", hierarchical_weight},
            {"entity_importance_strategy", entity_importance_strategy}
        };
        if (expand_topics) {
            j["expand_topics"] = true;
            j["topic_expansion_factor"] = topic_expansion_factor;
        }
        if (prioritize_relationships) j["prioritize_relationships"] = true;
        if (!target_entities.empty()) j["target_entities"] = target_entities;
        if (!comparison_entities.empty()) j["comparison_entities"] = comparison_entities;
        if (find_common_categories) j["find_common_categories"] = true;
        if (find_relationships_between) j["find_relationships_between"] = true;
        if (!prioritize_edge_types.empty()) j["prioritize_edge_types"] = prioritize_edge_types;
        if (!collection_target.empty()) j["collection_target"] = collection_target;
        return j;
    }
};

} // namespace marga
