#pragma once
// Query rewriter: intent templates that steer traversal
//
// Templates are tried in a fixed order against the lowercased text and
// the first match wins:
//   1. topic_lookup  "information on X", "details about X"
//   2. comparison    "compare X and Y", "differences between X vs Y"
//   3. definition    "what is X", "define X", "meaning of X"
//   4. causal        "effects of X", "causes of X", "impact of X"
//   5. enumeration   "list of X", "types of X", "examples of X"
//
// No match leaves the plan untouched. std::regex matching recurses per
// character, so texts longer than max_pattern_text are never matched.

#include "types.hpp"
#include "error.hpp"
#include "hints.hpp"
#include "plan.hpp"
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace marga {

struct RewriterConfig {
    size_t max_pattern_text = 512;   // Longer texts skip template matching

    void validate() const {
        if (max_pattern_text == 0) {
            throw ConfigurationError("max pattern text must be at least 1");
        }
    }
};

struct IntentTemplate {
    PatternKind kind;
    std::regex pattern;
};

class QueryRewriter {
public:
    explicit QueryRewriter(RewriterConfig config = {}) : config_(config) {
        config_.validate();
        templates_.push_back({PatternKind::TopicLookup, std::regex(
            "(?:about|information|details)\\s+(?:on|about)\\s+([a-z0-9\\s]+)")});
        templates_.push_back({PatternKind::Comparison, std::regex(
            "(?:compare|comparison|differences?|similarities?)\\s+(?:(?:between|of)\\s+)?"
            "([a-z0-9\\s]+?)\\s+(?:and|vs\\.?|versus)\\s+([a-z0-9\\s]+)")});
        templates_.push_back({PatternKind::Definition, std::regex(
            "(?:what\\s+is|define|definition\\s+of|meaning\\s+of)\\s+([a-z0-9\\s]+)")});
        templates_.push_back({PatternKind::Causal, std::regex(
            "(?:causes?|effects?|impact|influence|results?)\\s+of\\s+([a-z0-9\\s]+)")});
        templates_.push_back({PatternKind::Enumeration, std::regex(
            "(?:list|enumerate|types|kinds|categories|examples)\\s+of\\s+([a-z0-9\\s]+)")});
    }

    bool accepts(const std::string& query_text) const {
        return query_text.size() <= config_.max_pattern_text;
    }

    std::optional<PatternMatch> rewrite(const std::string& query_text) const {
        if (!accepts(query_text)) return std::nullopt;
        std::string text = to_lower(query_text);
        for (const auto& t : templates_) {
            std::smatch match;
            if (!std::regex_search(text, match, t.pattern)) continue;

            PatternMatch result{t.kind, {}};
            for (size_t i = 1; i < match.size(); ++i) {
                std::string entity = trim(match[i].str());
                if (!entity.empty()) result.entities.push_back(entity);
            }
            if (result.entities.empty()) continue;
            return result;
        }
        return std::nullopt;
    }

    // Inject the strategy and traversal preferences for a recognized intent
    void apply_hints(ExecutionPlan& plan, PatternKind kind,
                     const std::vector<std::string>& entities) const {
        auto& hints = plan.hints;
        switch (kind) {
            case PatternKind::TopicLookup:
                hints.strategy = Strategy::TopicFocused;
                hints.target_entities = entities;
                hints.prioritize_relationships = true;
                break;
            case PatternKind::Comparison:
                hints.strategy = Strategy::Comparison;
                hints.comparison_entities = entities;
                hints.find_common_categories = true;
                hints.find_relationships_between = true;
                break;
            case PatternKind::Definition:
                hints.strategy = Strategy::Definition;
                hints.target_entities = entities;
                hints.prioritize_edge_types = {"instance_of", "subclass_of", "defined_as"};
                break;
            case PatternKind::Causal:
                hints.strategy = Strategy::Causal;
                hints.target_entities = entities;
                hints.prioritize_edge_types = {"causes", "caused_by", "affects", "affected_by"};
                break;
            case PatternKind::Enumeration:
                hints.strategy = Strategy::Collection;
                hints.prioritize_edge_types = {"instance_of", "subclass_of", "example_of", "has_example"};
                hints.collection_target = entities.empty() ? "" : entities.front();
                break;
        }
        plan.pattern = PatternMatch{kind, entities};
    }

    // rewrite() + apply_hints(); returns whether a template matched
    bool rewrite_plan(ExecutionPlan& plan, const std::string& query_text) const {
        auto match = rewrite(query_text);
        if (!match) return false;
        apply_hints(plan, match->kind, match->entities);
        return true;
    }

    const RewriterConfig& config() const { return config_; }

private:
    RewriterConfig config_;
    std::vector<IntentTemplate> templates_;
};

} // namespace marga
