#pragma once
// Orchestrator: one plan() call, start to finish
//
// Stages run in a fixed order:
//   1. base weighting     graph kind, vector/graph mix, edge types, adaptive top_k/depth
//   2. expansion          topics and categories, only when the query has text
//   3. rewriting          intent templates inject strategy and preferences
//   4. traversal planning level budgets, activation depths, entity priorities
//   5. budget allocation  advisory ceilings (vector-only without graph data)
//   6. metrics / trace    plan id from the metrics sink, trace event
//
// Only a missing query vector or an out-of-range traversal depth is fatal.
// Every other stage degrades and reports through stderr and the tracer.

#include "types.hpp"
#include "error.hpp"
#include "config.hpp"
#include "tracer.hpp"
#include "plan.hpp"
#include "graph_access.hpp"
#include "relationship_weights.hpp"
#include "category_graph.hpp"
#include "entity_importance.hpp"
#include "query_expansion.hpp"
#include "query_rewriter.hpp"
#include "traversal_planner.hpp"
#include "budget.hpp"
#include "learning.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace marga {

using json = nlohmann::json;

struct Query {
    std::optional<Vector> vector;
    std::string text;
    size_t max_vector_results = 5;
    int max_traversal_depth = 2;
    std::optional<std::vector<std::string>> edge_types;  // nullopt: ask the graph
    float min_similarity = 0.5f;
    Priority priority = Priority::Normal;
    std::vector<std::string> category_filter;
    bool expand_query = true;
    bool expand_topics = false;
    float topic_expansion_factor = 1.0f;
    std::string trace_id;

    json to_json() const {
        json j = {
            {"has_vector", vector.has_value()},
            {"text", text},
            {"max_vector_results", max_vector_results},
            {"max_traversal_depth", max_traversal_depth},
            {"min_similarity", min_similarity},
            {"priority", priority_name(priority)}
        };
        if (edge_types) j["edge_types"] = *edge_types;
        if (!category_filter.empty()) j["category_filter"] = category_filter;
        if (expand_topics) j["topic_expansion_factor"] = topic_expansion_factor;
        if (!trace_id.empty()) j["trace_id"] = trace_id;
        return j;
    }

    static Query from_json(const json& j) {
        if (!j.is_object()) throw InvalidQueryError("query must be a JSON object");
        Query q;
        try {
            if (j.contains("vector") && !j["vector"].is_null()) {
                q.vector = j["vector"].get<Vector>();
            }
            q.text = j.value("text", "");
            q.max_vector_results = j.value("max_vector_results", q.max_vector_results);
            q.max_traversal_depth = j.value("max_traversal_depth", q.max_traversal_depth);
            if (j.contains("edge_types") && !j["edge_types"].is_null()) {
                q.edge_types = j["edge_types"].get<std::vector<std::string>>();
            }
            q.min_similarity = j.value("min_similarity", q.min_similarity);
            if (j.contains("priority")) {
                auto p = parse_priority(j["priority"].get<std::string>());
                if (!p) throw InvalidQueryError("unknown priority '" + j["priority"].get<std::string>() + "'");
                q.priority = *p;
            }
            if (j.contains("category_filter")) {
                q.category_filter = j["category_filter"].get<std::vector<std::string>>();
            }
            q.expand_query = j.value("expand_query", q.expand_query);
            q.expand_topics = j.value("expand_topics", q.expand_topics);
            q.topic_expansion_factor = j.value("topic_expansion_factor", q.topic_expansion_factor);
            q.trace_id = j.value("trace_id", "");
        } catch (const json::exception& e) {
            throw InvalidQueryError(std::string("malformed field: ") + e.what());
        }
        if (q.max_traversal_depth < 0) throw InvalidQueryError("max_traversal_depth must be non-negative");
        return q;
    }
};

// What the caller lends the planner for one call
struct DataAccess {
    const GraphAccessor* graph = nullptr;  // nullptr: no graph
    VectorSearchFn search;                 // empty: no topic expansion
};

struct PlanningRecord {
    Timestamp at = 0;
    json params;
    bool expanded = false;
    std::string graph_type;
};

class Orchestrator {
public:
    explicit Orchestrator(PlannerConfig config = {},
                          Tracer* tracer = nullptr,
                          MetricsSink* metrics = nullptr)
        : config_(validated(std::move(config)))
        , tracer_(tracer)
        , metrics_(metrics)
        , weights_(config_.weights)
        , learning_(weights_, config_.learning)
        , expansion_(config_.expansion, tracer)
        , rewriter_(config_.rewriter)
        , traversal_(weights_, config_.traversal)
        , budgets_(config_.budget)
    {}

    void set_tracer(Tracer* tracer) {
        tracer_ = tracer;
        expansion_.set_tracer(tracer);
    }

    void set_metrics(MetricsSink* metrics) { metrics_ = metrics; }

    ExecutionPlan plan(const Query& query, const DataAccess& data = {}) {
        if (!query.vector || query.vector->empty()) {
            throw InvalidQueryError("query vector is required");
        }
        if (query.max_traversal_depth < 0 ||
            query.max_traversal_depth > config_.traversal.max_depth_limit) {
            throw InvalidQueryError("max_traversal_depth must be in [0, " +
                                    std::to_string(config_.traversal.max_depth_limit) + "]");
        }
        const GraphAccessor& graph = data.graph ? *data.graph
                                                : static_cast<const GraphAccessor&>(absent_);

        ExecutionPlan plan;
        plan.priority = query.priority;

        // 1. Base weighting
        GraphKind kind = detect_graph_kind(graph);
        plan.graph_type = graph_kind_name(kind);
        apply_base_weighting(plan, query, kind);

        std::vector<Entity> sample = sample_entities(graph, query.trace_id);
        std::vector<std::string> edge_types = resolve_edge_types(query, graph, !sample.empty());
        plan.hints.edge_types = weights_.prioritize(edge_types);

        // 2. Expansion
        if (query.expand_query && !query.text.empty()) {
            try {
                plan.expansion = expansion_.expand(*query.vector, query.text, data.search,
                                                   categories_, query.trace_id);
            } catch (const std::exception& e) {
                report_failure(tracer_, "Orchestrator", "expansion_failure",
                               std::string("expansion skipped: ") + e.what(),
                               {{"trace_id", query.trace_id}});
            }
        }

        // 3. Rewriting
        if (!query.text.empty() && !rewriter_.accepts(query.text)) {
            report_failure(tracer_, "Orchestrator", "rewrite_skipped",
                           "rewriting skipped: text of " + std::to_string(query.text.size()) +
                           " chars exceeds " + std::to_string(config_.rewriter.max_pattern_text),
                           {{"trace_id", query.trace_id}, {"text_length", query.text.size()}});
        } else if (!query.text.empty()) {
            try {
                rewriter_.rewrite_plan(plan, query.text);
            } catch (const std::exception& e) {
                std::cerr << "[Orchestrator] rewriting skipped: " << e.what() << "\n";
            }
        }

        // 4. Traversal planning
        if (!plan.hints.edge_types.empty()) {
            plan.traversal = traversal_.plan(plan.hints.edge_types, plan.hints.max_depth,
                                             config_.node_budget);
        } else {
            plan.traversal.max_depth = std::max(0, plan.hints.max_depth);
        }
        plan.entity_priorities = prioritize_entities(sample);

        // 5. Budget allocation
        plan.budget = budgets_.allocate(plan.hints, plan.priority, plan.vector_params.top_k);
        if (plan.traversal.empty()) plan.budget.make_vector_only();

        // 6. Metrics and trace
        emit(plan, query);
        remember(query, plan);
        return plan;
    }

    // Importance of one entity; lookup failures fall back to a neutral snapshot
    float entity_importance(const std::string& entity_id, const GraphAccessor& graph) {
        Entity entity;
        entity.id = entity_id;
        try {
            if (auto found = graph.get_entity(entity_id)) entity = *found;
        } catch (const std::exception& e) {
            report_failure(tracer_, "Orchestrator", "graph_access_failure",
                           "entity lookup failed for '" + entity_id + "': " + e.what(),
                           {{"entity_id", entity_id}});
        }
        EntityImportanceModel model(config_.importance);
        auto category_weights = categories_.weights_for(entity.categories);
        return model.score(entity, &category_weights);
    }

    OutcomeSummary record_outcome(const std::string& query_id,
                                  const std::vector<RetrievalResult>& results,
                                  float elapsed_seconds,
                                  const ExecutionPlan& plan_used) {
        OutcomeSummary summary = learning_.record_outcome(query_id, results, elapsed_seconds, plan_used);
        if (tracer_) tracer_->log_event("outcome_recorded", summary.to_json());
        return summary;
    }

    bool should_stop_early(const std::vector<RetrievalResult>& results, float consumed_ratio) const {
        return budgets_.should_stop_early(results, consumed_ratio);
    }

    std::vector<PlanningRecord> history() const {
        std::lock_guard<std::mutex> lock(history_mutex_);
        return history_;
    }

    const PlannerConfig& config() const { return config_; }
    RelationshipWeightTable& weights() { return weights_; }
    CategoryGraph& categories() { return categories_; }
    LearningFeedbackLoop& learning() { return learning_; }
    BudgetAllocator& budgets() { return budgets_; }
    const QueryRewriter& rewriter() const { return rewriter_; }

private:
    static PlannerConfig validated(PlannerConfig config) {
        config.validate();
        return config;
    }

    void apply_base_weighting(ExecutionPlan& plan, const Query& query, GraphKind kind) const {
        size_t top_k = query.max_vector_results;
        int depth = query.max_traversal_depth;
        if (config_.adapt_parameters) {
            AdaptedParams adapted = learning_.adapt(top_k, depth);
            top_k = adapted.top_k;
            depth = adapted.max_depth;
        }

        plan.vector_params.top_k = top_k;
        plan.vector_params.min_score = query.min_similarity;
        plan.vector_params.categories = query.category_filter;

        plan.weights.vector = config_.vector_weight;
        plan.weights.graph = config_.graph_weight;

        plan.hints.max_depth = depth;
        plan.hints.expand_topics = query.expand_topics;
        plan.hints.topic_expansion_factor = query.topic_expansion_factor;
        if (kind == GraphKind::FlatLink) {
            plan.hints.strategy = Strategy::Standard;
            plan.hints.hierarchical_weight = 1.0f;
            plan.weights.hierarchical_bonus = 0.0f;
        } else {
            plan.hints.strategy = Strategy::Hierarchical;
            plan.hints.hierarchical_weight = config_.hierarchical_weight;
            plan.weights.hierarchical_bonus = config_.hierarchical_bonus;
        }
    }

    std::vector<Entity> sample_entities(const GraphAccessor& graph, const std::string& trace_id) const {
        try {
            return graph.get_entities(config_.entity_sample);
        } catch (const std::exception& e) {
            report_failure(tracer_, "Orchestrator", "graph_access_failure",
                           std::string("entity sample failed: ") + e.what(),
                           {{"trace_id", trace_id}});
            return {};
        }
    }

    // Query edge types, else the graph's, else the default vocabulary.
    // A graph with no entities and no relationship types yields none.
    std::vector<std::string> resolve_edge_types(const Query& query, const GraphAccessor& graph,
                                                bool has_entities) const {
        std::vector<std::string> graph_types;
        try {
            graph_types = graph.get_relationship_types();
        } catch (const std::exception& e) {
            report_failure(tracer_, "Orchestrator", "graph_access_failure",
                           std::string("relationship types unavailable: ") + e.what(),
                           {{"trace_id", query.trace_id}});
        }

        if (!has_entities && graph_types.empty()) return {};
        if (query.edge_types && !query.edge_types->empty()) return *query.edge_types;
        if (!graph_types.empty()) return graph_types;
        return config_.default_edge_types;
    }

    std::vector<EntityPriority> prioritize_entities(const std::vector<Entity>& sample) const {
        std::vector<EntityPriority> priorities;
        if (sample.empty()) return priorities;

        std::vector<std::string> cats;
        for (const auto& e : sample) {
            cats.insert(cats.end(), e.categories.begin(), e.categories.end());
        }
        auto category_weights = categories_.weights_for(cats);

        // Fresh per call: the cache must not outlive this plan
        EntityImportanceModel model(config_.importance);
        for (const auto& [entity, score] : model.rank_scored(sample, &category_weights)) {
            if (priorities.size() >= config_.entity_priorities) break;
            priorities.push_back({entity.id, score});
        }
        return priorities;
    }

    void emit(ExecutionPlan& plan, const Query& query) {
        if (metrics_) {
            try {
                plan.plan_id = metrics_->start_tracking(query.to_json());
            } catch (const std::exception& e) {
                std::cerr << "[Orchestrator] metrics tracking failed: " << e.what() << "\n";
            }
        }
        if (tracer_) {
            json payload = {
                {"trace_id", query.trace_id},
                {"graph_type", plan.graph_type},
                {"strategy", strategy_name(plan.hints.strategy)},
                {"edge_types", plan.traversal.edge_types},
                {"vector_only", plan.traversal.empty()},
                {"expanded", plan.expansion && plan.expansion->has_expansions}
            };
            if (plan.pattern) payload["pattern"] = pattern_name(plan.pattern->kind);
            if (plan.plan_id) payload["plan_id"] = *plan.plan_id;
            tracer_->log_event("plan_created", payload);
        }
    }

    void remember(const Query& query, const ExecutionPlan& plan) {
        PlanningRecord record;
        record.at = now();
        record.params = query.to_json();
        record.expanded = plan.expansion && plan.expansion->has_expansions;
        record.graph_type = plan.graph_type;

        std::lock_guard<std::mutex> lock(history_mutex_);
        history_.push_back(std::move(record));
        if (history_.size() > config_.history_limit) {
            history_.erase(history_.begin(),
                           history_.begin() + (history_.size() - config_.history_limit));
        }
    }

    PlannerConfig config_;
    Tracer* tracer_ = nullptr;
    MetricsSink* metrics_ = nullptr;

    RelationshipWeightTable weights_;
    CategoryGraph categories_;
    LearningFeedbackLoop learning_;
    QueryExpansionEngine expansion_;
    QueryRewriter rewriter_;
    TraversalPlanner traversal_;
    BudgetAllocator budgets_;
    AbsentGraph absent_;

    mutable std::mutex history_mutex_;
    std::vector<PlanningRecord> history_;
};

} // namespace marga
