#include <marga/marga.hpp>
#include <iostream>
#include <cassert>
#include <cmath>
#include <stdexcept>

using namespace marga;

bool near(float a, float b, float eps = 1e-4f) {
    return std::fabs(a - b) < eps;
}

template <typename Fn>
bool throws_configuration_error(Fn fn) {
    try {
        fn();
    } catch (const ConfigurationError&) {
        return true;
    }
    return false;
}

// Keeps every event for inspection
class RecordingTracer : public Tracer {
public:
    void log_event(const std::string& kind, const json& payload) override {
        events.emplace_back(kind, payload);
    }

    bool has(const std::string& kind) const {
        for (const auto& [k, _] : events) {
            if (k == kind) return true;
        }
        return false;
    }

    std::vector<std::pair<std::string, json>> events;
};

class FixedMetrics : public MetricsSink {
public:
    std::string start_tracking(const json& query_params) override {
        last_params = query_params;
        return "plan-" + std::to_string(++calls);
    }

    int calls = 0;
    json last_params;
};

// Every lookup fails
class BrokenGraph : public GraphAccessor {
public:
    std::vector<Entity> get_entities(size_t) const override {
        throw GraphAccessFailure("backend offline");
    }
    std::vector<std::string> get_relationship_types() const override {
        throw GraphAccessFailure("backend offline");
    }
    std::optional<Entity> get_entity(const std::string&) const override {
        throw GraphAccessFailure("backend offline");
    }
};

std::vector<SearchHit> failing_search(const Vector&, size_t, const SearchFilter&) {
    throw std::runtime_error("vector store unreachable");
}

json wiki_snapshot() {
    return {
        {"graph_type", "wikipedia"},
        {"entities", json::array({
            {{"id", "Q1"}, {"type", "article"}, {"inbound_connections", 120},
             {"outbound_connections", 40}, {"reference_count", 30},
             {"categories", {"Physics"}}, {"mention_count", 60}, {"last_modified", now()}},
            {{"id", "Q2"}, {"type", "article"}, {"inbound_connections", 1}, {"reference_count", 0}},
            {{"id", "Q3"}, {"type", "category"}}
        })},
        {"relationship_types", {"mentions", "subclass_of", "instance_of", "related_to"}},
        {"category_edges", json::array({json::array({"Science", "Physics"})})}
    };
}

Query vector_query(const std::string& text = "") {
    Query q;
    q.vector = Vector{0.1f, 0.2f, 0.3f};
    q.text = text;
    return q;
}

// ═══════════════════════════════════════════════════════════════════════════
// Relationship weights
// ═══════════════════════════════════════════════════════════════════════════

void test_edge_type_normalization() {
    std::cout << "Testing edge type normalization..." << std::endl;

    assert(normalize_edge_type("subclass_of") == "subclass_of");
    assert(normalize_edge_type("Is Subclass-Of") == "subclass_of");
    assert(normalize_edge_type("SubclassOf") == "subclass_of");
    assert(normalize_edge_type("is_instance_of") == "instance_of");
    assert(normalize_edge_type("ContainsPart") == "has_part");
    assert(normalize_edge_type("  related  to ") == "related_to");

    std::cout << "  PASS" << std::endl;
}

void test_relationship_weights() {
    std::cout << "Testing RelationshipWeightTable..." << std::endl;

    RelationshipWeightTable table;
    assert(near(table.weight("subclass_of"), 1.5f));
    assert(near(table.weight("Subclass Of"), 1.5f));
    assert(near(table.weight("mentions"), 0.5f));

    // Never-weighted types get the default
    for (const char* e : {"frobnicates", "links_to", "zz_top"}) {
        assert(!table.has_explicit_weight(e));
        assert(near(table.weight(e), table.default_weight()));
    }

    std::vector<std::string> input = {"mentions", "subclass_of", "instance_of", "related_to"};
    auto sorted = table.prioritize(input);
    std::vector<std::string> expected = {"subclass_of", "instance_of", "related_to", "mentions"};
    assert(sorted == expected);
    assert(table.prioritize(sorted) == sorted);

    // Equal weights keep input order
    auto ties = table.prioritize({"unknown_b", "unknown_a", "part_of"});
    assert(ties[0] == "part_of");
    assert(ties[1] == "unknown_b");
    assert(ties[2] == "unknown_a");

    auto high = table.filter_above({"mentions", "subclass_of", "related_to"}, 0.9f);
    assert(high.size() == 2);
    assert(high[0] == "subclass_of");
    assert(high[1] == "related_to");
    assert(table.filter_above({"mentions", "part_of"}).size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_weight_adjust_clamps() {
    std::cout << "Testing weight adjust clamping..." << std::endl;

    RelationshipWeightTable table;
    assert(near(table.adjust("subclass_of", 10.0f), MAX_EDGE_WEIGHT));
    assert(near(table.weight("subclass_of"), MAX_EDGE_WEIGHT));
    assert(near(table.adjust("brand_new", -10.0f), MIN_EDGE_WEIGHT));
    assert(table.has_explicit_weight("brand_new"));
    assert(near(table.adjust("related_to", 0.1f), 1.1f));

    assert(throws_configuration_error([&] { table.set("related_to", 2.5f); }));
    table.set("related_to", 0.3f);
    assert(near(table.weight("related_to"), 0.3f));

    WeightConfig bad;
    bad.overrides["subclass_of"] = 3.0f;
    assert(throws_configuration_error([&] { RelationshipWeightTable t(bad); }));

    WeightConfig custom;
    custom.default_weight = 0.8f;
    custom.overrides["Links To"] = 1.9f;
    RelationshipWeightTable t2(custom);
    assert(near(t2.weight("links_to"), 1.9f));
    assert(near(t2.weight("never_seen"), 0.8f));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Category graph
// ═══════════════════════════════════════════════════════════════════════════

void test_category_depth() {
    std::cout << "Testing CategoryGraph depth..." << std::endl;

    CategoryGraph g;
    g.register_edge("Science", "Physics");
    g.register_edge("Physics", "Quantum_Physics");
    g.register_edge("Physics", "Quantum_Physics");  // idempotent
    assert(g.edge_count() == 2);
    assert(g.depth("Science") == 0);
    assert(g.depth("Physics") == 1);
    assert(g.depth("Quantum_Physics") == 2);
    assert(g.depth("Unregistered") == 0);

    CategoryGraph chain;
    chain.register_edge("A", "B");
    chain.register_edge("B", "C");
    chain.register_edge("C", "D");
    assert(chain.depth("A") == 0);
    assert(chain.depth("B") == 1);
    assert(chain.depth("C") == 2);
    assert(chain.depth("D") == 3);

    // Longest path wins
    chain.register_edge("A", "D");
    chain.clear_cache();
    assert(chain.depth("D") == 3);

    std::cout << "  PASS" << std::endl;
}

void test_category_cycles() {
    std::cout << "Testing CategoryGraph cycles..." << std::endl;

    CategoryGraph cycle;
    cycle.register_edge("A", "B");
    cycle.register_edge("B", "C");
    cycle.register_edge("C", "A");
    int a = cycle.depth("A");
    assert(a == 3);
    assert(cycle.depth("C") == 2);
    assert(cycle.depth("B") == 1);

    CategoryGraph self;
    self.register_edge("Loop", "Loop");
    assert(self.depth("Loop") == 0);

    std::cout << "  PASS" << std::endl;
}

void test_category_related() {
    std::cout << "Testing CategoryGraph related..." << std::endl;

    CategoryGraph g;
    g.register_edge("Science", "Physics");
    g.register_edge("Science", "Biology");
    g.register_edge("Physics", "Quantum_Physics");

    auto near_physics = g.related("Physics", 1);
    assert(near_physics.size() == 2);
    for (const auto& [name, distance] : near_physics) {
        assert(name != "Physics");
        assert(distance == 1);
        assert(name == "Science" || name == "Quantum_Physics");
    }

    auto from_science = g.related("Science", 2);
    bool found_quantum = false;
    for (const auto& [name, distance] : from_science) {
        assert(name != "Science");
        assert(distance <= 2);
        if (name == "Quantum_Physics") {
            found_quantum = true;
            assert(distance == 2);
        }
    }
    assert(found_quantum);
    assert(g.related("Physics", 0).empty());

    auto w = g.weights_for({"Quantum_Physics", "Science"}, {{"Science", 0.5f}});
    assert(near(w["Quantum_Physics"], 0.7f));
    assert(near(w["Science"], 0.25f));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Entity importance
// ═══════════════════════════════════════════════════════════════════════════

void test_entity_importance_bounds() {
    std::cout << "Testing EntityImportanceModel bounds..." << std::endl;

    Timestamp t = now();
    EntityImportanceModel model({}, t);

    Entity neutral;
    neutral.id = "neutral";
    assert(near(model.score(neutral), 0.5f));

    Entity zero;
    zero.id = "zero";
    zero.inbound_connections = 0;
    zero.outbound_connections = 0;
    zero.reference_count = 0;
    zero.mention_count = 0;
    zero.last_modified = t;
    float z = model.score(zero);
    assert(z >= 0.0f && z <= 1.0f);
    assert(near(z, 0.25f));

    Entity huge;
    huge.id = "huge";
    huge.inbound_connections = 1000000;
    huge.outbound_connections = 1000000;
    huge.reference_count = 1000000;
    huge.mention_count = 1000000;
    huge.categories = {"X"};
    huge.last_modified = t + 10 * MILLIS_PER_DAY;  // future timestamp
    std::unordered_map<std::string, float> cw = {{"X", 1.5f}};
    float h = model.score(huge, &cw);
    assert(h >= 0.0f && h <= 1.0f);
    assert(near(h, 1.0f));

    Entity ancient;
    ancient.id = "ancient";
    ancient.last_modified = t - 5000 * MILLIS_PER_DAY;
    auto b = model.breakdown(ancient);
    assert(near(b.recency, 0.0f));

    std::cout << "  PASS" << std::endl;
}

void test_entity_importance_cache_and_rank() {
    std::cout << "Testing EntityImportanceModel cache/rank..." << std::endl;

    Timestamp t = now();
    EntityImportanceModel model({}, t);

    Entity hub;
    hub.id = "hub";
    hub.inbound_connections = 80;
    hub.reference_count = 15;
    Entity leaf;
    leaf.id = "leaf";
    leaf.inbound_connections = 1;
    leaf.reference_count = 0;

    float first = model.score(hub);
    float second = model.score(hub);
    assert(first == second);
    assert(model.cached_count() == 1);

    EntityImportanceModel fresh({}, t);
    assert(fresh.breakdown(hub).total == first);

    auto ranked = model.rank({leaf, hub});
    assert(ranked.size() == 2);
    assert(ranked[0].id == "hub");
    assert(ranked[1].id == "leaf");

    ImportanceConfig bad;
    bad.connection_weight = 0.9f;
    assert(throws_configuration_error([&] { EntityImportanceModel m(bad); }));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Query expansion
// ═══════════════════════════════════════════════════════════════════════════

void test_expansion_categories() {
    std::cout << "Testing QueryExpansionEngine categories..." << std::endl;

    CategoryGraph g;
    g.register_edge("Science", "Physics");
    g.register_edge("Physics", "Quantum_Physics");
    g.register_edge("Arts", "Music");

    QueryExpansionEngine engine;
    auto result = engine.expand({0.1f}, "quantum physics experiments", nullptr, g);
    assert(result.topics.empty());
    assert(result.has_expansions);
    assert(result.categories.size() == 3);
    assert(result.categories[0].category == "Quantum_Physics");
    assert(result.categories[0].depth == 2);
    assert(result.categories[1].category == "Physics");
    assert(result.categories[2].category == "Science");
    for (size_t i = 1; i < result.categories.size(); ++i) {
        assert(result.categories[i - 1].depth >= result.categories[i].depth);
    }

    auto none = engine.expand({0.1f}, "opera singers", nullptr, g);
    assert(!none.has_expansions);

    std::cout << "  PASS" << std::endl;
}

void test_expansion_topics() {
    std::cout << "Testing QueryExpansionEngine topics..." << std::endl;

    size_t requested = 0;
    VectorSearchFn search = [&](const Vector&, size_t top_k, const SearchFilter&) {
        requested = top_k;
        return std::vector<SearchHit>{
            {"t3", 0.60f, {{"type", "topic"}, {"name", "Weak"}}},
            {"a1", 0.95f, {{"type", "article"}, {"name", "Not a topic"}}},
            {"t1", 0.90f, {{"type", "topic"}, {"name", "Entanglement"}}},
            {"t2", 0.70f, {{"type", "topic"}, {"name", "Superposition"}}}
        };
    };

    QueryExpansionEngine engine;
    CategoryGraph empty;
    auto result = engine.expand({0.1f}, "", search, empty);
    assert(requested == 10);
    assert(result.topics.size() == 2);
    assert(result.topics[0].topic_id == "t1");
    assert(result.topics[0].name == "Entanglement");
    assert(result.topics[1].topic_id == "t2");
    for (const auto& t : result.topics) {
        assert(t.similarity >= 0.65f && t.similarity <= 1.0f);
    }
    assert(result.has_expansions);

    std::cout << "  PASS" << std::endl;
}

void test_expansion_search_failure() {
    std::cout << "Testing QueryExpansionEngine search failure..." << std::endl;

    CategoryGraph g;
    g.register_edge("Science", "Physics");

    RecordingTracer tracer;
    QueryExpansionEngine engine({}, &tracer);

    auto with_cats = engine.expand({0.1f}, "physics", failing_search, g, "trace-1");
    assert(with_cats.topics.empty());
    assert(with_cats.has_expansions == !with_cats.categories.empty());
    assert(with_cats.has_expansions);
    assert(tracer.has("expansion_failure"));

    auto without = engine.expand({0.1f}, "cooking", failing_search, g);
    assert(without.has_expansions == !without.categories.empty());
    assert(!without.has_expansions);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Traversal planning
// ═══════════════════════════════════════════════════════════════════════════

void test_level_budgets() {
    std::cout << "Testing TraversalPlanner level budgets..." << std::endl;

    RelationshipWeightTable weights;
    TraversalPlanner planner(weights);

    auto b = planner.level_budgets(3, 1000);
    assert(b.size() == 3);
    assert(b[0] == 400);
    assert(b[1] == 140);
    assert(b[2] == 98);

    for (int depth : {0, 1, 2, 4, 8}) {
        for (size_t total : {size_t(0), size_t(1), size_t(7), size_t(100), size_t(1000), size_t(12345)}) {
            auto levels = planner.level_budgets(depth, total);
            assert(levels.size() == static_cast<size_t>(depth));
            size_t sum = 0;
            for (size_t i = 0; i < levels.size(); ++i) {
                sum += levels[i];
                if (i > 0) assert(levels[i] <= levels[i - 1]);
            }
            assert(sum <= total);
        }
    }

    TraversalConfig bad;
    bad.level_decay = 1.5f;
    assert(throws_configuration_error([&] { TraversalPlanner p(weights, bad); }));

    TraversalConfig no_depth;
    no_depth.max_depth_limit = 0;
    assert(throws_configuration_error([&] { TraversalPlanner p(weights, no_depth); }));

    std::cout << "  PASS" << std::endl;
}

void test_traversal_plan() {
    std::cout << "Testing TraversalPlanner plan..." << std::endl;

    RelationshipWeightTable weights;
    TraversalPlanner planner(weights);

    auto plan = planner.plan({"mentions", "subclass_of", "instance_of", "related_to", "mentions"}, 3, 1000);
    std::vector<std::string> expected = {"subclass_of", "instance_of", "related_to", "mentions"};
    assert(plan.edge_types == expected);
    assert(plan.level_budgets.size() == 3);
    assert(plan.planned_nodes() <= 1000);
    assert(plan.activation_depth.at("subclass_of") == 3);
    assert(plan.activation_depth.at("instance_of") == 2);
    assert(plan.activation_depth.at("related_to") == 1);
    assert(plan.activation_depth.at("mentions") == 1);
    assert(near(plan.traversal_cost.at("subclass_of"), 0.6f));
    assert(near(plan.traversal_cost.at("mentions"), 1.5f));

    auto level2 = plan.active_at(2);
    assert(level2.size() == 2);
    assert(level2[0] == "subclass_of");

    auto single = planner.plan({"part_of"}, 4, 100);
    assert(single.activation_depth.at("part_of") == 4);

    // Spellings of one edge type are planned once
    auto spelled = planner.plan({"SubclassOf", "subclass_of", "Subclass Of", "mentions"}, 2, 100);
    assert(spelled.edge_types.size() == 2);
    assert(spelled.edge_types[0] == "SubclassOf");

    // Depth is clamped to the configured limit
    auto deep = planner.plan({"part_of"}, 1000000000, 1000);
    assert(deep.max_depth == 16);
    assert(deep.level_budgets.size() == 16);
    assert(planner.level_budgets(1000000000, 1000).size() == 16);

    assert(planner.plan({}, 3, 1000).empty());
    assert(planner.plan({"subclass_of"}, 0, 1000).empty());
    assert(near(traversal_cost("never_seen"), DEFAULT_TRAVERSAL_COST));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Budget
// ═══════════════════════════════════════════════════════════════════════════

void test_budget_allocation() {
    std::cout << "Testing BudgetAllocator allocate..." << std::endl;

    BudgetAllocator allocator;
    TraversalHints hints;
    hints.strategy = Strategy::Standard;

    Budget normal = allocator.allocate(hints, Priority::Normal);
    assert(near(normal.vector_search_ms, 500.0f));
    assert(near(normal.graph_traversal_ms, 1000.0f));
    assert(normal.max_nodes == 1000);
    assert(normal.max_categories == 20);

    Budget low = allocator.allocate(hints, Priority::Low);
    assert(near(low.vector_search_ms, 250.0f));
    assert(low.max_nodes == 500);

    hints.strategy = Strategy::Hierarchical;
    Budget hier = allocator.allocate(hints, Priority::Normal);
    assert(near(hier.graph_traversal_ms, 1300.0f, 1e-2f));
    assert(hier.max_nodes == 1300);
    assert(near(hier.vector_search_ms, 500.0f));

    hints.strategy = Strategy::TopicFocused;
    assert(near(allocator.allocate(hints, Priority::Normal).vector_search_ms, 700.0f, 1e-2f));

    hints.strategy = Strategy::Comparison;
    Budget cmp = allocator.allocate(hints, Priority::Normal);
    assert(near(cmp.vector_search_ms, 600.0f, 1e-2f));
    assert(near(cmp.graph_traversal_ms, 1200.0f, 1e-2f));

    hints.strategy = Strategy::Standard;
    hints.edge_types = {"Category Contains"};
    Budget cat = allocator.allocate(hints, Priority::Normal);
    assert(near(cat.category_traversal_ms, 7500.0f, 1e-2f));
    assert(cat.max_categories == 30);

    hints.edge_types.clear();
    hints.expand_topics = true;
    hints.topic_expansion_factor = 2.0f;
    Budget topics = allocator.allocate(hints, Priority::Normal);
    assert(near(topics.topic_expansion_ms, 6000.0f, 1e-2f));
    assert(topics.max_topics == 30);

    assert(estimate_complexity(1, 0, 0) == Complexity::Low);
    assert(estimate_complexity(5, 2, 0) == Complexity::Medium);
    assert(estimate_complexity(10, 3, 5) == Complexity::High);
    assert(estimate_complexity(20, 5, 10) == Complexity::VeryHigh);

    Budget vo = normal;
    vo.make_vector_only();
    assert(vo.vector_only());
    assert(vo.max_nodes == 0 && vo.max_edges == 0 && vo.max_categories == 0);
    assert(near(vo.vector_search_ms, 500.0f));

    std::cout << "  PASS" << std::endl;
}

void test_budget_monotonic_in_priority() {
    std::cout << "Testing budget monotonic in priority..." << std::endl;

    BudgetAllocator allocator;
    std::vector<TraversalHints> variants(4);
    variants[0].strategy = Strategy::Standard;
    variants[1].strategy = Strategy::Hierarchical;
    variants[1].edge_types = {"category_contains", "subclass_of"};
    variants[2].strategy = Strategy::TopicFocused;
    variants[2].expand_topics = true;
    variants[2].topic_expansion_factor = 1.7f;
    variants[3].strategy = Strategy::Comparison;
    variants[3].max_depth = 5;

    for (const auto& hints : variants) {
        for (size_t top_k : {size_t(1), size_t(5), size_t(20)}) {
            Budget prev = allocator.allocate(hints, Priority::Low, top_k);
            for (Priority p : {Priority::Normal, Priority::High}) {
                Budget next = allocator.allocate(hints, p, top_k);
                assert(next.vector_search_ms >= prev.vector_search_ms);
                assert(next.graph_traversal_ms >= prev.graph_traversal_ms);
                assert(next.ranking_ms >= prev.ranking_ms);
                assert(next.timeout_ms >= prev.timeout_ms);
                assert(next.max_nodes >= prev.max_nodes);
                assert(next.max_edges >= prev.max_edges);
                assert(next.category_traversal_ms >= prev.category_traversal_ms);
                assert(next.topic_expansion_ms >= prev.topic_expansion_ms);
                assert(next.max_categories >= prev.max_categories);
                assert(next.max_topics >= prev.max_topics);
                prev = next;
            }
        }
    }

    BudgetConfig inverted;
    inverted.low_multiplier = 2.0f;
    assert(throws_configuration_error([&] { BudgetAllocator a(inverted); }));

    BudgetConfig negative;
    negative.defaults.vector_search_ms = -1.0f;
    assert(throws_configuration_error([&] { BudgetAllocator a(negative); }));

    std::cout << "  PASS" << std::endl;
}

void test_early_stopping() {
    std::cout << "Testing early stopping..." << std::endl;

    BudgetAllocator allocator;

    std::vector<RetrievalResult> confident = {
        {"c1", 0.90f, "category", "Physics", {}},
        {"c2", 0.88f, "category", "Chemistry", {}},
        {"c3", 0.87f, "category", "Biology", {}}
    };
    assert(allocator.should_stop_early(confident, 0.6f));
    assert(!allocator.should_stop_early(confident, 0.5f));

    std::vector<RetrievalResult> samey;
    for (int i = 0; i < 12; ++i) {
        samey.push_back({"r" + std::to_string(i), 0.5f, "article", "Physics", {}});
    }
    assert(allocator.should_stop_early(samey, 0.7f));
    assert(!allocator.should_stop_early(samey, 0.65f));

    // Base heuristic
    std::vector<RetrievalResult> two = {{"a", 0.99f, "article", "", {}}, {"b", 0.99f, "article", "", {}}};
    assert(!allocator.should_stop_early(two, 1.0f));

    std::vector<RetrievalResult> strong = {
        {"a", 0.95f, "article", "A", {}}, {"b", 0.90f, "article", "B", {}}, {"c", 0.88f, "article", "C", {}}
    };
    assert(allocator.should_stop_early(strong, 0.7f));
    assert(!allocator.should_stop_early(strong, 0.2f));

    std::vector<RetrievalResult> drop = {
        {"a", 0.95f, "article", "A", {}}, {"b", 0.90f, "article", "B", {}},
        {"c", 0.80f, "article", "C", {}}, {"d", 0.70f, "article", "D", {}},
        {"e", 0.60f, "article", "E", {}}, {"f", 0.50f, "article", "F", {}}
    };
    assert(allocator.should_stop_early(drop, 0.0f));

    allocator.set_base_heuristic([](const std::vector<RetrievalResult>&, float) { return true; });
    assert(allocator.should_stop_early({}, 0.0f));
    allocator.set_base_heuristic(nullptr);
    assert(!allocator.should_stop_early({}, 0.0f));

    std::cout << "  PASS" << std::endl;
}

void test_budget_tracker() {
    std::cout << "Testing BudgetTracker..." << std::endl;

    BudgetTracker tracker(Budget{});
    tracker.track(Resource::VectorSearchMs, 250.0f);
    assert(!tracker.exceeded(Resource::VectorSearchMs));
    assert(near(tracker.consumed_ratio(), 0.5f / 7.0f));

    tracker.track(Resource::VectorSearchMs, 300.0f);
    assert(tracker.exceeded(Resource::VectorSearchMs));
    tracker.track(Resource::NodesVisited, -5.0f);  // ignored
    assert(near(tracker.consumed(Resource::NodesVisited), 0.0f));

    json report = tracker.report();
    assert(report["consumed"]["vector_search_ms"].get<float>() > 549.0f);
    assert(report.contains("overall_consumption_ratio"));

    Budget vo;
    vo.make_vector_only();
    BudgetTracker vtracker(vo);
    vtracker.track(Resource::VectorSearchMs, 500.0f);
    vtracker.track(Resource::RankingMs, 200.0f);
    assert(!vtracker.exceeded(Resource::NodesVisited));
    assert(near(vtracker.limit(Resource::GraphTraversalMs), 0.0f));
    assert(near(vtracker.consumed_ratio(), 2.0f / 3.0f));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Query rewriting
// ═══════════════════════════════════════════════════════════════════════════

void test_query_patterns() {
    std::cout << "Testing QueryRewriter patterns..." << std::endl;

    QueryRewriter rewriter;

    auto def = rewriter.rewrite("what is quantum entanglement");
    assert(def.has_value());
    assert(def->kind == PatternKind::Definition);
    assert(def->entities.size() == 1);
    assert(def->entities[0] == "quantum entanglement");

    auto def2 = rewriter.rewrite("What is Quantum Entanglement?");
    assert(def2 && def2->entities[0] == "quantum entanglement");

    auto cmp = rewriter.rewrite("compare python and java");
    assert(cmp && cmp->kind == PatternKind::Comparison);
    assert(cmp->entities.size() == 2);
    assert(cmp->entities[0] == "python");
    assert(cmp->entities[1] == "java");

    auto cmp2 = rewriter.rewrite("differences between cats vs dogs");
    assert(cmp2 && cmp2->kind == PatternKind::Comparison);
    assert(cmp2->entities[0] == "cats" && cmp2->entities[1] == "dogs");

    auto topic = rewriter.rewrite("information about black holes");
    assert(topic && topic->kind == PatternKind::TopicLookup);
    assert(topic->entities[0] == "black holes");

    auto causal = rewriter.rewrite("effects of climate change");
    assert(causal && causal->kind == PatternKind::Causal);
    assert(causal->entities[0] == "climate change");

    auto list = rewriter.rewrite("types of renewable energy");
    assert(list && list->kind == PatternKind::Enumeration);
    assert(list->entities[0] == "renewable energy");

    assert(!rewriter.rewrite("hello world").has_value());
    assert(!rewriter.rewrite("").has_value());

    // Texts over the limit are never handed to std::regex
    std::string long_text = "what is " + std::string(100000, 'x');
    assert(!rewriter.accepts(long_text));
    assert(!rewriter.rewrite(long_text).has_value());

    RewriterConfig tight;
    tight.max_pattern_text = 16;
    QueryRewriter short_rewriter(tight);
    assert(short_rewriter.rewrite("what is gravity").has_value());
    assert(!short_rewriter.rewrite("what is quantum entanglement").has_value());

    RewriterConfig zero;
    zero.max_pattern_text = 0;
    assert(throws_configuration_error([&] { QueryRewriter r(zero); }));

    std::cout << "  PASS" << std::endl;
}

void test_apply_hints() {
    std::cout << "Testing QueryRewriter apply_hints..." << std::endl;

    QueryRewriter rewriter;

    ExecutionPlan plan;
    rewriter.apply_hints(plan, PatternKind::Definition, {"entropy"});
    assert(plan.hints.strategy == Strategy::Definition);
    assert(plan.hints.prioritize_edge_types[0] == "instance_of");
    assert(plan.pattern && plan.pattern->kind == PatternKind::Definition);

    ExecutionPlan cmp;
    rewriter.apply_hints(cmp, PatternKind::Comparison, {"cats", "dogs"});
    assert(cmp.hints.strategy == Strategy::Comparison);
    assert(cmp.hints.find_common_categories);
    assert(cmp.hints.find_relationships_between);
    assert(cmp.hints.comparison_entities.size() == 2);

    ExecutionPlan causal;
    rewriter.apply_hints(causal, PatternKind::Causal, {"smoking"});
    assert(causal.hints.prioritize_edge_types[0] == "causes");
    assert(causal.hints.prioritize_edge_types[1] == "caused_by");

    ExecutionPlan list;
    rewriter.apply_hints(list, PatternKind::Enumeration, {"birds"});
    assert(list.hints.strategy == Strategy::Collection);
    assert(list.hints.collection_target == "birds");

    ExecutionPlan untouched;
    untouched.hints.strategy = Strategy::Hierarchical;
    assert(!rewriter.rewrite_plan(untouched, "hello world"));
    assert(untouched.hints.strategy == Strategy::Hierarchical);
    assert(!untouched.pattern.has_value());

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Learning
// ═══════════════════════════════════════════════════════════════════════════

void test_learning_adjusts_weights() {
    std::cout << "Testing LearningFeedbackLoop weight adjustment..." << std::endl;

    RelationshipWeightTable weights;
    LearningFeedbackLoop loop(weights);

    ExecutionPlan plan;
    plan.traversal.edge_types = {"subclass_of", "mentions"};
    plan.traversal.max_depth = 2;

    std::vector<RetrievalResult> results = {
        {"r1", 0.9f, "article", "Physics", {"subclass_of"}},
        {"r2", 0.8f, "article", "Physics", {"subclass_of", "subclass_of"}},
        {"r3", 0.7f, "article", "Physics", {"Subclass Of"}},
        {"r4", 0.6f, "article", "Physics", {"mentions"}}
    };
    auto summary = loop.record_outcome("q1", results, 0.4f, plan);
    assert(summary.result_count == 4);
    assert(near(summary.mean_score, 0.75f));
    assert(near(summary.effectiveness["subclass_of"], 0.75f));
    assert(near(summary.effectiveness["mentions"], 0.25f));
    assert(near(weights.weight("subclass_of"), 1.5125f));
    assert(near(weights.weight("mentions"), 0.4875f));
    assert(near(weights.weight("related_to"), 1.0f));

    // No results: nothing to learn, but the time is still recorded
    auto empty = loop.record_outcome("q2", {}, 0.2f, plan);
    assert(empty.effectiveness.empty());
    assert(loop.stats().count() == 2);

    weights.set("part_of", 2.0f);
    loop.record_outcome("q3", {{"r", 1.0f, "article", "", {"part_of"}}}, 0.1f, plan);
    assert(near(weights.weight("part_of"), 2.0f));

    std::cout << "  PASS" << std::endl;
}

void test_query_stats() {
    std::cout << "Testing QueryStats..." << std::endl;

    QueryStats stats;
    assert(near(stats.mean(), 0.0f));
    assert(near(stats.trend(), 0.0f));

    stats.record_time("a", 1.0f);
    stats.record_time("b", 2.0f);
    stats.record_time("c", 3.0f);
    assert(near(stats.mean(), 2.0f));
    assert(near(stats.trend(), 1.0f));

    auto recent = stats.recent(2);
    assert(recent.size() == 2);
    assert(recent[1].query_id == "c");
    assert(stats.recent(10).size() == 3);

    stats.truncate(1);
    assert(stats.count() == 1);
    assert(stats.recent(5)[0].query_id == "c");

    QueryPattern p1{{"subclass_of"}, 2, Strategy::Hierarchical};
    QueryPattern p2{{"mentions"}, 3, Strategy::Standard};
    stats.record_pattern(p1);
    stats.record_pattern(p2);
    stats.record_pattern(p1);
    auto common = stats.common_patterns(1);
    assert(common.size() == 1);
    assert(common[0].second == 2);
    assert(common[0].first.max_depth == 2);
    assert(stats.most_common_depth().value() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_adaptive_parameters() {
    std::cout << "Testing adaptive parameters..." << std::endl;

    RelationshipWeightTable weights;
    ExecutionPlan plan;
    plan.traversal.edge_types = {"subclass_of"};
    plan.traversal.max_depth = 3;

    LearningFeedbackLoop slow(weights);
    for (int i = 0; i < 9; ++i) slow.record_outcome("q", {}, 2.0f, plan);
    AdaptedParams before = slow.adapt(5, 2);
    assert(before.top_k == 5 && before.max_depth == 2);
    slow.record_outcome("q", {}, 2.0f, plan);
    AdaptedParams after = slow.adapt(5, 2);
    assert(after.top_k == 3);
    assert(after.max_depth == 3);
    assert(slow.adapt(3, 2).top_k == 3);

    LearningFeedbackLoop fast(weights);
    for (int i = 0; i < 10; ++i) fast.record_outcome("q", {}, 0.01f, plan);
    assert(fast.adapt(5, 2).top_k == 7);
    assert(fast.adapt(9, 2).top_k == 10);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Graph access and configuration
// ═══════════════════════════════════════════════════════════════════════════

void test_graph_kind_detection() {
    std::cout << "Testing graph kind detection..." << std::endl;

    assert(detect_graph_kind(AbsentGraph{}) == GraphKind::Unknown);
    assert(detect_graph_kind(JsonGraphAccessor(wiki_snapshot())) == GraphKind::Hierarchical);

    json ipld = {{"graph_type", "ipld"}};
    assert(detect_graph_kind(JsonGraphAccessor(ipld)) == GraphKind::FlatLink);

    json links = {
        {"entities", json::array({{{"id", "b1"}, {"type", "dag_node"}}})},
        {"relationship_types", {"links_to", "references"}}
    };
    assert(detect_graph_kind(JsonGraphAccessor(links)) == GraphKind::FlatLink);

    json tie = {
        {"entities", json::array({{{"id", "x"}, {"type", "category"}}})},
        {"relationship_types", {"links_to"}}
    };
    assert(detect_graph_kind(JsonGraphAccessor(tie)) == GraphKind::Unknown);

    assert(detect_graph_kind(BrokenGraph{}) == GraphKind::Unknown);

    std::cout << "  PASS" << std::endl;
}

void test_entity_json() {
    std::cout << "Testing entity JSON..." << std::endl;

    Entity e = entity_from_json({{"id", "Q42"}, {"type", "person"}, {"reference_count", 7},
                                 {"categories", {"Writers", "Humorists"}}, {"last_modified", 1700000000000LL}});
    assert(e.id == "Q42");
    assert(e.reference_count.value() == 7);
    assert(!e.inbound_connections.has_value());
    assert(e.categories.size() == 2);
    assert(e.last_modified.value() == 1700000000000LL);
    assert(entity_from_json(entity_to_json(e)).categories == e.categories);

    bool threw = false;
    try {
        entity_from_json({{"type", "orphan"}});
    } catch (const GraphAccessFailure&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        entity_from_json({{"id", "x"}, {"mention_count", -3}});
    } catch (const GraphAccessFailure&) {
        threw = true;
    }
    assert(threw);

    JsonGraphAccessor graph(wiki_snapshot());
    assert(graph.get_entities(2).size() == 2);
    assert(graph.get_entities(100).size() == 3);
    assert(graph.get_entity("Q3").has_value());
    assert(!graph.get_entity("Q99").has_value());
    assert(graph.category_edges().size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_config_loading() {
    std::cout << "Testing PlannerConfig..." << std::endl;

    PlannerConfig defaults = PlannerConfig::from_json(json::object());
    assert(defaults.node_budget == 1000);
    assert(defaults.default_edge_types.size() == 7);

    json doc = {
        {"weights", {{"default", 0.6}, {"overrides", {{"Links To", 1.2}}}}},
        {"budget", {{"defaults", {{"max_nodes", 2000}}},
                    {"priority_multipliers", {{"low", 0.25}, {"normal", 1.0}, {"high", 2.0}}}}},
        {"expansion", {{"similarity_threshold", 0.8}}},
        {"planner", {{"node_budget", 500}}}
    };
    PlannerConfig c = PlannerConfig::from_json(doc);
    assert(near(c.weights.default_weight, 0.6f));
    assert(near(c.weights.overrides.at("Links To"), 1.2f));
    assert(c.budget.defaults.max_nodes == 2000);
    assert(near(c.budget.high_multiplier, 2.0f));
    assert(near(c.expansion.similarity_threshold, 0.8f));
    assert(c.node_budget == 500);

    json tuned = {
        {"budget", {{"comparison_bonus", 1.1}, {"topic_vector_bonus", 1.25},
                    {"early_stopping", {{"high_confidence", 0.9}, {"min_confident_categories", 4}}}}},
        {"learning", {{"slow_query_seconds", 2.0}, {"max_top_k", 12}, {"min_outcomes", 20}}},
        {"traversal", {{"max_depth_limit", 8}}},
        {"rewriter", {{"max_pattern_text", 64}}},
        {"planner", {{"history_limit", 50}}}
    };
    PlannerConfig t = PlannerConfig::from_json(tuned);
    assert(near(t.budget.comparison_bonus, 1.1f));
    assert(near(t.budget.topic_vector_bonus, 1.25f));
    assert(near(t.budget.high_confidence, 0.9f));
    assert(t.budget.min_confident_categories == 4);
    assert(near(t.learning.slow_query_seconds, 2.0f));
    assert(t.learning.max_top_k == 12);
    assert(t.learning.min_outcomes == 20);
    assert(t.traversal.max_depth_limit == 8);
    assert(t.rewriter.max_pattern_text == 64);
    assert(t.history_limit == 50);

    // Negative counts must not wrap around
    assert(throws_configuration_error([] {
        PlannerConfig::from_json({{"planner", {{"node_budget", -1}}}});
    }));
    assert(throws_configuration_error([] {
        PlannerConfig::from_json({{"planner", {{"entity_sample", -5}}}});
    }));
    assert(throws_configuration_error([] {
        PlannerConfig::from_json({{"planner", {{"entity_priorities", 2.5}}}});
    }));
    assert(throws_configuration_error([] {
        PlannerConfig::from_json({{"expansion", {{"max_expansions", -1}}}});
    }));
    assert(throws_configuration_error([] {
        PlannerConfig::from_json({{"learning", {{"min_outcomes", -10}}}});
    }));
    assert(throws_configuration_error([] {
        PlannerConfig::from_json({{"budget", {{"comparison_bonus", -1.0}}}});
    }));

    assert(throws_configuration_error([] {
        PlannerConfig::from_json({{"weights", {{"overrides", {{"subclass_of", 5.0}}}}}});
    }));
    assert(throws_configuration_error([] {
        PlannerConfig::from_json({{"weights", {{"default", "heavy"}}}});
    }));
    assert(throws_configuration_error([] {
        PlannerConfig::from_json({{"budget", {{"priority_multipliers", {{"low", 3.0}}}}}});
    }));
    assert(throws_configuration_error([] {
        PlannerConfig::from_json({{"budget", {{"defaults", {{"max_nodes", -1}}}}}});
    }));
    assert(throws_configuration_error([] {
        PlannerConfig::from_json({{"expansion", {{"similarity_threshold", 1.5}}}});
    }));
    assert(throws_configuration_error([] { PlannerConfig::from_json({{"weights", 3}}); }));
    assert(throws_configuration_error([] { load_config("/nonexistent/marga.json"); }));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Orchestrator
// ═══════════════════════════════════════════════════════════════════════════

void test_orchestrator_requires_vector() {
    std::cout << "Testing Orchestrator requires vector..." << std::endl;

    Orchestrator orchestrator;
    Query q;
    q.text = "what is quantum entanglement";

    bool threw = false;
    try {
        orchestrator.plan(q);
    } catch (const InvalidQueryError&) {
        threw = true;
    }
    assert(threw);

    q.vector = Vector{};
    threw = false;
    try {
        orchestrator.plan(q);
    } catch (const InvalidQueryError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        Query::from_json({{"vector", {0.1}}, {"priority", "urgent"}});
    } catch (const InvalidQueryError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_orchestrator_without_graph() {
    std::cout << "Testing Orchestrator without graph data..." << std::endl;

    Orchestrator orchestrator;
    ExecutionPlan plan = orchestrator.plan(vector_query());
    assert(plan.traversal.empty());
    assert(!plan.graph_enabled());
    assert(plan.budget.vector_only());
    assert(plan.budget.vector_search_ms > 0.0f);
    assert(plan.entity_priorities.empty());
    assert(plan.graph_type == "unknown");

    // Explicit empty graph, even with edge types on the query
    AbsentGraph absent;
    Query q = vector_query();
    q.edge_types = std::vector<std::string>{"subclass_of"};
    ExecutionPlan p2 = orchestrator.plan(q, {&absent, nullptr});
    assert(p2.traversal.empty());
    assert(p2.budget.vector_only());

    json doc = p2.to_json();
    assert(doc["format_version"] == "1.2");
    assert(doc.contains("budget"));
    assert(doc["vector_search_params"]["top_k"] == 5);

    std::cout << "  PASS" << std::endl;
}

void test_orchestrator_with_graph() {
    std::cout << "Testing Orchestrator with graph..." << std::endl;

    RecordingTracer tracer;
    FixedMetrics metrics;
    Orchestrator orchestrator({}, &tracer, &metrics);
    JsonGraphAccessor graph(wiki_snapshot());
    for (const auto& [parent, child] : graph.category_edges()) {
        orchestrator.categories().register_edge(parent, child);
    }

    Query q = vector_query("physics");
    q.category_filter = {"Physics"};
    ExecutionPlan plan = orchestrator.plan(q, {&graph, nullptr});

    assert(plan.graph_type == "hierarchical");
    assert(plan.hints.strategy == Strategy::Hierarchical);
    assert(near(plan.hints.hierarchical_weight, 1.5f));
    assert(near(plan.weights.vector, 0.7f));
    assert(near(plan.weights.graph, 0.3f));
    assert(near(plan.weights.hierarchical_bonus, 0.2f));
    assert(plan.vector_params.categories.size() == 1);

    std::vector<std::string> expected = {"subclass_of", "instance_of", "related_to", "mentions"};
    assert(plan.traversal.edge_types == expected);
    assert(plan.traversal.level_budgets.size() == 2);
    assert(plan.traversal.level_budgets[0] == 400);
    assert(!plan.budget.vector_only());
    assert(near(plan.budget.graph_traversal_ms, 1300.0f, 1e-2f));

    assert(plan.entity_priorities.size() == 3);
    assert(plan.entity_priorities[0].id == "Q1");
    assert(plan.entity_priorities[1].id == "Q3");
    assert(plan.entity_priorities[2].id == "Q2");

    assert(plan.expansion.has_value());
    assert(plan.expansion->has_expansions);
    assert(plan.plan_id.value() == "plan-1");
    assert(metrics.last_params["text"] == "physics");
    assert(tracer.has("plan_created"));
    assert(tracer.has("query_expansion"));

    assert(orchestrator.history().size() == 1);
    assert(orchestrator.history()[0].expanded);

    json doc = plan.to_json();
    assert(doc["plan_id"] == "plan-1");
    assert(doc["entity_priorities"].size() == 3);

    std::cout << "  PASS" << std::endl;
}

void test_orchestrator_pattern_and_defaults() {
    std::cout << "Testing Orchestrator pattern and default edges..." << std::endl;

    Orchestrator orchestrator;
    json doc = {{"entities", json::array({{{"id", "e1"}}, {{"id", "e2"}}})}};
    JsonGraphAccessor graph(doc);

    ExecutionPlan plan = orchestrator.plan(vector_query("what is quantum entanglement"), {&graph, nullptr});
    assert(plan.pattern.has_value());
    assert(plan.pattern->kind == PatternKind::Definition);
    assert(plan.pattern->entities[0] == "quantum entanglement");
    assert(plan.hints.strategy == Strategy::Definition);

    // Default vocabulary, prioritized
    assert(plan.traversal.edge_types.size() == 7);
    assert(plan.traversal.edge_types[0] == "subclass_of");
    assert(plan.traversal.edge_types.back() == "mentions");

    Query q = vector_query();
    q.edge_types = std::vector<std::string>{"mentions", "part_of"};
    ExecutionPlan custom = orchestrator.plan(q, {&graph, nullptr});
    assert(custom.traversal.edge_types.size() == 2);
    assert(custom.traversal.edge_types[0] == "part_of");

    json flat = {{"graph_type", "ipld"}, {"relationship_types", {"links_to"}}};
    JsonGraphAccessor ipld(flat);
    ExecutionPlan fp = orchestrator.plan(vector_query(), {&ipld, nullptr});
    assert(fp.graph_type == "flat_link");
    assert(fp.hints.strategy == Strategy::Standard);
    assert(near(fp.weights.hierarchical_bonus, 0.0f));

    std::cout << "  PASS" << std::endl;
}

void test_orchestrator_recovers_failures() {
    std::cout << "Testing Orchestrator failure recovery..." << std::endl;

    RecordingTracer tracer;
    Orchestrator orchestrator({}, &tracer);
    orchestrator.categories().register_edge("Science", "Physics");

    BrokenGraph broken;
    ExecutionPlan plan = orchestrator.plan(vector_query("physics"), {&broken, failing_search});
    assert(plan.traversal.empty());
    assert(plan.budget.vector_only());
    assert(plan.expansion.has_value());
    assert(plan.expansion->topics.empty());
    assert(plan.expansion->has_expansions == !plan.expansion->categories.empty());
    assert(tracer.has("expansion_failure"));
    assert(tracer.has("graph_access_failure"));

    float importance = orchestrator.entity_importance("Q1", broken);
    assert(near(importance, 0.5f));

    JsonGraphAccessor graph(wiki_snapshot());
    float q1 = orchestrator.entity_importance("Q1", graph);
    assert(q1 > 0.8f && q1 <= 1.0f);
    assert(near(orchestrator.entity_importance("missing", graph), 0.5f));

    std::cout << "  PASS" << std::endl;
}

void test_orchestrator_input_limits() {
    std::cout << "Testing Orchestrator input limits..." << std::endl;

    RecordingTracer tracer;
    Orchestrator orchestrator({}, &tracer);
    JsonGraphAccessor graph(wiki_snapshot());

    // 100 KB of text still plans, without template matching
    ExecutionPlan plan = orchestrator.plan(vector_query("what is " + std::string(100000, 'x')),
                                           {&graph, nullptr});
    assert(!plan.pattern.has_value());
    assert(plan.hints.strategy == Strategy::Hierarchical);
    assert(!plan.traversal.empty());
    assert(tracer.has("rewrite_skipped"));

    // Depth beyond the limit is rejected before any allocation
    Query deep = vector_query();
    deep.max_traversal_depth = 1000000000;
    bool threw = false;
    try {
        orchestrator.plan(deep, {&graph, nullptr});
    } catch (const InvalidQueryError&) {
        threw = true;
    }
    assert(threw);

    deep.max_traversal_depth = 16;
    ExecutionPlan at_limit = orchestrator.plan(deep, {&graph, nullptr});
    assert(at_limit.traversal.max_depth == 16);
    assert(at_limit.traversal.level_budgets.size() == 16);

    // No text: no expansion and no vector store call
    int searches = 0;
    VectorSearchFn counting = [&searches](const Vector&, size_t, const SearchFilter&) {
        ++searches;
        return std::vector<SearchHit>{};
    };
    ExecutionPlan silent = orchestrator.plan(vector_query(), {&graph, counting});
    assert(!silent.expansion.has_value());
    assert(searches == 0);

    orchestrator.plan(vector_query("physics"), {&graph, counting});
    assert(searches > 0);

    std::cout << "  PASS" << std::endl;
}

void test_orchestrator_learning_cycle() {
    std::cout << "Testing Orchestrator learning cycle..." << std::endl;

    RecordingTracer tracer;
    Orchestrator orchestrator({}, &tracer);
    JsonGraphAccessor graph(wiki_snapshot());

    float before = orchestrator.weights().weight("mentions");
    for (int i = 0; i < 10; ++i) {
        ExecutionPlan plan = orchestrator.plan(vector_query(), {&graph, nullptr});
        std::vector<RetrievalResult> results = {
            {"r1", 0.9f, "article", "Physics", {"mentions"}},
            {"r2", 0.8f, "article", "Physics", {"mentions"}}
        };
        orchestrator.record_outcome("q" + std::to_string(i), results, 1.5f, plan);
    }
    assert(orchestrator.weights().weight("mentions") > before);
    assert(tracer.has("outcome_recorded"));

    // Slow history shrinks top_k
    ExecutionPlan adapted = orchestrator.plan(vector_query(), {&graph, nullptr});
    assert(adapted.vector_params.top_k == 3);
    assert(adapted.traversal.max_depth == 2);
    assert(orchestrator.history().size() == 11);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Marga Planner Tests ===" << std::endl;
    std::cout << "version " << MARGA_VERSION << std::endl;
    std::cout << std::endl;

    test_edge_type_normalization();
    test_relationship_weights();
    test_weight_adjust_clamps();
    test_category_depth();
    test_category_cycles();
    test_category_related();
    test_entity_importance_bounds();
    test_entity_importance_cache_and_rank();

    std::cout << std::endl;
    std::cout << "=== Expansion and Traversal ===" << std::endl;
    test_expansion_categories();
    test_expansion_topics();
    test_expansion_search_failure();
    test_level_budgets();
    test_traversal_plan();

    std::cout << std::endl;
    std::cout << "=== Budget and Rewriting ===" << std::endl;
    test_budget_allocation();
    test_budget_monotonic_in_priority();
    test_early_stopping();
    test_budget_tracker();
    test_query_patterns();
    test_apply_hints();

    std::cout << std::endl;
    std::cout << "=== Learning ===" << std::endl;
    test_learning_adjusts_weights();
    test_query_stats();
    test_adaptive_parameters();

    std::cout << std::endl;
    std::cout << "=== Graph Access and Config ===" << std::endl;
    test_graph_kind_detection();
    test_entity_json();
    test_config_loading();

    std::cout << std::endl;
    std::cout << "=== Orchestrator ===" << std::endl;
    test_orchestrator_requires_vector();
    test_orchestrator_without_graph();
    test_orchestrator_with_graph();
    test_orchestrator_pattern_and_defaults();
    test_orchestrator_recovers_failures();
    test_orchestrator_input_limits();
    test_orchestrator_learning_cycle();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
