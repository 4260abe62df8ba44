#pragma once
// Graph access: what the planner may ask of a knowledge graph
//
// Capabilities are explicit. A graph that cannot list entities returns an
// empty list; AbsentGraph is the graph that has nothing at all. Accessors
// signal lookup failures with GraphAccessFailure and the planner recovers.

#include "types.hpp"
#include "error.hpp"
#include "entity_importance.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace marga {

using json = nlohmann::json;

class GraphAccessor {
public:
    virtual ~GraphAccessor() = default;

    // Graph type the owner declares ("wikipedia", "ipld", ...), if any
    virtual std::optional<std::string> declared_graph_type() const { return std::nullopt; }

    virtual std::vector<Entity> get_entities(size_t limit) const = 0;
    virtual std::vector<std::string> get_relationship_types() const = 0;
    virtual std::optional<Entity> get_entity(const std::string& id) const = 0;
};

// No graph behind the query
class AbsentGraph : public GraphAccessor {
public:
    std::vector<Entity> get_entities(size_t) const override { return {}; }
    std::vector<std::string> get_relationship_types() const override { return {}; }
    std::optional<Entity> get_entity(const std::string&) const override { return std::nullopt; }
};

// ═══════════════════════════════════════════════════════════════════════════
// Graph kind detection
// ═══════════════════════════════════════════════════════════════════════════

enum class GraphKind {
    Hierarchical,  // category trees, subclass chains (encyclopedic graphs)
    FlatLink,      // content-addressed link graphs
    Unknown
};

inline std::string graph_kind_name(GraphKind k) {
    switch (k) {
        case GraphKind::Hierarchical: return "hierarchical";
        case GraphKind::FlatLink: return "flat_link";
        case GraphKind::Unknown: return "unknown";
    }
    return "unknown";
}

inline GraphKind parse_declared_graph_type(const std::string& declared) {
    std::string d = to_lower(trim(declared));
    if (d.find("wiki") != std::string::npos || d.find("hierarch") != std::string::npos ||
        d.find("categor") != std::string::npos) {
        return GraphKind::Hierarchical;
    }
    if (d.find("ipld") != std::string::npos || d.find("flat") != std::string::npos ||
        d.find("dag") != std::string::npos) {
        return GraphKind::FlatLink;
    }
    return GraphKind::Unknown;
}

namespace detail {

inline bool contains_any(const std::string& text, std::initializer_list<const char*> needles) {
    for (const char* n : needles) {
        if (text.find(n) != std::string::npos) return true;
    }
    return false;
}

} // namespace detail

constexpr size_t GRAPH_KIND_SAMPLE = 20;

// Declared type wins; otherwise count vocabulary hits in sampled entity
// types and relationship types. Tie is Unknown.
inline GraphKind detect_graph_kind(const GraphAccessor& graph) {
    if (auto declared = graph.declared_graph_type()) {
        GraphKind kind = parse_declared_graph_type(*declared);
        if (kind != GraphKind::Unknown) return kind;
    }

    size_t hierarchical = 0;
    size_t flat = 0;

    try {
        for (const auto& e : graph.get_entities(GRAPH_KIND_SAMPLE)) {
            std::string t = to_lower(e.type);
            if (detail::contains_any(t, {"category", "article", "wikidata", "topic"})) hierarchical++;
            if (detail::contains_any(t, {"ipld", "cid", "dag", "content_addressed"})) flat++;
        }
    } catch (const std::exception& e) {
        std::cerr << "[GraphAccess] entity sample failed: " << e.what() << "\n";
    }

    try {
        for (const auto& r : graph.get_relationship_types()) {
            std::string t = normalize_edge_type(r);
            if (detail::contains_any(t, {"subclass_of", "instance_of", "category_contains",
                                         "article_in_category"})) {
                hierarchical++;
            }
            if (detail::contains_any(t, {"links_to", "references", "contains_hash",
                                         "content_references"})) {
                flat++;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[GraphAccess] relationship types unavailable: " << e.what() << "\n";
    }

    if (hierarchical > flat) return GraphKind::Hierarchical;
    if (flat > hierarchical) return GraphKind::FlatLink;
    return GraphKind::Unknown;
}

// ═══════════════════════════════════════════════════════════════════════════
// JSON-backed graph snapshot
// ═══════════════════════════════════════════════════════════════════════════

// {"id": "...", "type": "...", "inbound_connections": 3, "categories": [...],
//  "last_modified": <unix millis>, ...}; only "id" is required
inline Entity entity_from_json(const json& j) {
    if (!j.is_object() || !j.contains("id") || !j["id"].is_string()) {
        throw GraphAccessFailure("entity record without string id");
    }
    Entity e;
    e.id = j["id"].get<std::string>();
    e.type = j.value("type", "");

    auto count = [&j](const char* key) -> std::optional<size_t> {
        if (!j.contains(key) || j[key].is_null()) return std::nullopt;
        if (!j[key].is_number_integer() || j[key].get<int64_t>() < 0) {
            throw GraphAccessFailure(std::string("entity field '") + key +
                                     "' must be a non-negative integer");
        }
        return static_cast<size_t>(j[key].get<int64_t>());
    };
    e.inbound_connections = count("inbound_connections");
    e.outbound_connections = count("outbound_connections");
    e.reference_count = count("reference_count");
    e.mention_count = count("mention_count");

    if (j.contains("categories") && j["categories"].is_array()) {
        for (const auto& c : j["categories"]) {
            if (c.is_string()) e.categories.push_back(c.get<std::string>());
        }
    }
    if (j.contains("last_modified") && j["last_modified"].is_number_integer()) {
        e.last_modified = j["last_modified"].get<Timestamp>();
    }
    return e;
}

inline json entity_to_json(const Entity& e) {
    json j = {{"id", e.id}, {"type", e.type}};
    if (e.inbound_connections) j["inbound_connections"] = *e.inbound_connections;
    if (e.outbound_connections) j["outbound_connections"] = *e.outbound_connections;
    if (e.reference_count) j["reference_count"] = *e.reference_count;
    if (!e.categories.empty()) j["categories"] = e.categories;
    if (e.mention_count) j["mention_count"] = *e.mention_count;
    if (e.last_modified) j["last_modified"] = *e.last_modified;
    return j;
}

// Snapshot document:
// {
//   "graph_type": "wikipedia",
//   "entities": [ {entity}, ... ],
//   "relationship_types": ["subclass_of", ...],
//   "category_edges": [["Science", "Physics"], ...]
// }
class JsonGraphAccessor : public GraphAccessor {
public:
    explicit JsonGraphAccessor(const json& doc) {
        if (!doc.is_object()) throw GraphAccessFailure("graph snapshot must be a JSON object");

        if (doc.contains("graph_type") && doc["graph_type"].is_string()) {
            graph_type_ = doc["graph_type"].get<std::string>();
        }
        if (doc.contains("entities")) {
            if (!doc["entities"].is_array()) throw GraphAccessFailure("'entities' must be an array");
            for (const auto& ej : doc["entities"]) {
                Entity e = entity_from_json(ej);
                index_[e.id] = entities_.size();
                entities_.push_back(std::move(e));
            }
        }
        if (doc.contains("relationship_types") && doc["relationship_types"].is_array()) {
            for (const auto& r : doc["relationship_types"]) {
                if (r.is_string()) relationship_types_.push_back(r.get<std::string>());
            }
        }
        if (doc.contains("category_edges") && doc["category_edges"].is_array()) {
            for (const auto& edge : doc["category_edges"]) {
                if (!edge.is_array() || edge.size() != 2 ||
                    !edge[0].is_string() || !edge[1].is_string()) {
                    throw GraphAccessFailure("category edge must be [parent, child]");
                }
                category_edges_.emplace_back(edge[0].get<std::string>(), edge[1].get<std::string>());
            }
        }
    }

    static JsonGraphAccessor from_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) throw GraphAccessFailure("cannot open graph snapshot " + path);
        try {
            return JsonGraphAccessor(json::parse(in));
        } catch (const json::exception& e) {
            throw GraphAccessFailure("cannot parse graph snapshot " + path + ": " + e.what());
        }
    }

    std::optional<std::string> declared_graph_type() const override { return graph_type_; }

    std::vector<Entity> get_entities(size_t limit) const override {
        size_t n = std::min(limit, entities_.size());
        return std::vector<Entity>(entities_.begin(), entities_.begin() + n);
    }

    std::vector<std::string> get_relationship_types() const override {
        return relationship_types_;
    }

    std::optional<Entity> get_entity(const std::string& id) const override {
        auto it = index_.find(id);
        if (it == index_.end()) return std::nullopt;
        return entities_[it->second];
    }

    const std::vector<std::pair<std::string, std::string>>& category_edges() const {
        return category_edges_;
    }

private:
    std::optional<std::string> graph_type_;
    std::vector<Entity> entities_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<std::string> relationship_types_;
    std::vector<std::pair<std::string, std::string>> category_edges_;
};

} // namespace marga
