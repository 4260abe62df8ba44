#pragma once
// Core types: the vocabulary every planner stage speaks
//
// Time is Unix millis. Edge types are free-form labels normalized to
// lowercase snake_case before any lookup. Results reported back by an
// executor share one shape so budget and learning code can both read them.

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace marga {

// Timestamp as Unix millis
using Timestamp = int64_t;

constexpr Timestamp MILLIS_PER_DAY = 86400000;

// Current time as Timestamp
inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// Query embedding. Dimension is whatever the caller's vector store uses.
using Vector = std::vector<float>;

// Weight bounds shared by the weight table and the learning loop
constexpr float MIN_EDGE_WEIGHT = 0.1f;
constexpr float MAX_EDGE_WEIGHT = 2.0f;

// ═══════════════════════════════════════════════════════════════════════════
// Edge type normalization
// ═══════════════════════════════════════════════════════════════════════════

// "Is Subclass-Of", "SubclassOf" and "is_subclass_of" all become "subclass_of"
inline std::string normalize_edge_type(const std::string& raw) {
    std::string out;
    out.reserve(raw.size() + 4);

    bool pending_sep = false;
    char prev = 0;
    for (char c : raw) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isspace(uc) || c == '-' || c == '_') {
            pending_sep = !out.empty();
            prev = c;
            continue;
        }
        // camelCase boundary
        if (std::isupper(uc) && prev != 0 &&
            (std::islower(static_cast<unsigned char>(prev)) ||
             std::isdigit(static_cast<unsigned char>(prev)))) {
            pending_sep = true;
        }
        if (pending_sep) {
            out += '_';
            pending_sep = false;
        }
        out += static_cast<char>(std::tolower(uc));
        prev = c;
    }

    // Collapse "is_X_of" / "is_X_to" / "is_X_by" / "is_X_in" to the bare relation
    if (out.size() > 6 && out.compare(0, 3, "is_") == 0) {
        std::string rest = out.substr(3);
        auto ends_with = [&rest](const char* suffix) {
            std::string s(suffix);
            return rest.size() > s.size() &&
                   rest.compare(rest.size() - s.size(), s.size(), s) == 0;
        };
        if (ends_with("_of") || ends_with("_to") || ends_with("_by") || ends_with("_in")) {
            out = std::move(rest);
        }
    }

    if (out == "contains_part") return "has_part";
    return out;
}

// Lowercase alphanumeric tokens; everything else separates
inline std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : text) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            current += static_cast<char>(std::tolower(uc));
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) tokens.push_back(std::move(current));
    return tokens;
}

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        start++;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        end--;
    }
    return s.substr(start, end - start);
}

// ═══════════════════════════════════════════════════════════════════════════
// Priority and strategy
// ═══════════════════════════════════════════════════════════════════════════

enum class Priority {
    Low,
    Normal,
    High
};

inline std::string priority_name(Priority p) {
    switch (p) {
        case Priority::Low: return "low";
        case Priority::High: return "high";
        default: return "normal";
    }
}

inline std::optional<Priority> parse_priority(const std::string& s) {
    std::string p = to_lower(trim(s));
    if (p == "low") return Priority::Low;
    if (p == "normal") return Priority::Normal;
    if (p == "high") return Priority::High;
    return std::nullopt;
}

// Named traversal strategy handed to the executor
enum class Strategy {
    Standard,       // flat-link graphs, no hierarchy bonus
    Hierarchical,   // default for category-structured graphs
    TopicFocused,   // "information about X"
    Comparison,     // "compare X and Y"
    Definition,     // "what is X"
    Causal,         // "effects of X"
    Collection      // "types of X"
};

inline std::string strategy_name(Strategy s) {
    switch (s) {
        case Strategy::Standard: return "standard";
        case Strategy::Hierarchical: return "hierarchical";
        case Strategy::TopicFocused: return "topic_focused";
        case Strategy::Comparison: return "comparison";
        case Strategy::Definition: return "definition";
        case Strategy::Causal: return "causal";
        case Strategy::Collection: return "collection";
    }
    return "standard";
}

// ═══════════════════════════════════════════════════════════════════════════
// Results reported back by an executor
// ═══════════════════════════════════════════════════════════════════════════

struct RetrievalResult {
    std::string id;
    float score = 0.0f;
    std::string type;                         // "category", "topic", "article", ...
    std::string category;                     // category the result was reached through
    std::vector<std::string> path_edge_types; // edge types walked to reach it
};

} // namespace marga
