#pragma once
// Entity importance: which entities deserve traversal budget first
//
// importance = 0.30 * connections + 0.20 * references + 0.20 * categories
//            + 0.15 * explicitness + 0.15 * recency
//
// Counts are log-scaled against a saturation point so a handful of links
// already matters and thousands do not dominate. A feature the caller did
// not supply scores a neutral 0.5 instead of 0; an entity with an explicit
// zero count scores 0 on that feature.

#include "types.hpp"
#include "error.hpp"
#include <algorithm>
#include <cmath>
#include <mutex>
#include <numeric>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace marga {

// Read-only snapshot handed in by the caller
struct Entity {
    std::string id;
    std::string type;
    std::optional<size_t> inbound_connections;
    std::optional<size_t> outbound_connections;
    std::optional<size_t> reference_count;
    std::vector<std::string> categories;       // empty = unknown
    std::optional<size_t> mention_count;
    std::optional<Timestamp> last_modified;
};

struct ImportanceConfig {
    float connection_weight = 0.30f;
    float reference_weight = 0.20f;
    float category_weight = 0.20f;
    float explicitness_weight = 0.15f;
    float recency_weight = 0.15f;

    // Counts at which a log-scaled feature saturates to 1.0
    float connection_saturation = 100.0f;
    float reference_saturation = 20.0f;
    float mention_saturation = 50.0f;

    float recency_horizon_days = 365.0f;  // Linear decay to 0 over this span
    float neutral = 0.5f;                 // Missing feature

    void validate() const {
        const float ws[] = {connection_weight, reference_weight, category_weight,
                            explicitness_weight, recency_weight};
        float sum = 0.0f;
        for (float w : ws) {
            if (w < 0.0f) throw ConfigurationError("importance feature weight is negative");
            sum += w;
        }
        if (std::fabs(sum - 1.0f) > 1e-3f) {
            throw ConfigurationError("importance feature weights sum to " +
                                     std::to_string(sum) + ", expected 1.0");
        }
        if (connection_saturation <= 0.0f || reference_saturation <= 0.0f ||
            mention_saturation <= 0.0f || recency_horizon_days <= 0.0f) {
            throw ConfigurationError("importance saturation points must be positive");
        }
        if (neutral < 0.0f || neutral > 1.0f) {
            throw ConfigurationError("neutral importance must be in [0, 1]");
        }
    }
};

// Per-feature scores, each in [0, 1]
struct ImportanceBreakdown {
    float connections = 0.0f;
    float references = 0.0f;
    float categories = 0.0f;
    float explicitness = 0.0f;
    float recency = 0.0f;
    float total = 0.0f;
};

class EntityImportanceModel {
public:
    explicit EntityImportanceModel(ImportanceConfig config = {},
                                   Timestamp reference_time = now())
        : config_(config), reference_time_(reference_time)
    {
        config_.validate();
    }

    ImportanceBreakdown breakdown(
        const Entity& entity,
        const std::unordered_map<std::string, float>* category_weights = nullptr) const
    {
        ImportanceBreakdown b;

        if (entity.inbound_connections || entity.outbound_connections) {
            size_t total = entity.inbound_connections.value_or(0) +
                           entity.outbound_connections.value_or(0);
            b.connections = log_scaled(total, config_.connection_saturation);
        } else {
            b.connections = config_.neutral;
        }

        b.references = entity.reference_count
            ? log_scaled(*entity.reference_count, config_.reference_saturation)
            : config_.neutral;

        b.categories = config_.neutral;
        if (category_weights && !category_weights->empty() && !entity.categories.empty()) {
            float sum = 0.0f;
            for (const auto& cat : entity.categories) {
                auto it = category_weights->find(cat);
                sum += it != category_weights->end() ? it->second : config_.neutral;
            }
            b.categories = std::clamp(sum / entity.categories.size(), 0.0f, 1.0f);
        }

        b.explicitness = entity.mention_count
            ? log_scaled(*entity.mention_count, config_.mention_saturation)
            : config_.neutral;

        if (entity.last_modified) {
            float age_days = static_cast<float>(reference_time_ - *entity.last_modified) /
                             static_cast<float>(MILLIS_PER_DAY);
            b.recency = std::clamp(1.0f - age_days / config_.recency_horizon_days, 0.0f, 1.0f);
        } else {
            b.recency = config_.neutral;
        }

        b.total = config_.connection_weight * b.connections +
                  config_.reference_weight * b.references +
                  config_.category_weight * b.categories +
                  config_.explicitness_weight * b.explicitness +
                  config_.recency_weight * b.recency;
        b.total = std::clamp(b.total, 0.0f, 1.0f);
        return b;
    }

    // Cached per entity id for the life of this model
    float score(const Entity& entity,
                const std::unordered_map<std::string, float>* category_weights = nullptr) {
        if (!entity.id.empty()) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = cache_.find(entity.id);
            if (it != cache_.end()) return it->second;
        }

        float s = breakdown(entity, category_weights).total;

        if (!entity.id.empty()) {
            std::lock_guard<std::mutex> lock(mutex_);
            cache_.emplace(entity.id, s);
        }
        return s;
    }

    std::vector<std::pair<Entity, float>> rank_scored(
        const std::vector<Entity>& entities,
        const std::unordered_map<std::string, float>* category_weights = nullptr)
    {
        std::vector<std::pair<Entity, float>> scored;
        scored.reserve(entities.size());
        for (const auto& e : entities) {
            scored.emplace_back(e, score(e, category_weights));
        }
        std::stable_sort(scored.begin(), scored.end(),
                         [](const auto& a, const auto& b) { return a.second > b.second; });
        return scored;
    }

    std::vector<Entity> rank(const std::vector<Entity>& entities,
                             const std::unordered_map<std::string, float>* category_weights = nullptr) {
        std::vector<Entity> ranked;
        ranked.reserve(entities.size());
        for (auto& [entity, _] : rank_scored(entities, category_weights)) {
            ranked.push_back(std::move(entity));
        }
        return ranked;
    }

    size_t cached_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_.size();
    }

    Timestamp reference_time() const { return reference_time_; }

private:
    static float log_scaled(size_t count, float saturation) {
        return std::min(1.0f, static_cast<float>(std::log1p(static_cast<double>(count)) /
                                                 std::log1p(static_cast<double>(saturation))));
    }

    ImportanceConfig config_;
    Timestamp reference_time_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, float> cache_;
};

} // namespace marga
