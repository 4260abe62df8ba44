#pragma once
// Category graph: the hierarchy categories hang in
//
// Directed parent -> child edges registered incrementally by the caller
// before planning. Depth is 1 + max(depth of parents), 0 for roots, and is
// memoized per instance. The graph is append-only within a session; the
// depth cache is only dropped by clear_cache(), so register every edge
// before the first depth query or clear afterwards.
//
// Cycles: a parent that is already on the current recursion path
// contributes depth 0 to that branch. Termination is guaranteed, but the
// depth of nodes on a cycle depends on which node was queried first
// (A->B->C->A queried at A yields A=3, C=2, B=1).

#include "types.hpp"
#include <algorithm>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace marga {

class CategoryGraph {
public:
    CategoryGraph() = default;

    // Idempotent: the same edge twice is a single edge
    void register_edge(const std::string& parent, const std::string& child) {
        std::unique_lock lock(mutex_);
        children_[parent].insert(child);
        parents_[child].insert(parent);
        children_.try_emplace(child);
        parents_.try_emplace(parent);
    }

    bool contains(const std::string& category) const {
        std::shared_lock lock(mutex_);
        return children_.count(category) > 0;
    }

    // Every category seen as parent or child, sorted by name
    std::vector<std::string> categories() const {
        std::shared_lock lock(mutex_);
        std::vector<std::string> names;
        names.reserve(children_.size());
        for (const auto& [name, _] : children_) names.push_back(name);
        return names;
    }

    std::vector<std::string> children(const std::string& category) const {
        std::shared_lock lock(mutex_);
        auto it = children_.find(category);
        if (it == children_.end()) return {};
        return {it->second.begin(), it->second.end()};
    }

    std::vector<std::string> parents(const std::string& category) const {
        std::shared_lock lock(mutex_);
        auto it = parents_.find(category);
        if (it == parents_.end()) return {};
        return {it->second.begin(), it->second.end()};
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return children_.size();
    }

    size_t edge_count() const {
        std::shared_lock lock(mutex_);
        size_t n = 0;
        for (const auto& [_, kids] : children_) n += kids.size();
        return n;
    }

    int depth(const std::string& category) const {
        std::shared_lock lock(mutex_);
        std::lock_guard<std::mutex> cache_lock(cache_mutex_);
        std::unordered_set<std::string> on_path;
        return depth_locked(category, on_path);
    }

    void clear_cache() {
        std::lock_guard<std::mutex> cache_lock(cache_mutex_);
        depth_cache_.clear();
    }

    // Breadth-first over child and parent edges. Source excluded.
    std::vector<std::pair<std::string, int>> related(const std::string& category,
                                                     int max_distance = 2) const {
        std::vector<std::pair<std::string, int>> result;
        if (max_distance <= 0) return result;

        std::shared_lock lock(mutex_);
        std::unordered_set<std::string> visited{category};
        std::deque<std::pair<std::string, int>> queue{{category, 0}};

        while (!queue.empty()) {
            std::string current = queue.front().first;
            int distance = queue.front().second;
            queue.pop_front();

            if (current != category) {
                result.emplace_back(current, distance);
            }
            if (distance >= max_distance) continue;

            auto enqueue = [&](const std::set<std::string>& neighbours) {
                for (const auto& n : neighbours) {
                    if (visited.insert(n).second) {
                        queue.emplace_back(n, distance + 1);
                    }
                }
            };
            if (auto it = children_.find(current); it != children_.end()) enqueue(it->second);
            if (auto it = parents_.find(current); it != parents_.end()) enqueue(it->second);
        }
        return result;
    }

    // Deeper (more specific) categories weigh more: 0.5 at the root, 1.5 at depth >= 10,
    // scaled by an optional per-category similarity (missing = 1.0)
    std::unordered_map<std::string, float> weights_for(
        const std::vector<std::string>& categories,
        const std::unordered_map<std::string, float>& similarity_scores = {}) const
    {
        std::unordered_map<std::string, float> weights;
        for (const auto& category : categories) {
            float depth_score = 0.5f + std::min(static_cast<float>(depth(category)) / 10.0f, 1.0f);
            auto it = similarity_scores.find(category);
            float sim = it != similarity_scores.end() ? it->second : 1.0f;
            weights[category] = depth_score * sim;
        }
        return weights;
    }

private:
    int depth_locked(const std::string& category,
                     std::unordered_set<std::string>& on_path) const {
        auto hit = depth_cache_.find(category);
        if (hit != depth_cache_.end()) return hit->second;

        auto pit = parents_.find(category);
        if (pit == parents_.end()) return 0;  // unknown: root, not cached

        if (!on_path.insert(category).second) return 0;  // back edge

        int d = 0;
        for (const auto& parent : pit->second) {
            if (parent == category) continue;  // self-loop
            d = std::max(d, depth_locked(parent, on_path) + 1);
        }

        on_path.erase(category);
        depth_cache_[category] = d;
        return d;
    }

    mutable std::shared_mutex mutex_;
    std::map<std::string, std::set<std::string>> children_;
    std::map<std::string, std::set<std::string>> parents_;

    mutable std::mutex cache_mutex_;
    mutable std::unordered_map<std::string, int> depth_cache_;
};

} // namespace marga
