/// @file lru_cache.hpp
/// @brief Least-recently-used map with an optional byte budget

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lumen::cache {

/// @brief LRU cache bounded by the total weight of its values
///
/// A budget of 0 means unbounded. The most recently inserted entry is never
/// evicted, so a single value larger than the budget is still cached until
/// something newer arrives. Not thread-safe.
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class LruCache {
public:
    using Weigher = std::function<size_t(const Value&)>;

    explicit LruCache(size_t byte_budget = 0, Weigher weigher = {})
        : byte_budget_(byte_budget), weigher_(std::move(weigher)) {}

    [[nodiscard]] std::optional<Value> get(const Key& key) {
        auto it = cache_map_.find(key);
        if (it == cache_map_.end()) {
            return std::nullopt;
        }

        // Move to front (most recently used)
        cache_list_.splice(cache_list_.begin(), cache_list_, it->second);
        return it->second->value;
    }

    /// @brief Insert or replace a value
    /// @return Keys evicted to stay within the budget
    std::vector<Key> put(const Key& key, Value value) {
        size_t weight = weigh(value);
        auto it = cache_map_.find(key);

        if (it != cache_map_.end()) {
            // Update existing
            bytes_ -= it->second->weight;
            it->second->value = std::move(value);
            it->second->weight = weight;
            bytes_ += weight;
            cache_list_.splice(cache_list_.begin(), cache_list_, it->second);
        } else {
            cache_list_.push_front(Node{key, std::move(value), weight});
            cache_map_.emplace(key, cache_list_.begin());
            bytes_ += weight;
        }

        return evictOverBudget();
    }

    bool remove(const Key& key) {
        auto it = cache_map_.find(key);
        if (it == cache_map_.end()) {
            return false;
        }
        bytes_ -= it->second->weight;
        cache_list_.erase(it->second);
        cache_map_.erase(it);
        return true;
    }

    [[nodiscard]] bool contains(const Key& key) const {
        return cache_map_.find(key) != cache_map_.end();
    }

    void clear() {
        cache_list_.clear();
        cache_map_.clear();
        bytes_ = 0;
    }

    [[nodiscard]] size_t size() const { return cache_map_.size(); }
    [[nodiscard]] size_t bytes() const { return bytes_; }
    [[nodiscard]] size_t budget() const { return byte_budget_; }
    [[nodiscard]] uint64_t evictions() const { return evictions_; }

private:
    struct Node {
        Key key;
        Value value;
        size_t weight = 0;
    };

    [[nodiscard]] size_t weigh(const Value& value) const {
        return weigher_ ? weigher_(value) : 1;
    }

    std::vector<Key> evictOverBudget() {
        std::vector<Key> evicted;
        if (byte_budget_ == 0) {
            return evicted;
        }
        while (bytes_ > byte_budget_ && cache_list_.size() > 1) {
            Node& last = cache_list_.back();
            bytes_ -= last.weight;
            cache_map_.erase(last.key);
            evicted.push_back(std::move(last.key));
            cache_list_.pop_back();
            ++evictions_;
        }
        return evicted;
    }

    size_t byte_budget_;
    Weigher weigher_;
    size_t bytes_ = 0;
    uint64_t evictions_ = 0;
    std::list<Node> cache_list_;
    std::unordered_map<Key, typename std::list<Node>::iterator, Hash> cache_map_;
};

}  // namespace lumen::cache
