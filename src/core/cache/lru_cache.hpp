/// @file lru_cache.hpp
/// @brief Bounded least-recently-used map
///
/// Not synchronized; owners guard it with their own mutex.

#pragma once

#include <cstddef>
#include <cstdint>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

namespace laxy::cache {

/// @brief LRU cache with fixed capacity
template <typename Key, typename Value>
class LruCache {
public:
    explicit LruCache(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    /// @brief Look up and mark as most recently used
    [[nodiscard]] Value* get(const Key& key) {
        auto it = cache_map_.find(key);
        if (it == cache_map_.end()) {
            return nullptr;
        }

        // Move to front (most recently used)
        cache_list_.splice(cache_list_.begin(), cache_list_, it->second);
        return &it->second->second;
    }

    /// @brief Insert or replace; evicts the least recently used entry when full
    void put(const Key& key, Value value) {
        auto it = cache_map_.find(key);

        if (it != cache_map_.end()) {
            it->second->second = std::move(value);
            cache_list_.splice(cache_list_.begin(), cache_list_, it->second);
            return;
        }

        if (cache_map_.size() >= capacity_) {
            auto last = std::prev(cache_list_.end());
            cache_map_.erase(last->first);
            cache_list_.pop_back();
            ++evictions_;
        }

        cache_list_.emplace_front(key, std::move(value));
        cache_map_[key] = cache_list_.begin();
    }

    bool remove(const Key& key) {
        auto it = cache_map_.find(key);
        if (it == cache_map_.end()) {
            return false;
        }
        cache_list_.erase(it->second);
        cache_map_.erase(it);
        return true;
    }

    /// @brief Remove every entry matching @p predicate(key, value)
    /// @return Number of entries removed
    template <typename Predicate>
    size_t removeIf(Predicate predicate) {
        size_t removed = 0;
        for (auto it = cache_list_.begin(); it != cache_list_.end();) {
            if (predicate(it->first, it->second)) {
                cache_map_.erase(it->first);
                it = cache_list_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    [[nodiscard]] bool contains(const Key& key) const {
        return cache_map_.find(key) != cache_map_.end();
    }

    void clear() {
        cache_list_.clear();
        cache_map_.clear();
    }

    [[nodiscard]] size_t size() const noexcept { return cache_map_.size(); }
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] uint64_t evictions() const noexcept { return evictions_; }

private:
    size_t capacity_;
    uint64_t evictions_ = 0;
    std::list<std::pair<Key, Value>> cache_list_;
    std::unordered_map<Key, typename std::list<std::pair<Key, Value>>::iterator> cache_map_;
};

}  // namespace laxy::cache
