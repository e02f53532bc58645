#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace omc::core {

/**
 * @brief Statistics for LruCache
 */
struct LruCacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t invalidations = 0;
    uint64_t evictions = 0; ///< capacity and TTL evictions
    size_t size = 0;
    size_t capacity = 0;

    double hitRate() const {
        auto total = hits + misses;
        return total == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(total);
    }
};

/**
 * @brief Thread-safe bounded LRU map with a per-cache TTL.
 *
 * A single mutex guards order, entries and stats: a lookup moves the entry to the front, so
 * reads mutate. Expired entries are evicted when found. A zero TTL disables expiry.
 */
template <typename Key, typename Value, typename Hash = std::hash<Key>> class LruCache {
public:
    using Clock = std::chrono::steady_clock;

    explicit LruCache(size_t capacity, std::chrono::milliseconds ttl = std::chrono::milliseconds{0})
        : capacity_(capacity == 0 ? 1 : capacity), ttl_(ttl) {}

    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end()) {
            ++stats_.misses;
            return std::nullopt;
        }
        if (isExpired(it->second->insertedAt)) {
            order_.erase(it->second);
            map_.erase(it);
            ++stats_.evictions;
            ++stats_.misses;
            return std::nullopt;
        }
        order_.splice(order_.begin(), order_, it->second);
        ++stats_.hits;
        return it->second->value;
    }

    void put(const Key& key, Value value) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it != map_.end()) {
            it->second->value = std::move(value);
            it->second->insertedAt = Clock::now();
            order_.splice(order_.begin(), order_, it->second);
            return;
        }
        while (map_.size() >= capacity_ && !order_.empty()) {
            map_.erase(order_.back().key);
            order_.pop_back();
            ++stats_.evictions;
        }
        order_.push_front(Entry{key, std::move(value), Clock::now()});
        map_.emplace(key, order_.begin());
    }

    bool invalidate(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end())
            return false;
        order_.erase(it->second);
        map_.erase(it);
        ++stats_.invalidations;
        return true;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.invalidations += map_.size();
        map_.clear();
        order_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.size();
    }

    LruCacheStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto s = stats_;
        s.size = map_.size();
        s.capacity = capacity_;
        return s;
    }

    // Visit live entries under the lock, most recent first
    void forEach(const std::function<void(const Key&, const Value&)>& fn) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& e : order_) {
            if (!isExpired(e.insertedAt))
                fn(e.key, e.value);
        }
    }

private:
    struct Entry {
        Key key;
        Value value;
        Clock::time_point insertedAt;
    };

    bool isExpired(Clock::time_point insertedAt) const {
        return ttl_.count() > 0 && Clock::now() - insertedAt >= ttl_;
    }

    size_t capacity_;
    std::chrono::milliseconds ttl_;

    mutable std::mutex mutex_;
    std::list<Entry> order_;
    std::unordered_map<Key, typename std::list<Entry>::iterator, Hash> map_;
    LruCacheStats stats_;
};

} // namespace omc::core
