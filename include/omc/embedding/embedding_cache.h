#pragma once

#include <omc/core/types.h>

#include <atomic>
#include <chrono>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace omc::embedding {

/**
 * @brief Text -> vector cache with TTL. At capacity the oldest entry by insertion is evicted.
 */
class EmbeddingCache {
public:
    struct Config {
        size_t maxEntries = 1000;        ///< Entries kept before eviction
        std::chrono::seconds ttl{3600}; ///< Lifetime of an entry
    };

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        size_t size = 0;
        double hitRate = 0.0;
    };

    explicit EmbeddingCache(Config config);
    EmbeddingCache() : EmbeddingCache(Config{}) {}

    std::optional<Embedding> get(const std::string& text) const;
    void put(const std::string& text, Embedding vector);
    void clear();

    size_t size() const;
    Stats stats() const;

private:
    struct Entry {
        Embedding vector;
        std::chrono::steady_clock::time_point createdAt;

        bool isExpired(std::chrono::seconds ttl) const {
            return std::chrono::steady_clock::now() - createdAt >= ttl;
        }
    };

    Config config_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;

    mutable std::atomic<uint64_t> hits_{0};
    mutable std::atomic<uint64_t> misses_{0};
};

} // namespace omc::embedding
