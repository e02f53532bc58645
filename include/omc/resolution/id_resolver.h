#pragma once

#include <omc/core/lru_cache.h>
#include <omc/core/types.h>
#include <omc/store/store_client.h>

#include <chrono>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace omc::resolution {

/**
 * @brief Maps external memory ids to internal store ids through a bounded LRU with TTL.
 *
 * Within the TTL a cached id is returned without touching the store. A miss, or an entry past
 * its TTL, costs exactly one getMemory call (no retry). Unknown ids are ErrorCode::NotFound and
 * are not cached. Writers call invalidate() after mutating a memory.
 */
class IdResolver {
public:
    struct Config {
        size_t maxEntries = 10000;      ///< LRU capacity
        std::chrono::milliseconds ttl = std::chrono::seconds(300);
    };

    using Stats = core::LruCacheStats;

    IdResolver(std::shared_ptr<store::StoreClient> store, Config config);
    explicit IdResolver(std::shared_ptr<store::StoreClient> store)
        : IdResolver(std::move(store), Config{}) {}

    Result<InternalId> resolve(const MemoryId& memoryId);

    // Sequential resolution; failures are skipped and logged
    std::unordered_map<MemoryId, InternalId> resolveMany(const std::vector<MemoryId>& ids);

    // Seed the cache after a write that returned the internal id
    void remember(const MemoryId& memoryId, const InternalId& internalId);

    void invalidate(const MemoryId& memoryId);
    void clear();

    Stats stats() const { return cache_.stats(); }

private:
    std::shared_ptr<store::StoreClient> store_;
    core::LruCache<MemoryId, InternalId> cache_;
};

} // namespace omc::resolution
