#pragma once

#include <omc/core/lru_cache.h>
#include <omc/core/types.h>
#include <omc/memory/memory_crud.h>
#include <omc/resolution/id_resolver.h>
#include <omc/store/store_client.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace omc::evolution {

enum class DeletionStrategy { Soft, Hard, Cascade };

const char* toString(DeletionStrategy strategy);
std::optional<DeletionStrategy> parseDeletionStrategy(std::string_view name);

struct DeletionResult {
    MemoryId memory_id;
    DeletionStrategy strategy = DeletionStrategy::Soft;
    bool success = false;
    std::string deleted_by;
    std::string deleted_at;
    std::optional<std::string> reason;
    size_t edges_affected = 0;
};

struct RestoreResult {
    MemoryId memory_id;
    bool success = false;
    std::string restored_by;
    std::string restored_at;
};

/// Hard-deleted memory id -> deleted_at, shareable between deletion managers
using HardDeleteLog = core::LruCache<MemoryId, std::string>;

inline constexpr size_t kHardDeleteLogCapacity = 10000;

struct CleanupStats {
    size_t orphaned_entities = 0;
    size_t orphaned_edges = 0;
    size_t deleted_entities = 0;
    size_t deleted_edges = 0;
    bool dry_run = false;
};

/**
 * @brief Soft delete, restore, hard delete and orphan cleanup.
 *
 * Errors carry stable prefixes: `AlreadyDeleted:` (InvalidState) and `CannotRestore:`
 * (InvalidOperation). `CannotRestore` comes from the hard-delete log, which holds the most
 * recent ids hard-deleted through any manager sharing it, or from a `restoreMemory` reply
 * saying the memory was hard deleted.
 */
class DeletionManager {
public:
    DeletionManager(std::shared_ptr<store::StoreClient> store,
                    std::shared_ptr<memory::MemoryCrud> crud,
                    std::shared_ptr<resolution::IdResolver> resolver,
                    std::shared_ptr<HardDeleteLog> hardDeleted = nullptr);

    Result<DeletionResult> remove(const MemoryId& memoryId, const std::string& deletedBy,
                                  DeletionStrategy strategy,
                                  const std::optional<std::string>& reason = std::nullopt);

    Result<DeletionResult> softDelete(const MemoryId& memoryId, const std::string& deletedBy,
                                      const std::optional<std::string>& reason = std::nullopt);

    Result<DeletionResult> hardDelete(const MemoryId& memoryId, const std::string& deletedBy,
                                      bool cascade);

    Result<RestoreResult> undelete(const MemoryId& memoryId, const std::string& restoredBy);

    Result<CleanupStats> cleanupOrphans(bool dryRun);

    bool wasHardDeleted(const MemoryId& memoryId) const;

private:
    Result<size_t> deleteEdges(const MemoryId& memoryId);
    Result<std::vector<std::string>> findIds(const std::string& query);
    Result<size_t> deleteBatch(const std::string& query, const char* key,
                               const std::vector<std::string>& ids);

    std::shared_ptr<store::StoreClient> store_;
    std::shared_ptr<memory::MemoryCrud> crud_;
    std::shared_ptr<resolution::IdResolver> resolver_;

    std::shared_ptr<HardDeleteLog> hardDeleted_;
};

} // namespace omc::evolution
