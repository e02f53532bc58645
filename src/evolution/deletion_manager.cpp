#include <omc/config/config_helpers.h>
#include <omc/core/time_utils.h>
#include <omc/evolution/deletion_manager.h>
#include <omc/store/json_fields.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace omc::evolution {

using nlohmann::json;

namespace {

Error alreadyDeleted(const MemoryId& id) {
    return Error{ErrorCode::InvalidState, "AlreadyDeleted: Memory already deleted: " + id};
}

Error cannotRestore(const MemoryId& id) {
    return Error{ErrorCode::InvalidOperation,
                 "CannotRestore: Cannot restore hard-deleted memory: " + id};
}

Error databaseError(const std::string& message) {
    return Error{ErrorCode::DatabaseError, "Database error: " + message};
}

// `true`, {"success": true} and {"deleted": true} all count as success
bool ackedTrue(const json& body) {
    if (body.is_boolean())
        return body.get<bool>();
    if (body.is_object()) {
        for (const char* key : {"success", "deleted", "result"}) {
            auto it = body.find(key);
            if (it != body.end() && it->is_boolean())
                return it->get<bool>();
        }
        return true;
    }
    return !body.is_null();
}

} // namespace

const char* toString(DeletionStrategy strategy) {
    switch (strategy) {
        case DeletionStrategy::Soft:
            return "soft";
        case DeletionStrategy::Hard:
            return "hard";
        case DeletionStrategy::Cascade:
            return "cascade";
    }
    return "soft";
}

std::optional<DeletionStrategy> parseDeletionStrategy(std::string_view name) {
    auto n = config::toLower(config::trimmed(name));
    if (n == "soft")
        return DeletionStrategy::Soft;
    if (n == "hard")
        return DeletionStrategy::Hard;
    if (n == "cascade")
        return DeletionStrategy::Cascade;
    return std::nullopt;
}

DeletionManager::DeletionManager(std::shared_ptr<store::StoreClient> store,
                                 std::shared_ptr<memory::MemoryCrud> crud,
                                 std::shared_ptr<resolution::IdResolver> resolver,
                                 std::shared_ptr<HardDeleteLog> hardDeleted)
    : store_(std::move(store)), crud_(std::move(crud)), resolver_(std::move(resolver)),
      hardDeleted_(hardDeleted ? std::move(hardDeleted)
                               : std::make_shared<HardDeleteLog>(kHardDeleteLogCapacity)) {
    spdlog::info("Initializing DeletionManager");
}

bool DeletionManager::wasHardDeleted(const MemoryId& memoryId) const {
    return hardDeleted_->get(memoryId).has_value();
}

Result<DeletionResult> DeletionManager::remove(const MemoryId& memoryId,
                                               const std::string& deletedBy,
                                               DeletionStrategy strategy,
                                               const std::optional<std::string>& reason) {
    switch (strategy) {
        case DeletionStrategy::Soft:
            return softDelete(memoryId, deletedBy, reason);
        case DeletionStrategy::Hard:
            return hardDelete(memoryId, deletedBy, false);
        case DeletionStrategy::Cascade:
            return hardDelete(memoryId, deletedBy, true);
    }
    return Error{ErrorCode::InvalidArgument, "unknown deletion strategy"};
}

Result<DeletionResult> DeletionManager::softDelete(const MemoryId& memoryId,
                                                   const std::string& deletedBy,
                                                   const std::optional<std::string>& reason) {
    if (wasHardDeleted(memoryId))
        return Error{ErrorCode::NotFound, "Memory not found: " + memoryId};

    auto memory = crud_->getMemory(memoryId);
    if (!memory)
        return memory.error();
    if (memory.value().is_deleted)
        return alreadyDeleted(memoryId);

    const auto now = core::nowTimestamp();
    auto res = store_->executeAck("softDeleteMemory", {{"memory_id", memoryId},
                                                       {"deleted_by", deletedBy},
                                                       {"deleted_at", now},
                                                       {"reason", reason.value_or("")}});
    if (!res)
        return databaseError(res.error().message);

    resolver_->invalidate(memoryId);
    spdlog::info("Soft deleted memory {} by {}", memoryId, deletedBy);

    DeletionResult result;
    result.memory_id = memoryId;
    result.strategy = DeletionStrategy::Soft;
    result.success = true;
    result.deleted_by = deletedBy;
    result.deleted_at = now;
    result.reason = reason;
    return result;
}

Result<size_t> DeletionManager::deleteEdges(const MemoryId& memoryId) {
    size_t edgeCount = 0;
    auto count = store_->execute("getMemoryEdgeCount", {{"memory_id", memoryId}});
    if (count) {
        const auto& body = count.value();
        if (body.is_number_unsigned() || body.is_number_integer())
            edgeCount = body.get<size_t>();
        else if (body.is_object())
            edgeCount = static_cast<size_t>(store::jsonInt(body, "count", 0));
    } else {
        spdlog::warn("Could not count edges for memory {}: {}", memoryId, count.error().message);
    }

    if (edgeCount == 0) {
        spdlog::debug("No edges to delete for memory {}", memoryId);
        return size_t{0};
    }

    auto res = store_->execute("deleteMemoryEdges", {{"memory_id", memoryId}});
    if (!res)
        return databaseError(res.error().message);
    if (!ackedTrue(res.value()))
        return databaseError("Failed to delete edges for memory " + memoryId);

    spdlog::info("Deleted {} edges for memory {}", edgeCount, memoryId);
    return edgeCount;
}

Result<DeletionResult> DeletionManager::hardDelete(const MemoryId& memoryId,
                                                   const std::string& deletedBy, bool cascade) {
    spdlog::warn("HARD DELETE requested for memory {} by {} - this cannot be undone", memoryId,
                 deletedBy);

    if (wasHardDeleted(memoryId))
        return Error{ErrorCode::NotFound, "Memory not found: " + memoryId};

    size_t edgesAffected = 0;
    if (cascade) {
        auto edges = deleteEdges(memoryId);
        if (!edges) {
            spdlog::error("Failed to cascade delete edges for memory {}: {}", memoryId,
                          edges.error().message);
            return edges.error();
        }
        edgesAffected = edges.value();
    }

    auto res = store_->execute("hardDeleteMemory", {{"memory_id", memoryId}});
    if (!res) {
        if (res.error().code == ErrorCode::NotFound)
            return Error{ErrorCode::NotFound, "Memory not found: " + memoryId};
        spdlog::error("Failed to hard delete memory {}: {}", memoryId, res.error().message);
        return databaseError(res.error().message);
    }
    if (!ackedTrue(res.value()))
        return databaseError("Hard delete failed for memory " + memoryId);

    hardDeleted_->put(memoryId, core::nowTimestamp());
    resolver_->invalidate(memoryId);
    spdlog::info("Hard deleted memory {}", memoryId);

    DeletionResult result;
    result.memory_id = memoryId;
    result.strategy = cascade ? DeletionStrategy::Cascade : DeletionStrategy::Hard;
    result.success = true;
    result.deleted_by = deletedBy;
    result.deleted_at = core::nowTimestamp();
    result.reason = "Hard delete requested";
    result.edges_affected = edgesAffected;
    return result;
}

Result<RestoreResult> DeletionManager::undelete(const MemoryId& memoryId,
                                                const std::string& restoredBy) {
    if (wasHardDeleted(memoryId))
        return cannotRestore(memoryId);

    auto memory = crud_->getMemory(memoryId);
    if (!memory)
        return memory.error();
    if (!memory.value().is_deleted)
        return Error{ErrorCode::InvalidState, "Memory is not deleted: " + memoryId};

    const auto now = core::nowTimestamp();
    auto res = store_->executeAck(
        "restoreMemory",
        {{"memory_id", memoryId}, {"restored_by", restoredBy}, {"restored_at", now}});
    if (!res) {
        if (config::toLower(res.error().message).find("hard deleted") != std::string::npos) {
            spdlog::warn("Cannot restore hard-deleted memory {}: {}", memoryId,
                         res.error().message);
            hardDeleted_->put(memoryId, now);
            return cannotRestore(memoryId);
        }
        spdlog::error("Failed to restore memory {}: {}", memoryId, res.error().message);
        return databaseError(res.error().message);
    }

    resolver_->invalidate(memoryId);
    spdlog::info("Restored memory {} by {}", memoryId, restoredBy);

    RestoreResult result;
    result.memory_id = memoryId;
    result.success = true;
    result.restored_by = restoredBy;
    result.restored_at = now;
    return result;
}

Result<std::vector<std::string>> DeletionManager::findIds(const std::string& query) {
    auto res = store_->execute(query, json::object());
    if (!res) {
        if (res.error().code == ErrorCode::NotFound)
            return std::vector<std::string>{};
        return databaseError(res.error().message);
    }
    std::vector<std::string> ids;
    const auto& body = res.value();
    const json* list = &body;
    if (body.is_object()) {
        for (const char* key : {"ids", "entity_ids", "edge_ids"}) {
            if (auto it = body.find(key); it != body.end() && it->is_array()) {
                list = &*it;
                break;
            }
        }
    }
    if (!list->is_array())
        return ids;
    for (const auto& item : *list) {
        if (item.is_string())
            ids.push_back(item.get<std::string>());
    }
    return ids;
}

Result<size_t> DeletionManager::deleteBatch(const std::string& query, const char* key,
                                            const std::vector<std::string>& ids) {
    if (ids.empty())
        return size_t{0};
    auto res = store_->execute(query, {{key, ids}});
    if (!res)
        return databaseError(res.error().message);
    return static_cast<size_t>(std::max(0, store::jsonInt(res.value(), "deleted_count", 0)));
}

Result<CleanupStats> DeletionManager::cleanupOrphans(bool dryRun) {
    spdlog::info("Starting orphan cleanup (dry_run: {})", dryRun);
    CleanupStats stats;
    stats.dry_run = dryRun;

    auto entities = findIds("findOrphanedEntities");
    if (!entities)
        return entities.error();
    stats.orphaned_entities = entities.value().size();
    if (!dryRun) {
        auto deleted = deleteBatch("deleteEntitiesBatch", "entity_ids", entities.value());
        if (!deleted)
            return deleted.error();
        stats.deleted_entities = deleted.value();
    }

    auto edges = findIds("findOrphanedEdges");
    if (!edges)
        return edges.error();
    stats.orphaned_edges = edges.value().size();
    if (!dryRun) {
        auto deleted = deleteBatch("deleteEdgesBatch", "edge_ids", edges.value());
        if (!deleted)
            return deleted.error();
        stats.deleted_edges = deleted.value();
    }

    spdlog::info("Orphan cleanup completed: {} entities, {} edges orphaned; {} and {} deleted",
                 stats.orphaned_entities, stats.orphaned_edges, stats.deleted_entities,
                 stats.deleted_edges);
    return stats;
}

} // namespace omc::evolution
