#include <omc/core/time_utils.h>
#include <omc/evolution/evolution_manager.h>

#include <spdlog/spdlog.h>

namespace omc::evolution {

EvolutionManager::EvolutionManager(std::shared_ptr<store::StoreClient> store,
                                   std::shared_ptr<memory::MemoryCrud> crud,
                                   std::shared_ptr<memory::RelationManager> relations)
    : store_(std::move(store)), crud_(std::move(crud)), relations_(std::move(relations)) {
    spdlog::info("EvolutionManager initialized");
}

Result<EvolutionResult> EvolutionManager::supersede(const MemoryId& olderId,
                                                    const MemoryId& newerId,
                                                    const std::string& reason,
                                                    bool copyRelations) {
    auto older = crud_->getMemory(olderId);
    if (!older)
        return older.error();
    auto newer = crud_->getMemory(newerId);
    if (!newer)
        return newer.error();
    return supersede(older.value(), newer.value(), reason, copyRelations);
}

Result<EvolutionResult> EvolutionManager::supersede(const store::MemoryRecord& older,
                                                    const store::MemoryRecord& newer,
                                                    const std::string& reason,
                                                    bool copyRelations) {
    if (older.memory_id == newer.memory_id)
        return Error{ErrorCode::InvalidOperation, "A memory cannot supersede itself"};

    spdlog::info("Handling supersession: {} supersedes {}", newer.memory_id, older.memory_id);

    // The boundary never precedes the old memory's own start
    std::string boundary = newer.created_at.empty() ? core::nowTimestamp() : newer.created_at;
    auto boundaryTp = core::parseTimestamp(boundary);
    auto validFromTp = core::parseTimestamp(older.valid_from);
    if (boundaryTp && validFromTp && *boundaryTp < *validFromTp)
        boundary = older.valid_from;

    auto closed = store_->executeAck("updateMemoryValidUntil",
                                     {{"memory_id", older.memory_id}, {"valid_until", boundary}});
    if (!closed)
        return Error{ErrorCode::DatabaseError,
                     "Failed to close validity of " + older.memory_id + ": " +
                         closed.error().message};

    auto contradiction = detector_.detect(older.content, newer.content);

    EvolutionResult result;
    result.old_memory_id = older.memory_id;
    result.new_memory_id = newer.memory_id;
    result.operation = "supersession";
    result.is_contradiction = contradiction.has_value();
    result.timestamp = core::nowTimestamp();

    auto edge = relations_->addSupersession(newer.memory_id, older.memory_id, reason, boundary,
                                            result.is_contradiction);
    if (!edge)
        return Error{ErrorCode::DatabaseError,
                     "Failed to create supersession edge: " + edge.error().message};
    result.edge_created = true;

    if (contradiction) {
        spdlog::debug("Supersession is also a contradiction ({})", *contradiction);
        auto c = relations_->addContradiction(newer.memory_id, older.memory_id, "superseded", true,
                                              "newer_wins");
        if (!c)
            spdlog::warn("Failed to create contradiction edge: {}", c.error().message);
    }

    if (copyRelations) {
        auto copied = relations_->copyReasoningRelations(older.memory_id, newer.memory_id);
        if (copied)
            result.relations_copied = copied.value();
        else
            spdlog::warn("Failed to copy relations from {}: {}", older.memory_id,
                         copied.error().message);
    }

    result.success = true;
    spdlog::info("Memory supersession complete: {} supersedes {} (contradiction: {}, relations: {})",
                 newer.memory_id, older.memory_id, result.is_contradiction,
                 result.relations_copied);
    return result;
}

Result<EvolutionResult> EvolutionManager::contradict(const MemoryId& existingId,
                                                     const MemoryId& newId, int confidence,
                                                     const std::string& explanation) {
    spdlog::info("Handling contradiction: {} <-> {}", newId, existingId);
    const std::string strategy = explanation.empty() ? "keep_both" : explanation;

    auto forward = relations_->addContradiction(newId, existingId, "", false, strategy, confidence);
    auto backward =
        relations_->addContradiction(existingId, newId, "", false, strategy, confidence);

    EvolutionResult result;
    result.success = true;
    result.old_memory_id = existingId;
    result.new_memory_id = newId;
    result.operation = "contradiction";
    result.is_contradiction = true;
    result.edge_created = forward.has_value() && backward.has_value();
    result.timestamp = core::nowTimestamp();

    if (!result.edge_created) {
        spdlog::warn("Some CONTRADICTS edges failed: forward={}, backward={}", forward.has_value(),
                     backward.has_value());
    }
    spdlog::warn("Memory contradiction detected and logged: {} <-> {}", newId, existingId);
    return result;
}

Result<EvolutionResult> EvolutionManager::enhance(const MemoryId& memoryId,
                                                  const std::string& content) {
    if (content.empty())
        return Error{ErrorCode::ValidationError, "Enhanced content cannot be empty"};

    spdlog::info("Enhancing memory: {}", memoryId);
    const auto now = core::nowTimestamp();
    auto res = store_->executeAck(
        "updateMemoryContent", {{"memory_id", memoryId}, {"content", content}, {"updated_at", now}});
    if (!res) {
        if (res.error().code == ErrorCode::NotFound)
            return Error{ErrorCode::NotFound, "Memory not found: " + memoryId};
        return Error{ErrorCode::DatabaseError, res.error().message};
    }

    EvolutionResult result;
    result.success = true;
    result.old_memory_id = memoryId;
    result.operation = "enhancement";
    result.timestamp = now;
    return result;
}

Result<EvolutionResult> EvolutionManager::updateMetadata(const MemoryId& memoryId,
                                                         std::optional<int> certainty,
                                                         std::optional<int> importance) {
    auto memory = crud_->getMemory(memoryId);
    if (!memory)
        return memory.error();
    const auto& m = memory.value();

    const int c = certainty.value_or(m.certainty);
    const int i = importance.value_or(m.importance);
    if (c < 0 || c > 100 || i < 0 || i > 100)
        return Error{ErrorCode::ValidationError, "certainty and importance must be in 0..100"};

    const auto now = core::nowTimestamp();
    auto res = store_->executeAck("updateMemoryById", {{"id", m.internal_id},
                                                       {"content", m.content},
                                                       {"certainty", c},
                                                       {"importance", i},
                                                       {"updated_at", now}});
    if (!res)
        return Error{ErrorCode::DatabaseError, res.error().message};

    spdlog::debug("Updated metadata for memory {}", memoryId);
    EvolutionResult result;
    result.success = true;
    result.old_memory_id = memoryId;
    result.operation = "metadata_update";
    result.timestamp = now;
    return result;
}

} // namespace omc::evolution
