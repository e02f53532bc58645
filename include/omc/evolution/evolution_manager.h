#pragma once

#include <omc/core/types.h>
#include <omc/evolution/contradiction_detector.h>
#include <omc/memory/memory_crud.h>
#include <omc/memory/relation_manager.h>
#include <omc/store/store_client.h>

#include <memory>
#include <optional>
#include <string>

namespace omc::evolution {

struct EvolutionResult {
    bool success = false;
    MemoryId old_memory_id;
    std::optional<MemoryId> new_memory_id;
    std::string operation; ///< supersession, contradiction, enhancement, metadata_update
    bool edge_created = false;
    bool is_contradiction = false;
    size_t relations_copied = 0;
    std::string timestamp;
};

/**
 * @brief Temporal evolution of memories: supersession, contradiction and enhancement.
 *
 * Supersession closes the old memory's validity window at the new memory's created_at and
 * writes a SUPERSEDES edge. Contradiction keeps both memories active.
 */
class EvolutionManager {
public:
    EvolutionManager(std::shared_ptr<store::StoreClient> store,
                     std::shared_ptr<memory::MemoryCrud> crud,
                     std::shared_ptr<memory::RelationManager> relations);

    // `newer` supersedes `older`; both must already exist
    Result<EvolutionResult> supersede(const MemoryId& olderId, const MemoryId& newerId,
                                      const std::string& reason = "content_update",
                                      bool copyRelations = true);

    Result<EvolutionResult> supersede(const store::MemoryRecord& older,
                                      const store::MemoryRecord& newer,
                                      const std::string& reason = "content_update",
                                      bool copyRelations = true);

    // CONTRADICTS in both directions at the same confidence; edge failures are not fatal
    Result<EvolutionResult> contradict(const MemoryId& existingId, const MemoryId& newId,
                                       int confidence = 80,
                                       const std::string& explanation = {});

    Result<EvolutionResult> enhance(const MemoryId& memoryId, const std::string& content);

    // Unset fields keep the stored values
    Result<EvolutionResult> updateMetadata(const MemoryId& memoryId,
                                           std::optional<int> certainty,
                                           std::optional<int> importance);

    const ContradictionDetector& detector() const { return detector_; }

private:
    std::shared_ptr<store::StoreClient> store_;
    std::shared_ptr<memory::MemoryCrud> crud_;
    std::shared_ptr<memory::RelationManager> relations_;
    ContradictionDetector detector_;
};

} // namespace omc::evolution
