#pragma once

#include <omc/core/types.h>
#include <omc/entity/entity_manager.h>
#include <omc/search/onto_search.h>
#include <omc/store/records.h>
#include <omc/store/store_client.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace omc::retrieval {

enum class RetrievalDepth { Shallow, Medium, Deep };

const char* toString(RetrievalDepth depth);

// Case-insensitive; unknown strings are Medium
RetrievalDepth parseRetrievalDepth(std::string_view text);

search::SearchMode modeFor(RetrievalDepth depth);

struct ReasoningLink {
    MemoryId from_memory_id;
    MemoryId to_memory_id;
    std::string relation_type;
    int strength = 0;
};

struct RetrievedMemory {
    MemoryId memory_id;
    std::string content;
    std::string memory_type;
    std::string user_id;
    std::string created_at;
    double score = 0.0;
    size_t chunk_count = 0; ///< chunks joined into content, 0 when stored whole
};

struct RetrievalResult {
    std::vector<RetrievedMemory> memories;
    size_t chunks_reconstructed = 0;
    std::vector<store::MemoryRecord> context_memories;
    std::vector<ReasoningLink> reasoning_chains;
    std::vector<entity::Entity> entities;
    nlohmann::json metadata = nlohmann::json::object();
};

void to_json(nlohmann::json& j, const RetrievalResult& r);

struct Reconstruction {
    std::string content;
    size_t chunks = 0;
};

/**
 * @brief Depth-aware retrieval: onto-search, chunk reconstruction and context assembly.
 *
 * Shallow returns search hits as stored. Medium and Deep join multi-chunk memories back
 * together and gather reasoning relations (depth 1 and 2) and linked entities.
 */
class RetrievalManager {
public:
    RetrievalManager(std::shared_ptr<store::StoreClient> store,
                     std::shared_ptr<search::OntoSearch> search,
                     std::shared_ptr<entity::EntityManager> entities);

    Result<RetrievalResult> retrieve(const std::string& query, std::span<const float> embedding,
                                     const std::string& userId, RetrievalDepth depth, size_t limit,
                                     bool includeReasoning = true, bool includeEntities = true);

    // Chunks sorted by position and joined by one space; chunks == 0 for an unchunked memory
    Result<Reconstruction> reconstruct(const MemoryId& memoryId);

    Result<std::vector<ReasoningLink>> reasoningRelations(const MemoryId& memoryId,
                                                          size_t maxDepth);

private:
    std::shared_ptr<store::StoreClient> store_;
    std::shared_ptr<search::OntoSearch> search_;
    std::shared_ptr<entity::EntityManager> entities_;
};

} // namespace omc::retrieval
