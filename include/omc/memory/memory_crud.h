#pragma once

#include <omc/core/types.h>
#include <omc/embedding/embedding_generator.h>
#include <omc/memory/user_linker.h>
#include <omc/resolution/id_resolver.h>
#include <omc/store/records.h>
#include <omc/store/store_client.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace omc::memory {

struct AddMemoryRequest {
    std::string content;
    std::string user_id;
    std::string memory_type = "fact";
    std::optional<int> certainty;  ///< defaults from configuration when unset
    std::optional<int> importance; ///< defaults from configuration when unset
    std::string source = "user";
    std::string context_tags = "[]";
    std::string metadata = "{}";
    std::optional<Embedding> vector; ///< precomputed embedding; generated when absent
};

struct MemoryDefaults {
    int certainty = 80;
    int importance = 50;
};

/**
 * @brief Create and read memory nodes.
 *
 * addMemory writes the node, its embedding and the owning user's OWNS edge. Only the node
 * write is fatal; embedding and user-link failures are logged.
 */
class MemoryCrud {
public:
    MemoryCrud(std::shared_ptr<store::StoreClient> store,
               std::shared_ptr<resolution::IdResolver> resolver,
               std::shared_ptr<embedding::EmbeddingGenerator> embedder,
               std::shared_ptr<UserLinker> users, MemoryDefaults defaults = {});

    Result<store::MemoryRecord> addMemory(const AddMemoryRequest& request);

    // NotFound when the id is unknown. Soft-deleted memories are returned as stored.
    Result<store::MemoryRecord> getMemory(const MemoryId& memoryId);

    Result<std::vector<store::MemoryRecord>> listMemories(const std::string& userId,
                                                          size_t limit = 100);

    // Attach a vector to an existing memory node
    Result<void> attachEmbedding(const InternalId& internalId, const Embedding& vector);

private:
    std::shared_ptr<store::StoreClient> store_;
    std::shared_ptr<resolution::IdResolver> resolver_;
    std::shared_ptr<embedding::EmbeddingGenerator> embedder_;
    std::shared_ptr<UserLinker> users_;
    MemoryDefaults defaults_;
};

} // namespace omc::memory
