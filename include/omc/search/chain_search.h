#pragma once

#include <omc/core/types.h>
#include <omc/store/records.h>
#include <omc/store/store_client.h>

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace omc::search {

enum class ChainDirection { Forward, Backward, Both };

const char* toString(ChainDirection direction);

struct MemoryChainConfig {
    size_t max_depth = 5;
    ChainDirection direction = ChainDirection::Both;
    std::vector<std::string> relation_types{"IMPLIES", "BECAUSE", "CONTRADICTS"};
    double min_confidence = 0.5;
    bool include_contradictions = true;

    static MemoryChainConfig causalOnly();
    static MemoryChainConfig implicationsOnly();
    static MemoryChainConfig deepContext();

    // "causal" | "forward" | "deep"; anything else is the default (both directions)
    static MemoryChainConfig fromChainMode(std::string_view mode);

    bool allows(const std::string& relationType) const;
};

struct ChainNode {
    MemoryId memory_id;
    std::string content;
    std::optional<std::string> memory_type;
    size_t depth = 0;
    std::optional<std::string> relation_type; ///< nullopt for the seed
};

struct MemoryChain {
    MemoryId seed_memory_id;
    std::string chain_type = "mixed";
    std::vector<ChainNode> nodes;
    size_t total_depth = 0;

    void addNode(ChainNode node);

    // One line per node: "[depth] RELATION -> content", content cut at 80 bytes
    std::string reasoningTrail() const;
};

struct ChainSearchResult {
    std::string query;
    std::vector<MemoryChain> chains;
    size_t total_memories = 0; ///< distinct memory ids across chains
    size_t total_chains = 0;
    size_t deepest_chain = 0;
    std::vector<ChainNode> memories; ///< first occurrence of each memory across chains

    static ChainSearchResult build(std::string query, std::vector<MemoryChain> chains);

    std::string reasoningTrails() const;
};

/**
 * @brief Typed reasoning-chain expansion seeded by vector search.
 *
 * Every seed is expanded depth-first over the connection keys the direction allows, skipping
 * edges weaker than min_confidence. Each chain has its own visited set.
 */
class ChainSearch {
public:
    explicit ChainSearch(std::shared_ptr<store::StoreClient> store);

    Result<ChainSearchResult> search(const std::string& query, std::span<const float> embedding,
                                     const std::optional<std::string>& userId, size_t limit,
                                     const MemoryChainConfig& config);

    ChainSearchResult searchFromSeeds(const std::string& query,
                                      const std::vector<store::MemoryRecord>& seeds,
                                      const MemoryChainConfig& config);

    /// Connection keys followed for a relation type in a direction, e.g. BECAUSE/Backward
    static std::vector<std::string> connectionKeys(const std::string& relationType,
                                                   ChainDirection direction);

private:
    std::optional<MemoryChain> buildChain(const store::MemoryRecord& seed,
                                          const MemoryChainConfig& config);

    void expand(MemoryChain& chain, const MemoryId& nodeId, size_t depth,
                const MemoryChainConfig& config, std::unordered_set<std::string>& visited);

    std::shared_ptr<store::StoreClient> store_;
};

} // namespace omc::search
