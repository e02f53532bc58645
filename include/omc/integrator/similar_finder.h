#pragma once

#include <omc/core/types.h>
#include <omc/store/store_client.h>

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace omc::integrator {

struct SimilarCandidate {
    MemoryId memory_id;
    std::string content;
    double similarity = 0.0;
    std::string created_at;
};

/**
 * @brief Nearest existing memories of the same user for a new embedding.
 *
 * Soft-deleted and expired memories never qualify. Results are sorted by similarity and hold
 * at most `maxSimilar` entries at or above `similarityThreshold`.
 */
class SimilarMemoryFinder {
public:
    struct Config {
        double similarityThreshold = 0.7;
        size_t maxSimilar = 10;
    };

    SimilarMemoryFinder(std::shared_ptr<store::StoreClient> store, Config config);
    explicit SimilarMemoryFinder(std::shared_ptr<store::StoreClient> store)
        : SimilarMemoryFinder(std::move(store), Config{}) {}

    Result<std::vector<SimilarCandidate>> find(std::span<const float> embedding,
                                               const std::string& userId,
                                               const std::optional<MemoryId>& excludeId = {});

    const Config& config() const { return config_; }

private:
    std::shared_ptr<store::StoreClient> store_;
    Config config_;
};

} // namespace omc::integrator
