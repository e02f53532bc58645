#include <omc/core/similarity.h>
#include <omc/integrator/similar_finder.h>
#include <omc/store/records.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <unordered_set>

namespace omc::integrator {

SimilarMemoryFinder::SimilarMemoryFinder(std::shared_ptr<store::StoreClient> store, Config config)
    : store_(std::move(store)), config_(config) {}

Result<std::vector<SimilarCandidate>>
SimilarMemoryFinder::find(std::span<const float> embedding, const std::string& userId,
                          const std::optional<MemoryId>& excludeId) {
    auto response = store_->executeAs<store::VectorSearchResponse>(
        "smartVectorSearchWithChunks",
        {{"query_vector", std::vector<float>(embedding.begin(), embedding.end())},
         {"limit", config_.maxSimilar * 2}});
    if (!response) {
        if (response.error().code == ErrorCode::NotFound)
            return std::vector<SimilarCandidate>{};
        return Error{ErrorCode::DatabaseError, response.error().message};
    }

    const auto now = std::chrono::system_clock::now();
    std::unordered_set<std::string> seen;
    std::vector<SimilarCandidate> candidates;

    for (const auto& hit : response.value().merged()) {
        const auto& m = hit.memory;
        if (!seen.insert(m.memory_id).second)
            continue;
        if (excludeId && m.memory_id == *excludeId)
            continue;
        if (m.user_id != userId || !m.isActive(now))
            continue;

        double similarity = hit.score;
        if (hit.vector && !hit.vector->empty())
            similarity = core::cosineSimilarity(embedding, *hit.vector);

        if (similarity >= config_.similarityThreshold)
            candidates.push_back({m.memory_id, m.content, similarity, m.created_at});
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const auto& a, const auto& b) { return a.similarity > b.similarity; });
    if (candidates.size() > config_.maxSimilar)
        candidates.resize(config_.maxSimilar);

    if (candidates.empty())
        spdlog::debug("No similar memories found for user {}", userId);
    else
        spdlog::info("Found {} similar memories", candidates.size());
    return candidates;
}

} // namespace omc::integrator
