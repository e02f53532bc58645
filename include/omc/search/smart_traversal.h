#pragma once

#include <omc/core/lru_cache.h>
#include <omc/core/types.h>
#include <omc/search/search_common.h>
#include <omc/search/search_modes.h>
#include <omc/store/store_client.h>

#include <boost/asio/any_io_executor.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace omc::search {

struct SearchConfig {
    size_t vector_top_k = 10;
    size_t graph_depth = 2;
    double min_vector_score = 0.5;
    double min_combined_score = 0.3;
    std::optional<std::vector<std::string>> edge_types; ///< relation names, e.g. "implies"
    double temporal_decay_days = 30.0;

    static SearchConfig fromMode(SearchMode mode);
};

struct TraversalStats {
    double phase1_duration_ms = 0.0;
    double phase2_duration_ms = 0.0;
    double phase3_duration_ms = 0.0;
    double total_duration_ms = 0.0;
    uint64_t cache_hits = 0;
    uint64_t cache_misses = 0;
    double cache_hit_rate = 0.0;
    size_t cache_size = 0;
};

/**
 * @brief Vector-first search followed by graph expansion over reasoning edges.
 *
 * Phase 1 scores vector hits as 0.7 vector + 0.3 temporal. Phase 2 walks logical connections
 * from every hit (seeds in parallel, one shared visited set) and scores neighbours as
 * 0.3 semantic + 0.5 graph + 0.2 temporal. Phase 3 keeps the best score per memory, drops
 * results below the floor and sorts descending. Final lists are cached by query fingerprint.
 */
class SmartTraversal {
public:
    SmartTraversal(std::shared_ptr<store::StoreClient> store,
                   boost::asio::any_io_executor executor, size_t cacheSize = 100,
                   std::chrono::milliseconds cacheTtl = std::chrono::seconds(300));

    Result<std::vector<SearchResult>> search(const std::string& query,
                                             std::span<const float> embedding,
                                             const std::optional<std::string>& userId,
                                             const SearchConfig& config,
                                             const std::optional<TimePoint>& cutoff);

    void clearCache();
    TraversalStats stats() const;

    // sha256 over the vector's little-endian floats, user, config and cutoff (to the minute)
    static std::string cacheKey(std::span<const float> embedding,
                                const std::optional<std::string>& userId,
                                const SearchConfig& config,
                                const std::optional<TimePoint>& cutoff);

private:
    Result<std::vector<SearchResult>> vectorPhase(std::span<const float> embedding,
                                                  const std::optional<std::string>& userId,
                                                  const SearchConfig& config,
                                                  const std::optional<TimePoint>& cutoff,
                                                  TimePoint now);

    std::vector<SearchResult> graphPhase(const std::vector<SearchResult>& seeds,
                                         std::span<const float> embedding,
                                         const std::optional<std::string>& userId,
                                         const SearchConfig& config,
                                         const std::optional<TimePoint>& cutoff, TimePoint now);

    std::shared_ptr<store::StoreClient> store_;
    boost::asio::any_io_executor executor_;
    core::LruCache<std::string, std::vector<SearchResult>> cache_;

    mutable std::mutex statsMutex_;
    TraversalStats stats_;
};

/// Phase 3: best score per memory, floor, descending order
std::vector<SearchResult> rankAndFilter(std::vector<SearchResult> results, double minCombined);

} // namespace omc::search
