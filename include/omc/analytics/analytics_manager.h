#pragma once

#include <omc/core/types.h>
#include <omc/store/records.h>
#include <omc/store/store_client.h>

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace omc::analytics {

inline constexpr size_t kVectorBytesPerMemory = EMBEDDING_DIMENSIONS * sizeof(float);

struct StorageStats {
    size_t total_size_bytes = 0;
    double total_size_mb = 0.0;
    double total_size_gb = 0.0;
    size_t total_memories = 0;
    std::map<std::string, size_t> size_by_type;
    double avg_memory_size = 0.0;
    std::vector<std::pair<MemoryId, size_t>> largest_memories; ///< at most ten, largest first
    size_t vector_count = 0;
    double vector_storage_mb = 0.0;
    std::string collected_at;
};

struct GraphStats {
    std::map<std::string, size_t> node_counts; ///< Memory, Entity, Concept
    size_t total_nodes = 0;
    size_t total_edges = 0;
    double graph_density = 0.0;
    double avg_degree = 0.0;
    std::string collected_at;
};

struct GrowthStats {
    double memories_per_day = 0.0;
    double growth_rate_percent = 0.0;
    std::string trend = "unknown"; ///< slow, stable, growing or rapid
    int analysis_period_days = 7;
    std::string collected_at;
};

struct AnalyticsSummary {
    StorageStats storage;
    GraphStats graph;
    GrowthStats growth;
    std::map<std::string, size_t> categories;
    std::string collected_at;
};

void to_json(nlohmann::json& j, const StorageStats& s);
void to_json(nlohmann::json& j, const GraphStats& s);
void to_json(nlohmann::json& j, const GrowthStats& s);
void to_json(nlohmann::json& j, const AnalyticsSummary& s);

// memories_per_day thresholds 1, 10 and 100
std::string growthTrend(double memoriesPerDay);

class AnalyticsManager {
public:
    explicit AnalyticsManager(std::shared_ptr<store::StoreClient> store);

    Result<StorageStats> storageStats();
    Result<GraphStats> graphStats();
    Result<GrowthStats> growthStats(TimePoint now);
    Result<std::map<std::string, size_t>> categoryBreakdown();
    Result<AnalyticsSummary> collectAll();

private:
    Result<std::vector<store::MemoryRecord>> allMemories();
    size_t count(const std::string& query);

    std::shared_ptr<store::StoreClient> store_;
};

} // namespace omc::analytics
