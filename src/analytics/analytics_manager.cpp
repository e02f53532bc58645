#include <omc/analytics/analytics_manager.h>
#include <omc/core/time_utils.h>
#include <omc/store/json_fields.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

namespace omc::analytics {

using nlohmann::json;

namespace {

constexpr double kMiB = 1024.0 * 1024.0;

} // namespace

void to_json(json& j, const StorageStats& s) {
    json largest = json::array();
    for (const auto& [id, size] : s.largest_memories)
        largest.push_back({{"memory_id", id}, {"size", size}});
    j = json{{"total_size_bytes", s.total_size_bytes},
             {"total_size_mb", s.total_size_mb},
             {"total_size_gb", s.total_size_gb},
             {"total_memories", s.total_memories},
             {"size_by_type", s.size_by_type},
             {"avg_memory_size", s.avg_memory_size},
             {"largest_memories", largest},
             {"vector_count", s.vector_count},
             {"vector_storage_mb", s.vector_storage_mb},
             {"collected_at", s.collected_at}};
}

void to_json(json& j, const GraphStats& s) {
    j = json{{"node_counts", s.node_counts}, {"total_nodes", s.total_nodes},
             {"total_edges", s.total_edges}, {"graph_density", s.graph_density},
             {"avg_degree", s.avg_degree},   {"collected_at", s.collected_at}};
}

void to_json(json& j, const GrowthStats& s) {
    j = json{{"memories_per_day", s.memories_per_day},
             {"growth_rate_percent", s.growth_rate_percent},
             {"trend", s.trend},
             {"analysis_period_days", s.analysis_period_days},
             {"collected_at", s.collected_at}};
}

void to_json(json& j, const AnalyticsSummary& s) {
    j = json{{"storage", s.storage},
             {"graph", s.graph},
             {"growth", s.growth},
             {"categories", s.categories},
             {"collected_at", s.collected_at}};
}

std::string growthTrend(double memoriesPerDay) {
    if (memoriesPerDay < 1.0)
        return "slow";
    if (memoriesPerDay < 10.0)
        return "stable";
    if (memoriesPerDay < 100.0)
        return "growing";
    return "rapid";
}

AnalyticsManager::AnalyticsManager(std::shared_ptr<store::StoreClient> store)
    : store_(std::move(store)) {}

Result<std::vector<store::MemoryRecord>> AnalyticsManager::allMemories() {
    auto res = store_->execute("getAllMemories", json::object());
    if (!res) {
        if (res.error().code == ErrorCode::NotFound)
            return std::vector<store::MemoryRecord>{};
        return Error{ErrorCode::DatabaseError, "Database error: " + res.error().message};
    }
    const auto& body = store::unwrap(res.value(), "memories");
    std::vector<store::MemoryRecord> out;
    if (!body.is_array())
        return out;
    for (const auto& item : body)
        out.push_back(item.get<store::MemoryRecord>());
    return out;
}

size_t AnalyticsManager::count(const std::string& query) {
    auto res = store_->execute(query, json::object());
    if (!res) {
        spdlog::debug("{} failed: {}", query, res.error().message);
        return 0;
    }
    const auto& v = res.value();
    if (v.is_number_integer())
        return v.get<size_t>();
    if (v.is_number())
        return static_cast<size_t>(v.get<double>());
    return static_cast<size_t>(std::max(0, store::jsonInt(v, "count")));
}

Result<StorageStats> AnalyticsManager::storageStats() {
    auto memories = allMemories();
    if (!memories)
        return memories.error();

    StorageStats s;
    s.total_memories = memories.value().size();
    std::vector<std::pair<MemoryId, size_t>> sizes;
    for (const auto& m : memories.value()) {
        const auto size = m.content.size();
        s.total_size_bytes += size;
        s.size_by_type[m.memory_type.empty() ? "unknown" : m.memory_type] += size;
        sizes.emplace_back(m.memory_id, size);
    }
    s.total_size_mb = static_cast<double>(s.total_size_bytes) / kMiB;
    s.total_size_gb = s.total_size_mb / 1024.0;
    s.avg_memory_size = s.total_memories == 0 ? 0.0
                                              : static_cast<double>(s.total_size_bytes) /
                                                    static_cast<double>(s.total_memories);

    std::stable_sort(sizes.begin(), sizes.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (sizes.size() > 10)
        sizes.resize(10);
    s.largest_memories = std::move(sizes);

    s.vector_count = s.total_memories;
    s.vector_storage_mb = static_cast<double>(s.vector_count * kVectorBytesPerMemory) / kMiB;
    s.collected_at = core::nowTimestamp();
    spdlog::debug("Storage stats: {} memories, {:.2f} MB, {} vectors", s.total_memories,
                  s.total_size_mb, s.vector_count);
    return s;
}

Result<GraphStats> AnalyticsManager::graphStats() {
    GraphStats s;
    s.node_counts["Memory"] = count("countAllMemories");
    s.node_counts["Entity"] = count("countAllEntities");
    s.node_counts["Concept"] = count("countAllConcepts");
    for (const auto& [_, n] : s.node_counts)
        s.total_nodes += n;

    // edge totals are not exposed by the store
    const size_t maxEdges = s.total_nodes > 1 ? s.total_nodes * (s.total_nodes - 1) / 2 : 0;
    s.graph_density =
        maxEdges > 0 ? static_cast<double>(s.total_edges) / static_cast<double>(maxEdges) : 0.0;
    s.avg_degree = s.total_nodes > 0 ? 2.0 * static_cast<double>(s.total_edges) /
                                           static_cast<double>(s.total_nodes)
                                     : 0.0;
    s.collected_at = core::nowTimestamp();
    return s;
}

Result<GrowthStats> AnalyticsManager::growthStats(TimePoint now) {
    auto memories = allMemories();
    if (!memories)
        return memories.error();

    GrowthStats s;
    const auto cutoff = now - std::chrono::hours(24 * s.analysis_period_days);
    size_t recent = 0;
    for (const auto& m : memories.value()) {
        auto created = core::parseTimestamp(m.created_at);
        if (created && *created >= cutoff)
            ++recent;
    }
    const size_t total = memories.value().size();
    const size_t older = total - recent;

    s.memories_per_day = static_cast<double>(recent) / s.analysis_period_days;
    if (older > 0)
        s.growth_rate_percent = static_cast<double>(recent) / static_cast<double>(older) * 100.0;
    else if (recent > 0)
        s.growth_rate_percent = 100.0;
    s.trend = growthTrend(s.memories_per_day);
    s.collected_at = core::nowTimestamp();
    spdlog::debug("Growth stats: {:.1f} memories/day, {:.1f}% growth, trend={}",
                  s.memories_per_day, s.growth_rate_percent, s.trend);
    return s;
}

Result<std::map<std::string, size_t>> AnalyticsManager::categoryBreakdown() {
    auto memories = allMemories();
    if (!memories)
        return memories.error();
    std::map<std::string, size_t> breakdown;
    for (const auto& m : memories.value())
        ++breakdown[m.memory_type.empty() ? "unknown" : m.memory_type];
    return breakdown;
}

Result<AnalyticsSummary> AnalyticsManager::collectAll() {
    spdlog::info("Collecting all analytics...");
    AnalyticsSummary summary;

    auto storage = storageStats();
    if (!storage)
        return storage.error();
    summary.storage = std::move(storage).value();

    auto graph = graphStats();
    if (!graph)
        return graph.error();
    summary.graph = std::move(graph).value();

    auto growth = growthStats(std::chrono::system_clock::now());
    if (!growth)
        return growth.error();
    summary.growth = std::move(growth).value();

    auto categories = categoryBreakdown();
    if (!categories)
        return categories.error();
    summary.categories = std::move(categories).value();

    summary.collected_at = core::nowTimestamp();
    spdlog::info("Analytics collected: {} memories, {} nodes, {:.2f} MB",
                 summary.storage.total_memories, summary.graph.total_nodes,
                 summary.storage.total_size_mb);
    return summary;
}

} // namespace omc::analytics
