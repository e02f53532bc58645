#include <omc/config/config_helpers.h>
#include <omc/core/executor.h>
#include <omc/core/time_utils.h>
#include <omc/crypto/hasher.h>
#include <omc/search/smart_traversal.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <deque>
#include <future>
#include <iterator>
#include <unordered_map>
#include <unordered_set>

namespace omc::search {

namespace {

double elapsedMs(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since)
        .count();
}

bool edgeAllowed(const std::string& key, const SearchConfig& config) {
    if (!config.edge_types || config.edge_types->empty())
        return true;
    auto relation = relationOfKey(key);
    for (const auto& t : *config.edge_types) {
        auto wanted = config::toLower(t);
        if (wanted == relation || wanted == key)
            return true;
    }
    return false;
}

} // namespace

SearchConfig SearchConfig::fromMode(SearchMode mode) {
    auto d = defaultsFor(mode);
    SearchConfig c;
    c.vector_top_k = d.vector_top_k;
    c.graph_depth = d.graph_depth;
    c.min_vector_score = d.min_vector_score;
    c.min_combined_score = d.min_combined_score;
    return c;
}

std::vector<SearchResult> rankAndFilter(std::vector<SearchResult> results, double minCombined) {
    std::unordered_map<std::string, size_t> best;
    std::vector<SearchResult> unique;
    unique.reserve(results.size());
    for (auto& r : results) {
        auto it = best.find(r.memory_id);
        if (it == best.end()) {
            best.emplace(r.memory_id, unique.size());
            unique.push_back(std::move(r));
        } else if (r.combined_score > unique[it->second].combined_score) {
            unique[it->second] = std::move(r);
        }
    }
    unique.erase(std::remove_if(unique.begin(), unique.end(),
                                [minCombined](const SearchResult& r) {
                                    return r.combined_score < minCombined;
                                }),
                 unique.end());
    std::stable_sort(unique.begin(), unique.end(), [](const auto& a, const auto& b) {
        return a.combined_score > b.combined_score;
    });
    return unique;
}

SmartTraversal::SmartTraversal(std::shared_ptr<store::StoreClient> store,
                               boost::asio::any_io_executor executor, size_t cacheSize,
                               std::chrono::milliseconds cacheTtl)
    : store_(std::move(store)), executor_(std::move(executor)), cache_(cacheSize, cacheTtl) {}

std::string SmartTraversal::cacheKey(std::span<const float> embedding,
                                     const std::optional<std::string>& userId,
                                     const SearchConfig& config,
                                     const std::optional<TimePoint>& cutoff) {
    crypto::SHA256Hasher hasher;
    hasher.update(embedding);
    if (userId)
        hasher.update(*userId);
    hasher.update(fmt::format("|{}|{}|{:.6f}|{:.6f}|{:.3f}", config.vector_top_k,
                              config.graph_depth, config.min_vector_score,
                              config.min_combined_score, config.temporal_decay_days));
    if (config.edge_types) {
        for (const auto& t : *config.edge_types)
            hasher.update(t);
    }
    if (cutoff) {
        auto minutes =
            std::chrono::duration_cast<std::chrono::minutes>(cutoff->time_since_epoch()).count();
        hasher.update(fmt::format("|cutoff:{}", minutes));
    }
    return hasher.finalize();
}

void SmartTraversal::clearCache() {
    cache_.clear();
}

TraversalStats SmartTraversal::stats() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    auto s = stats_;
    auto c = cache_.stats();
    s.cache_size = c.size;
    return s;
}

Result<std::vector<SearchResult>>
SmartTraversal::vectorPhase(std::span<const float> embedding,
                            const std::optional<std::string>& userId, const SearchConfig& config,
                            const std::optional<TimePoint>& cutoff, TimePoint now) {
    auto response = store_->executeAs<store::VectorSearchResponse>(
        "smartVectorSearchWithChunks",
        {{"query_vector", std::vector<float>(embedding.begin(), embedding.end())},
         {"limit", config.vector_top_k}});
    if (!response) {
        if (response.error().code == ErrorCode::NotFound)
            return std::vector<SearchResult>{};
        return Error{ErrorCode::DatabaseError, "Vector search failed: " + response.error().message};
    }

    std::vector<SearchResult> hits;
    for (const auto& hit : response.value().merged()) {
        const auto& m = hit.memory;
        if (!passesFilters(m, userId, cutoff, now))
            continue;
        double v = vectorScore(embedding, hit.vector, hit.score);
        if (v < config.min_vector_score)
            continue;

        SearchResult r;
        r.memory_id = m.memory_id;
        r.content = m.content;
        r.memory_type = m.memory_type;
        r.user_id = m.user_id;
        r.created_at = m.created_at;
        r.vector_score = v;
        r.temporal_score = temporalScore(m.created_at, config.temporal_decay_days, now);
        r.combined_score = std::clamp(0.7 * v + 0.3 * r.temporal_score, 0.0, 1.0);
        r.source = ResultSource::Vector;
        hits.push_back(std::move(r));
    }
    return hits;
}

std::vector<SearchResult>
SmartTraversal::graphPhase(const std::vector<SearchResult>& seeds,
                           std::span<const float> embedding,
                           const std::optional<std::string>& userId, const SearchConfig& config,
                           const std::optional<TimePoint>& cutoff, TimePoint now) {
    if (config.graph_depth == 0 || seeds.empty())
        return {};

    std::mutex visitedMutex;
    std::unordered_set<std::string> visited;
    for (const auto& s : seeds)
        visited.insert(s.memory_id);

    const std::vector<float> query(embedding.begin(), embedding.end());

    auto expand = [&, query](const SearchResult& seed) {
        std::vector<SearchResult> found;
        struct Frontier {
            std::string id;
            double combined;
            size_t depth;
        };
        std::deque<Frontier> queue{{seed.memory_id, seed.combined_score, 0}};

        while (!queue.empty()) {
            auto current = std::move(queue.front());
            queue.pop_front();
            if (current.depth >= config.graph_depth)
                continue;

            auto conns = store_->executeAs<store::LogicalConnections>(
                "getMemoryLogicalConnections", {{"memory_id", current.id}});
            if (!conns) {
                if (conns.error().code != ErrorCode::NotFound)
                    spdlog::warn("Graph expansion from {} failed: {}", current.id,
                                 conns.error().message);
                continue;
            }

            for (const auto& [key, neighbours] : conns.value().byKey) {
                if (!edgeAllowed(key, config))
                    continue;
                const double weight = edgeWeight(key);
                for (const auto& n : neighbours) {
                    const auto& m = n.memory;
                    if (!passesFilters(m, userId, cutoff, now))
                        continue;
                    {
                        std::lock_guard<std::mutex> lock(visitedMutex);
                        if (!visited.insert(m.memory_id).second)
                            continue;
                    }

                    SearchResult r;
                    r.memory_id = m.memory_id;
                    r.content = m.content;
                    r.memory_type = m.memory_type;
                    r.user_id = m.user_id;
                    r.created_at = m.created_at;
                    r.vector_score = semanticScore(query, n.vector);
                    r.graph_score = std::clamp(weight * current.combined, 0.0, 1.0);
                    r.temporal_score = temporalScore(m.created_at, config.temporal_decay_days, now);
                    r.combined_score = std::clamp(
                        0.3 * r.vector_score + 0.5 * r.graph_score + 0.2 * r.temporal_score, 0.0,
                        1.0);
                    r.source = ResultSource::Graph;
                    r.depth = current.depth + 1;
                    r.via_edge = key;
                    r.parent_id = current.id;

                    queue.push_back({r.memory_id, r.combined_score, r.depth});
                    found.push_back(std::move(r));
                }
            }
        }
        return found;
    };

    std::vector<std::future<std::vector<SearchResult>>> futures;
    futures.reserve(seeds.size());
    for (const auto& seed : seeds)
        futures.push_back(core::submit(executor_, [&expand, &seed]() { return expand(seed); }));

    // expand shares locals with every task
    for (auto& f : futures)
        f.wait();

    std::vector<SearchResult> out;
    for (auto& f : futures) {
        auto part = f.get();
        std::move(part.begin(), part.end(), std::back_inserter(out));
    }
    return out;
}

Result<std::vector<SearchResult>> SmartTraversal::search(const std::string& query,
                                                         std::span<const float> embedding,
                                                         const std::optional<std::string>& userId,
                                                         const SearchConfig& config,
                                                         const std::optional<TimePoint>& cutoff) {
    const auto key = cacheKey(embedding, userId, config, cutoff);
    if (auto cached = cache_.get(key)) {
        std::lock_guard<std::mutex> lock(statsMutex_);
        ++stats_.cache_hits;
        stats_.cache_hit_rate = static_cast<double>(stats_.cache_hits) /
                                static_cast<double>(stats_.cache_hits + stats_.cache_misses);
        spdlog::debug("Cache hit for query: {}", query);
        return *cached;
    }
    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        ++stats_.cache_misses;
        stats_.cache_hit_rate = static_cast<double>(stats_.cache_hits) /
                                static_cast<double>(stats_.cache_hits + stats_.cache_misses);
    }

    const auto start = std::chrono::steady_clock::now();
    const auto now = std::chrono::system_clock::now();
    spdlog::info("Starting smart traversal search for query: {}", query);

    auto phase = std::chrono::steady_clock::now();
    auto hits = vectorPhase(embedding, userId, config, cutoff, now);
    if (!hits)
        return hits.error();
    const double phase1 = elapsedMs(phase);

    phase = std::chrono::steady_clock::now();
    auto graph = graphPhase(hits.value(), embedding, userId, config, cutoff, now);
    const double phase2 = elapsedMs(phase);

    phase = std::chrono::steady_clock::now();
    auto all = std::move(hits).value();
    std::move(graph.begin(), graph.end(), std::back_inserter(all));
    auto ranked = rankAndFilter(std::move(all), config.min_combined_score);
    const double phase3 = elapsedMs(phase);

    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.phase1_duration_ms = phase1;
        stats_.phase2_duration_ms = phase2;
        stats_.phase3_duration_ms = phase3;
        stats_.total_duration_ms = elapsedMs(start);
    }
    cache_.put(key, ranked);

    spdlog::info("Smart traversal search completed in {:.2f}ms with {} results", elapsedMs(start),
                 ranked.size());
    return ranked;
}

} // namespace omc::search
