#include <omc/config/config_helpers.h>
#include <omc/search/onto_search.h>
#include <omc/search/search_common.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <deque>
#include <iterator>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace omc::search {

namespace {

constexpr std::array<std::pair<const char*, const char*>, 6> kOntoEdges{{
    {"implies_out", "IMPLIES"},
    {"implies_in", "IMPLIES"},
    {"because_out", "BECAUSE"},
    {"because_in", "BECAUSE"},
    {"relation_out", "MEMORY_RELATION"},
    {"relation_in", "MEMORY_RELATION"},
}};

bool containsId(const std::vector<std::string>& ids, const std::string& id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

} // namespace

OntoSearchConfig OntoSearchConfig::fromMode(SearchMode mode) {
    OntoSearchConfig c;
    switch (mode) {
        case SearchMode::Recent:
            c.concept_weight = 0.20;
            c.tag_weight = 0.05;
            c.vector_weight = 0.30;
            c.graph_weight = 0.05;
            c.temporal_weight = 0.40;
            c.temporal_hours = 24.0;
            c.temporal_decay_days = 7.0;
            c.min_final_score = 0.15;
            break;
        case SearchMode::Contextual:
            c.concept_weight = 0.40;
            c.tag_weight = 0.15;
            c.vector_weight = 0.30;
            c.graph_weight = 0.05;
            c.temporal_weight = 0.10;
            c.boost_exact_concept_match = 0.3;
            break;
        case SearchMode::Deep:
            c.concept_weight = 0.25;
            c.tag_weight = 0.10;
            c.vector_weight = 0.25;
            c.graph_weight = 0.30;
            c.temporal_weight = 0.10;
            c.graph_depth = 3;
            c.max_concept_depth = 4;
            break;
        case SearchMode::Full:
            c.concept_weight = 0.25;
            c.tag_weight = 0.15;
            c.vector_weight = 0.25;
            c.graph_weight = 0.20;
            c.temporal_weight = 0.15;
            c.graph_depth = 2;
            break;
    }
    return c;
}

OntoSearchConfig OntoSearchConfig::fromModeName(std::string_view mode) {
    auto name = config::toLower(config::trimmed(mode));
    if (name == "recent" || name == "contextual" || name == "deep" || name == "full")
        return fromMode(parseSearchMode(name));
    return OntoSearchConfig{};
}

double combinedScore(const OntoSearchResult& r, const OntoSearchConfig& c) {
    return r.vector_score * c.vector_weight + r.concept_score * c.concept_weight +
           r.tag_score * c.tag_weight + r.graph_score * c.graph_weight +
           r.temporal_score * c.temporal_weight;
}

double conceptOverlap(const std::vector<ontology::QueryConcept>& queryConcepts,
                      const std::vector<std::string>& memoryConcepts,
                      const OntoSearchConfig& config) {
    if (queryConcepts.empty() || memoryConcepts.empty())
        return 0.0;
    double total = 0.0;
    double maxScore = 0.0;
    for (const auto& qc : queryConcepts) {
        maxScore += qc.confidence;
        if (containsId(memoryConcepts, qc.concept_id))
            total += qc.confidence + config.boost_exact_concept_match;
    }
    return maxScore > 0.0 ? std::min(1.0, total / maxScore) : 0.0;
}

double tagOverlap(const std::vector<std::string>& queryTags, const std::string& content,
                  const OntoSearchConfig& config) {
    if (queryTags.empty())
        return 0.0;
    const auto lowered = config::toLower(content);
    auto matches = std::count_if(queryTags.begin(), queryTags.end(), [&](const std::string& t) {
        return lowered.find(t) != std::string::npos;
    });
    double score = static_cast<double>(matches) / static_cast<double>(queryTags.size());
    return std::min(1.0, score + config.boost_tag_match);
}

std::vector<OntoSearchResult> rankOntoResults(std::vector<OntoSearchResult> results,
                                              const OntoSearchConfig& config) {
    std::unordered_map<std::string, size_t> best;
    std::vector<OntoSearchResult> unique;
    for (auto& r : results) {
        r.final_score = combinedScore(r, config);
        auto it = best.find(r.memory_id);
        if (it == best.end()) {
            best.emplace(r.memory_id, unique.size());
            unique.push_back(std::move(r));
        } else if (r.final_score > unique[it->second].final_score) {
            unique[it->second] = std::move(r);
        }
    }
    unique.erase(std::remove_if(unique.begin(), unique.end(),
                                [&](const OntoSearchResult& r) {
                                    return r.final_score < config.min_final_score;
                                }),
                 unique.end());
    std::stable_sort(unique.begin(), unique.end(),
                     [](const auto& a, const auto& b) { return a.final_score > b.final_score; });
    return unique;
}

OntoSearch::OntoSearch(std::shared_ptr<store::StoreClient> store) : store_(std::move(store)) {}

std::vector<std::string> OntoSearch::loadMemoryConcepts(const MemoryId& memoryId) {
    auto res = store_->executeAs<store::MemoryConcepts>("getMemoryConcepts",
                                                        {{"memory_id", memoryId}});
    if (!res) {
        if (res.error().code != ErrorCode::NotFound)
            spdlog::debug("getMemoryConcepts failed for {}: {}", memoryId, res.error().message);
        return {};
    }
    auto ids = res.value().instanceOf;
    for (const auto& id : res.value().belongsTo) {
        if (!containsId(ids, id))
            ids.push_back(id);
    }
    return ids;
}

Result<std::vector<OntoSearchResult>>
OntoSearch::vectorPhase(std::span<const float> embedding, const std::optional<std::string>& userId,
                        const OntoSearchConfig& config, TimePoint now) {
    auto response = store_->executeAs<store::VectorSearchResponse>(
        "smartVectorSearchWithChunks",
        {{"query_vector", std::vector<float>(embedding.begin(), embedding.end())},
         {"limit", config.vector_top_k}});
    if (!response) {
        if (response.error().code == ErrorCode::NotFound)
            return std::vector<OntoSearchResult>{};
        return Error{ErrorCode::DatabaseError, "Vector search failed: " + response.error().message};
    }

    std::optional<TimePoint> cutoff;
    if (config.temporal_hours) {
        cutoff = now - std::chrono::duration_cast<std::chrono::system_clock::duration>(
                           std::chrono::duration<double, std::ratio<3600>>(*config.temporal_hours));
    }

    std::vector<OntoSearchResult> results;
    for (const auto& hit : response.value().merged()) {
        const auto& m = hit.memory;
        if (!passesFilters(m, userId, cutoff, now))
            continue;
        OntoSearchResult r;
        r.memory_id = m.memory_id;
        r.content = m.content;
        r.memory_type = m.memory_type;
        r.user_id = m.user_id;
        r.created_at = m.created_at;
        r.vector_score = vectorScore(embedding, hit.vector, hit.score);
        r.temporal_score = temporalScore(m.created_at, config.temporal_decay_days, now);
        results.push_back(std::move(r));
    }
    spdlog::info("Vector search: {} results", results.size());
    return results;
}

void OntoSearch::scorePhase(std::vector<OntoSearchResult>& results,
                            const std::vector<ontology::QueryConcept>& queryConcepts,
                            const std::vector<std::string>& queryTags,
                            const OntoSearchConfig& config) {
    for (auto& r : results) {
        r.memory_concepts = loadMemoryConcepts(r.memory_id);
        r.concept_score = conceptOverlap(queryConcepts, r.memory_concepts, config);
        r.matched_concepts.clear();
        for (const auto& qc : queryConcepts) {
            if (containsId(r.memory_concepts, qc.concept_id))
                r.matched_concepts.push_back(qc);
        }

        r.tag_score = tagOverlap(queryTags, r.content, config);
        r.matched_tags.clear();
        const auto lowered = config::toLower(r.content);
        for (const auto& tag : queryTags) {
            if (lowered.find(tag) != std::string::npos)
                r.matched_tags.push_back(TagMatch{tag, 1.0});
        }
        spdlog::debug("Scored {}: concept={:.2f}, tag={:.2f}", r.memory_id, r.concept_score,
                      r.tag_score);
    }
}

std::vector<OntoSearchResult> OntoSearch::graphPhase(const std::vector<OntoSearchResult>& seeds,
                                                     std::span<const float> embedding,
                                                     const std::optional<std::string>& userId,
                                                     const OntoSearchConfig& config,
                                                     TimePoint now) {
    std::vector<OntoSearchResult> expanded;
    if (config.graph_depth == 0)
        return expanded;

    std::unordered_set<std::string> visited;
    for (const auto& s : seeds)
        visited.insert(s.memory_id);

    struct Frontier {
        MemoryId id;
        double graph;
        size_t depth;
    };
    std::deque<Frontier> queue;
    for (const auto& s : seeds)
        queue.push_back({s.memory_id, 1.0, 0});

    while (!queue.empty()) {
        auto current = std::move(queue.front());
        queue.pop_front();
        if (current.depth >= config.graph_depth)
            continue;

        auto conns = store_->executeAs<store::LogicalConnections>("getMemoryLogicalConnections",
                                                                  {{"memory_id", current.id}});
        if (!conns)
            continue;

        for (const auto& [key, edgeType] : kOntoEdges) {
            const double weight = edgeWeight(key);
            for (const auto& n : conns.value().get(key)) {
                const auto& m = n.memory;
                if (m.memory_id.empty() || !passesFilters(m, userId, std::nullopt, now))
                    continue;
                if (!visited.insert(m.memory_id).second)
                    continue;

                OntoSearchResult r;
                r.memory_id = m.memory_id;
                r.content = m.content;
                r.memory_type = m.memory_type;
                r.user_id = m.user_id;
                r.created_at = m.created_at;
                r.vector_score = semanticScore(embedding, n.vector);
                r.graph_score = weight * current.graph;
                r.temporal_score = temporalScore(m.created_at, config.temporal_decay_days, now);
                r.depth = current.depth + 1;
                r.source = "graph";
                r.graph_context = GraphContext{{current.id}, {edgeType}, {weight}};

                queue.push_back({r.memory_id, r.graph_score, r.depth});
                expanded.push_back(std::move(r));
            }
        }
    }
    spdlog::info("Graph expansion: {} -> {} results", seeds.size(), seeds.size() + expanded.size());
    return expanded;
}

Result<std::vector<OntoSearchResult>>
OntoSearch::search(const std::string& query, std::span<const float> embedding,
                   const std::optional<std::string>& userId, const OntoSearchConfig& config,
                   const std::optional<std::string>& conceptFilter,
                   const std::vector<std::string>& extraTags) {
    const auto now = std::chrono::system_clock::now();

    auto queryConcepts =
        ontology::ConceptMapper::classifyQuery(query, config.max_concepts_per_query);
    auto queryTags = ontology::ConceptMapper::extractQueryTags(query, config.max_tags_per_query);
    for (const auto& tag : extraTags) {
        auto t = config::toLower(config::trimmed(tag));
        if (queryTags.size() >= config.max_tags_per_query)
            break;
        if (!t.empty() && std::find(queryTags.begin(), queryTags.end(), t) == queryTags.end())
            queryTags.push_back(std::move(t));
    }
    spdlog::debug("Query classified into {} concepts and {} tags", queryConcepts.size(),
                  queryTags.size());

    auto hits = vectorPhase(embedding, userId, config, now);
    if (!hits)
        return hits.error();
    auto results = std::move(hits).value();

    auto neighbours = graphPhase(results, embedding, userId, config, now);
    std::move(neighbours.begin(), neighbours.end(), std::back_inserter(results));

    scorePhase(results, queryConcepts, queryTags, config);

    auto ranked = rankOntoResults(std::move(results), config);

    if (conceptFilter && !conceptFilter->empty()) {
        const auto wanted = config::toLower(*conceptFilter);
        ranked.erase(std::remove_if(ranked.begin(), ranked.end(),
                                    [&](const OntoSearchResult& r) {
                                        return std::none_of(
                                            r.memory_concepts.begin(), r.memory_concepts.end(),
                                            [&](const std::string& c) {
                                                return config::toLower(c) == wanted;
                                            });
                                    }),
                     ranked.end());
    }

    spdlog::info("Onto-search for '{}' returned {} results", query, ranked.size());
    return ranked;
}

} // namespace omc::search
