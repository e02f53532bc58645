#pragma once

#include <omc/core/types.h>
#include <omc/ontology/concept_mapper.h>
#include <omc/search/search_modes.h>
#include <omc/store/store_client.h>

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace omc::search {

struct OntoSearchConfig {
    double concept_weight = 0.30;
    double tag_weight = 0.15;
    double vector_weight = 0.35;
    double graph_weight = 0.10;
    double temporal_weight = 0.10;
    size_t max_concept_depth = 3;
    std::optional<double> temporal_hours;
    double temporal_decay_days = 30.0;
    double min_concept_score = 0.1;
    double min_final_score = 0.2;
    double boost_exact_concept_match = 0.2;
    double boost_tag_match = 0.1;
    size_t max_concepts_per_query = 5;
    size_t max_tags_per_query = 10;
    size_t vector_top_k = 20;
    size_t graph_depth = 2;

    static OntoSearchConfig fromMode(SearchMode mode);

    // "recent" | "contextual" | "deep" | "full"; anything else is the default table
    static OntoSearchConfig fromModeName(std::string_view mode);
};

struct TagMatch {
    std::string tag;
    double score = 1.0;
};

struct GraphContext {
    std::vector<MemoryId> related_memories;
    std::vector<std::string> edge_types;
    std::vector<double> edge_weights;
};

struct OntoSearchResult {
    MemoryId memory_id;
    std::string content;
    std::string memory_type;
    std::string user_id;
    std::string created_at;
    double vector_score = 0.0;
    double concept_score = 0.0;
    double tag_score = 0.0;
    double graph_score = 0.0;
    double temporal_score = 0.0;
    double final_score = 0.0;
    std::vector<ontology::QueryConcept> matched_concepts;
    std::vector<TagMatch> matched_tags;
    std::vector<std::string> memory_concepts; ///< concept ids linked to the memory
    std::optional<GraphContext> graph_context;
    size_t depth = 0;
    std::string source = "vector";
};

// Σ weight * score over the five components
double combinedScore(const OntoSearchResult& result, const OntoSearchConfig& config);

double conceptOverlap(const std::vector<ontology::QueryConcept>& queryConcepts,
                      const std::vector<std::string>& memoryConcepts,
                      const OntoSearchConfig& config);

double tagOverlap(const std::vector<std::string>& queryTags, const std::string& content,
                  const OntoSearchConfig& config);

/// Scores every result, keeps the best per memory, drops those under min_final_score, sorts
std::vector<OntoSearchResult> rankOntoResults(std::vector<OntoSearchResult> results,
                                              const OntoSearchConfig& config);

/**
 * @brief Ontology-aware search: vector hits rescored by concept and tag overlap, then expanded
 * over implies/because/relation edges.
 */
class OntoSearch {
public:
    explicit OntoSearch(std::shared_ptr<store::StoreClient> store);

    Result<std::vector<OntoSearchResult>>
    search(const std::string& query, std::span<const float> embedding,
           const std::optional<std::string>& userId, const OntoSearchConfig& config,
           const std::optional<std::string>& conceptFilter = std::nullopt,
           const std::vector<std::string>& extraTags = {});

    std::vector<std::string> loadMemoryConcepts(const MemoryId& memoryId);

private:
    Result<std::vector<OntoSearchResult>> vectorPhase(std::span<const float> embedding,
                                                      const std::optional<std::string>& userId,
                                                      const OntoSearchConfig& config,
                                                      TimePoint now);

    void scorePhase(std::vector<OntoSearchResult>& results,
                    const std::vector<ontology::QueryConcept>& queryConcepts,
                    const std::vector<std::string>& queryTags, const OntoSearchConfig& config);

    std::vector<OntoSearchResult> graphPhase(const std::vector<OntoSearchResult>& seeds,
                                             std::span<const float> embedding,
                                             const std::optional<std::string>& userId,
                                             const OntoSearchConfig& config, TimePoint now);

    std::shared_ptr<store::StoreClient> store_;
};

} // namespace omc::search
