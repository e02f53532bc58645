#pragma once

#include <omc/core/types.h>
#include <omc/memory/relation_manager.h>

#include <string>
#include <string_view>
#include <vector>

namespace omc::ontology {

enum class ConceptKind { Preference, Skill, Goal, Opinion, Fact, Action, Experience, Achievement };

const char* toString(ConceptKind kind);

struct TextConcept {
    std::string id;
    std::string name;
    ConceptKind kind = ConceptKind::Fact;
};

struct ConceptMatch {
    TextConcept concept_ref;
    double confidence = 0.0; ///< matched keywords / keywords of the concept
    std::vector<std::string> matched_keywords;
};

/// Concept guessed from a search query
struct QueryConcept {
    std::string concept_id;
    double confidence = 0.8;
    std::string match_type = "exact";
};

/**
 * @brief Keyword-table concept mapping for memory content and search queries.
 */
class ConceptMapper {
public:
    // Best matches first; ties keep table order
    std::vector<ConceptMatch> map(std::string_view text, size_t topK = 3) const;

    // INSTANCE_OF for the best match, BELONGS_TO_CATEGORY for the rest. Returns edges written.
    size_t linkMemoryToConcepts(memory::RelationManager& relations, const MemoryId& memoryId,
                                const std::vector<ConceptMatch>& matches) const;

    static std::vector<QueryConcept> classifyQuery(std::string_view query, size_t maxConcepts);
    static std::vector<std::string> extractQueryTags(std::string_view query, size_t maxTags);
};

} // namespace omc::ontology
