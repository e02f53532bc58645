#pragma once

#include <omc/core/types.h>
#include <omc/store/records.h>
#include <omc/store/store_client.h>

#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace omc::ontology {

enum class ConceptType { Abstract, Concrete };

const char* toString(ConceptType type);

struct Concept {
    std::string concept_id;
    std::string name;
    ConceptType concept_type = ConceptType::Concrete;
    std::string description;
    std::optional<std::string> parent_concept;
    int level = 0;
};

// Levels 0..2 are abstract
Concept fromRecord(const store::ConceptRecord& record);

/// HAS_SUBTYPE(parent -> child)
struct ConceptRelation {
    std::string from_concept;
    std::string to_concept;
};

struct OntologyStats {
    size_t total_concepts = 0;
    size_t total_relations = 0;
    std::map<std::string, size_t> concepts_by_type;
    size_t max_depth = 0;
};

/**
 * @brief Concept hierarchy loaded from the store and queried from memory.
 *
 * load() bootstraps the base ontology when the store reports it missing. Before load(),
 * subtypes() is NotInitialized and the other queries return empty results.
 */
class OntologyManager {
public:
    explicit OntologyManager(std::shared_ptr<store::StoreClient> store);

    Result<void> load();
    bool isLoaded() const { return loaded_.load(); }

    std::optional<Concept> getConcept(const std::string& conceptId) const;

    // InvalidOperation when the id is already known
    Result<void> addConcept(const Concept& node);

    Result<std::vector<Concept>> subtypes(const std::string& conceptId) const;

    // Nearest parent first. Stops at a cycle or a parent whose level is not strictly lower.
    std::vector<Concept> ancestors(const std::string& conceptId) const;

    size_t depth(const std::string& conceptId) const;

    // (concept_id, score) with score = matched keywords / keywords, descending
    std::vector<std::pair<std::string, double>> classify(const std::string& text,
                                                         double minConfidence = 0.1) const;

    std::vector<std::string> suggestConcepts(const std::string& text, size_t topN) const;

    std::vector<ConceptRelation> relations() const;
    OntologyStats stats() const;

private:
    std::vector<Concept> ancestorsLocked(const std::string& conceptId) const;

    std::shared_ptr<store::StoreClient> store_;
    std::atomic<bool> loaded_{false};

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Concept> concepts_;
    std::vector<ConceptRelation> relations_;
};

} // namespace omc::ontology
