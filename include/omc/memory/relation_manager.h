#pragma once

#include <omc/core/types.h>
#include <omc/store/store_client.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace omc::memory {

enum class RelationType { Implies, Because, Contradicts, Supports, Refutes, RelatesTo, Supersedes };

/// Upper-case wire name: IMPLIES, BECAUSE, CONTRADICTS, SUPPORTS, REFUTES, RELATES_TO, SUPERSEDES
const char* toString(RelationType type);

/// Case-insensitive; accepts "related" and "relation" for RelatesTo
std::optional<RelationType> parseRelationType(std::string_view name);

/**
 * @brief Writes memory-to-memory and memory-to-concept edges.
 *
 * Strengths and probabilities are integers in 0..100 on the wire. SUPPORTS and REFUTES travel
 * as typed MEMORY_RELATION edges.
 */
class RelationManager {
public:
    explicit RelationManager(std::shared_ptr<store::StoreClient> store);

    Result<void> addImplication(const MemoryId& from, const MemoryId& to, int probability,
                                const std::string& reasoning = {});
    Result<void> addCausation(const MemoryId& from, const MemoryId& to, int strength,
                              const std::string& reasoning = {});
    Result<void> addContradiction(const MemoryId& from, const MemoryId& to,
                                  const std::string& resolution, bool resolved,
                                  const std::string& strategy, int confidence = 100);
    Result<void> addRelation(const MemoryId& source, const MemoryId& target,
                             const std::string& relationType, int strength,
                             const std::string& metadata = "{}");
    Result<void> addSupersession(const MemoryId& newId, const MemoryId& oldId,
                                 const std::string& reason, const std::string& supersededAt,
                                 bool isContradiction);

    // Dispatch on type; `confidence` is 0..1
    Result<void> addTyped(RelationType type, const MemoryId& from, const MemoryId& to,
                          double confidence, const std::string& reasoning = {});

    // linkType is INSTANCE_OF or BELONGS_TO_CATEGORY; anything else is InvalidArgument
    Result<void> linkToConcept(const MemoryId& memoryId, const std::string& conceptId,
                               int confidence, const std::string& linkType);

    // Re-point oldId's outgoing IMPLIES, BECAUSE and MEMORY_RELATION edges from newId
    Result<size_t> copyReasoningRelations(const MemoryId& oldId, const MemoryId& newId);

private:
    std::shared_ptr<store::StoreClient> store_;
};

} // namespace omc::memory
