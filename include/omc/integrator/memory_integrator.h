#pragma once

#include <omc/core/types.h>
#include <omc/decision/decision_engine.h>
#include <omc/evolution/evolution_manager.h>
#include <omc/integrator/relation_inferrer.h>
#include <omc/integrator/similar_finder.h>
#include <omc/memory/relation_manager.h>

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace omc::integrator {

struct IntegrationConfig {
    double similarityThreshold = 0.7;
    size_t maxSimilar = 10;
    double duplicateThreshold = 0.92;
    bool enableReasoning = true;
};

/// Outcome of the read-only half of integration
struct IntegrationPlan {
    std::vector<SimilarCandidate> similar;
    decision::MemoryDecision decision;
};

struct IntegrationResult {
    MemoryId memory_id;
    size_t similar_found = 0;
    size_t relations_created = 0;
    size_t relations_failed = 0;
    std::vector<MemoryId> superseded_memories;
    std::vector<MemoryId> contradicted_memories;
    double integration_time_ms = 0.0;
};

/**
 * @brief Places a new memory in the graph.
 *
 * plan() finds neighbours and asks the decision engine; it writes nothing, so it runs before
 * the memory exists. apply() writes reasoning edges and triggers supersession or
 * contradiction once the memory is stored. Edge failures are counted, not returned.
 */
class MemoryIntegrator {
public:
    MemoryIntegrator(std::shared_ptr<SimilarMemoryFinder> finder,
                     std::shared_ptr<decision::DecisionEngine> decisions,
                     std::shared_ptr<RelationInferrer> inferrer,
                     std::shared_ptr<memory::RelationManager> relations,
                     std::shared_ptr<evolution::EvolutionManager> evolution);

    IntegrationPlan plan(const std::string& content, std::span<const float> embedding,
                         const std::string& userId,
                         const std::optional<MemoryId>& excludeId = std::nullopt);

    IntegrationResult apply(const MemoryId& memoryId, const std::string& content,
                            const IntegrationPlan& plan);

    // plan() then apply() for a memory that is already stored
    IntegrationResult integrate(const MemoryId& memoryId, const std::string& content,
                                std::span<const float> embedding, const std::string& userId);

private:
    std::shared_ptr<SimilarMemoryFinder> finder_;
    std::shared_ptr<decision::DecisionEngine> decisions_;
    std::shared_ptr<RelationInferrer> inferrer_;
    std::shared_ptr<memory::RelationManager> relations_;
    std::shared_ptr<evolution::EvolutionManager> evolution_;
};

} // namespace omc::integrator
