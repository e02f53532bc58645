#pragma once

#include <omc/core/types.h>
#include <omc/integrator/similar_finder.h>
#include <omc/llm/llm_provider.h>
#include <omc/memory/relation_manager.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace omc::integrator {

struct InferredRelation {
    MemoryId target_id;
    memory::RelationType relation_type = memory::RelationType::RelatesTo;
    double confidence = 0.0; ///< 0..1
    std::string reasoning;
};

// Pairwise relation classifier. nullopt means "no relation".
class IRelationReasoner {
public:
    virtual ~IRelationReasoner() = default;
    virtual Result<std::optional<InferredRelation>> infer(const std::string& newContent,
                                                          const SimilarCandidate& existing) = 0;
};

/// JSON-mode LLM classifier over IMPLIES, BECAUSE, CONTRADICTS, SUPPORTS, RELATES_TO
class LlmRelationReasoner : public IRelationReasoner {
public:
    explicit LlmRelationReasoner(std::shared_ptr<llm::ILlmProvider> llm);

    Result<std::optional<InferredRelation>> infer(const std::string& newContent,
                                                  const SimilarCandidate& existing) override;

private:
    std::shared_ptr<llm::ILlmProvider> llm_;
};

/**
 * @brief Turns similar memories into typed relations from the new memory.
 *
 * Without a reasoner every candidate at or above `heuristicThreshold` becomes RELATES_TO with
 * its similarity as confidence. With a reasoner, a failed call falls back to the same edge.
 */
class RelationInferrer {
public:
    static constexpr double kHeuristicThreshold = 0.75;

    explicit RelationInferrer(std::shared_ptr<IRelationReasoner> reasoner = nullptr,
                              bool enableReasoning = true);

    std::vector<InferredRelation> infer(const std::string& newContent,
                                        const std::vector<SimilarCandidate>& similar) const;

    static std::vector<InferredRelation>
    heuristicRelations(const std::vector<SimilarCandidate>& similar);

private:
    std::shared_ptr<IRelationReasoner> reasoner_;
    bool enableReasoning_;
};

} // namespace omc::integrator
