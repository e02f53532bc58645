#include <omc/integrator/relation_inferrer.h>
#include <omc/store/json_fields.h>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace omc::integrator {

using nlohmann::json;

namespace {

constexpr const char* kReasonerSystemPrompt =
    "You classify the logical relation between two memories of the same user. "
    "Respond with JSON only: {\"relation_type\": \"IMPLIES|BECAUSE|CONTRADICTS|SUPPORTS|"
    "RELATES_TO|NONE\", \"confidence\": 0-100, \"reasoning\": \"short explanation\"}. "
    "IMPLIES: the new memory logically implies the existing one. BECAUSE: the new memory is "
    "caused by the existing one. CONTRADICTS: both cannot be true at once. SUPPORTS: the new "
    "memory is evidence for the existing one. RELATES_TO: same topic, no stronger relation.";

InferredRelation fallbackRelation(const SimilarCandidate& sim, const char* label) {
    return InferredRelation{sim.memory_id, memory::RelationType::RelatesTo, sim.similarity,
                            fmt::format("{}: {:.2f}", label, sim.similarity)};
}

} // namespace

LlmRelationReasoner::LlmRelationReasoner(std::shared_ptr<llm::ILlmProvider> llm)
    : llm_(std::move(llm)) {}

Result<std::optional<InferredRelation>>
LlmRelationReasoner::infer(const std::string& newContent, const SimilarCandidate& existing) {
    auto prompt = fmt::format("New memory:\n\"{}\"\n\nExisting memory ({}):\n\"{}\"\n\n"
                              "Semantic similarity: {:.2f}",
                              newContent, existing.memory_id, existing.content,
                              existing.similarity);
    auto res = llm_->generate(kReasonerSystemPrompt, prompt, std::string("json_object"));
    if (!res)
        return Error{ErrorCode::ProviderError, res.error().message};

    auto body = json::parse(res.value().text, nullptr, false);
    if (body.is_discarded() || !body.is_object())
        return Error{ErrorCode::InvalidData, "relation reply is not a JSON object"};

    auto typeName = store::jsonString(body, "relation_type");
    if (typeName.empty())
        return Error{ErrorCode::InvalidData, "relation reply has no relation_type"};
    if (typeName == "NONE" || typeName == "none")
        return std::optional<InferredRelation>{};

    auto type = memory::parseRelationType(typeName);
    if (!type)
        return Error{ErrorCode::InvalidData, "unknown relation type " + typeName};

    InferredRelation rel;
    rel.target_id = existing.memory_id;
    rel.relation_type = *type;
    rel.confidence = std::clamp(store::jsonNumber(body, "confidence", 50.0) / 100.0, 0.0, 1.0);
    rel.reasoning = store::jsonString(body, "reasoning");
    return std::optional<InferredRelation>{std::move(rel)};
}

RelationInferrer::RelationInferrer(std::shared_ptr<IRelationReasoner> reasoner,
                                   bool enableReasoning)
    : reasoner_(std::move(reasoner)), enableReasoning_(enableReasoning) {}

std::vector<InferredRelation>
RelationInferrer::heuristicRelations(const std::vector<SimilarCandidate>& similar) {
    std::vector<InferredRelation> out;
    for (const auto& sim : similar) {
        if (sim.similarity >= kHeuristicThreshold)
            out.push_back(fallbackRelation(sim, "Semantic similarity"));
    }
    return out;
}

std::vector<InferredRelation>
RelationInferrer::infer(const std::string& newContent,
                        const std::vector<SimilarCandidate>& similar) const {
    if (!enableReasoning_ || !reasoner_)
        return heuristicRelations(similar);

    std::vector<InferredRelation> out;
    for (const auto& sim : similar) {
        auto inferred = reasoner_->infer(newContent, sim);
        if (!inferred) {
            spdlog::warn("Reasoning failed for {}: {}", sim.memory_id, inferred.error().message);
            out.push_back(fallbackRelation(sim, "Fallback: similarity"));
            continue;
        }
        if (inferred.value())
            out.push_back(*inferred.value());
    }
    return out;
}

} // namespace omc::integrator
