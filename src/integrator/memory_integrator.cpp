#include <omc/integrator/memory_integrator.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <unordered_set>

namespace omc::integrator {

using decision::MemoryOperation;

MemoryIntegrator::MemoryIntegrator(std::shared_ptr<SimilarMemoryFinder> finder,
                                   std::shared_ptr<decision::DecisionEngine> decisions,
                                   std::shared_ptr<RelationInferrer> inferrer,
                                   std::shared_ptr<memory::RelationManager> relations,
                                   std::shared_ptr<evolution::EvolutionManager> evolution)
    : finder_(std::move(finder)), decisions_(std::move(decisions)),
      inferrer_(std::move(inferrer)), relations_(std::move(relations)),
      evolution_(std::move(evolution)) {}

IntegrationPlan MemoryIntegrator::plan(const std::string& content,
                                       std::span<const float> embedding,
                                       const std::string& userId,
                                       const std::optional<MemoryId>& excludeId) {
    IntegrationPlan out;
    auto found = finder_->find(embedding, userId, excludeId);
    if (found) {
        out.similar = std::move(found).value();
    } else {
        spdlog::warn("Similar-memory search failed, treating memory as new: {}",
                     found.error().message);
    }

    std::vector<decision::SimilarMemory> similar;
    similar.reserve(out.similar.size());
    for (const auto& c : out.similar)
        similar.push_back({c.memory_id, c.content, c.similarity, c.created_at});

    out.decision = decisions_->decide(content, similar, userId);
    return out;
}

IntegrationResult MemoryIntegrator::apply(const MemoryId& memoryId, const std::string& content,
                                          const IntegrationPlan& plan) {
    const auto start = std::chrono::steady_clock::now();
    spdlog::info("Starting memory integration for {}", memoryId);

    IntegrationResult result;
    result.memory_id = memoryId;
    result.similar_found = plan.similar.size();

    const auto& d = plan.decision;
    std::unordered_set<MemoryId> handled{memoryId};

    auto countEdge = [&](const Result<void>& r, const MemoryId& target, const char* what) {
        if (r) {
            ++result.relations_created;
        } else {
            ++result.relations_failed;
            spdlog::warn("Failed to create {} edge {} -> {}: {}", what, memoryId, target,
                         r.error().message);
        }
    };

    if (d.operation == MemoryOperation::Supersede) {
        auto target = d.supersedes_memory_id ? d.supersedes_memory_id : d.target_memory_id;
        if (target && handled.insert(*target).second) {
            auto r = evolution_->supersede(*target, memoryId, d.reasoning.empty() ? "content_update"
                                                                                : d.reasoning);
            if (r) {
                result.superseded_memories.push_back(*target);
                ++result.relations_created;
            } else {
                ++result.relations_failed;
                spdlog::warn("Supersession of {} failed: {}", *target, r.error().message);
            }
        }
    } else if (d.operation == MemoryOperation::Contradict) {
        auto target = d.contradicts_memory_id ? d.contradicts_memory_id : d.target_memory_id;
        if (target && handled.insert(*target).second) {
            auto r = evolution_->contradict(*target, memoryId, d.confidence, d.reasoning);
            if (r && r.value().edge_created) {
                result.contradicted_memories.push_back(*target);
                result.relations_created += 2;
            } else {
                ++result.relations_failed;
            }
        }
    }

    for (const auto& [targetId, typeName] : d.relates_to) {
        if (!handled.insert(targetId).second)
            continue;
        auto type = memory::parseRelationType(typeName).value_or(memory::RelationType::RelatesTo);
        countEdge(relations_->addTyped(type, memoryId, targetId, d.confidence / 100.0,
                                       d.reasoning),
                  targetId, memory::toString(type));
    }

    std::vector<SimilarCandidate> remaining;
    for (const auto& c : plan.similar) {
        if (!handled.count(c.memory_id))
            remaining.push_back(c);
    }
    for (const auto& rel : inferrer_->infer(content, remaining)) {
        if (!handled.insert(rel.target_id).second)
            continue;
        if (rel.relation_type == memory::RelationType::Contradicts) {
            auto r = evolution_->contradict(rel.target_id, memoryId,
                                            static_cast<int>(rel.confidence * 100.0),
                                            rel.reasoning);
            if (r && r.value().edge_created) {
                result.contradicted_memories.push_back(rel.target_id);
                result.relations_created += 2;
            } else {
                ++result.relations_failed;
            }
            continue;
        }
        countEdge(relations_->addTyped(rel.relation_type, memoryId, rel.target_id, rel.confidence,
                                       rel.reasoning),
                  rel.target_id, memory::toString(rel.relation_type));
    }

    result.integration_time_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    spdlog::info("Integration complete for {}: {} similar, {} relations created", memoryId,
                 result.similar_found, result.relations_created);
    return result;
}

IntegrationResult MemoryIntegrator::integrate(const MemoryId& memoryId, const std::string& content,
                                              std::span<const float> embedding,
                                              const std::string& userId) {
    auto p = plan(content, embedding, userId, memoryId);
    if (p.decision.operation == MemoryOperation::Noop) {
        IntegrationResult result;
        result.memory_id = memoryId;
        result.similar_found = p.similar.size();
        return result;
    }
    return apply(memoryId, content, p);
}

} // namespace omc::integrator
