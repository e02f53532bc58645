#include <omc/config/config_helpers.h>
#include <omc/retrieval/retrieval_manager.h>
#include <omc/store/json_fields.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_set>

namespace omc::retrieval {

using nlohmann::json;

const char* toString(RetrievalDepth depth) {
    switch (depth) {
        case RetrievalDepth::Shallow:
            return "shallow";
        case RetrievalDepth::Medium:
            return "medium";
        case RetrievalDepth::Deep:
            return "deep";
    }
    return "medium";
}

RetrievalDepth parseRetrievalDepth(std::string_view text) {
    auto name = config::toLower(config::trimmed(text));
    if (name == "shallow")
        return RetrievalDepth::Shallow;
    if (name == "deep")
        return RetrievalDepth::Deep;
    return RetrievalDepth::Medium;
}

search::SearchMode modeFor(RetrievalDepth depth) {
    switch (depth) {
        case RetrievalDepth::Shallow:
            return search::SearchMode::Recent;
        case RetrievalDepth::Medium:
            return search::SearchMode::Contextual;
        case RetrievalDepth::Deep:
            return search::SearchMode::Deep;
    }
    return search::SearchMode::Contextual;
}

void to_json(json& j, const RetrievalResult& r) {
    json memories = json::array();
    for (const auto& m : r.memories) {
        memories.push_back({{"memory_id", m.memory_id},
                            {"content", m.content},
                            {"memory_type", m.memory_type},
                            {"user_id", m.user_id},
                            {"created_at", m.created_at},
                            {"score", m.score},
                            {"chunk_count", m.chunk_count}});
    }
    json chains = json::array();
    for (const auto& c : r.reasoning_chains) {
        chains.push_back({{"from_memory_id", c.from_memory_id},
                          {"to_memory_id", c.to_memory_id},
                          {"relation_type", c.relation_type},
                          {"strength", c.strength}});
    }
    json entities = json::array();
    for (const auto& e : r.entities)
        entities.push_back(
            {{"entity_id", e.entity_id}, {"name", e.name}, {"entity_type", e.entity_type}});
    json context = json::array();
    for (const auto& m : r.context_memories)
        context.push_back(m);

    j = json{{"memories", memories},
             {"chunks_reconstructed", r.chunks_reconstructed},
             {"context_memories", context},
             {"reasoning_chains", chains},
             {"entities", entities},
             {"metadata", r.metadata}};
}

RetrievalManager::RetrievalManager(std::shared_ptr<store::StoreClient> store,
                                   std::shared_ptr<search::OntoSearch> search,
                                   std::shared_ptr<entity::EntityManager> entities)
    : store_(std::move(store)), search_(std::move(search)), entities_(std::move(entities)) {}

Result<Reconstruction> RetrievalManager::reconstruct(const MemoryId& memoryId) {
    auto res =
        store_->executeAs<store::MemoryWithChunks>("getMemoryWithChunks", {{"memory_id", memoryId}});
    if (!res)
        return res.error();
    auto body = std::move(res).value();
    if (!body.hasChunks || body.chunks.empty())
        return Reconstruction{body.content, 0};

    std::stable_sort(body.chunks.begin(), body.chunks.end(),
                     [](const auto& a, const auto& b) { return a.position < b.position; });
    Reconstruction out;
    for (const auto& chunk : body.chunks) {
        if (!out.content.empty())
            out.content += ' ';
        out.content += chunk.content;
    }
    out.chunks = body.chunks.size();
    spdlog::debug("Reconstructed {} chunks for memory {}", out.chunks, memoryId);
    return out;
}

Result<std::vector<ReasoningLink>> RetrievalManager::reasoningRelations(const MemoryId& memoryId,
                                                                        size_t maxDepth) {
    auto res = store_->executeAs<std::vector<store::ReasoningEdgeRecord>>(
        "getMemoryReasoningRelations", {{"memory_id", memoryId}, {"max_depth", maxDepth}});
    if (!res) {
        if (res.error().code == ErrorCode::NotFound)
            return std::vector<ReasoningLink>{};
        return res.error();
    }
    std::vector<ReasoningLink> out;
    for (const auto& e : res.value()) {
        out.push_back(ReasoningLink{e.from_id, e.to_id, e.relation_type,
                                    static_cast<int>(e.strength)});
    }
    return out;
}

Result<RetrievalResult> RetrievalManager::retrieve(const std::string& query,
                                                   std::span<const float> embedding,
                                                   const std::string& userId,
                                                   RetrievalDepth depth, size_t limit,
                                                   bool includeReasoning, bool includeEntities) {
    const auto mode = modeFor(depth);
    spdlog::info("Retrieving '{}' [depth={}, limit={}]", query, toString(depth), limit);

    auto hits = search_->search(query, embedding, userId,
                                search::OntoSearchConfig::fromMode(mode));
    if (!hits)
        return Error{hits.error().code, "Search failed: " + hits.error().message};

    RetrievalResult result;
    for (const auto& hit : hits.value()) {
        if (result.memories.size() >= limit)
            break;
        result.memories.push_back(RetrievedMemory{hit.memory_id, hit.content, hit.memory_type,
                                                  hit.user_id, hit.created_at, hit.final_score,
                                                  0});
    }

    if (depth != RetrievalDepth::Shallow) {
        for (auto& m : result.memories) {
            auto rebuilt = reconstruct(m.memory_id);
            if (!rebuilt) {
                spdlog::warn("Failed to get chunks for memory {}: {}", m.memory_id,
                             rebuilt.error().message);
                continue;
            }
            if (rebuilt.value().chunks > 0) {
                m.content = rebuilt.value().content;
                m.chunk_count = rebuilt.value().chunks;
                result.chunks_reconstructed += m.chunk_count;
            }
        }

        const size_t maxDepth = depth == RetrievalDepth::Deep ? 2 : 1;
        std::unordered_set<std::string> inResults;
        for (const auto& m : result.memories)
            inResults.insert(m.memory_id);
        std::unordered_set<std::string> contextSeen;
        std::unordered_set<std::string> entitySeen;

        for (const auto& m : result.memories) {
            if (includeReasoning) {
                auto links = reasoningRelations(m.memory_id, maxDepth);
                if (!links) {
                    spdlog::warn("Failed to gather reasoning for {}: {}", m.memory_id,
                                 links.error().message);
                } else {
                    for (const auto& link : links.value()) {
                        result.reasoning_chains.push_back(link);
                        for (const auto* id : {&link.from_memory_id, &link.to_memory_id}) {
                            if (id->empty() || inResults.count(*id) ||
                                !contextSeen.insert(*id).second)
                                continue;
                            auto ctx = store_->execute("getMemory", {{"memory_id", *id}});
                            if (ctx)
                                result.context_memories.push_back(
                                    store::unwrap(ctx.value(), "memory")
                                        .get<store::MemoryRecord>());
                        }
                    }
                }
            }
            if (includeEntities && entities_) {
                auto ents = entities_->getEntitiesForMemory(m.memory_id);
                if (!ents) {
                    spdlog::warn("Failed to gather entities for {}: {}", m.memory_id,
                                 ents.error().message);
                } else {
                    for (const auto& e : ents.value()) {
                        if (entitySeen.insert(e.entity_id).second)
                            result.entities.push_back(e);
                    }
                }
            }
        }
    }

    result.metadata = json{{"depth", toString(depth)},
                           {"query", query},
                           {"mode", search::toString(mode)}};

    spdlog::info("Retrieved {} memories ({} chunks, {} context, {} reasoning, {} entities)",
                 result.memories.size(), result.chunks_reconstructed,
                 result.context_memories.size(), result.reasoning_chains.size(),
                 result.entities.size());
    return result;
}

} // namespace omc::retrieval
