#include <omc/app/memory_service.h>
#include <omc/config/config_helpers.h>
#include <omc/core/time_utils.h>
#include <omc/llm/provider_factory.h>
#include <omc/net/http_client.h>
#include <omc/search/search_modes.h>
#include <omc/store/store_transport.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <unordered_map>
#include <unordered_set>

namespace omc::app {

using nlohmann::json;

namespace {

void appendUnique(std::vector<std::string>& out, const std::string& value) {
    if (std::find(out.begin(), out.end(), value) == out.end())
        out.push_back(value);
}

} // namespace

void to_json(json& j, const AddResult& r) {
    j = json{{"memories_added", r.memories_added},
             {"memory_ids", r.memory_ids},
             {"entities", r.entities},
             {"relations", r.relations},
             {"chunks_created", r.chunks_created},
             {"skipped_duplicates", r.skipped_duplicates},
             {"superseded", r.superseded},
             {"contradictions", r.contradictions},
             {"updated", r.updated}};
}

void to_json(json& j, const search::SearchResult& r) {
    j = json{{"memory_id", r.memory_id},
             {"content", r.content},
             {"memory_type", r.memory_type},
             {"user_id", r.user_id},
             {"created_at", r.created_at},
             {"vector_score", r.vector_score},
             {"graph_score", r.graph_score},
             {"temporal_score", r.temporal_score},
             {"combined_score", r.combined_score},
             {"source", search::toString(r.source)},
             {"depth", r.depth}};
    if (r.via_edge)
        j["via_edge"] = *r.via_edge;
    if (r.parent_id)
        j["parent_id"] = *r.parent_id;
}

void to_json(json& j, const search::OntoSearchResult& r) {
    json concepts = json::array();
    for (const auto& c : r.matched_concepts)
        concepts.push_back({{"concept_id", c.concept_id},
                            {"confidence", c.confidence},
                            {"match_type", c.match_type}});
    json tags = json::array();
    for (const auto& t : r.matched_tags)
        tags.push_back({{"tag", t.tag}, {"score", t.score}});
    j = json{{"memory_id", r.memory_id},
             {"content", r.content},
             {"memory_type", r.memory_type},
             {"user_id", r.user_id},
             {"created_at", r.created_at},
             {"vector_score", r.vector_score},
             {"concept_score", r.concept_score},
             {"tag_score", r.tag_score},
             {"graph_score", r.graph_score},
             {"temporal_score", r.temporal_score},
             {"final_score", r.final_score},
             {"matched_concepts", concepts},
             {"matched_tags", tags},
             {"depth", r.depth},
             {"source", r.source}};
}

void to_json(json& j, const search::ChainSearchResult& r) {
    auto nodeJson = [](const search::ChainNode& n) {
        json node{{"memory_id", n.memory_id}, {"content", n.content}, {"depth", n.depth}};
        node["memory_type"] = n.memory_type ? json(*n.memory_type) : json(nullptr);
        node["relation_type"] = n.relation_type ? json(*n.relation_type) : json(nullptr);
        return node;
    };
    json chains = json::array();
    for (const auto& c : r.chains) {
        json nodes = json::array();
        for (const auto& n : c.nodes)
            nodes.push_back(nodeJson(n));
        chains.push_back({{"seed_memory_id", c.seed_memory_id},
                          {"chain_type", c.chain_type},
                          {"total_depth", c.total_depth},
                          {"nodes", nodes}});
    }
    json memories = json::array();
    for (const auto& n : r.memories)
        memories.push_back(nodeJson(n));
    j = json{{"query", r.query},
             {"chains", chains},
             {"total_memories", r.total_memories},
             {"total_chains", r.total_chains},
             {"deepest_chain", r.deepest_chain},
             {"memories", memories}};
}

MemoryService::MemoryService(ServiceDependencies deps)
    : config_(std::move(deps.config)), store_(std::move(deps.store)),
      embedder_(std::move(deps.embedder)), llm_(std::move(deps.llm)),
      executor_(std::move(deps.executor)) {
    resolver_ = std::make_shared<resolution::IdResolver>(store_);
    users_ = std::make_shared<memory::UserLinker>(store_);
    crud_ = std::make_shared<memory::MemoryCrud>(
        store_, resolver_, embedder_, users_,
        memory::MemoryDefaults{config_.defaults.certainty, config_.defaults.importance});
    relations_ = std::make_shared<memory::RelationManager>(store_);
    contexts_ = std::make_shared<memory::ContextManager>(store_);
    entities_ = std::make_shared<entity::EntityManager>(store_);
    ontology_ = std::make_shared<ontology::OntologyManager>(store_);
    if (llm_)
        extractor_ = std::make_unique<llm::MemoryExtractor>(llm_);

    chunking::ChunkingService::Config chunkConfig;
    chunkConfig.threshold = config_.chunking.threshold;
    chunkConfig.splitter.chunkSize = config_.chunking.chunkSize;
    chunkConfig.splitter.overlap = config_.chunking.overlap;
    chunking_ = std::make_shared<chunking::ChunkingService>(store_, resolver_, executor_,
                                                            chunkConfig, embedder_);

    evolution_ = std::make_shared<evolution::EvolutionManager>(store_, crud_, relations_);
    deletion_ = std::make_shared<evolution::DeletionManager>(store_, crud_, resolver_,
                                                              deps.hardDeleted);

    auto finder = std::make_shared<integrator::SimilarMemoryFinder>(store_);
    auto decisions = std::make_shared<decision::DecisionEngine>(llm_);
    std::shared_ptr<integrator::IRelationReasoner> reasoner;
    if (llm_)
        reasoner = std::make_shared<integrator::LlmRelationReasoner>(llm_);
    auto inferrer = std::make_shared<integrator::RelationInferrer>(reasoner);
    integrator_ = std::make_shared<integrator::MemoryIntegrator>(finder, decisions, inferrer,
                                                                 relations_, evolution_);

    traversal_ = std::make_shared<search::SmartTraversal>(store_, executor_);
    ontoSearch_ = std::make_shared<search::OntoSearch>(store_);
    chainSearch_ = std::make_shared<search::ChainSearch>(store_);
    retrieval_ = std::make_shared<retrieval::RetrievalManager>(store_, ontoSearch_, entities_);
    analytics_ = std::make_shared<analytics::AnalyticsManager>(store_);

    spdlog::info("MemoryService initialized (llm={}, chunking={})", llm_ ? "on" : "off",
                 config_.chunking.enabled);
}

Result<std::unique_ptr<MemoryService>>
MemoryService::create(const config::OmcConfig& config, boost::asio::any_io_executor executor) {
    if (auto valid = config.validate(); !valid)
        return valid.error();

    auto http = net::makeCurlHttpClient();
    auto transport = std::make_shared<store::HttpStoreTransport>(
        http, config.store.baseUrl(),
        std::chrono::duration_cast<std::chrono::milliseconds>(config.store.timeout));
    store::RetryPolicy policy;
    policy.maxRetries = config.store.maxRetries;

    ServiceDependencies deps;
    deps.store = std::make_shared<store::StoreClient>(transport, policy);
    deps.executor = std::move(executor);
    deps.config = config;

    auto embedder = embedding::createEmbeddingGenerator(config.embedding, http);
    if (!embedder)
        return Error{ErrorCode::ConfigurationError, embedder.error().message};
    deps.embedder = embedder.value();

    auto llm = llm::createLlmProvider(config.llm, http);
    if (llm) {
        deps.llm = llm.value();
    } else {
        spdlog::warn("LLM provider unavailable, running without extraction: {}",
                     llm.error().message);
    }
    return std::make_unique<MemoryService>(std::move(deps));
}

Result<void> MemoryService::initialize() {
    auto loaded = ontology_->load();
    if (!loaded) {
        spdlog::warn("Ontology not loaded: {}", loaded.error().message);
        return loaded;
    }
    contexts_->warmUp();
    return {};
}

bool MemoryService::healthCheck() {
    return store_->healthCheck();
}

void MemoryService::clearSearchCaches() {
    traversal_->clearCache();
}

Result<Embedding> MemoryService::embed(const std::string& text) {
    if (!embedder_)
        return Error{ErrorCode::NotInitialized, "No embedding generator configured"};
    return embedder_->generate(text);
}

void MemoryService::linkAgentContext(const MemoryId& memoryId, const std::string& agentId) {
    auto ctx = contexts_->getContextByName(agentId);
    if (!ctx) {
        auto created = contexts_->createContext(agentId, json{{"kind", "agent"}});
        if (!created) {
            spdlog::warn("Failed to create agent context {}: {}", agentId,
                         created.error().message);
            return;
        }
        ctx = created.value();
    }
    auto linked = contexts_->linkMemoryToContext(memoryId, ctx->context_id, 50);
    if (!linked)
        spdlog::warn("Failed to link memory {} to context {}: {}", memoryId, ctx->context_id,
                     linked.error().message);
}

Result<MemoryService::WrittenMemory>
MemoryService::writeMemory(const llm::ExtractedMemory& extracted, const std::string& userId,
                           const std::optional<Embedding>& vector,
                           const std::optional<std::string>& agentId) {
    memory::AddMemoryRequest request;
    request.content = extracted.text;
    request.user_id = userId;
    request.memory_type = extracted.memory_type;
    request.certainty = extracted.certainty;
    request.importance = extracted.importance;
    request.vector = vector;
    if (agentId)
        request.metadata = json{{"agent_id", *agentId}}.dump();

    auto record = crud_->addMemory(request);
    if (!record)
        return record.error();

    WrittenMemory written{record.value().memory_id, 0};
    if (config_.chunking.enabled && chunking_->needsChunking(record.value().content)) {
        auto outcome = chunking_->process(written.memory_id, record.value().content);
        if (outcome) {
            written.chunks = outcome.value().chunks_created;
        } else {
            spdlog::warn("Chunking failed for {}: {}", written.memory_id,
                         outcome.error().message);
        }
    }
    if (agentId && !agentId->empty())
        linkAgentContext(written.memory_id, *agentId);
    return written;
}

Result<AddResult> MemoryService::add(const std::string& message, const std::string& userId,
                                     const std::optional<std::string>& agentId) {
    const auto text = config::trimmed(message);
    if (text.empty())
        return Error{ErrorCode::ValidationError, "message is empty"};
    if (userId.empty())
        return Error{ErrorCode::ValidationError, "user_id is empty"};

    llm::ExtractionResult extraction;
    if (extractor_) {
        auto extracted = extractor_->extract(text, userId);
        if (extracted) {
            extraction = std::move(extracted).value();
        } else {
            spdlog::warn("Extraction failed, storing raw message: {}",
                         extracted.error().message);
        }
    }
    if (extraction.empty()) {
        llm::ExtractedMemory raw;
        raw.text = text;
        extraction.memories = {raw};
    }

    // extracted entity id -> stored entity id
    std::unordered_map<std::string, std::string> entityIds;
    for (const auto& e : extraction.entities) {
        auto ent = entities_->getOrCreate(e.name, e.type);
        if (ent)
            entityIds[e.id.empty() ? e.name : e.id] = ent.value().entity_id;
        else
            spdlog::warn("Failed to create entity {}: {}", e.name, ent.error().message);
    }

    AddResult result;
    std::unordered_map<std::string, MemoryId> idByContent;

    for (const auto& mem : extraction.memories) {
        const auto content = config::trimmed(mem.text);
        if (content.empty())
            continue;

        std::optional<Embedding> vector;
        auto embedded = embed(content);
        if (embedded)
            vector = std::move(embedded).value();
        else
            spdlog::warn("Embedding failed for new memory: {}", embedded.error().message);

        integrator::IntegrationPlan plan;
        if (vector)
            plan = integrator_->plan(content, *vector, userId);
        else
            plan.decision = decision::MemoryDecision::add(50, "no embedding available");

        const auto& choice = plan.decision;
        spdlog::info("Decision for new memory: {} ({}%) {}", toString(choice.operation),
                     choice.confidence, choice.reasoning);

        if (choice.operation == decision::MemoryOperation::Noop) {
            ++result.skipped_duplicates;
            continue;
        }

        if (choice.operation == decision::MemoryOperation::Update && choice.target_memory_id) {
            const auto& target = *choice.target_memory_id;
            auto merged = choice.merged_content.value_or(content);
            auto enhanced = evolution_->enhance(target, merged);
            if (enhanced) {
                resolver_->invalidate(target);
                if (auto v = embed(merged)) {
                    if (auto internal = resolver_->resolve(target)) {
                        auto attached = crud_->attachEmbedding(internal.value(), v.value());
                        if (!attached)
                            spdlog::warn("Failed to refresh embedding of {}: {}", target,
                                         attached.error().message);
                    }
                }
                result.updated.push_back(target);
                idByContent[content] = target;
                continue;
            }
            spdlog::warn("Update of {} failed ({}), adding as new memory", target,
                         enhanced.error().message);
        }

        if (choice.operation == decision::MemoryOperation::Delete && choice.target_memory_id) {
            auto removed = deletion_->softDelete(*choice.target_memory_id, "system",
                                                 std::string("replaced by newer memory"));
            if (!removed)
                spdlog::warn("Failed to delete {}: {}", *choice.target_memory_id,
                             removed.error().message);
        }

        llm::ExtractedMemory toWrite = mem;
        toWrite.text = content;
        auto written = writeMemory(toWrite, userId, vector, agentId);
        if (!written) {
            spdlog::error("Failed to store memory: {}", written.error().message);
            if (extraction.memories.size() == 1)
                return written.error();
            continue;
        }
        const auto& memoryId = written.value().memory_id;
        ++result.memories_added;
        result.memory_ids.push_back(memoryId);
        result.chunks_created += written.value().chunks;
        idByContent[content] = memoryId;

        for (const auto& ref : mem.entities) {
            auto it = entityIds.find(ref);
            if (it == entityIds.end())
                continue;
            auto linked = entities_->linkToMemory(memoryId, it->second,
                                                  entity::EntityEdgeType::ExtractedEntity);
            if (linked)
                appendUnique(result.entities, it->second);
            else
                spdlog::warn("Failed to link entity {}: {}", it->second, linked.error().message);
        }

        auto concepts = conceptMapper_.map(content);
        conceptMapper_.linkMemoryToConcepts(*relations_, memoryId, concepts);

        auto integration = integrator_->apply(memoryId, content, plan);
        result.relations += integration.relations_created;
        for (const auto& id : integration.superseded_memories) {
            appendUnique(result.superseded, id);
            resolver_->invalidate(id);
        }
        for (const auto& id : integration.contradicted_memories)
            appendUnique(result.contradictions, id);
    }

    for (const auto& rel : extraction.relations) {
        auto from = idByContent.find(config::trimmed(rel.from_memory_content));
        auto to = idByContent.find(config::trimmed(rel.to_memory_content));
        if (from == idByContent.end() || to == idByContent.end() || from->second == to->second)
            continue;
        auto type = memory::parseRelationType(rel.relation_type);
        if (!type) {
            spdlog::warn("Skipping relation with unknown type {}", rel.relation_type);
            continue;
        }
        auto written = relations_->addTyped(*type, from->second, to->second,
                                            std::clamp(rel.confidence, 0, 100) / 100.0,
                                            rel.explanation);
        if (written)
            ++result.relations;
        else
            spdlog::warn("Failed to write {} relation: {}", rel.relation_type,
                         written.error().message);
    }

    clearSearchCaches();
    spdlog::info("Added {} memories for {} ({} skipped, {} chunks, {} relations)",
                 result.memories_added, userId, result.skipped_duplicates, result.chunks_created,
                 result.relations);
    return result;
}

Result<std::vector<search::SearchResult>>
MemoryService::search(const std::string& query, const std::string& userId,
                      std::optional<size_t> limit, std::optional<std::string> mode) {
    const auto searchMode = search::parseSearchMode(mode.value_or(config_.defaults.searchMode));
    const auto defaults = search::defaultsFor(searchMode);

    auto vector = embed(query);
    if (!vector)
        return vector.error();

    const auto now = std::chrono::system_clock::now();
    std::optional<std::string> user;
    if (!userId.empty())
        user = userId;
    auto results = traversal_->search(query, vector.value(), user,
                                      search::SearchConfig::fromMode(searchMode),
                                      search::temporalCutoff(searchMode, now));
    if (!results)
        return results.error();

    auto out = std::move(results).value();
    const size_t cap = limit.value_or(std::min(defaults.max_results, config_.defaults.searchLimit));
    if (out.size() > cap)
        out.resize(cap);
    return out;
}

Result<std::vector<search::OntoSearchResult>>
MemoryService::searchByConcept(const std::string& query, const std::string& userId,
                               const std::optional<std::string>& conceptType,
                               const std::vector<std::string>& tags,
                               const std::optional<std::string>& mode,
                               std::optional<size_t> limit) {
    auto vector = embed(query);
    if (!vector)
        return vector.error();

    std::optional<std::string> user;
    if (!userId.empty())
        user = userId;
    auto cfg = search::OntoSearchConfig::fromModeName(mode.value_or("default"));
    auto results = ontoSearch_->search(query, vector.value(), user, cfg, conceptType, tags);
    if (!results)
        return results.error();

    auto out = std::move(results).value();
    const size_t cap = limit.value_or(config_.defaults.searchLimit);
    if (out.size() > cap)
        out.resize(cap);
    return out;
}

Result<search::ChainSearchResult>
MemoryService::searchReasoningChain(const std::string& query, const std::string& userId,
                                    const std::string& chainMode, std::optional<size_t> maxDepth,
                                    size_t limit) {
    auto vector = embed(query);
    if (!vector)
        return vector.error();

    auto cfg = search::MemoryChainConfig::fromChainMode(chainMode);
    if (maxDepth)
        cfg.max_depth = *maxDepth;
    std::optional<std::string> user;
    if (!userId.empty())
        user = userId;
    return chainSearch_->search(query, vector.value(), user, limit, cfg);
}

Result<retrieval::RetrievalResult> MemoryService::retrieve(const std::string& query,
                                                           const std::string& userId,
                                                           retrieval::RetrievalDepth depth,
                                                           size_t limit, bool includeReasoning,
                                                           bool includeEntities) {
    auto vector = embed(query);
    if (!vector)
        return vector.error();
    return retrieval_->retrieve(query, vector.value(), userId, depth, limit, includeReasoning,
                                includeEntities);
}

Result<UpdateResult> MemoryService::update(const MemoryId& memoryId,
                                           const std::string& newContent,
                                           const std::string& userId) {
    auto existing = crud_->getMemory(memoryId);
    if (!existing)
        return existing.error();
    if (!userId.empty() && !existing.value().user_id.empty() &&
        existing.value().user_id != userId) {
        return Error{ErrorCode::InvalidOperation,
                     "Memory " + memoryId + " does not belong to user " + userId};
    }

    auto enhanced = evolution_->enhance(memoryId, newContent);
    if (!enhanced)
        return enhanced.error();

    auto vector = embed(newContent);
    if (vector) {
        auto internal = existing.value().internal_id.empty()
                            ? resolver_->resolve(memoryId)
                            : Result<InternalId>(existing.value().internal_id);
        if (internal) {
            auto attached = crud_->attachEmbedding(internal.value(), vector.value());
            if (!attached)
                spdlog::warn("Failed to refresh embedding of {}: {}", memoryId,
                             attached.error().message);
        }
    } else {
        spdlog::warn("Re-embedding of {} failed: {}", memoryId, vector.error().message);
    }

    resolver_->invalidate(memoryId);
    clearSearchCaches();
    return UpdateResult{true, memoryId};
}

Result<evolution::DeletionResult> MemoryService::remove(const MemoryId& memoryId,
                                                        evolution::DeletionStrategy strategy,
                                                        const std::string& deletedBy,
                                                        const std::optional<std::string>& reason) {
    auto res = deletion_->remove(memoryId, deletedBy, strategy, reason);
    clearSearchCaches();
    return res;
}

Result<evolution::RestoreResult> MemoryService::undelete(const MemoryId& memoryId,
                                                         const std::string& restoredBy) {
    auto res = deletion_->undelete(memoryId, restoredBy);
    clearSearchCaches();
    return res;
}

Result<evolution::CleanupStats> MemoryService::cleanupOrphans(bool dryRun) {
    auto res = deletion_->cleanupOrphans(dryRun);
    if (!dryRun)
        clearSearchCaches();
    return res;
}

Result<analytics::AnalyticsSummary> MemoryService::analytics() {
    return analytics_->collectAll();
}

} // namespace omc::app
