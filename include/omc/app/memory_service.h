#pragma once

#include <omc/analytics/analytics_manager.h>
#include <omc/chunking/chunking_service.h>
#include <omc/config/omc_config.h>
#include <omc/core/types.h>
#include <omc/decision/decision_engine.h>
#include <omc/embedding/embedding_generator.h>
#include <omc/entity/entity_manager.h>
#include <omc/evolution/deletion_manager.h>
#include <omc/evolution/evolution_manager.h>
#include <omc/integrator/memory_integrator.h>
#include <omc/llm/extractor.h>
#include <omc/llm/llm_provider.h>
#include <omc/memory/context_manager.h>
#include <omc/memory/memory_crud.h>
#include <omc/memory/relation_manager.h>
#include <omc/ontology/concept_mapper.h>
#include <omc/ontology/ontology_manager.h>
#include <omc/resolution/id_resolver.h>
#include <omc/retrieval/retrieval_manager.h>
#include <omc/search/chain_search.h>
#include <omc/search/onto_search.h>
#include <omc/search/smart_traversal.h>
#include <omc/store/store_client.h>

#include <boost/asio/any_io_executor.hpp>
#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace omc::app {

struct AddResult {
    size_t memories_added = 0;
    std::vector<MemoryId> memory_ids;
    std::vector<std::string> entities; ///< entity ids linked during the call
    size_t relations = 0;
    size_t chunks_created = 0;
    size_t skipped_duplicates = 0;
    std::vector<MemoryId> superseded;
    std::vector<MemoryId> contradictions;
    std::vector<MemoryId> updated;
};

struct UpdateResult {
    bool updated = false;
    MemoryId memory_id;
};

void to_json(nlohmann::json& j, const AddResult& r);
void to_json(nlohmann::json& j, const search::SearchResult& r);
void to_json(nlohmann::json& j, const search::OntoSearchResult& r);
void to_json(nlohmann::json& j, const search::ChainSearchResult& r);

/**
 * @brief Everything the service needs from the outside world.
 *
 * `store`, `embedder` and `executor` are required. Without `llm` the raw message is stored as
 * one fact and every decision is ADD.
 */
struct ServiceDependencies {
    std::shared_ptr<store::StoreClient> store;
    std::shared_ptr<embedding::EmbeddingGenerator> embedder;
    std::shared_ptr<llm::ILlmProvider> llm;
    boost::asio::any_io_executor executor;
    config::OmcConfig config;
    /// Shared with other services over the same store; a private log when null
    std::shared_ptr<evolution::HardDeleteLog> hardDeleted;
};

/**
 * @brief Public entry point: write path, the three search strategies, retrieval, deletion
 * and analytics over one backing store.
 *
 * Every mutation clears the smart-traversal cache and drops resolver entries it touched.
 */
class MemoryService {
public:
    explicit MemoryService(ServiceDependencies deps);

    /// Wire providers, HTTP transport and store client from configuration
    static Result<std::unique_ptr<MemoryService>> create(const config::OmcConfig& config,
                                                         boost::asio::any_io_executor executor);

    // Bootstrap the ontology; failure is logged and the service stays usable
    Result<void> initialize();

    bool healthCheck();

    Result<AddResult> add(const std::string& message, const std::string& userId,
                          const std::optional<std::string>& agentId = std::nullopt);

    Result<std::vector<search::SearchResult>> search(const std::string& query,
                                                     const std::string& userId,
                                                     std::optional<size_t> limit = std::nullopt,
                                                     std::optional<std::string> mode = std::nullopt);

    Result<std::vector<search::OntoSearchResult>>
    searchByConcept(const std::string& query, const std::string& userId,
                    const std::optional<std::string>& conceptType = std::nullopt,
                    const std::vector<std::string>& tags = {},
                    const std::optional<std::string>& mode = std::nullopt,
                    std::optional<size_t> limit = std::nullopt);

    // chainMode: causal, forward, both or deep
    Result<search::ChainSearchResult>
    searchReasoningChain(const std::string& query, const std::string& userId,
                         const std::string& chainMode = "both",
                         std::optional<size_t> maxDepth = std::nullopt, size_t limit = 5);

    Result<retrieval::RetrievalResult> retrieve(const std::string& query,
                                                const std::string& userId,
                                                retrieval::RetrievalDepth depth, size_t limit,
                                                bool includeReasoning = true,
                                                bool includeEntities = true);

    Result<UpdateResult> update(const MemoryId& memoryId, const std::string& newContent,
                                const std::string& userId);

    Result<evolution::DeletionResult> remove(const MemoryId& memoryId,
                                             evolution::DeletionStrategy strategy,
                                             const std::string& deletedBy,
                                             const std::optional<std::string>& reason = std::nullopt);

    Result<evolution::RestoreResult> undelete(const MemoryId& memoryId,
                                              const std::string& restoredBy);

    Result<evolution::CleanupStats> cleanupOrphans(bool dryRun);

    Result<analytics::AnalyticsSummary> analytics();

    void clearSearchCaches();

    const config::OmcConfig& config() const { return config_; }
    search::SmartTraversal& traversal() { return *traversal_; }
    resolution::IdResolver& resolver() { return *resolver_; }

private:
    struct WrittenMemory {
        MemoryId memory_id;
        size_t chunks = 0;
    };

    Result<WrittenMemory> writeMemory(const llm::ExtractedMemory& extracted,
                                      const std::string& userId,
                                      const std::optional<Embedding>& vector,
                                      const std::optional<std::string>& agentId);

    void linkAgentContext(const MemoryId& memoryId, const std::string& agentId);

    Result<Embedding> embed(const std::string& text);

    config::OmcConfig config_;
    std::shared_ptr<store::StoreClient> store_;
    std::shared_ptr<embedding::EmbeddingGenerator> embedder_;
    std::shared_ptr<llm::ILlmProvider> llm_;
    boost::asio::any_io_executor executor_;

    std::shared_ptr<resolution::IdResolver> resolver_;
    std::shared_ptr<memory::UserLinker> users_;
    std::shared_ptr<memory::MemoryCrud> crud_;
    std::shared_ptr<memory::RelationManager> relations_;
    std::shared_ptr<memory::ContextManager> contexts_;
    std::shared_ptr<entity::EntityManager> entities_;
    std::shared_ptr<ontology::OntologyManager> ontology_;
    ontology::ConceptMapper conceptMapper_;
    std::unique_ptr<llm::MemoryExtractor> extractor_;
    std::shared_ptr<chunking::ChunkingService> chunking_;
    std::shared_ptr<evolution::EvolutionManager> evolution_;
    std::shared_ptr<evolution::DeletionManager> deletion_;
    std::shared_ptr<integrator::MemoryIntegrator> integrator_;
    std::shared_ptr<search::SmartTraversal> traversal_;
    std::shared_ptr<search::OntoSearch> ontoSearch_;
    std::shared_ptr<search::ChainSearch> chainSearch_;
    std::shared_ptr<retrieval::RetrievalManager> retrieval_;
    std::shared_ptr<analytics::AnalyticsManager> analytics_;
};

} // namespace omc::app
