#pragma once

#include <omc/core/types.h>
#include <omc/store/store_client.h>
#include <omc/store/store_transport.h>

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace omc::test {

/**
 * @brief In-memory graph that answers the named store queries the core issues.
 *
 * Memories are keyed by external id and carry an internal id ("int_N"). Reasoning edges are
 * stored with their wire type (IMPLIES, BECAUSE, CONTRADICTS, SUPPORTS, REFUTES, RELATION,
 * SUPERSEDES). Misses are reported as ErrorCode::NotFound. Thread-safe.
 */
class FakeStoreTransport : public store::IStoreTransport {
public:
    struct Edge {
        std::string edge_id;
        std::string type;
        std::string from;
        std::string to;
        int strength = 100;
        std::string relation_type; ///< only for RELATION edges
    };

    FakeStoreTransport();

    Result<nlohmann::json> call(const std::string& query, const nlohmann::json& params) override;

    // Seeding

    /// Insert a memory directly; returns its internal id
    std::string putMemory(const nlohmann::json& record,
                          std::optional<std::vector<float>> vector = std::nullopt);
    void addEdge(const std::string& type, const std::string& from, const std::string& to,
                 int strength = 100);
    void setOntologyInitialized(bool initialized);

    // Fault injection

    /// Every call of `query` fails with `error` until cleared
    void failQuery(const std::string& query, Error error);
    /// The next `times` calls of `query` fail with `error`
    void failNext(const std::string& query, Error error, size_t times = 1);
    void clearFailures();
    /// addMemory answers without an internal id
    void setOmitInternalId(bool omit);

    // Inspection

    size_t callCount(const std::string& query) const;
    std::vector<nlohmann::json> callsOf(const std::string& query) const;
    void resetCalls();

    std::optional<nlohmann::json> memory(const std::string& memoryId) const;
    std::vector<nlohmann::json> memories() const;
    std::optional<std::vector<float>> memoryVector(const std::string& memoryId) const;
    std::vector<Edge> edges(const std::string& type = {}) const;
    std::vector<std::pair<std::string, std::string>> ownsEdges() const;
    std::vector<nlohmann::json> chunksOf(const std::string& memoryId) const;
    std::vector<std::pair<std::string, std::string>> nextChunkEdges() const;
    size_t chunkEmbeddingCount() const;
    std::vector<nlohmann::json> entities() const;
    std::vector<std::pair<std::string, std::string>> entityLinks() const;
    std::vector<nlohmann::json> contexts() const;
    std::vector<std::pair<std::string, std::string>> contextLinks() const;
    std::vector<std::pair<std::string, std::string>> conceptLinks(const std::string& kind) const;
    std::set<std::string> users() const;

private:
    struct MemoryNode {
        nlohmann::json record;
        std::optional<std::vector<float>> vector;
    };

    struct Failure {
        Error error;
        size_t remaining = 0; ///< 0 means always
    };

    Result<nlohmann::json> dispatch(const std::string& query, const nlohmann::json& params);

    Result<nlohmann::json> vectorSearch(const nlohmann::json& params);
    Result<nlohmann::json> logicalConnections(const std::string& memoryId);
    Result<nlohmann::json> outgoingRelations(const std::string& memoryId);
    Result<nlohmann::json> reasoningRelations(const std::string& memoryId, size_t maxDepth);
    Result<nlohmann::json> addEdgeChecked(const std::string& type, const std::string& from,
                                          const std::string& to, int strength,
                                          const std::string& relationType = {});

    nlohmann::json memoryJson(const MemoryNode& node, bool withVector) const;
    MemoryNode* findByInternal(const std::string& internalId);
    static Error notFound(const std::string& what);

    mutable std::mutex mutex_;
    std::map<std::string, MemoryNode> memories_;
    std::map<std::string, std::string> internalToMemory_;
    size_t nextId_ = 1;

    std::set<std::string> users_;
    std::vector<std::pair<std::string, std::string>> owns_;
    std::vector<Edge> edges_;

    std::map<std::string, nlohmann::json> chunks_; ///< by internal chunk id
    std::map<std::string, std::vector<float>> chunkVectors_;
    std::vector<std::pair<std::string, std::string>> nextChunk_;

    std::map<std::string, nlohmann::json> entities_;
    std::vector<std::pair<std::string, std::string>> entityLinks_;
    std::map<std::string, nlohmann::json> contexts_;
    std::vector<std::pair<std::string, std::string>> contextLinks_;
    std::map<std::string, std::vector<std::pair<std::string, std::string>>> conceptLinks_;

    bool ontologyInitialized_ = false;
    std::vector<nlohmann::json> concepts_;

    bool omitInternalId_ = false;
    std::map<std::string, Failure> failures_;
    std::vector<std::pair<std::string, nlohmann::json>> calls_;
};

/// StoreClient over `transport` with no backoff delay
std::shared_ptr<store::StoreClient> makeClient(std::shared_ptr<FakeStoreTransport> transport,
                                               uint32_t maxRetries = 1);

/// Memory record JSON with sensible defaults, created `ageDays` ago
nlohmann::json memoryRecord(const std::string& memoryId, const std::string& content,
                            const std::string& userId = "alice", double ageDays = 0.0);

} // namespace omc::test
