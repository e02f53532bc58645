#pragma once

#include <omc/core/types.h>

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace omc::store {

/**
 * @brief A memory node as stored and returned by the backing store.
 *
 * `internal_id` is the opaque store id (`id` on the wire); `memory_id` is the external id.
 */
struct MemoryRecord {
    std::string internal_id;
    std::string memory_id;
    std::string content;
    std::string memory_type = "fact";
    std::string user_id;
    int certainty = 80;
    int importance = 50;
    std::string created_at;
    std::string updated_at;
    std::string valid_from;
    std::optional<std::string> valid_until;
    bool immutable = false;
    bool verified = false;
    std::string context_tags = "[]";
    std::string source = "user";
    std::string metadata = "{}";
    bool is_deleted = false;
    std::optional<std::string> deleted_at;
    std::optional<std::string> deleted_by;

    /// valid_until set and strictly before `now`
    bool isExpired(TimePoint now) const;

    /// Neither soft-deleted nor expired
    bool isActive(TimePoint now) const { return !is_deleted && !isExpired(now); }
};

void to_json(nlohmann::json& j, const MemoryRecord& m);
void from_json(const nlohmann::json& j, MemoryRecord& m);

/// Memory returned from a vector query, with the store score and optionally its vector
struct ScoredRecord {
    MemoryRecord memory;
    double score = 0.0;
    std::optional<std::vector<float>> vector;
};

void from_json(const nlohmann::json& j, ScoredRecord& r);

/// Response of smartVectorSearchWithChunks
struct VectorSearchResponse {
    std::vector<ScoredRecord> memories;
    std::vector<ScoredRecord> parentMemories;

    /// memories then parent memories, first occurrence of each memory_id kept
    std::vector<ScoredRecord> merged() const;
};

void from_json(const nlohmann::json& j, VectorSearchResponse& r);

/// Neighbor reached over a reasoning edge; strength is 0..100
struct LinkedRecord {
    MemoryRecord memory;
    double strength = 100.0;
    std::optional<std::vector<float>> vector;
};

/**
 * @brief Response of getMemoryLogicalConnections.
 *
 * Keys are `<relation>_<out|in>`: implies, because, contradicts, supports, refutes, relation,
 * supersedes.
 */
struct LogicalConnections {
    std::map<std::string, std::vector<LinkedRecord>> byKey;

    const std::vector<LinkedRecord>& get(const std::string& key) const;
    size_t total() const;
};

void from_json(const nlohmann::json& j, LogicalConnections& c);

struct UserRecord {
    std::string user_id;
    std::string name;
};

void to_json(nlohmann::json& j, const UserRecord& u);
void from_json(const nlohmann::json& j, UserRecord& u);

struct ChunkRecord {
    std::string internal_id;
    std::string chunk_id;
    std::string parent_id;
    size_t position = 0;
    std::string content;
    size_t token_count = 0;
    std::string created_at;
};

void to_json(nlohmann::json& j, const ChunkRecord& c);
void from_json(const nlohmann::json& j, ChunkRecord& c);

/// Response of getMemoryWithChunks
struct MemoryWithChunks {
    bool hasChunks = false;
    std::string content;
    std::vector<ChunkRecord> chunks;
};

void from_json(const nlohmann::json& j, MemoryWithChunks& m);

struct ConceptRecord {
    std::string concept_id;
    std::string name;
    int level = 0;
    std::string description;
    std::optional<std::string> parent_id;
};

void from_json(const nlohmann::json& j, ConceptRecord& c);

/// Response of getMemoryConcepts
struct MemoryConcepts {
    std::vector<std::string> instanceOf;
    std::vector<std::string> belongsTo;

    bool empty() const { return instanceOf.empty() && belongsTo.empty(); }
};

void from_json(const nlohmann::json& j, MemoryConcepts& c);

/// One edge returned by getMemoryReasoningRelations
struct ReasoningEdgeRecord {
    std::string from_id;
    std::string to_id;
    std::string relation_type;
    double strength = 0.0;
};

void from_json(const nlohmann::json& j, ReasoningEdgeRecord& e);

} // namespace omc::store
