#pragma once

#include <omc/core/types.h>
#include <omc/store/records.h>

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace omc::search {

enum class ResultSource { Vector, Graph };

const char* toString(ResultSource source);

struct SearchResult {
    MemoryId memory_id;
    std::string content;
    std::string memory_type;
    std::string user_id;
    std::string created_at;
    double vector_score = 0.0;
    double graph_score = 0.0;
    double temporal_score = 0.0;
    double combined_score = 0.0;
    ResultSource source = ResultSource::Vector;
    size_t depth = 0;
    std::optional<std::string> via_edge;  ///< logical-connection key, e.g. implies_out
    std::optional<MemoryId> parent_id;    ///< memory the edge was followed from
};

/// Traversal weight of a logical-connection key such as "because_out"; unknown keys get 0.5
double edgeWeight(const std::string& key);

/// Relation part of a connection key: "implies_out" -> "implies"
std::string relationOfKey(const std::string& key);

/**
 * Default result filter: owned by `userId` (when given), not soft-deleted, not expired, and
 * created at or after `cutoff` (when given). Unparsable created_at passes the cutoff.
 */
bool passesFilters(const store::MemoryRecord& memory, const std::optional<std::string>& userId,
                   const std::optional<TimePoint>& cutoff, TimePoint now);

/// Cosine against the hit vector clamped to [0, 1], else the store score clamped to [0, 1]
double vectorScore(std::span<const float> query, const std::optional<std::vector<float>>& vector,
                   double storeScore);

/// Graph neighbour similarity: (cos + 1) / 2 against its vector, else `fallback`
double semanticScore(std::span<const float> query, const std::optional<std::vector<float>>& vector,
                     double fallback = 0.5);

/// Freshness of an RFC 3339 created_at; 0.5 when unparsable
double temporalScore(const std::string& createdAt, double decayDays, TimePoint now);

} // namespace omc::search
