#include <omc/core/similarity.h>
#include <omc/core/time_utils.h>
#include <omc/search/search_common.h>

#include <algorithm>
#include <array>
#include <utility>

namespace omc::search {

namespace {

constexpr std::array<std::pair<std::string_view, double>, 14> kEdgeWeights{{
    {"implies_out", 0.9},
    {"implies_in", 0.8},
    {"because_out", 0.95},
    {"because_in", 0.85},
    {"relation_out", 0.7},
    {"relation_in", 0.6},
    {"contradicts_out", 0.5},
    {"contradicts_in", 0.5},
    {"supports_out", 0.8},
    {"supports_in", 0.8},
    {"refutes_out", 0.5},
    {"refutes_in", 0.5},
    {"supersedes_out", 0.6},
    {"supersedes_in", 0.6},
}};

} // namespace

const char* toString(ResultSource source) {
    return source == ResultSource::Vector ? "vector" : "graph";
}

double edgeWeight(const std::string& key) {
    for (const auto& [k, w] : kEdgeWeights) {
        if (k == key)
            return w;
    }
    return 0.5;
}

std::string relationOfKey(const std::string& key) {
    auto pos = key.rfind('_');
    return pos == std::string::npos ? key : key.substr(0, pos);
}

bool passesFilters(const store::MemoryRecord& memory, const std::optional<std::string>& userId,
                   const std::optional<TimePoint>& cutoff, TimePoint now) {
    if (userId && memory.user_id != *userId)
        return false;
    if (!memory.isActive(now))
        return false;
    if (cutoff) {
        auto created = core::parseTimestamp(memory.created_at);
        if (created && *created < *cutoff)
            return false;
    }
    return true;
}

double vectorScore(std::span<const float> query, const std::optional<std::vector<float>>& vector,
                   double storeScore) {
    if (vector && !vector->empty() && !query.empty())
        return std::clamp(core::cosineSimilarity(query, *vector), 0.0, 1.0);
    return std::clamp(storeScore, 0.0, 1.0);
}

double semanticScore(std::span<const float> query, const std::optional<std::vector<float>>& vector,
                     double fallback) {
    if (vector && !vector->empty() && !query.empty())
        return core::rescaleCosine(core::cosineSimilarity(query, *vector));
    return fallback;
}

double temporalScore(const std::string& createdAt, double decayDays, TimePoint now) {
    auto created = core::parseTimestamp(createdAt);
    if (!created)
        return 0.5;
    return core::temporalFreshness(core::daysBetween(*created, now), decayDays);
}

} // namespace omc::search
