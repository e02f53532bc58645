#pragma once

#include <omc/core/types.h>

#include <optional>
#include <string_view>

namespace omc::search {

enum class SearchMode { Recent, Contextual, Deep, Full };

const char* toString(SearchMode mode);

// Case-insensitive; unknown names are Recent
SearchMode parseSearchMode(std::string_view name);

struct SearchModeDefaults {
    size_t max_results = 10;
    size_t graph_depth = 1;
    std::optional<double> temporal_days; ///< nullopt: no time window
    size_t vector_top_k = 5;
    double min_vector_score = 0.6;
    double min_combined_score = 0.4;
};

SearchModeDefaults defaultsFor(SearchMode mode);

/// Oldest created_at a result may have, or nullopt for an unbounded window
std::optional<TimePoint> temporalCutoff(SearchMode mode, TimePoint now);

} // namespace omc::search
