#include <omc/config/config_helpers.h>
#include <omc/search/search_modes.h>

#include <chrono>

namespace omc::search {

const char* toString(SearchMode mode) {
    switch (mode) {
        case SearchMode::Recent:
            return "recent";
        case SearchMode::Contextual:
            return "contextual";
        case SearchMode::Deep:
            return "deep";
        case SearchMode::Full:
            return "full";
    }
    return "recent";
}

SearchMode parseSearchMode(std::string_view name) {
    auto n = config::toLower(config::trimmed(name));
    if (n == "contextual")
        return SearchMode::Contextual;
    if (n == "deep")
        return SearchMode::Deep;
    if (n == "full")
        return SearchMode::Full;
    return SearchMode::Recent;
}

SearchModeDefaults defaultsFor(SearchMode mode) {
    switch (mode) {
        case SearchMode::Recent:
            return {10, 1, 4.0 / 24.0, 5, 0.6, 0.4};
        case SearchMode::Contextual:
            return {20, 2, 30.0, 10, 0.5, 0.3};
        case SearchMode::Deep:
            return {50, 3, 90.0, 15, 0.4, 0.25};
        case SearchMode::Full:
            return {100, 4, std::nullopt, 100, 0.0, 0.0};
    }
    return {};
}

std::optional<TimePoint> temporalCutoff(SearchMode mode, TimePoint now) {
    auto days = defaultsFor(mode).temporal_days;
    if (!days)
        return std::nullopt;
    auto window = std::chrono::duration_cast<TimePoint::duration>(
        std::chrono::duration<double, std::ratio<86400>>(*days));
    return now - window;
}

} // namespace omc::search
