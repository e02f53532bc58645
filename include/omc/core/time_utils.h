#pragma once

#include <omc/core/types.h>

#include <optional>
#include <string>
#include <string_view>

namespace omc::core {

/**
 * Format a time point as RFC 3339 with microsecond precision.
 * Format: 2025-10-01T14:30:00.123456Z
 */
std::string formatTimestamp(TimePoint tp);

/// Current time as an RFC 3339 string.
std::string nowTimestamp();

/**
 * Parse an RFC 3339 / ISO 8601 timestamp. Accepts an optional fractional part and either a
 * `Z` suffix or a `+HH:MM` / `-HH:MM` offset. Returns nullopt for anything else.
 */
std::optional<TimePoint> parseTimestamp(std::string_view text);

/// Fractional days between `then` and `now`. Negative if `then` is in the future.
double daysBetween(TimePoint then, TimePoint now);

} // namespace omc::core
