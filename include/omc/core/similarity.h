#pragma once

#include <span>

namespace omc::core {

/**
 * Cosine similarity in [-1, 1]. Returns 0 when either vector is empty, all zero, or the
 * lengths differ.
 */
double cosineSimilarity(std::span<const float> a, std::span<const float> b);

/// Map a cosine value from [-1, 1] onto [0, 1], clamping out-of-range input.
double rescaleCosine(double cosine);

/// exp(-days / decayDays) clamped to [0, 1]; future timestamps count as age 0.
double temporalFreshness(double daysOld, double decayDays);

} // namespace omc::core
