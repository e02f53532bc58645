#include <omc/core/similarity.h>

#include <algorithm>
#include <cmath>

namespace omc::core {

double cosineSimilarity(std::span<const float> a, std::span<const float> b) {
    if (a.empty() || a.size() != b.size())
        return 0.0;

    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        normA += static_cast<double>(a[i]) * a[i];
        normB += static_cast<double>(b[i]) * b[i];
    }
    if (normA == 0.0 || normB == 0.0)
        return 0.0;

    return std::clamp(dot / (std::sqrt(normA) * std::sqrt(normB)), -1.0, 1.0);
}

double rescaleCosine(double cosine) {
    return std::clamp((cosine + 1.0) / 2.0, 0.0, 1.0);
}

double temporalFreshness(double daysOld, double decayDays) {
    if (decayDays <= 0.0)
        return 1.0;
    return std::clamp(std::exp(-std::max(0.0, daysOld) / decayDays), 0.0, 1.0);
}

} // namespace omc::core
