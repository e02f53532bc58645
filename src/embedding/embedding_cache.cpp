#include <omc/embedding/embedding_cache.h>

#include <algorithm>
#include <mutex>

namespace omc::embedding {

EmbeddingCache::EmbeddingCache(Config config) : config_(config) {
    if (config_.maxEntries == 0)
        config_.maxEntries = 1;
}

std::optional<Embedding> EmbeddingCache::get(const std::string& text) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(text);
    if (it == entries_.end() || it->second.isExpired(config_.ttl)) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }
    hits_.fetch_add(1, std::memory_order_relaxed);
    return it->second.vector;
}

void EmbeddingCache::put(const std::string& text, Embedding vector) {
    std::unique_lock lock(mutex_);
    auto existing = entries_.find(text);
    if (existing == entries_.end() && entries_.size() >= config_.maxEntries) {
        auto oldest = std::min_element(entries_.begin(), entries_.end(),
                                       [](const auto& a, const auto& b) {
                                           return a.second.createdAt < b.second.createdAt;
                                       });
        if (oldest != entries_.end())
            entries_.erase(oldest);
    }
    entries_[text] = Entry{std::move(vector), std::chrono::steady_clock::now()};
}

void EmbeddingCache::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}

size_t EmbeddingCache::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

EmbeddingCache::Stats EmbeddingCache::stats() const {
    Stats s;
    s.hits = hits_.load(std::memory_order_relaxed);
    s.misses = misses_.load(std::memory_order_relaxed);
    s.size = size();
    auto total = s.hits + s.misses;
    s.hitRate = total == 0 ? 0.0 : static_cast<double>(s.hits) / static_cast<double>(total);
    return s;
}

} // namespace omc::embedding
