#pragma once

#include <omc/config/omc_config.h>
#include <omc/embedding/embedding_cache.h>
#include <omc/embedding/embedding_provider.h>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>

namespace omc::embedding {

/**
 * @brief Cached embedding front end with a lazily built fallback provider.
 *
 * Each call consults the cache, then the primary provider, then the fallback. A primary
 * success clears the fallback flag. When both fail the error names both failures.
 */
class EmbeddingGenerator {
public:
    using Factory = std::function<std::shared_ptr<IEmbeddingProvider>()>;

    struct Stats {
        bool usingFallback = false;
        uint64_t fallbackCount = 0;
        EmbeddingCache::Stats cache;
    };

    EmbeddingGenerator(std::shared_ptr<IEmbeddingProvider> primary, Factory fallbackFactory,
                       EmbeddingCache::Config cacheConfig = {}, bool fallbackEnabled = true);

    Result<Embedding> generate(const std::string& text, bool useCache = true);

    std::string modelName() const;
    bool isUsingFallback() const { return usingFallback_.load(std::memory_order_acquire); }
    Stats stats() const;
    void clearCache() { cache_.clear(); }

private:
    std::shared_ptr<IEmbeddingProvider> fallback();

    std::shared_ptr<IEmbeddingProvider> primary_;
    Factory fallbackFactory_;
    bool fallbackEnabled_;
    EmbeddingCache cache_;

    mutable std::mutex fallbackMutex_;
    std::shared_ptr<IEmbeddingProvider> fallback_;

    std::atomic<bool> usingFallback_{false};
    std::atomic<uint64_t> fallbackCount_{0};
};

// Build providers and generator from configuration. Unknown providers are InvalidArgument.
Result<std::shared_ptr<IEmbeddingProvider>>
createEmbeddingProvider(const std::string& provider, const std::string& url,
                        const std::string& model, const std::string& apiKey,
                        std::chrono::milliseconds timeout, std::shared_ptr<net::IHttpClient> http);

Result<std::shared_ptr<EmbeddingGenerator>>
createEmbeddingGenerator(const config::EmbeddingConfig& config,
                         std::shared_ptr<net::IHttpClient> http);

} // namespace omc::embedding
