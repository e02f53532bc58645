#include <omc/config/config_helpers.h>
#include <omc/embedding/embedding_generator.h>

#include <spdlog/spdlog.h>

#include <fmt/format.h>

namespace omc::embedding {

EmbeddingGenerator::EmbeddingGenerator(std::shared_ptr<IEmbeddingProvider> primary,
                                       Factory fallbackFactory,
                                       EmbeddingCache::Config cacheConfig, bool fallbackEnabled)
    : primary_(std::move(primary)), fallbackFactory_(std::move(fallbackFactory)),
      fallbackEnabled_(fallbackEnabled && static_cast<bool>(fallbackFactory_)),
      cache_(cacheConfig) {}

std::shared_ptr<IEmbeddingProvider> EmbeddingGenerator::fallback() {
    std::lock_guard<std::mutex> lock(fallbackMutex_);
    if (!fallback_) {
        fallback_ = fallbackFactory_();
    }
    return fallback_;
}

Result<Embedding> EmbeddingGenerator::generate(const std::string& text, bool useCache) {
    if (config::trimmed(text).empty()) {
        return Error{ErrorCode::InvalidArgument, "Empty text"};
    }

    if (useCache) {
        if (auto cached = cache_.get(text)) {
            spdlog::debug("Embedding cache hit for: {}...", text.substr(0, 50));
            return std::move(*cached);
        }
    }

    auto primaryResult = primary_->embed(text);
    if (primaryResult) {
        if (usingFallback_.exchange(false, std::memory_order_acq_rel)) {
            spdlog::info("[Embeddings] Primary provider {} recovered", primary_->providerName());
        }
        if (useCache)
            cache_.put(text, primaryResult.value());
        return primaryResult;
    }

    const auto primaryError = primaryResult.error();
    spdlog::warn("[Embeddings] Primary provider {} failed: {}", primary_->providerName(),
                 primaryError.message);
    if (!fallbackEnabled_) {
        return primaryError;
    }

    auto fb = fallback();
    if (!fb) {
        return primaryError;
    }

    auto fallbackResult = fb->embed(text);
    if (!fallbackResult) {
        return Error{ErrorCode::ProviderError,
                     fmt::format("Both primary and fallback failed: primary={}, fallback={}",
                                 primaryError.message, fallbackResult.error().message)};
    }

    usingFallback_.store(true, std::memory_order_release);
    fallbackCount_.fetch_add(1, std::memory_order_relaxed);
    if (useCache)
        cache_.put(text, fallbackResult.value());
    return fallbackResult;
}

std::string EmbeddingGenerator::modelName() const {
    if (isUsingFallback()) {
        std::lock_guard<std::mutex> lock(fallbackMutex_);
        if (fallback_)
            return fallback_->modelName();
    }
    return primary_->modelName();
}

EmbeddingGenerator::Stats EmbeddingGenerator::stats() const {
    Stats s;
    s.usingFallback = isUsingFallback();
    s.fallbackCount = fallbackCount_.load(std::memory_order_relaxed);
    s.cache = cache_.stats();
    return s;
}

Result<std::shared_ptr<IEmbeddingProvider>>
createEmbeddingProvider(const std::string& provider, const std::string& url,
                        const std::string& model, const std::string& apiKey,
                        std::chrono::milliseconds timeout, std::shared_ptr<net::IHttpClient> http) {
    auto name = config::toLower(provider);
    if (name == "ollama") {
        return std::shared_ptr<IEmbeddingProvider>(
            std::make_shared<OllamaEmbeddingProvider>(std::move(http), url, model, timeout));
    }
    if (name == "openai" || name == "openai-compatible") {
        return std::shared_ptr<IEmbeddingProvider>(std::make_shared<OpenAiEmbeddingProvider>(
            std::move(http), url, model, apiKey, timeout));
    }
    return Error{ErrorCode::InvalidArgument,
                 fmt::format("Unknown embedding provider: {}", provider)};
}

Result<std::shared_ptr<EmbeddingGenerator>>
createEmbeddingGenerator(const config::EmbeddingConfig& config,
                         std::shared_ptr<net::IHttpClient> http) {
    auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config.timeout);
    auto primary = createEmbeddingProvider(config.provider, config.url, config.model,
                                           config.apiKey, timeout, http);
    if (!primary)
        return primary.error();

    EmbeddingGenerator::Factory factory;
    if (config.fallbackEnabled) {
        factory = [config, http, timeout]() -> std::shared_ptr<IEmbeddingProvider> {
            auto fb = createEmbeddingProvider(config.fallbackProvider, config.fallbackUrl,
                                              config.fallbackModel, config.apiKey, timeout, http);
            if (!fb) {
                spdlog::error("[Embeddings] Cannot build fallback: {}", fb.error().message);
                return nullptr;
            }
            return fb.value();
        };
    }

    EmbeddingCache::Config cacheConfig;
    cacheConfig.maxEntries = config.cacheSize;
    cacheConfig.ttl = config.cacheTtl;

    spdlog::info("EmbeddingGenerator initialized: provider={}, model={}, cache={}",
                 config.provider, config.model, config.cacheSize);
    return std::make_shared<EmbeddingGenerator>(primary.value(), std::move(factory), cacheConfig,
                                                config.fallbackEnabled);
}

} // namespace omc::embedding
