#include <omc/llm/fallback_provider.h>

#include <spdlog/spdlog.h>

#include <fmt/format.h>

namespace omc::llm {

FallbackLlmProvider::FallbackLlmProvider(std::shared_ptr<ILlmProvider> primary,
                                         Factory fallbackFactory, bool fallbackEnabled)
    : primary_(std::move(primary)), fallbackFactory_(std::move(fallbackFactory)),
      fallbackEnabled_(fallbackEnabled && static_cast<bool>(fallbackFactory_)) {}

std::shared_ptr<ILlmProvider> FallbackLlmProvider::fallback() {
    std::lock_guard<std::mutex> lock(fallbackMutex_);
    if (!fallback_) {
        fallback_ = fallbackFactory_();
        if (fallback_) {
            spdlog::info("[LLM] Initialized fallback provider {} ({})", fallback_->providerName(),
                         fallback_->modelName());
        }
    }
    return fallback_;
}

Result<LlmResponse>
FallbackLlmProvider::generate(const std::string& systemPrompt, const std::string& userPrompt,
                              const std::optional<std::string>& responseFormat) {
    auto primaryResult = primary_->generate(systemPrompt, userPrompt, responseFormat);
    if (primaryResult) {
        if (usingFallback_.exchange(false, std::memory_order_acq_rel)) {
            spdlog::info("[LLM] Primary provider {} recovered", primary_->providerName());
        }
        primaryFailures_.store(0, std::memory_order_relaxed);
        return primaryResult;
    }

    const auto& primaryError = primaryResult.error();
    primaryFailures_.fetch_add(1, std::memory_order_relaxed);
    spdlog::warn("[LLM] Primary provider {} failed: {}", primary_->providerName(),
                 primaryError.message);

    if (!fallbackEnabled_) {
        return primaryError;
    }

    auto fb = fallback();
    if (!fb) {
        return Error{primaryError.code,
                     fmt::format("{}; fallback provider unavailable", primaryError.message)};
    }

    fallbackInvocations_.fetch_add(1, std::memory_order_relaxed);
    auto fallbackResult = fb->generate(systemPrompt, userPrompt, responseFormat);
    if (!fallbackResult) {
        return Error{ErrorCode::ProviderError,
                     fmt::format("Primary failed: {}; fallback failed: {}", primaryError.message,
                                 fallbackResult.error().message)};
    }

    usingFallback_.store(true, std::memory_order_release);
    auto response = std::move(fallbackResult).value();
    response.metadata.fallbackUsed = true;
    response.metadata.originalProvider = primary_->providerName();
    response.metadata.originalError = primaryError.message;
    return response;
}

std::string FallbackLlmProvider::providerName() const {
    if (isUsingFallback()) {
        std::lock_guard<std::mutex> lock(fallbackMutex_);
        if (fallback_)
            return fallback_->providerName() + " (fallback)";
    }
    return primary_->providerName();
}

std::string FallbackLlmProvider::modelName() const {
    if (isUsingFallback()) {
        std::lock_guard<std::mutex> lock(fallbackMutex_);
        if (fallback_)
            return fallback_->modelName();
    }
    return primary_->modelName();
}

FallbackLlmProvider::Stats FallbackLlmProvider::stats() const {
    Stats s;
    s.usingFallback = isUsingFallback();
    s.primaryFailures = primaryFailures_.load(std::memory_order_relaxed);
    s.fallbackInvocations = fallbackInvocations_.load(std::memory_order_relaxed);
    return s;
}

} // namespace omc::llm
