#pragma once

#include <omc/llm/llm_provider.h>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>

namespace omc::llm {

/**
 * @brief Primary provider with a lazily constructed local fallback.
 *
 * Every call tries the primary first. When it fails the fallback is built on first use and
 * called with the same arguments; its metadata records `fallbackUsed`, the original provider
 * and the original error. A later primary success clears the fallback flag.
 */
class FallbackLlmProvider final : public ILlmProvider {
public:
    using Factory = std::function<std::shared_ptr<ILlmProvider>()>;

    struct Stats {
        bool usingFallback = false;
        uint64_t primaryFailures = 0;
        uint64_t fallbackInvocations = 0;
    };

    FallbackLlmProvider(std::shared_ptr<ILlmProvider> primary, Factory fallbackFactory,
                        bool fallbackEnabled = true);

    Result<LlmResponse> generate(const std::string& systemPrompt, const std::string& userPrompt,
                                 const std::optional<std::string>& responseFormat) override;

    std::string providerName() const override;
    std::string modelName() const override;

    bool isUsingFallback() const { return usingFallback_.load(std::memory_order_acquire); }
    Stats stats() const;

private:
    std::shared_ptr<ILlmProvider> fallback();

    std::shared_ptr<ILlmProvider> primary_;
    Factory fallbackFactory_;
    bool fallbackEnabled_;

    mutable std::mutex fallbackMutex_;
    std::shared_ptr<ILlmProvider> fallback_;

    std::atomic<bool> usingFallback_{false};
    std::atomic<uint64_t> primaryFailures_{0};
    std::atomic<uint64_t> fallbackInvocations_{0};
};

} // namespace omc::llm
