#pragma once

#include <omc/core/types.h>

#include <cstdint>
#include <optional>
#include <string>

namespace omc::llm {

struct LlmMetadata {
    std::string provider;
    std::string model;
    std::optional<std::string> baseUrl;
    std::optional<uint32_t> tokensPrompt;
    std::optional<uint32_t> tokensCompletion;
    std::optional<uint32_t> tokensTotal;
    bool fallbackUsed = false;
    std::optional<std::string> originalProvider;
    std::optional<std::string> originalError;
};

struct LlmResponse {
    std::string text;
    LlmMetadata metadata;
};

/**
 * @brief Chat-completion provider.
 *
 * `responseFormat` is passed through as the provider's structured-output hint; the only value
 * the core uses is "json_object".
 */
class ILlmProvider {
public:
    virtual ~ILlmProvider() = default;

    virtual Result<LlmResponse> generate(const std::string& systemPrompt,
                                         const std::string& userPrompt,
                                         const std::optional<std::string>& responseFormat) = 0;

    virtual std::string providerName() const = 0;
    virtual std::string modelName() const = 0;
};

} // namespace omc::llm
