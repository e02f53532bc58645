#pragma once

#include <omc/llm/llm_provider.h>
#include <omc/net/http_client.h>

#include <chrono>
#include <memory>
#include <string>

namespace omc::llm {

/**
 * @brief OpenAI-style `/chat/completions` client. Cerebras speaks the same protocol.
 */
class OpenAiCompatibleProvider final : public ILlmProvider {
public:
    struct Options {
        std::string name = "openai";
        std::string baseUrl = "https://api.openai.com/v1";
        std::string model;
        std::string apiKey;
        double temperature = 0.3;
        std::chrono::milliseconds timeout = std::chrono::seconds(600);
    };

    OpenAiCompatibleProvider(std::shared_ptr<net::IHttpClient> http, Options options);

    Result<LlmResponse> generate(const std::string& systemPrompt, const std::string& userPrompt,
                                 const std::optional<std::string>& responseFormat) override;

    std::string providerName() const override { return options_.name; }
    std::string modelName() const override { return options_.model; }

private:
    std::shared_ptr<net::IHttpClient> http_;
    Options options_;
};

/**
 * @brief Ollama `/api/chat` client (non-streaming).
 */
class OllamaProvider final : public ILlmProvider {
public:
    struct Options {
        std::string baseUrl = "http://localhost:11434";
        std::string model = "llama3.2";
        double temperature = 0.3;
        std::chrono::milliseconds timeout = std::chrono::seconds(600);
    };

    OllamaProvider(std::shared_ptr<net::IHttpClient> http, Options options);

    Result<LlmResponse> generate(const std::string& systemPrompt, const std::string& userPrompt,
                                 const std::optional<std::string>& responseFormat) override;

    std::string providerName() const override { return "ollama"; }
    std::string modelName() const override { return options_.model; }

private:
    std::shared_ptr<net::IHttpClient> http_;
    Options options_;
};

inline constexpr const char* kCerebrasBaseUrl = "https://api.cerebras.ai/v1";

} // namespace omc::llm
