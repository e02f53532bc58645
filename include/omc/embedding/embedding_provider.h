#pragma once

#include <omc/core/types.h>
#include <omc/net/http_client.h>

#include <chrono>
#include <memory>
#include <string>

namespace omc::embedding {

class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    // Empty or whitespace-only text is InvalidArgument
    virtual Result<Embedding> embed(const std::string& text) = 0;

    virtual std::string providerName() const = 0;
    virtual std::string modelName() const = 0;
};

// POST {url}/api/embeddings {model, prompt} -> {embedding}
class OllamaEmbeddingProvider final : public IEmbeddingProvider {
public:
    OllamaEmbeddingProvider(std::shared_ptr<net::IHttpClient> http, std::string url,
                            std::string model,
                            std::chrono::milliseconds timeout = std::chrono::seconds(30));

    Result<Embedding> embed(const std::string& text) override;
    std::string providerName() const override { return "ollama"; }
    std::string modelName() const override { return model_; }

private:
    std::shared_ptr<net::IHttpClient> http_;
    std::string url_;
    std::string model_;
    std::chrono::milliseconds timeout_;
};

// POST {base}/embeddings {model, input} -> {data:[{embedding}]}
class OpenAiEmbeddingProvider final : public IEmbeddingProvider {
public:
    OpenAiEmbeddingProvider(std::shared_ptr<net::IHttpClient> http, std::string baseUrl,
                            std::string model, std::string apiKey,
                            std::chrono::milliseconds timeout = std::chrono::seconds(30));

    Result<Embedding> embed(const std::string& text) override;
    std::string providerName() const override { return "openai"; }
    std::string modelName() const override { return model_; }

private:
    std::shared_ptr<net::IHttpClient> http_;
    std::string baseUrl_;
    std::string model_;
    std::string apiKey_;
    std::chrono::milliseconds timeout_;
};

} // namespace omc::embedding
