#pragma once

#include <omc/config/config_helpers.h>
#include <omc/core/ids.h>
#include <omc/embedding/embedding_generator.h>
#include <omc/llm/llm_provider.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cmath>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace omc::test {

inline constexpr size_t kTestDim = 32;

/// Unit vector along `axis`
inline Embedding axisVector(size_t axis, size_t dim = kTestDim) {
    Embedding v(dim, 0.0f);
    v[axis % dim] = 1.0f;
    return v;
}

/// Unit vector whose cosine with axisVector(base) is exactly `cosine`
inline Embedding vectorWithCosine(size_t base, size_t other, double cosine,
                                  size_t dim = kTestDim) {
    Embedding v(dim, 0.0f);
    v[base % dim] = static_cast<float>(cosine);
    v[other % dim] = static_cast<float>(std::sqrt(std::max(0.0, 1.0 - cosine * cosine)));
    return v;
}

/**
 * @brief Deterministic embedder: hashed bag of words, normalized, unless a vector was pinned
 * for the exact text.
 */
class FakeEmbeddingProvider : public embedding::IEmbeddingProvider {
public:
    Result<Embedding> embed(const std::string& text) override {
        ++calls_;
        if (config::trimmed(text).empty())
            return Error{ErrorCode::InvalidArgument, "Cannot embed empty text"};
        if (failing_)
            return Error{ErrorCode::NetworkError, "embedding service unreachable"};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (auto it = pinned_.find(text); it != pinned_.end())
                return it->second;
        }
        Embedding v(kTestDim, 0.0f);
        std::string word;
        auto flush = [&] {
            if (word.empty())
                return;
            auto h = std::stoul(core::shortHash(word), nullptr, 16);
            v[h % kTestDim] += 1.0f;
            word.clear();
        };
        for (unsigned char c : text) {
            if (std::isalnum(c))
                word.push_back(static_cast<char>(std::tolower(c)));
            else
                flush();
        }
        flush();
        double norm = 0.0;
        for (float x : v)
            norm += static_cast<double>(x) * x;
        norm = std::sqrt(norm);
        if (norm > 0.0) {
            for (auto& x : v)
                x = static_cast<float>(x / norm);
        }
        return v;
    }

    std::string providerName() const override { return "fake"; }
    std::string modelName() const override { return "fake-embed"; }

    void pin(const std::string& text, Embedding vector) {
        std::lock_guard<std::mutex> lock(mutex_);
        pinned_[text] = std::move(vector);
    }

    void setFailing(bool failing) { failing_ = failing; }
    size_t calls() const { return calls_.load(); }

private:
    std::mutex mutex_;
    std::map<std::string, Embedding> pinned_;
    std::atomic<bool> failing_{false};
    std::atomic<size_t> calls_{0};
};

inline std::shared_ptr<embedding::EmbeddingGenerator>
makeGenerator(std::shared_ptr<embedding::IEmbeddingProvider> provider) {
    return std::make_shared<embedding::EmbeddingGenerator>(std::move(provider), nullptr,
                                                           embedding::EmbeddingCache::Config{},
                                                           false);
}

/**
 * @brief Chat provider driven by a test-supplied handler. Records every prompt pair.
 */
class ScriptedLlmProvider : public llm::ILlmProvider {
public:
    using Handler =
        std::function<Result<std::string>(const std::string& system, const std::string& user)>;

    explicit ScriptedLlmProvider(Handler handler = {}) : handler_(std::move(handler)) {}

    Result<llm::LlmResponse> generate(const std::string& systemPrompt,
                                      const std::string& userPrompt,
                                      const std::optional<std::string>&) override {
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            prompts_.emplace_back(systemPrompt, userPrompt);
            handler = handler_;
        }
        if (!handler)
            return Error{ErrorCode::ProviderError, "no scripted reply"};
        auto text = handler(systemPrompt, userPrompt);
        if (!text)
            return text.error();
        llm::LlmResponse response;
        response.text = text.value();
        response.metadata.provider = "scripted";
        response.metadata.model = "scripted-model";
        return response;
    }

    std::string providerName() const override { return "scripted"; }
    std::string modelName() const override { return "scripted-model"; }

    void setHandler(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    std::vector<std::pair<std::string, std::string>> prompts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return prompts_;
    }

private:
    mutable std::mutex mutex_;
    Handler handler_;
    std::vector<std::pair<std::string, std::string>> prompts_;
};

} // namespace omc::test
