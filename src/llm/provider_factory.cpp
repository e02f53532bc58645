#include <omc/config/config_helpers.h>
#include <omc/llm/fallback_provider.h>
#include <omc/llm/http_providers.h>
#include <omc/llm/provider_factory.h>

#include <spdlog/spdlog.h>

#include <fmt/format.h>

namespace omc::llm {

Result<std::shared_ptr<ILlmProvider>>
createPrimaryLlmProvider(const config::LlmConfig& config, std::shared_ptr<net::IHttpClient> http) {
    auto name = config::toLower(config.provider);
    auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config.timeout);

    if (name == "cerebras" || name == "openai" || name == "openai-compatible") {
        OpenAiCompatibleProvider::Options opts;
        opts.name = name;
        opts.model = config.model;
        opts.apiKey = config.apiKey;
        opts.temperature = config.temperature;
        opts.timeout = timeout;
        if (!config.baseUrl.empty()) {
            opts.baseUrl = config.baseUrl;
        } else if (name == "cerebras") {
            opts.baseUrl = kCerebrasBaseUrl;
        } else if (name == "openai-compatible") {
            return Error{ErrorCode::InvalidArgument,
                         "openai-compatible provider requires a base URL"};
        }
        if (name == "cerebras" && opts.apiKey.empty()) {
            spdlog::warn("[LLM] Cerebras selected without HELIX_LLM_API_KEY");
        }
        return std::shared_ptr<ILlmProvider>(
            std::make_shared<OpenAiCompatibleProvider>(std::move(http), std::move(opts)));
    }

    if (name == "ollama") {
        OllamaProvider::Options opts;
        opts.model = config.model;
        opts.temperature = config.temperature;
        opts.timeout = timeout;
        opts.baseUrl = config.baseUrl.empty() ? config.fallbackUrl : config.baseUrl;
        return std::shared_ptr<ILlmProvider>(
            std::make_shared<OllamaProvider>(std::move(http), std::move(opts)));
    }

    return Error{ErrorCode::InvalidArgument,
                 fmt::format("Unknown LLM provider: {}", config.provider)};
}

Result<std::shared_ptr<ILlmProvider>> createLlmProvider(const config::LlmConfig& config,
                                                        std::shared_ptr<net::IHttpClient> http) {
    auto primary = createPrimaryLlmProvider(config, http);
    if (!primary)
        return primary.error();

    if (!config.fallbackEnabled || config::toLower(config.provider) == "ollama") {
        return primary;
    }

    auto factory = [http, config]() -> std::shared_ptr<ILlmProvider> {
        OllamaProvider::Options opts;
        opts.baseUrl = config.fallbackUrl;
        opts.model = config.fallbackModel;
        opts.temperature = config.temperature;
        opts.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config.timeout);
        return std::make_shared<OllamaProvider>(http, std::move(opts));
    };
    spdlog::debug("[LLM] {} with fallback ollama/{} at {}", config.provider, config.fallbackModel,
                  config.fallbackUrl);
    return std::shared_ptr<ILlmProvider>(
        std::make_shared<FallbackLlmProvider>(primary.value(), std::move(factory), true));
}

} // namespace omc::llm
