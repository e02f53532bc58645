#pragma once

#include <omc/config/omc_config.h>
#include <omc/llm/llm_provider.h>
#include <omc/net/http_client.h>

#include <memory>

namespace omc::llm {

/**
 * Build the configured chat provider: cerebras, ollama, openai or openai-compatible.
 * When fallback is enabled the result is wrapped in a FallbackLlmProvider whose fallback is
 * a local Ollama instance. Unknown provider names are InvalidArgument.
 */
Result<std::shared_ptr<ILlmProvider>> createLlmProvider(const config::LlmConfig& config,
                                                        std::shared_ptr<net::IHttpClient> http);

// Provider without the fallback wrapper
Result<std::shared_ptr<ILlmProvider>>
createPrimaryLlmProvider(const config::LlmConfig& config, std::shared_ptr<net::IHttpClient> http);

} // namespace omc::llm
