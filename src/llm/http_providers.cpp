#include <omc/llm/http_providers.h>
#include <omc/store/json_fields.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fmt/format.h>

namespace omc::llm {

using nlohmann::json;

namespace {

std::string stripTrailingSlash(std::string url) {
    while (!url.empty() && url.back() == '/')
        url.pop_back();
    return url;
}

json chatMessages(const std::string& systemPrompt, const std::string& userPrompt) {
    json messages = json::array();
    if (!systemPrompt.empty())
        messages.push_back({{"role", "system"}, {"content", systemPrompt}});
    messages.push_back({{"role", "user"}, {"content", userPrompt}});
    return messages;
}

Error providerError(const std::string& provider, const std::string& what) {
    return Error{ErrorCode::ProviderError, fmt::format("{}: {}", provider, what)};
}

Result<json> postJson(net::IHttpClient& http, const std::string& provider, net::HttpRequest req) {
    auto res = http.post(req);
    if (!res) {
        return Error{res.error().code, fmt::format("{}: {}", provider, res.error().message)};
    }
    const auto& resp = res.value();
    if (resp.status >= 400) {
        return providerError(provider, fmt::format("HTTP {}: {}", resp.status, resp.body));
    }
    auto parsed = json::parse(resp.body, nullptr, false);
    if (parsed.is_discarded()) {
        return providerError(provider, "response is not valid JSON");
    }
    return parsed;
}

} // namespace

OpenAiCompatibleProvider::OpenAiCompatibleProvider(std::shared_ptr<net::IHttpClient> http,
                                                   Options options)
    : http_(std::move(http)), options_(std::move(options)) {
    options_.baseUrl = stripTrailingSlash(options_.baseUrl);
}

Result<LlmResponse>
OpenAiCompatibleProvider::generate(const std::string& systemPrompt, const std::string& userPrompt,
                                   const std::optional<std::string>& responseFormat) {
    json body = {{"model", options_.model},
                 {"messages", chatMessages(systemPrompt, userPrompt)},
                 {"temperature", options_.temperature}};
    if (responseFormat)
        body["response_format"] = {{"type", *responseFormat}};

    net::HttpRequest req;
    req.url = options_.baseUrl + "/chat/completions";
    req.body = body.dump();
    req.timeout = options_.timeout;
    if (!options_.apiKey.empty())
        req.headers.push_back({"Authorization", "Bearer " + options_.apiKey});

    auto res = postJson(*http_, options_.name, std::move(req));
    if (!res)
        return res.error();
    const auto& j = res.value();

    auto choices = j.find("choices");
    if (choices == j.end() || !choices->is_array() || choices->empty()) {
        return providerError(options_.name, "response has no choices");
    }
    const auto& message = (*choices)[0].value("message", json::object());
    auto content = store::jsonString(message, "content");
    if (content.empty()) {
        return providerError(options_.name, "empty completion");
    }

    LlmResponse out;
    out.text = std::move(content);
    out.metadata.provider = options_.name;
    out.metadata.model = store::jsonString(j, "model", options_.model);
    out.metadata.baseUrl = options_.baseUrl;
    if (auto usage = j.find("usage"); usage != j.end() && usage->is_object()) {
        out.metadata.tokensPrompt = store::jsonInt(*usage, "prompt_tokens");
        out.metadata.tokensCompletion = store::jsonInt(*usage, "completion_tokens");
        out.metadata.tokensTotal = store::jsonInt(*usage, "total_tokens");
    }
    return out;
}

OllamaProvider::OllamaProvider(std::shared_ptr<net::IHttpClient> http, Options options)
    : http_(std::move(http)), options_(std::move(options)) {
    options_.baseUrl = stripTrailingSlash(options_.baseUrl);
}

Result<LlmResponse> OllamaProvider::generate(const std::string& systemPrompt,
                                             const std::string& userPrompt,
                                             const std::optional<std::string>& responseFormat) {
    json body = {{"model", options_.model},
                 {"messages", chatMessages(systemPrompt, userPrompt)},
                 {"stream", false},
                 {"options", {{"temperature", options_.temperature}}}};
    if (responseFormat && *responseFormat == "json_object")
        body["format"] = "json";

    net::HttpRequest req;
    req.url = options_.baseUrl + "/api/chat";
    req.body = body.dump();
    req.timeout = options_.timeout;

    auto res = postJson(*http_, "ollama", std::move(req));
    if (!res)
        return res.error();
    const auto& j = res.value();

    const auto& message = j.value("message", json::object());
    auto content = store::jsonString(message, "content");
    if (content.empty()) {
        return providerError("ollama", "empty completion");
    }

    LlmResponse out;
    out.text = std::move(content);
    out.metadata.provider = "ollama";
    out.metadata.model = options_.model;
    out.metadata.baseUrl = options_.baseUrl;
    if (j.contains("prompt_eval_count"))
        out.metadata.tokensPrompt = store::jsonInt(j, "prompt_eval_count");
    if (j.contains("eval_count"))
        out.metadata.tokensCompletion = store::jsonInt(j, "eval_count");
    if (out.metadata.tokensPrompt && out.metadata.tokensCompletion)
        out.metadata.tokensTotal = *out.metadata.tokensPrompt + *out.metadata.tokensCompletion;
    return out;
}

} // namespace omc::llm
