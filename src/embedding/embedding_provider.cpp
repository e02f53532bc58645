#include <omc/embedding/embedding_provider.h>
#include <omc/store/json_fields.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fmt/format.h>

namespace omc::embedding {

using nlohmann::json;

namespace {

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string stripTrailingSlash(std::string url) {
    while (!url.empty() && url.back() == '/')
        url.pop_back();
    return url;
}

Result<json> postJson(net::IHttpClient& http, const char* provider, net::HttpRequest req) {
    auto res = http.post(req);
    if (!res)
        return Error{res.error().code, fmt::format("{}: {}", provider, res.error().message)};
    const auto& resp = res.value();
    if (resp.status >= 400) {
        return Error{ErrorCode::ProviderError,
                     fmt::format("{}: HTTP {}: {}", provider, resp.status, resp.body)};
    }
    auto parsed = json::parse(resp.body, nullptr, false);
    if (parsed.is_discarded()) {
        return Error{ErrorCode::ProviderError,
                     fmt::format("{}: response is not valid JSON", provider)};
    }
    return parsed;
}

} // namespace

OllamaEmbeddingProvider::OllamaEmbeddingProvider(std::shared_ptr<net::IHttpClient> http,
                                                 std::string url, std::string model,
                                                 std::chrono::milliseconds timeout)
    : http_(std::move(http)), url_(stripTrailingSlash(std::move(url))), model_(std::move(model)),
      timeout_(timeout) {}

Result<Embedding> OllamaEmbeddingProvider::embed(const std::string& text) {
    if (isBlank(text))
        return Error{ErrorCode::InvalidArgument, "Empty text"};

    net::HttpRequest req;
    req.url = url_ + "/api/embeddings";
    req.body = json{{"model", model_}, {"prompt", text}}.dump();
    req.timeout = timeout_;

    auto res = postJson(*http_, "ollama", std::move(req));
    if (!res)
        return res.error();

    auto vec = store::jsonVector(res.value(), "embedding");
    if (!vec)
        return Error{ErrorCode::ProviderError, "ollama: response has no embedding"};
    return std::move(*vec);
}

OpenAiEmbeddingProvider::OpenAiEmbeddingProvider(std::shared_ptr<net::IHttpClient> http,
                                                 std::string baseUrl, std::string model,
                                                 std::string apiKey,
                                                 std::chrono::milliseconds timeout)
    : http_(std::move(http)), baseUrl_(stripTrailingSlash(std::move(baseUrl))),
      model_(std::move(model)), apiKey_(std::move(apiKey)), timeout_(timeout) {}

Result<Embedding> OpenAiEmbeddingProvider::embed(const std::string& text) {
    if (isBlank(text))
        return Error{ErrorCode::InvalidArgument, "Empty text"};

    net::HttpRequest req;
    req.url = baseUrl_ + "/embeddings";
    req.body = json{{"model", model_}, {"input", text}}.dump();
    req.timeout = timeout_;
    if (!apiKey_.empty())
        req.headers.push_back({"Authorization", "Bearer " + apiKey_});

    auto res = postJson(*http_, "openai", std::move(req));
    if (!res)
        return res.error();

    const auto& j = res.value();
    auto data = j.find("data");
    if (data == j.end() || !data->is_array() || data->empty())
        return Error{ErrorCode::ProviderError, "openai: response has no data"};
    auto vec = store::jsonVector((*data)[0], "embedding");
    if (!vec)
        return Error{ErrorCode::ProviderError, "openai: response has no embedding"};
    return std::move(*vec);
}

} // namespace omc::embedding
