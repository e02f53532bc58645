#include <omc/store/store_transport.h>

#include <spdlog/spdlog.h>

#include <fmt/format.h>

namespace omc::store {

HttpStoreTransport::HttpStoreTransport(std::shared_ptr<net::IHttpClient> http,
                                       std::string baseUrl, std::chrono::milliseconds timeout)
    : http_(std::move(http)), baseUrl_(std::move(baseUrl)), timeout_(timeout) {
    while (!baseUrl_.empty() && baseUrl_.back() == '/')
        baseUrl_.pop_back();
}

Result<nlohmann::json> HttpStoreTransport::call(const std::string& query,
                                                const nlohmann::json& params) {
    net::HttpRequest req;
    req.url = baseUrl_ + "/" + query;
    req.body = params.dump();
    req.timeout = timeout_;

    auto res = http_->post(req);
    if (!res)
        return res.error();

    const auto& resp = res.value();
    if (resp.status == 404) {
        return Error{ErrorCode::NotFound,
                     fmt::format("{}: not found (HTTP 404) {}", query, resp.body)};
    }
    if (resp.status >= 400) {
        return Error{ErrorCode::DatabaseError,
                     fmt::format("{}: HTTP {}: {}", query, resp.status, resp.body)};
    }
    if (resp.body.empty()) {
        return nlohmann::json::object();
    }

    auto parsed = nlohmann::json::parse(resp.body, nullptr, false);
    if (parsed.is_discarded()) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("{}: response is not valid JSON", query)};
    }
    return parsed;
}

} // namespace omc::store
