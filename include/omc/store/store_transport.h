#pragma once

#include <omc/core/types.h>
#include <omc/net/http_client.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace omc::store {

/**
 * @brief One round trip to the backing store: a named query with a JSON object of params.
 *
 * Implementations report a logical miss as ErrorCode::NotFound (or any error whose message
 * contains "not found", "No value" or "couldn't find"); StoreClient classifies both the same way.
 */
class IStoreTransport {
public:
    virtual ~IStoreTransport() = default;

    virtual Result<nlohmann::json> call(const std::string& query,
                                        const nlohmann::json& params) = 0;
};

/**
 * @brief HelixDB-style HTTP transport: POST http://{host}:{port}/{query} with a JSON body.
 */
class HttpStoreTransport final : public IStoreTransport {
public:
    HttpStoreTransport(std::shared_ptr<net::IHttpClient> http, std::string baseUrl,
                       std::chrono::milliseconds timeout = std::chrono::seconds(30));

    Result<nlohmann::json> call(const std::string& query, const nlohmann::json& params) override;

    const std::string& baseUrl() const { return baseUrl_; }

private:
    std::shared_ptr<net::IHttpClient> http_;
    std::string baseUrl_;
    std::chrono::milliseconds timeout_;
};

} // namespace omc::store
