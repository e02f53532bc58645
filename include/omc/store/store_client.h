#pragma once

#include <omc/core/types.h>
#include <omc/store/store_transport.h>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace omc::store {

struct RetryPolicy {
    uint32_t maxRetries = 3;                          ///< Total attempts per call
    std::chrono::milliseconds initialDelay{100};      ///< First backoff, doubled per retry
    std::chrono::milliseconds maxDelay{10000};        ///< Backoff ceiling
};

/// True when an error message denotes a logical miss rather than a failure.
bool isNotFoundMessage(std::string_view message);

/**
 * @brief Retrying client for named backing-store queries.
 *
 * Connection and store errors are retried with exponential backoff. Logical misses are
 * returned at once as ErrorCode::NotFound and never retried.
 */
class StoreClient {
public:
    struct Stats {
        uint64_t calls = 0;
        uint64_t retries = 0;
        uint64_t failures = 0;
        uint64_t notFound = 0;
    };

    explicit StoreClient(std::shared_ptr<IStoreTransport> transport, RetryPolicy policy = {});

    Result<nlohmann::json> execute(const std::string& query, const nlohmann::json& params);

    // Single attempt with the same not-found classification
    Result<nlohmann::json> executeNoRetry(const std::string& query,
                                          const nlohmann::json& params);

    // Execute and discard the payload
    Result<void> executeAck(const std::string& query, const nlohmann::json& params);

    // Execute and decode with nlohmann get<T>(); decode failures are InvalidData
    template <typename T>
    Result<T> executeAs(const std::string& query, const nlohmann::json& params) {
        auto res = execute(query, params);
        if (!res)
            return res.error();
        try {
            return res.value().template get<T>();
        } catch (const nlohmann::json::exception& e) {
            return Error{ErrorCode::InvalidData,
                         "Failed to decode response of " + query + ": " + e.what()};
        }
    }

    // Probe the "health" query; a not-found answer still proves the store is reachable
    bool healthCheck();

    Stats stats() const;
    const RetryPolicy& retryPolicy() const { return policy_; }

private:
    Result<nlohmann::json> attempt(const std::string& query, const nlohmann::json& params);

    std::shared_ptr<IStoreTransport> transport_;
    RetryPolicy policy_;

    std::atomic<uint64_t> calls_{0};
    std::atomic<uint64_t> retries_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> notFound_{0};
};

} // namespace omc::store
