#pragma once

#include <omc/resolution/id_resolver.h>

#include <boost/asio/any_io_executor.hpp>

#include <chrono>
#include <memory>
#include <stop_token>
#include <unordered_map>
#include <utility>
#include <vector>

namespace omc::resolution {

struct BatchResult {
    std::unordered_map<MemoryId, InternalId> resolved;
    std::vector<std::pair<MemoryId, Error>> failed;

    bool isComplete() const { return failed.empty(); }
    size_t successCount() const { return resolved.size(); }
    size_t failureCount() const { return failed.size(); }
};

/**
 * @brief Resolves many ids concurrently with at most `maxParallel` lookups in flight.
 *
 * Ids are deduplicated first. A failed lookup is retried after `retryDelay * 2^attempt`;
 * NotFound is final. With `failFast` the first failure is returned as an error.
 */
class BatchResolver {
public:
    struct Config {
        size_t maxParallel = 100;
        uint32_t retryAttempts = 2;
        std::chrono::milliseconds retryDelay{100};
    };

    BatchResolver(std::shared_ptr<IdResolver> resolver, boost::asio::any_io_executor executor,
                  Config config);
    BatchResolver(std::shared_ptr<IdResolver> resolver, boost::asio::any_io_executor executor)
        : BatchResolver(std::move(resolver), std::move(executor), Config{}) {}

    Result<BatchResult> resolveBatch(const std::vector<MemoryId>& ids, bool failFast = false,
                                     std::stop_token stop = {});

private:
    static Result<InternalId> resolveWithRetry(IdResolver& resolver, const MemoryId& id,
                                               uint32_t retryAttempts,
                                               std::chrono::milliseconds retryDelay,
                                               const std::stop_token& stop);

    std::shared_ptr<IdResolver> resolver_;
    boost::asio::any_io_executor executor_;
    Config config_;
};

} // namespace omc::resolution
