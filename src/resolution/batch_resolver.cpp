#include <omc/core/executor.h>
#include <omc/resolution/batch_resolver.h>

#include <spdlog/spdlog.h>

#include <future>
#include <semaphore>
#include <thread>
#include <unordered_set>
#include <fmt/format.h>

namespace omc::resolution {

namespace {
using Semaphore = std::counting_semaphore<>;
}

BatchResolver::BatchResolver(std::shared_ptr<IdResolver> resolver,
                             boost::asio::any_io_executor executor, Config config)
    : resolver_(std::move(resolver)), executor_(std::move(executor)), config_(config) {
    if (config_.maxParallel == 0)
        config_.maxParallel = 1;
    spdlog::debug("BatchResolver initialized: max_parallel={}, retries={}", config_.maxParallel,
                  config_.retryAttempts);
}

Result<InternalId> BatchResolver::resolveWithRetry(IdResolver& resolver, const MemoryId& id,
                                                   uint32_t retryAttempts,
                                                   std::chrono::milliseconds retryDelay,
                                                   const std::stop_token& stop) {
    Result<InternalId> last = Error{ErrorCode::Unknown, "not attempted"};
    for (uint32_t attempt = 0; attempt <= retryAttempts; ++attempt) {
        if (stop.stop_requested()) {
            return Error{ErrorCode::OperationCancelled, "batch resolve cancelled"};
        }
        last = resolver.resolve(id);
        if (last || last.error().code == ErrorCode::NotFound) {
            return last;
        }
        if (attempt < retryAttempts) {
            std::this_thread::sleep_for(retryDelay * (1 << attempt));
        }
    }
    return last;
}

Result<BatchResult> BatchResolver::resolveBatch(const std::vector<MemoryId>& ids, bool failFast,
                                                std::stop_token stop) {
    std::vector<MemoryId> unique;
    {
        std::unordered_set<MemoryId> seen;
        for (const auto& id : ids) {
            if (seen.insert(id).second)
                unique.push_back(id);
        }
    }
    spdlog::debug("Batch resolve started: {} IDs ({} unique), fail_fast={}", ids.size(),
                  unique.size(), failFast);

    BatchResult result;
    if (unique.empty())
        return result;

    auto semaphore = std::make_shared<Semaphore>(static_cast<std::ptrdiff_t>(config_.maxParallel));
    std::vector<std::pair<MemoryId, std::future<Result<InternalId>>>> pending;
    pending.reserve(unique.size());

    for (const auto& id : unique) {
        if (stop.stop_requested()) {
            result.failed.emplace_back(id, Error{ErrorCode::OperationCancelled,
                                                 "batch resolve cancelled"});
            continue;
        }
        semaphore->acquire();
        auto resolver = resolver_;
        auto attempts = config_.retryAttempts;
        auto delay = config_.retryDelay;
        pending.emplace_back(
            id, core::submit(executor_, [resolver, semaphore, id, attempts, delay, stop]() {
                auto r = resolveWithRetry(*resolver, id, attempts, delay, stop);
                semaphore->release();
                return r;
            }));
    }

    for (auto& [id, fut] : pending) {
        auto r = fut.get();
        if (r) {
            result.resolved.emplace(id, std::move(r).value());
        } else {
            result.failed.emplace_back(id, r.error());
        }
    }

    if (failFast && !result.failed.empty()) {
        const auto& [id, err] = result.failed.front();
        return Error{ErrorCode::PartialFailure,
                     fmt::format("Failed to resolve {}: {}", id, err.message)};
    }

    spdlog::debug("Batch resolve finished: {} resolved, {} failed", result.successCount(),
                  result.failureCount());
    return result;
}

} // namespace omc::resolution
