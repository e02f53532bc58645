#include <omc/store/store_client.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

namespace omc::store {

bool isNotFoundMessage(std::string_view message) {
    return message.find("not found") != std::string_view::npos ||
           message.find("No value") != std::string_view::npos ||
           message.find("couldn't find") != std::string_view::npos;
}

StoreClient::StoreClient(std::shared_ptr<IStoreTransport> transport, RetryPolicy policy)
    : transport_(std::move(transport)), policy_(policy) {
    if (policy_.maxRetries == 0)
        policy_.maxRetries = 1;
}

Result<nlohmann::json> StoreClient::attempt(const std::string& query,
                                            const nlohmann::json& params) {
    auto res = transport_->call(query, params);
    if (res)
        return res;
    const auto& err = res.error();
    if (err.code == ErrorCode::NotFound || isNotFoundMessage(err.message)) {
        notFound_.fetch_add(1, std::memory_order_relaxed);
        return Error{ErrorCode::NotFound, err.message};
    }
    return err;
}

Result<nlohmann::json> StoreClient::execute(const std::string& query,
                                            const nlohmann::json& params) {
    calls_.fetch_add(1, std::memory_order_relaxed);
    auto delay = policy_.initialDelay;
    Error last{ErrorCode::Unknown, "no attempt made"};

    for (uint32_t attemptNo = 0; attemptNo < policy_.maxRetries; ++attemptNo) {
        auto res = attempt(query, params);
        if (res)
            return res;
        if (res.error().code == ErrorCode::NotFound)
            return res.error();

        last = res.error();
        if (attemptNo + 1 < policy_.maxRetries) {
            retries_.fetch_add(1, std::memory_order_relaxed);
            spdlog::debug("[StoreClient] {} attempt {}/{} failed: {}; retrying in {}ms", query,
                          attemptNo + 1, policy_.maxRetries, last.message, delay.count());
            std::this_thread::sleep_for(delay);
            delay = std::min(delay * 2, policy_.maxDelay);
        }
    }

    failures_.fetch_add(1, std::memory_order_relaxed);
    spdlog::warn("[StoreClient] {} failed after {} attempts: {}", query, policy_.maxRetries,
                 last.message);
    return last;
}

Result<nlohmann::json> StoreClient::executeNoRetry(const std::string& query,
                                                   const nlohmann::json& params) {
    calls_.fetch_add(1, std::memory_order_relaxed);
    auto res = attempt(query, params);
    if (!res && res.error().code != ErrorCode::NotFound)
        failures_.fetch_add(1, std::memory_order_relaxed);
    return res;
}

Result<void> StoreClient::executeAck(const std::string& query, const nlohmann::json& params) {
    auto res = execute(query, params);
    if (!res)
        return res.error();
    return {};
}

bool StoreClient::healthCheck() {
    auto res = executeNoRetry("health", nlohmann::json::object());
    if (res)
        return true;
    if (res.error().code == ErrorCode::NotFound) {
        spdlog::debug("[StoreClient] health query not defined, but the store answered");
        return true;
    }
    spdlog::warn("[StoreClient] health check failed: {}", res.error().message);
    return false;
}

StoreClient::Stats StoreClient::stats() const {
    Stats s;
    s.calls = calls_.load(std::memory_order_relaxed);
    s.retries = retries_.load(std::memory_order_relaxed);
    s.failures = failures_.load(std::memory_order_relaxed);
    s.notFound = notFound_.load(std::memory_order_relaxed);
    return s;
}

} // namespace omc::store
