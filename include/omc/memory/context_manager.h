#pragma once

#include <omc/core/types.h>
#include <omc/store/store_client.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace omc::memory {

struct Context {
    std::string context_id; ///< "ctx_" + 12 hex
    std::string name;
    nlohmann::json properties = nlohmann::json::object();
    std::string created_at;
};

void to_json(nlohmann::json& j, const Context& c);
void from_json(const nlohmann::json& j, Context& c);

/**
 * @brief Named situational contexts (IN_CONTEXT edges) with a bounded read-through cache.
 *
 * A context whose store write fails is still cached and returned.
 */
class ContextManager {
public:
    explicit ContextManager(std::shared_ptr<store::StoreClient> store, size_t cacheSize = 100);

    // Loads recent contexts once; later calls return the cache size
    size_t warmUp(const std::optional<std::string>& userId = std::nullopt, size_t limit = 50);

    Result<Context> createContext(const std::string& name,
                                  nlohmann::json properties = nlohmann::json::object());

    // nullopt when neither cache nor store knows the id
    std::optional<Context> getContext(const std::string& contextId);
    std::optional<Context> getContextByName(const std::string& name);

    // Priority must be 0..100 (ValidationError). Store failures are returned as errors.
    Result<void> linkMemoryToContext(const MemoryId& memoryId, const std::string& contextId,
                                     int priority = 50);

    void activateContext(const std::string& userId, const std::string& contextId);
    void deactivateContext(const std::string& userId, const std::string& contextId);
    std::vector<std::string> activeContexts(const std::string& userId) const;

    size_t cacheSize() const;

private:
    void addToCache(const Context& context);

    std::shared_ptr<store::StoreClient> store_;
    size_t maxEntries_;
    bool warmedUp_ = false;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Context> cache_;
    std::unordered_map<std::string, std::vector<std::string>> active_;
};

} // namespace omc::memory
