#include <omc/config/config_helpers.h>
#include <omc/core/ids.h>
#include <omc/core/time_utils.h>
#include <omc/memory/context_manager.h>
#include <omc/store/json_fields.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>

namespace omc::memory {

using nlohmann::json;

void to_json(json& j, const Context& c) {
    j = json{{"context_id", c.context_id},
             {"name", c.name},
             {"properties", c.properties.dump()},
             {"created_at", c.created_at}};
}

void from_json(const json& j, Context& c) {
    c.context_id = store::jsonString(j, "context_id");
    c.name = store::jsonString(j, "name");
    c.created_at = store::jsonString(j, "created_at");
    c.properties = json::object();
    if (auto it = j.find("properties"); it != j.end()) {
        if (it->is_object()) {
            c.properties = *it;
        } else if (it->is_string()) {
            auto parsed = json::parse(it->get<std::string>(), nullptr, false);
            if (!parsed.is_discarded() && parsed.is_object())
                c.properties = std::move(parsed);
        }
    }
}

ContextManager::ContextManager(std::shared_ptr<store::StoreClient> store, size_t cacheSize)
    : store_(std::move(store)), maxEntries_(cacheSize == 0 ? 1 : cacheSize) {
    spdlog::debug("ContextManager initialized (cache_size={})", maxEntries_);
}

void ContextManager::addToCache(const Context& context) {
    std::unique_lock lock(mutex_);
    if (!cache_.count(context.context_id) && cache_.size() >= maxEntries_) {
        auto oldest = std::min_element(cache_.begin(), cache_.end(), [](const auto& a, const auto& b) {
            return a.second.created_at < b.second.created_at;
        });
        if (oldest != cache_.end())
            cache_.erase(oldest);
    }
    cache_[context.context_id] = context;
}

size_t ContextManager::warmUp(const std::optional<std::string>& userId, size_t limit) {
    if (warmedUp_)
        return cacheSize();

    json params = {{"limit", limit}};
    if (userId)
        params["user_id"] = *userId;

    auto res = store_->execute("getRecentContexts", params);
    if (!res) {
        spdlog::warn("Context cache warm-up failed: {}, continuing with empty cache",
                     res.error().message);
        return 0;
    }
    const auto& list = store::unwrap(res.value(), "contexts");
    if (list.is_array()) {
        for (const auto& item : list) {
            auto ctx = item.get<Context>();
            if (!ctx.context_id.empty())
                addToCache(ctx);
        }
    }
    warmedUp_ = true;
    auto count = cacheSize();
    spdlog::info("Context cache warm-up complete: {} contexts loaded", count);
    return count;
}

Result<Context> ContextManager::createContext(const std::string& name, json properties) {
    if (config::trimmed(name).empty())
        return Error{ErrorCode::ValidationError, "Context name cannot be empty"};

    Context ctx;
    ctx.context_id = core::generateContextId();
    ctx.name = name;
    ctx.properties = properties.is_object() ? std::move(properties) : json::object();
    ctx.created_at = core::nowTimestamp();

    auto res = store_->execute("addContext", json(ctx));
    if (!res) {
        spdlog::warn("Failed to persist context {}: {}, adding to cache only", ctx.name,
                     res.error().message);
    } else {
        spdlog::info("Created context: {} ({})", ctx.name, ctx.context_id);
    }
    addToCache(ctx);
    return ctx;
}

std::optional<Context> ContextManager::getContext(const std::string& contextId) {
    {
        std::shared_lock lock(mutex_);
        if (auto it = cache_.find(contextId); it != cache_.end())
            return it->second;
    }
    auto res = store_->execute("getContext", {{"context_id", contextId}});
    if (!res) {
        if (res.error().code != ErrorCode::NotFound)
            spdlog::warn("Failed to query context {}: {}", contextId, res.error().message);
        return std::nullopt;
    }
    auto ctx = store::unwrap(res.value(), "context").get<Context>();
    if (ctx.context_id.empty())
        return std::nullopt;
    addToCache(ctx);
    return ctx;
}

std::optional<Context> ContextManager::getContextByName(const std::string& name) {
    const auto wanted = config::toLower(name);
    {
        std::shared_lock lock(mutex_);
        for (const auto& [_, ctx] : cache_) {
            if (config::toLower(ctx.name) == wanted)
                return ctx;
        }
    }
    auto res = store_->execute("getContextByName", {{"name", name}});
    if (!res)
        return std::nullopt;
    auto ctx = store::unwrap(res.value(), "context").get<Context>();
    if (ctx.context_id.empty())
        return std::nullopt;
    addToCache(ctx);
    return ctx;
}

Result<void> ContextManager::linkMemoryToContext(const MemoryId& memoryId,
                                                 const std::string& contextId, int priority) {
    if (priority < 0 || priority > 100) {
        return Error{ErrorCode::ValidationError,
                     "Priority must be between 0 and 100, got " + std::to_string(priority)};
    }
    auto res = store_->executeAck(
        "linkMemoryToContext",
        {{"memory_id", memoryId}, {"context_id", contextId}, {"priority", priority}});
    if (!res) {
        spdlog::warn("Failed to link memory to context: {}", res.error().message);
        return res;
    }
    spdlog::debug("Linked memory {} to context {}", memoryId, contextId);
    return {};
}

void ContextManager::activateContext(const std::string& userId, const std::string& contextId) {
    std::unique_lock lock(mutex_);
    auto& list = active_[userId];
    if (std::find(list.begin(), list.end(), contextId) == list.end())
        list.push_back(contextId);
}

void ContextManager::deactivateContext(const std::string& userId, const std::string& contextId) {
    std::unique_lock lock(mutex_);
    auto it = active_.find(userId);
    if (it == active_.end())
        return;
    auto& list = it->second;
    list.erase(std::remove(list.begin(), list.end(), contextId), list.end());
}

std::vector<std::string> ContextManager::activeContexts(const std::string& userId) const {
    std::shared_lock lock(mutex_);
    auto it = active_.find(userId);
    return it == active_.end() ? std::vector<std::string>{} : it->second;
}

size_t ContextManager::cacheSize() const {
    std::shared_lock lock(mutex_);
    return cache_.size();
}

} // namespace omc::memory
