#include <omc/resolution/id_resolver.h>
#include <omc/store/json_fields.h>

#include <spdlog/spdlog.h>

namespace omc::resolution {

IdResolver::IdResolver(std::shared_ptr<store::StoreClient> store, Config config)
    : store_(std::move(store)), cache_(config.maxEntries, config.ttl) {
    spdlog::debug("IdResolver initialized: max_size={}, ttl={}ms", config.maxEntries,
                  config.ttl.count());
}

Result<InternalId> IdResolver::resolve(const MemoryId& memoryId) {
    if (memoryId.empty()) {
        return Error{ErrorCode::InvalidArgument, "memory_id is empty"};
    }
    if (auto cached = cache_.get(memoryId)) {
        return std::move(*cached);
    }

    auto res = store_->executeNoRetry("getMemory", {{"memory_id", memoryId}});
    if (!res) {
        if (res.error().code == ErrorCode::NotFound) {
            return Error{ErrorCode::NotFound, "Memory not found: " + memoryId};
        }
        return res.error();
    }

    const auto& body = store::unwrap(res.value(), "memory");
    auto internalId = store::jsonString(body, "id");
    if (internalId.empty()) {
        return Error{ErrorCode::MissingInternalId, "getMemory returned no id for " + memoryId};
    }

    cache_.put(memoryId, internalId);
    return internalId;
}

std::unordered_map<MemoryId, InternalId>
IdResolver::resolveMany(const std::vector<MemoryId>& ids) {
    std::unordered_map<MemoryId, InternalId> out;
    for (const auto& id : ids) {
        if (out.count(id))
            continue;
        auto res = resolve(id);
        if (res) {
            out.emplace(id, std::move(res).value());
        } else {
            spdlog::debug("[IdResolver] {} unresolved: {}", id, res.error().message);
        }
    }
    return out;
}

void IdResolver::remember(const MemoryId& memoryId, const InternalId& internalId) {
    if (!memoryId.empty() && !internalId.empty())
        cache_.put(memoryId, internalId);
}

void IdResolver::invalidate(const MemoryId& memoryId) {
    cache_.invalidate(memoryId);
}

void IdResolver::clear() {
    cache_.clear();
}

} // namespace omc::resolution
