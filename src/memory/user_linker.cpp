#include <omc/memory/user_linker.h>

#include <spdlog/spdlog.h>

namespace omc::memory {

UserLinker::UserLinker(std::shared_ptr<store::StoreClient> store) : store_(std::move(store)) {}

Result<bool> UserLinker::ensureUserExists(const std::string& userId, const std::string& name) {
    if (userId.empty())
        return Error{ErrorCode::ValidationError, "user_id is empty"};

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (knownUsers_.count(userId))
            return false;
    }

    auto existing = store_->executeNoRetry("getUser", {{"user_id", userId}});
    if (existing) {
        std::lock_guard<std::mutex> lock(mutex_);
        knownUsers_.insert(userId);
        return false;
    }
    if (existing.error().code != ErrorCode::NotFound)
        return existing.error();

    auto created =
        store_->execute("addUser", {{"user_id", userId}, {"name", name.empty() ? userId : name}});
    if (!created)
        return created.error();

    spdlog::debug("Created user {}", userId);
    std::lock_guard<std::mutex> lock(mutex_);
    knownUsers_.insert(userId);
    return true;
}

Result<void> UserLinker::linkMemoryToUser(const std::string& userId, const MemoryId& memoryId,
                                          const std::string& context) {
    return store_->executeAck("linkUserToMemory",
                              {{"user_id", userId}, {"memory_id", memoryId}, {"context", context}});
}

} // namespace omc::memory
