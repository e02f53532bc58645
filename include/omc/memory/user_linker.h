#pragma once

#include <omc/core/types.h>
#include <omc/store/store_client.h>

#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

namespace omc::memory {

// Lazily creates users and writes OWNS edges.
class UserLinker {
public:
    explicit UserLinker(std::shared_ptr<store::StoreClient> store);

    // true when the user was created by this call
    Result<bool> ensureUserExists(const std::string& userId, const std::string& name = {});

    Result<void> linkMemoryToUser(const std::string& userId, const MemoryId& memoryId,
                                  const std::string& context = "created");

private:
    std::shared_ptr<store::StoreClient> store_;
    std::mutex mutex_;
    std::unordered_set<std::string> knownUsers_;
};

} // namespace omc::memory
