#include <omc/config/config_helpers.h>
#include <omc/core/ids.h>
#include <omc/core/time_utils.h>
#include <omc/memory/memory_crud.h>
#include <omc/memory/memory_types.h>
#include <omc/store/json_fields.h>

#include <spdlog/spdlog.h>

namespace omc::memory {

using nlohmann::json;

MemoryCrud::MemoryCrud(std::shared_ptr<store::StoreClient> store,
                       std::shared_ptr<resolution::IdResolver> resolver,
                       std::shared_ptr<embedding::EmbeddingGenerator> embedder,
                       std::shared_ptr<UserLinker> users, MemoryDefaults defaults)
    : store_(std::move(store)), resolver_(std::move(resolver)), embedder_(std::move(embedder)),
      users_(std::move(users)), defaults_(defaults) {}

Result<store::MemoryRecord> MemoryCrud::addMemory(const AddMemoryRequest& request) {
    auto content = config::trimmed(request.content);
    if (content.empty())
        return Error{ErrorCode::ValidationError, "memory content is empty"};
    if (request.user_id.empty())
        return Error{ErrorCode::ValidationError, "user_id is empty"};

    int certainty = request.certainty.value_or(defaults_.certainty);
    int importance = request.importance.value_or(defaults_.importance);
    if (certainty < 0 || certainty > 100 || importance < 0 || importance > 100)
        return Error{ErrorCode::ValidationError, "certainty and importance must be in 0..100"};

    if (!parseMemoryType(request.memory_type)) {
        spdlog::warn("Unknown memory type '{}', storing as fact", request.memory_type);
    }

    store::MemoryRecord record;
    record.memory_id = core::generateMemoryId();
    record.content = content;
    record.memory_type = normalizeMemoryType(request.memory_type);
    record.user_id = request.user_id;
    record.certainty = certainty;
    record.importance = importance;
    record.created_at = core::nowTimestamp();
    record.updated_at = record.created_at;
    record.valid_from = record.created_at;
    record.context_tags = request.context_tags;
    record.source = request.source;
    record.metadata = request.metadata;

    auto res = store_->execute("addMemory", json(record));
    if (!res)
        return res.error();

    record.internal_id = store::jsonString(store::unwrap(res.value(), "memory"), "id");
    if (record.internal_id.empty()) {
        return Error{ErrorCode::MissingInternalId,
                     "addMemory returned no internal id for " + record.memory_id};
    }
    resolver_->remember(record.memory_id, record.internal_id);
    spdlog::debug("Created memory {} (internal {})", record.memory_id, record.internal_id);

    std::optional<Embedding> vector = request.vector;
    if (!vector && embedder_) {
        auto generated = embedder_->generate(record.content);
        if (generated) {
            vector = std::move(generated).value();
        } else {
            spdlog::warn("Failed to generate embedding for {}: {}", record.memory_id,
                         generated.error().message);
        }
    }
    if (vector) {
        auto attached = attachEmbedding(record.internal_id, *vector);
        if (!attached)
            spdlog::warn("Failed to create embedding for {}: {}", record.memory_id,
                         attached.error().message);
    }

    if (users_) {
        auto ensured = users_->ensureUserExists(record.user_id);
        if (!ensured)
            spdlog::warn("Failed to create user {}: {}", record.user_id, ensured.error().message);
        auto linked = users_->linkMemoryToUser(record.user_id, record.memory_id);
        if (!linked)
            spdlog::warn("Failed to link memory to user: {}", linked.error().message);
    }

    return record;
}

Result<void> MemoryCrud::attachEmbedding(const InternalId& internalId, const Embedding& vector) {
    return store_->executeAck("addMemoryEmbedding",
                              {{"memory_id", internalId},
                               {"vector_data", vector},
                               {"embedding_model", embedder_ ? embedder_->modelName() : "unknown"},
                               {"created_at", core::nowTimestamp()}});
}

Result<store::MemoryRecord> MemoryCrud::getMemory(const MemoryId& memoryId) {
    auto res = store_->execute("getMemory", {{"memory_id", memoryId}});
    if (!res) {
        if (res.error().code == ErrorCode::NotFound)
            return Error{ErrorCode::NotFound, "Memory not found: " + memoryId};
        return res.error();
    }
    auto record = store::unwrap(res.value(), "memory").get<store::MemoryRecord>();
    if (record.memory_id.empty())
        record.memory_id = memoryId;
    if (!record.internal_id.empty())
        resolver_->remember(record.memory_id, record.internal_id);
    return record;
}

Result<std::vector<store::MemoryRecord>> MemoryCrud::listMemories(const std::string& userId,
                                                                  size_t limit) {
    auto res = store_->execute("getAllMemories", {{"user_id", userId}, {"limit", limit}});
    if (!res)
        return res.error();
    const auto& body = store::unwrap(res.value(), "memories");
    std::vector<store::MemoryRecord> out;
    if (!body.is_array())
        return out;
    for (const auto& item : body) {
        auto rec = item.get<store::MemoryRecord>();
        if (!userId.empty() && rec.user_id != userId)
            continue;
        out.push_back(std::move(rec));
        if (out.size() >= limit)
            break;
    }
    return out;
}

} // namespace omc::memory
