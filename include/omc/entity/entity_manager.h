#pragma once

#include <omc/core/lru_cache.h>
#include <omc/core/types.h>
#include <omc/store/store_client.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace omc::entity {

enum class EntityType {
    Person,
    Organization,
    Location,
    Technology,
    Concept,
    Event,
    Product,
    System,
    Component,
    Resource,
    Process,
    Custom
};

const char* toString(EntityType type);

// Unknown spellings map to Custom
EntityType parseEntityType(std::string_view name);

struct Entity {
    std::string entity_id; ///< "ent_" + 12 hex
    std::string name;
    EntityType entity_type = EntityType::Custom;
    std::string type_name; ///< original spelling, kept for Custom
    nlohmann::json properties = nlohmann::json::object();
    std::vector<std::string> aliases;
};

void to_json(nlohmann::json& j, const Entity& e);
void from_json(const nlohmann::json& j, Entity& e);

enum class EntityEdgeType { ExtractedEntity, Mentions };

struct EntityLinkParams {
    int confidence = 90;
    std::string method = "llm";
    int salience = 50;
    std::string sentiment = "neutral";
};

/// Lowercased, trimmed lookup key
std::string normalizeEntityName(std::string_view name);

/**
 * @brief Canonical entities with a bounded cache and a case-insensitive name index.
 *
 * getOrCreate is idempotent per normalized name. An entity whose creation failed in the
 * store is still cached so later lookups in this process agree.
 */
class EntityManager {
public:
    explicit EntityManager(std::shared_ptr<store::StoreClient> store, size_t cacheSize = 1000);

    Result<Entity> getOrCreate(const std::string& name, const std::string& entityType = "concept",
                               nlohmann::json properties = nlohmann::json::object());

    std::optional<Entity> getEntity(const std::string& entityId);

    Result<std::vector<Entity>> searchEntities(const std::string& query, size_t limit = 10);

    Result<std::vector<Entity>> getEntitiesForMemory(const MemoryId& memoryId);

    Result<void> linkToMemory(const MemoryId& memoryId, const std::string& entityId,
                              EntityEdgeType edgeType, const EntityLinkParams& params = {});

    core::LruCacheStats cacheStats() const { return cache_.stats(); }

private:
    void remember(const Entity& entity);
    std::optional<Entity> lookupByName(const std::string& key);

    std::shared_ptr<store::StoreClient> store_;
    core::LruCache<std::string, Entity> cache_;

    mutable std::shared_mutex indexMutex_;
    std::unordered_map<std::string, std::string> nameIndex_;
};

} // namespace omc::entity
