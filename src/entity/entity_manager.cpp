#include <omc/config/config_helpers.h>
#include <omc/core/ids.h>
#include <omc/entity/entity_manager.h>
#include <omc/store/json_fields.h>

#include <spdlog/spdlog.h>

#include <array>
#include <mutex>
#include <utility>

namespace omc::entity {

using nlohmann::json;

namespace {

constexpr std::array<std::pair<EntityType, const char*>, 12> kEntityTypeNames{{
    {EntityType::Person, "person"},
    {EntityType::Organization, "organization"},
    {EntityType::Location, "location"},
    {EntityType::Technology, "technology"},
    {EntityType::Concept, "concept"},
    {EntityType::Event, "event"},
    {EntityType::Product, "product"},
    {EntityType::System, "system"},
    {EntityType::Component, "component"},
    {EntityType::Resource, "resource"},
    {EntityType::Process, "process"},
    {EntityType::Custom, "custom"},
}};

std::vector<Entity> parseEntityList(const json& payload) {
    std::vector<Entity> out;
    const auto& list = store::unwrap(payload, "entities");
    if (!list.is_array())
        return out;
    for (const auto& item : list) {
        auto e = item.get<Entity>();
        if (!e.entity_id.empty())
            out.push_back(std::move(e));
    }
    return out;
}

} // namespace

const char* toString(EntityType type) {
    for (const auto& [t, name] : kEntityTypeNames) {
        if (t == type)
            return name;
    }
    return "custom";
}

EntityType parseEntityType(std::string_view name) {
    auto lowered = config::toLower(config::trimmed(name));
    for (const auto& [t, n] : kEntityTypeNames) {
        if (lowered == n)
            return t;
    }
    return EntityType::Custom;
}

std::string normalizeEntityName(std::string_view name) {
    return config::toLower(config::trimmed(name));
}

void to_json(json& j, const Entity& e) {
    j = json{{"entity_id", e.entity_id},
             {"name", e.name},
             {"entity_type", e.type_name.empty() ? toString(e.entity_type) : e.type_name},
             {"properties", e.properties.dump()},
             {"aliases", json(e.aliases).dump()}};
}

void from_json(const json& j, Entity& e) {
    e.entity_id = store::jsonString(j, "entity_id");
    e.name = store::jsonString(j, "name");
    e.type_name = store::jsonString(j, "entity_type", "custom");
    e.entity_type = parseEntityType(e.type_name);
    e.properties = json::object();
    e.aliases.clear();

    if (auto it = j.find("properties"); it != j.end()) {
        if (it->is_object()) {
            e.properties = *it;
        } else if (it->is_string()) {
            auto parsed = json::parse(it->get<std::string>(), nullptr, false);
            if (!parsed.is_discarded() && parsed.is_object())
                e.properties = std::move(parsed);
        }
    }
    if (auto it = j.find("aliases"); it != j.end()) {
        json list = *it;
        if (it->is_string())
            list = json::parse(it->get<std::string>(), nullptr, false);
        if (list.is_array()) {
            for (const auto& a : list) {
                if (a.is_string())
                    e.aliases.push_back(a.get<std::string>());
            }
        }
    }
}

EntityManager::EntityManager(std::shared_ptr<store::StoreClient> store, size_t cacheSize)
    : store_(std::move(store)), cache_(cacheSize) {}

void EntityManager::remember(const Entity& entity) {
    cache_.put(entity.entity_id, entity);
    std::unique_lock lock(indexMutex_);
    nameIndex_[normalizeEntityName(entity.name)] = entity.entity_id;
}

std::optional<Entity> EntityManager::lookupByName(const std::string& key) {
    std::string id;
    {
        std::shared_lock lock(indexMutex_);
        auto it = nameIndex_.find(key);
        if (it == nameIndex_.end())
            return std::nullopt;
        id = it->second;
    }
    return cache_.get(id);
}

Result<Entity> EntityManager::getOrCreate(const std::string& name, const std::string& entityType,
                                          json properties) {
    const auto key = normalizeEntityName(name);
    if (key.empty())
        return Error{ErrorCode::ValidationError, "Entity name cannot be empty"};

    if (auto cached = lookupByName(key))
        return *cached;

    auto existing = store_->execute("getEntityByName", {{"name", config::trimmed(name)}});
    if (existing) {
        auto entity = store::unwrap(existing.value(), "entity").get<Entity>();
        if (!entity.entity_id.empty()) {
            remember(entity);
            return entity;
        }
    } else if (existing.error().code != ErrorCode::NotFound) {
        spdlog::warn("[EntityManager] lookup of '{}' failed: {}", name, existing.error().message);
    }

    Entity entity;
    entity.entity_id = core::generateEntityId();
    entity.name = config::trimmed(name);
    entity.entity_type = parseEntityType(entityType);
    entity.type_name = entity.entity_type == EntityType::Custom ? config::toLower(entityType)
                                                                : toString(entity.entity_type);
    entity.properties = properties.is_object() ? std::move(properties) : json::object();

    auto created = store_->executeAck("createEntity", json(entity));
    if (!created) {
        spdlog::warn("[EntityManager] failed to persist entity {}: {}, caching only",
                     entity.name, created.error().message);
    } else {
        spdlog::debug("[EntityManager] created entity {} ({})", entity.name, entity.entity_id);
    }
    remember(entity);
    return entity;
}

std::optional<Entity> EntityManager::getEntity(const std::string& entityId) {
    if (auto cached = cache_.get(entityId))
        return cached;
    auto res = store_->execute("getEntity", {{"entity_id", entityId}});
    if (!res) {
        if (res.error().code != ErrorCode::NotFound)
            spdlog::warn("[EntityManager] getEntity {} failed: {}", entityId, res.error().message);
        return std::nullopt;
    }
    auto entity = store::unwrap(res.value(), "entity").get<Entity>();
    if (entity.entity_id.empty())
        return std::nullopt;
    remember(entity);
    return entity;
}

Result<std::vector<Entity>> EntityManager::searchEntities(const std::string& query,
                                                          size_t limit) {
    auto res = store_->execute("searchEntities", {{"query", query}, {"limit", limit}});
    if (!res) {
        if (res.error().code == ErrorCode::NotFound)
            return std::vector<Entity>{};
        return res.error();
    }
    auto entities = parseEntityList(res.value());
    if (entities.size() > limit)
        entities.resize(limit);
    return entities;
}

Result<std::vector<Entity>> EntityManager::getEntitiesForMemory(const MemoryId& memoryId) {
    auto res = store_->execute("getMemoryEntities", {{"memory_id", memoryId}});
    if (!res) {
        if (res.error().code == ErrorCode::NotFound)
            return std::vector<Entity>{};
        return res.error();
    }
    return parseEntityList(res.value());
}

Result<void> EntityManager::linkToMemory(const MemoryId& memoryId, const std::string& entityId,
                                         EntityEdgeType edgeType, const EntityLinkParams& params) {
    if (edgeType == EntityEdgeType::Mentions) {
        return store_->executeAck("linkMentionsEntity", {{"memory_id", memoryId},
                                                         {"entity_id", entityId},
                                                         {"salience", params.salience},
                                                         {"sentiment", params.sentiment}});
    }
    return store_->executeAck("linkExtractedEntity", {{"memory_id", memoryId},
                                                      {"entity_id", entityId},
                                                      {"confidence", params.confidence},
                                                      {"method", params.method}});
}

} // namespace omc::entity
