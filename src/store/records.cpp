#include <omc/core/time_utils.h>
#include <omc/store/json_fields.h>
#include <omc/store/records.h>

#include <unordered_set>

namespace omc::store {

using nlohmann::json;

bool MemoryRecord::isExpired(TimePoint now) const {
    if (!valid_until)
        return false;
    auto until = core::parseTimestamp(*valid_until);
    if (!until)
        return false;
    return *until < now;
}

void to_json(json& j, const MemoryRecord& m) {
    j = json{{"memory_id", m.memory_id},     {"content", m.content},
             {"memory_type", m.memory_type}, {"user_id", m.user_id},
             {"certainty", m.certainty},     {"importance", m.importance},
             {"created_at", m.created_at},   {"updated_at", m.updated_at},
             {"valid_from", m.valid_from},   {"immutable", m.immutable},
             {"verified", m.verified},       {"context_tags", m.context_tags},
             {"source", m.source},           {"metadata", m.metadata},
             {"is_deleted", m.is_deleted}};
    if (!m.internal_id.empty())
        j["id"] = m.internal_id;
    j["valid_until"] = m.valid_until ? json(*m.valid_until) : json("");
    if (m.deleted_at)
        j["deleted_at"] = *m.deleted_at;
    if (m.deleted_by)
        j["deleted_by"] = *m.deleted_by;
}

void from_json(const json& j, MemoryRecord& m) {
    m.internal_id = jsonString(j, "id");
    m.memory_id = jsonString(j, "memory_id");
    m.content = jsonString(j, "content");
    m.memory_type = jsonString(j, "memory_type", "fact");
    m.user_id = jsonString(j, "user_id");
    m.certainty = jsonInt(j, "certainty", 80);
    m.importance = jsonInt(j, "importance", 50);
    m.created_at = jsonString(j, "created_at");
    m.updated_at = jsonString(j, "updated_at", m.created_at);
    m.valid_from = jsonString(j, "valid_from", m.created_at);
    m.valid_until = jsonOptString(j, "valid_until");
    m.immutable = jsonBool(j, "immutable");
    m.verified = jsonBool(j, "verified");
    m.context_tags = jsonString(j, "context_tags", "[]");
    m.source = jsonString(j, "source", "user");
    m.metadata = jsonString(j, "metadata", "{}");
    m.is_deleted = jsonBool(j, "is_deleted");
    m.deleted_at = jsonOptString(j, "deleted_at");
    m.deleted_by = jsonOptString(j, "deleted_by");
}

void from_json(const json& j, ScoredRecord& r) {
    r.memory = j.get<MemoryRecord>();
    r.score = jsonNumber(j, "score", jsonNumber(j, "similarity", 0.0));
    r.vector = jsonVector(j, "vector");
}

std::vector<ScoredRecord> VectorSearchResponse::merged() const {
    std::vector<ScoredRecord> out;
    std::unordered_set<std::string> seen;
    for (const auto* list : {&memories, &parentMemories}) {
        for (const auto& r : *list) {
            if (r.memory.memory_id.empty())
                continue;
            if (seen.insert(r.memory.memory_id).second)
                out.push_back(r);
        }
    }
    return out;
}

void from_json(const json& j, VectorSearchResponse& r) {
    r.memories.clear();
    r.parentMemories.clear();
    if (j.is_array()) {
        r.memories = j.get<std::vector<ScoredRecord>>();
        return;
    }
    if (auto it = j.find("memories"); it != j.end() && it->is_array())
        r.memories = it->get<std::vector<ScoredRecord>>();
    if (auto it = j.find("parent_memories"); it != j.end() && it->is_array())
        r.parentMemories = it->get<std::vector<ScoredRecord>>();
}

const std::vector<LinkedRecord>& LogicalConnections::get(const std::string& key) const {
    static const std::vector<LinkedRecord> kEmpty;
    auto it = byKey.find(key);
    return it == byKey.end() ? kEmpty : it->second;
}

size_t LogicalConnections::total() const {
    size_t n = 0;
    for (const auto& [_, v] : byKey)
        n += v.size();
    return n;
}

void from_json(const json& j, LogicalConnections& c) {
    c.byKey.clear();
    if (!j.is_object())
        return;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_array())
            continue;
        auto& bucket = c.byKey[it.key()];
        for (const auto& item : it.value()) {
            if (!item.is_object())
                continue;
            LinkedRecord rec;
            rec.memory = item.get<MemoryRecord>();
            rec.strength = jsonNumber(item, "strength",
                                      jsonNumber(item, "probability", 100.0));
            rec.vector = jsonVector(item, "vector");
            if (!rec.memory.memory_id.empty())
                bucket.push_back(std::move(rec));
        }
    }
}

void to_json(json& j, const UserRecord& u) {
    j = json{{"user_id", u.user_id}, {"name", u.name}};
}

void from_json(const json& j, UserRecord& u) {
    u.user_id = jsonString(j, "user_id");
    u.name = jsonString(j, "name", u.user_id);
}

void to_json(json& j, const ChunkRecord& c) {
    j = json{{"chunk_id", c.chunk_id},       {"parent_id", c.parent_id},
             {"position", c.position},       {"content", c.content},
             {"token_count", c.token_count}, {"created_at", c.created_at}};
    if (!c.internal_id.empty())
        j["id"] = c.internal_id;
}

void from_json(const json& j, ChunkRecord& c) {
    c.internal_id = jsonString(j, "id");
    c.chunk_id = jsonString(j, "chunk_id");
    c.parent_id = jsonString(j, "parent_id");
    c.position = static_cast<size_t>(jsonInt(j, "position", 0));
    c.content = jsonString(j, "content", jsonString(j, "text"));
    c.token_count = static_cast<size_t>(jsonInt(j, "token_count", 0));
    c.created_at = jsonString(j, "created_at");
}

void from_json(const json& j, MemoryWithChunks& m) {
    const auto& body = unwrap(j, "memory");
    m.hasChunks = jsonBool(j, "has_chunks", jsonBool(body, "has_chunks"));
    m.content = jsonString(body, "content", jsonString(j, "content"));
    m.chunks.clear();
    auto it = j.find("chunks");
    if (it != j.end() && it->is_array())
        m.chunks = it->get<std::vector<ChunkRecord>>();
    if (!m.chunks.empty())
        m.hasChunks = true;
}

void from_json(const json& j, ConceptRecord& c) {
    c.concept_id = jsonString(j, "concept_id", jsonString(j, "id"));
    c.name = jsonString(j, "name", c.concept_id);
    c.level = jsonInt(j, "level", 0);
    c.description = jsonString(j, "description");
    c.parent_id = jsonOptString(j, "parent_id");
}

void from_json(const json& j, MemoryConcepts& c) {
    auto readIds = [&](const char* key) {
        std::vector<std::string> ids;
        auto it = j.find(key);
        if (it == j.end() || !it->is_array())
            return ids;
        for (const auto& item : *it) {
            if (item.is_string()) {
                ids.push_back(item.get<std::string>());
            } else if (item.is_object()) {
                auto id = jsonString(item, "concept_id", jsonString(item, "name"));
                if (!id.empty())
                    ids.push_back(std::move(id));
            }
        }
        return ids;
    };
    c.instanceOf = readIds("instance_of");
    c.belongsTo = readIds("belongs_to");
}

void from_json(const json& j, ReasoningEdgeRecord& e) {
    e.from_id = jsonString(j, "from_id");
    e.to_id = jsonString(j, "to_id");
    e.relation_type = jsonString(j, "relation_type");
    e.strength = jsonNumber(j, "strength", 0.0);
}

} // namespace omc::store
