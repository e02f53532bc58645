#include <omc/config/config_helpers.h>
#include <omc/core/time_utils.h>
#include <omc/memory/relation_manager.h>
#include <omc/store/json_fields.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace omc::memory {

using nlohmann::json;

namespace {

constexpr size_t kMaxReasoningLength = 255;

std::string truncateReasoning(const std::string& text) {
    if (text.size() <= kMaxReasoningLength)
        return text;
    size_t cut = kMaxReasoningLength;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80)
        --cut;
    return text.substr(0, cut);
}

int toPercent(double confidence) {
    return std::clamp(static_cast<int>(std::lround(confidence * 100.0)), 0, 100);
}

} // namespace

const char* toString(RelationType type) {
    switch (type) {
        case RelationType::Implies:
            return "IMPLIES";
        case RelationType::Because:
            return "BECAUSE";
        case RelationType::Contradicts:
            return "CONTRADICTS";
        case RelationType::Supports:
            return "SUPPORTS";
        case RelationType::Refutes:
            return "REFUTES";
        case RelationType::RelatesTo:
            return "RELATES_TO";
        case RelationType::Supersedes:
            return "SUPERSEDES";
    }
    return "RELATES_TO";
}

std::optional<RelationType> parseRelationType(std::string_view name) {
    auto n = config::toLower(config::trimmed(name));
    if (n == "implies")
        return RelationType::Implies;
    if (n == "because")
        return RelationType::Because;
    if (n == "contradicts")
        return RelationType::Contradicts;
    if (n == "supports")
        return RelationType::Supports;
    if (n == "refutes")
        return RelationType::Refutes;
    if (n == "relates_to" || n == "related" || n == "relation" || n == "relatesto")
        return RelationType::RelatesTo;
    if (n == "supersedes")
        return RelationType::Supersedes;
    return std::nullopt;
}

RelationManager::RelationManager(std::shared_ptr<store::StoreClient> store)
    : store_(std::move(store)) {}

Result<void> RelationManager::addImplication(const MemoryId& from, const MemoryId& to,
                                             int probability, const std::string& reasoning) {
    return store_->executeAck("addMemoryImplication",
                              {{"from_id", from},
                               {"to_id", to},
                               {"probability", std::clamp(probability, 0, 100)},
                               {"reasoning_id", truncateReasoning(reasoning)}});
}

Result<void> RelationManager::addCausation(const MemoryId& from, const MemoryId& to, int strength,
                                           const std::string& reasoning) {
    return store_->executeAck("addMemoryCausation",
                              {{"from_id", from},
                               {"to_id", to},
                               {"strength", std::clamp(strength, 0, 100)},
                               {"reasoning_id", truncateReasoning(reasoning)}});
}

Result<void> RelationManager::addContradiction(const MemoryId& from, const MemoryId& to,
                                               const std::string& resolution, bool resolved,
                                               const std::string& strategy, int confidence) {
    return store_->executeAck("addMemoryContradiction",
                              {{"from_id", from},
                               {"to_id", to},
                               {"resolution", resolution},
                               {"resolved", resolved ? 1 : 0},
                               {"resolution_strategy", truncateReasoning(strategy)},
                               {"confidence", std::clamp(confidence, 0, 100)}});
}

Result<void> RelationManager::addRelation(const MemoryId& source, const MemoryId& target,
                                          const std::string& relationType, int strength,
                                          const std::string& metadata) {
    auto res = store_->executeAck("addMemoryRelation", {{"source_id", source},
                                                        {"target_id", target},
                                                        {"relation_type", relationType},
                                                        {"strength", std::clamp(strength, 0, 100)},
                                                        {"created_at", core::nowTimestamp()},
                                                        {"metadata", metadata}});
    if (res)
        spdlog::debug("Added relation {}: {} -> {}", relationType, source, target);
    return res;
}

Result<void> RelationManager::addSupersession(const MemoryId& newId, const MemoryId& oldId,
                                              const std::string& reason,
                                              const std::string& supersededAt,
                                              bool isContradiction) {
    return store_->executeAck("addMemorySupersession", {{"new_id", newId},
                                                        {"old_id", oldId},
                                                        {"reason", reason},
                                                        {"superseded_at", supersededAt},
                                                        {"is_contradiction", isContradiction}});
}

Result<void> RelationManager::addTyped(RelationType type, const MemoryId& from,
                                       const MemoryId& to, double confidence,
                                       const std::string& reasoning) {
    const int pct = toPercent(confidence);
    switch (type) {
        case RelationType::Implies:
            return addImplication(from, to, pct, reasoning);
        case RelationType::Because:
            return addCausation(from, to, pct, reasoning);
        case RelationType::Contradicts:
            return addContradiction(from, to, "", false, reasoning, pct);
        case RelationType::Supports:
        case RelationType::Refutes:
        case RelationType::RelatesTo:
        case RelationType::Supersedes: {
            json meta = json::object();
            if (!reasoning.empty())
                meta["reasoning"] = reasoning;
            return addRelation(from, to, toString(type), pct, meta.dump());
        }
    }
    return Error{ErrorCode::InvalidArgument, "unknown relation type"};
}

Result<void> RelationManager::linkToConcept(const MemoryId& memoryId, const std::string& conceptId,
                                            int confidence, const std::string& linkType) {
    Result<void> res;
    if (linkType == "INSTANCE_OF") {
        res = store_->executeAck("linkMemoryToInstanceOf", {{"memory_id", memoryId},
                                                            {"concept_id", conceptId},
                                                            {"confidence", confidence}});
    } else if (linkType == "BELONGS_TO_CATEGORY") {
        res = store_->executeAck("linkMemoryToCategory", {{"memory_id", memoryId},
                                                          {"concept_id", conceptId},
                                                          {"relevance", confidence}});
    } else {
        return Error{ErrorCode::InvalidArgument, "Invalid link type: " + linkType};
    }
    if (res)
        spdlog::debug("Linked memory {} to concept {} ({})", memoryId, conceptId, linkType);
    return res;
}

Result<size_t> RelationManager::copyReasoningRelations(const MemoryId& oldId,
                                                       const MemoryId& newId) {
    auto res = store_->execute("getMemoryOutgoingRelations", {{"memory_id", oldId}});
    if (!res)
        return res.error();

    const auto& outgoing = res.value();
    const std::string copiedFrom = "copied_from_" + oldId;
    size_t copied = 0;

    auto forEachTarget = [&](const char* key, auto&& fn) {
        auto it = outgoing.find(key);
        if (it == outgoing.end() || !it->is_array())
            return;
        for (const auto& edge : *it) {
            auto to = edge.find("to");
            const auto& target = (to != edge.end() && to->is_object()) ? *to : edge;
            auto targetId = store::jsonString(target, "memory_id");
            if (targetId.empty() || targetId == newId)
                continue;
            fn(edge, targetId);
        }
    };

    forEachTarget("implies_out", [&](const json& edge, const std::string& target) {
        auto r = addImplication(newId, target, store::jsonInt(edge, "probability", 80), copiedFrom);
        if (r)
            ++copied;
        else
            spdlog::warn("Failed to copy IMPLIES relation: {}", r.error().message);
    });
    forEachTarget("because_out", [&](const json& edge, const std::string& target) {
        auto r = addCausation(newId, target, store::jsonInt(edge, "strength", 80), copiedFrom);
        if (r)
            ++copied;
        else
            spdlog::warn("Failed to copy BECAUSE relation: {}", r.error().message);
    });
    forEachTarget("relations_out", [&](const json& edge, const std::string& target) {
        json meta = {{"copied_from", oldId}};
        auto r = addRelation(newId, target, store::jsonString(edge, "relation_type", "related"),
                             store::jsonInt(edge, "strength", 50), meta.dump());
        if (r)
            ++copied;
        else
            spdlog::warn("Failed to copy MEMORY_RELATION: {}", r.error().message);
    });

    spdlog::debug("Copied {} reasoning relations from {} to {}", copied, oldId, newId);
    return copied;
}

} // namespace omc::memory
