#include <omc/config/config_helpers.h>
#include <omc/ontology/ontology_manager.h>
#include <omc/store/json_fields.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <mutex>
#include <unordered_set>

namespace omc::ontology {

using nlohmann::json;

namespace {

struct KeywordPattern {
    const char* conceptId;
    std::vector<std::string> keywords;
};

const std::vector<KeywordPattern>& keywordPatterns() {
    static const std::vector<KeywordPattern> patterns = {
        {"Preference", {"love", "like", "prefer", "enjoy", "favorite", "hate", "dislike"}},
        {"Skill", {"can", "know how", "able to", "expert", "proficient", "skilled"}},
        {"Fact", {"is", "are", "was", "were", "has", "have"}},
        {"Goal", {"want", "plan", "goal", "aim", "intend", "wish"}},
        {"Opinion", {"think", "believe", "feel", "opinion", "view"}},
        {"Experience", {"did", "went", "saw", "experienced", "happened"}},
        {"Achievement", {"completed", "finished", "achieved", "accomplished", "built"}},
    };
    return patterns;
}

} // namespace

const char* toString(ConceptType type) {
    return type == ConceptType::Abstract ? "abstract" : "concrete";
}

Concept fromRecord(const store::ConceptRecord& record) {
    Concept c;
    c.concept_id = record.concept_id;
    c.name = record.name;
    c.level = record.level;
    c.concept_type = record.level <= 2 ? ConceptType::Abstract : ConceptType::Concrete;
    c.description = record.description;
    c.parent_concept = record.parent_id;
    return c;
}

OntologyManager::OntologyManager(std::shared_ptr<store::StoreClient> store)
    : store_(std::move(store)) {}

Result<void> OntologyManager::load() {
    spdlog::info("Loading ontology");

    auto check = store_->execute("checkOntologyInitialized", json::object());
    bool initialized = false;
    if (check) {
        initialized = check.value().is_object() && check.value().contains("thing") &&
                      !check.value()["thing"].is_null();
    } else if (check.error().code != ErrorCode::NotFound) {
        return Error{ErrorCode::DatabaseError,
                     "Ontology check failed: " + check.error().message};
    }

    if (!initialized) {
        spdlog::info("Ontology not initialized - creating base ontology");
        auto init = store_->executeAck("initializeBaseOntology", json::object());
        if (!init)
            return Error{ErrorCode::DatabaseError,
                         "Base ontology initialization failed: " + init.error().message};
    }

    auto all = store_->execute("getAllConcepts", json::object());
    if (!all)
        return Error{ErrorCode::DatabaseError, "Failed to load concepts: " + all.error().message};

    std::unordered_map<std::string, Concept> concepts;
    std::vector<ConceptRelation> relations;
    const auto& list = store::unwrap(all.value(), "concepts");
    if (list.is_array()) {
        for (const auto& item : list) {
            auto node = fromRecord(item.get<store::ConceptRecord>());
            if (node.concept_id.empty())
                continue;
            if (node.parent_concept)
                relations.push_back({*node.parent_concept, node.concept_id});
            concepts.emplace(node.concept_id, std::move(node));
        }
    }

    spdlog::info("Loaded {} concepts and {} relations", concepts.size(), relations.size());
    {
        std::unique_lock lock(mutex_);
        concepts_ = std::move(concepts);
        relations_ = std::move(relations);
    }
    loaded_ = true;
    return {};
}

std::optional<Concept> OntologyManager::getConcept(const std::string& conceptId) const {
    std::shared_lock lock(mutex_);
    auto it = concepts_.find(conceptId);
    if (it == concepts_.end())
        return std::nullopt;
    return it->second;
}

Result<void> OntologyManager::addConcept(const Concept& node) {
    std::unique_lock lock(mutex_);
    if (concepts_.count(node.concept_id))
        return Error{ErrorCode::InvalidOperation,
                     "Concept already exists: " + node.concept_id};
    if (node.parent_concept) {
        auto parent = concepts_.find(*node.parent_concept);
        if (parent == concepts_.end())
            return Error{ErrorCode::ValidationError,
                         "Unknown parent concept: " + *node.parent_concept};
        if (parent->second.level >= node.level)
            return Error{ErrorCode::ValidationError,
                         "Parent concept must have a lower level than " + node.concept_id};
        relations_.push_back({*node.parent_concept, node.concept_id});
    }
    concepts_.emplace(node.concept_id, node);
    return {};
}

Result<std::vector<Concept>> OntologyManager::subtypes(const std::string& conceptId) const {
    if (!loaded_)
        return Error{ErrorCode::NotInitialized, "Ontology not loaded"};
    std::shared_lock lock(mutex_);
    std::vector<Concept> out;
    for (const auto& [_, c] : concepts_) {
        if (c.parent_concept && *c.parent_concept == conceptId)
            out.push_back(c);
    }
    std::sort(out.begin(), out.end(),
              [](const Concept& a, const Concept& b) { return a.concept_id < b.concept_id; });
    return out;
}

std::vector<Concept> OntologyManager::ancestorsLocked(const std::string& conceptId) const {
    std::vector<Concept> out;
    std::unordered_set<std::string> visited{conceptId};
    auto current = concepts_.find(conceptId);
    while (current != concepts_.end() && current->second.parent_concept) {
        const auto& parentId = *current->second.parent_concept;
        auto parent = concepts_.find(parentId);
        if (parent == concepts_.end())
            break;
        if (!visited.insert(parentId).second) {
            spdlog::warn("Concept hierarchy cycle detected at {}", parentId);
            break;
        }
        if (parent->second.level >= current->second.level) {
            spdlog::warn("Concept {} has level {} not below child {}", parentId,
                         parent->second.level, current->first);
            break;
        }
        out.push_back(parent->second);
        current = parent;
    }
    return out;
}

std::vector<Concept> OntologyManager::ancestors(const std::string& conceptId) const {
    if (!loaded_)
        return {};
    std::shared_lock lock(mutex_);
    return ancestorsLocked(conceptId);
}

size_t OntologyManager::depth(const std::string& conceptId) const {
    return ancestors(conceptId).size();
}

std::vector<std::pair<std::string, double>>
OntologyManager::classify(const std::string& text, double minConfidence) const {
    if (!loaded_)
        return {};
    const auto lowered = config::toLower(text);
    std::vector<std::pair<std::string, double>> scores;
    for (const auto& pattern : keywordPatterns()) {
        size_t matched = 0;
        for (const auto& kw : pattern.keywords) {
            if (lowered.find(kw) != std::string::npos)
                ++matched;
        }
        if (matched == 0)
            continue;
        double score = static_cast<double>(matched) / static_cast<double>(pattern.keywords.size());
        if (score >= minConfidence)
            scores.emplace_back(pattern.conceptId, score);
    }
    std::stable_sort(scores.begin(), scores.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    return scores;
}

std::vector<std::string> OntologyManager::suggestConcepts(const std::string& text,
                                                          size_t topN) const {
    std::vector<std::string> out;
    for (auto& [id, _] : classify(text, 0.1)) {
        if (out.size() >= topN)
            break;
        out.push_back(id);
    }
    return out;
}

std::vector<ConceptRelation> OntologyManager::relations() const {
    std::shared_lock lock(mutex_);
    return relations_;
}

OntologyStats OntologyManager::stats() const {
    std::shared_lock lock(mutex_);
    OntologyStats s;
    s.total_concepts = concepts_.size();
    s.total_relations = relations_.size();
    for (const auto& [id, c] : concepts_) {
        ++s.concepts_by_type[toString(c.concept_type)];
        s.max_depth = std::max(s.max_depth, ancestorsLocked(id).size());
    }
    return s;
}

} // namespace omc::ontology
