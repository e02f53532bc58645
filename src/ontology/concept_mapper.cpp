#include <omc/config/config_helpers.h>
#include <omc/ontology/concept_mapper.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace omc::ontology {

namespace {

struct KindKeywords {
    ConceptKind kind;
    std::vector<std::string> keywords;
};

const std::vector<KindKeywords>& conceptKeywords() {
    static const std::vector<KindKeywords> table = {
        {ConceptKind::Preference, {"like", "love", "prefer", "favorite", "enjoy", "hate", "dislike"}},
        {ConceptKind::Skill, {"can", "able to", "skilled at", "expert in", "know how", "proficient"}},
        {ConceptKind::Goal, {"want", "goal", "aim", "plan", "wish", "hope", "intend"}},
        {ConceptKind::Opinion, {"think", "believe", "feel", "opinion", "view", "consider"}},
        {ConceptKind::Fact, {"fact", "is", "has", "knows", "information", "data"}},
        {ConceptKind::Action, {"did", "does", "doing", "performed", "executed", "ran"}},
        {ConceptKind::Experience, {"experienced", "went through", "encounter", "witnessed"}},
        {ConceptKind::Achievement, {"completed", "finished", "achieved", "success", "accomplished"}},
    };
    return table;
}

// Query keyword -> concept id
const std::vector<std::pair<std::string, std::string>>& queryKeywords() {
    static const std::vector<std::pair<std::string, std::string>> table = {
        {"preference", "Preference"}, {"like", "Preference"},      {"love", "Preference"},
        {"enjoy", "Preference"},      {"hate", "Preference"},      {"dislike", "Preference"},
        {"skill", "Skill"},           {"know", "Skill"},           {"learn", "Skill"},
        {"expert", "Skill"},          {"master", "Skill"},         {"goal", "Goal"},
        {"want", "Goal"},             {"plan", "Goal"},            {"aim", "Goal"},
        {"objective", "Goal"},        {"fact", "Fact"},            {"remember", "Fact"},
        {"true", "Fact"},             {"false", "Fact"},           {"opinion", "Opinion"},
        {"think", "Opinion"},         {"believe", "Opinion"},      {"feel", "Opinion"},
        {"experience", "Experience"}, {"did", "Experience"},       {"happened", "Experience"},
        {"achievement", "Achievement"}, {"completed", "Achievement"},
        {"finished", "Achievement"},  {"succeeded", "Achievement"},
    };
    return table;
}

const std::vector<std::string>& knownTags() {
    static const std::vector<std::string> tags = {
        "python",  "fastapi",    "rust",      "javascript",  "typescript",  "react",
        "django",  "flask",      "nodejs",    "docker",      "kubernetes",  "aws",
        "gcp",     "postgresql", "mongodb",   "redis",       "helixdb",     "ollama",
        "openai",  "async",      "api",       "backend",     "frontend",    "database",
        "graph",   "work",       "personal",  "project",     "home",        "travel",
        "health",  "finance",    "learning",  "career",      "family",      "ai",
        "ml",      "memory",     "llm",       "embedding",   "vector",      "search",
        "programming", "coding", "development", "architecture",
    };
    return tags;
}

} // namespace

const char* toString(ConceptKind kind) {
    switch (kind) {
        case ConceptKind::Preference:
            return "Preference";
        case ConceptKind::Skill:
            return "Skill";
        case ConceptKind::Goal:
            return "Goal";
        case ConceptKind::Opinion:
            return "Opinion";
        case ConceptKind::Fact:
            return "Fact";
        case ConceptKind::Action:
            return "Action";
        case ConceptKind::Experience:
            return "Experience";
        case ConceptKind::Achievement:
            return "Achievement";
    }
    return "Fact";
}

std::vector<ConceptMatch> ConceptMapper::map(std::string_view text, size_t topK) const {
    const auto lowered = config::toLower(text);
    std::vector<ConceptMatch> matches;
    for (const auto& entry : conceptKeywords()) {
        ConceptMatch m;
        for (const auto& kw : entry.keywords) {
            if (lowered.find(kw) != std::string::npos)
                m.matched_keywords.push_back(kw);
        }
        if (m.matched_keywords.empty())
            continue;
        m.confidence = static_cast<double>(m.matched_keywords.size()) /
                       static_cast<double>(entry.keywords.size());
        m.concept_ref = TextConcept{toString(entry.kind), toString(entry.kind), entry.kind};
        matches.push_back(std::move(m));
    }
    std::stable_sort(matches.begin(), matches.end(),
                     [](const auto& a, const auto& b) { return a.confidence > b.confidence; });
    if (matches.size() > topK)
        matches.resize(topK);
    return matches;
}

size_t ConceptMapper::linkMemoryToConcepts(memory::RelationManager& relations,
                                           const MemoryId& memoryId,
                                           const std::vector<ConceptMatch>& matches) const {
    size_t linked = 0;
    for (size_t i = 0; i < matches.size(); ++i) {
        const auto& m = matches[i];
        const int confidence = std::clamp(static_cast<int>(std::lround(m.confidence * 100.0)), 0, 100);
        auto res = relations.linkToConcept(memoryId, m.concept_ref.id, confidence,
                                           i == 0 ? "INSTANCE_OF" : "BELONGS_TO_CATEGORY");
        if (res) {
            ++linked;
        } else {
            spdlog::warn("Failed to link memory {} to concept {}: {}", memoryId,
                         m.concept_ref.id, res.error().message);
        }
    }
    return linked;
}

std::vector<QueryConcept> ConceptMapper::classifyQuery(std::string_view query,
                                                       size_t maxConcepts) {
    const auto lowered = config::toLower(query);
    std::vector<QueryConcept> out;
    for (const auto& [keyword, conceptId] : queryKeywords()) {
        if (out.size() >= maxConcepts)
            break;
        if (lowered.find(keyword) == std::string::npos)
            continue;
        bool seen = std::any_of(out.begin(), out.end(),
                                [&](const QueryConcept& q) { return q.concept_id == conceptId; });
        if (!seen)
            out.push_back(QueryConcept{conceptId, 0.8, "exact"});
    }
    return out;
}

std::vector<std::string> ConceptMapper::extractQueryTags(std::string_view query, size_t maxTags) {
    const auto lowered = config::toLower(query);
    std::vector<std::string> out;
    for (const auto& tag : knownTags()) {
        if (out.size() >= maxTags)
            break;
        if (lowered.find(tag) != std::string::npos)
            out.push_back(tag);
    }
    return out;
}

} // namespace omc::ontology
