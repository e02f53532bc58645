#pragma once

#include <omc/core/types.h>
#include <omc/llm/llm_provider.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace omc::llm {

struct ExtractedMemory {
    std::string text;
    std::string memory_type = "fact";
    int certainty = 80;
    int importance = 50;
    std::vector<std::string> entities; ///< ids into ExtractionResult::entities
};

struct ExtractedEntity {
    std::string id;
    std::string name;
    std::string type = "concept";
};

struct ExtractedRelation {
    std::string from_memory_content;
    std::string to_memory_content;
    std::string relation_type;
    int strength = 80;
    int confidence = 80;
    std::string explanation;
};

struct ExtractionResult {
    std::vector<ExtractedMemory> memories;
    std::vector<ExtractedEntity> entities;
    std::vector<ExtractedRelation> relations;

    bool empty() const { return memories.empty(); }
};

void from_json(const nlohmann::json& j, ExtractedMemory& m);
void from_json(const nlohmann::json& j, ExtractedEntity& e);
void from_json(const nlohmann::json& j, ExtractedRelation& r);
void from_json(const nlohmann::json& j, ExtractionResult& r);

/**
 * @brief Splits free text into atomic memories, entities and relations with one JSON-mode call.
 *
 * Provider errors propagate. A reply that does not parse yields an empty result.
 */
class MemoryExtractor {
public:
    explicit MemoryExtractor(std::shared_ptr<ILlmProvider> provider);

    Result<ExtractionResult> extract(const std::string& text, const std::string& userId,
                                     bool extractEntities = true, bool extractRelations = true);

    static std::string buildSystemPrompt(bool extractEntities, bool extractRelations);

private:
    std::shared_ptr<ILlmProvider> provider_;
};

} // namespace omc::llm
