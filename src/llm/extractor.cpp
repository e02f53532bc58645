#include <omc/llm/extractor.h>
#include <omc/store/json_fields.h>

#include <spdlog/spdlog.h>

namespace omc::llm {

using nlohmann::json;
using store::jsonInt;
using store::jsonString;

void from_json(const json& j, ExtractedMemory& m) {
    m.text = jsonString(j, "text");
    m.memory_type = jsonString(j, "memory_type", "fact");
    m.certainty = jsonInt(j, "certainty", 80);
    m.importance = jsonInt(j, "importance", 50);
    m.entities.clear();
    if (auto it = j.find("entities"); it != j.end() && it->is_array()) {
        for (const auto& e : *it) {
            if (e.is_string())
                m.entities.push_back(e.get<std::string>());
        }
    }
}

void from_json(const json& j, ExtractedEntity& e) {
    e.id = jsonString(j, "id");
    e.name = jsonString(j, "name");
    e.type = jsonString(j, "type", "concept");
    if (e.id.empty())
        e.id = e.name;
}

void from_json(const json& j, ExtractedRelation& r) {
    r.from_memory_content = jsonString(j, "from_memory_content");
    r.to_memory_content = jsonString(j, "to_memory_content");
    r.relation_type = jsonString(j, "relation_type");
    r.strength = jsonInt(j, "strength", 80);
    r.confidence = jsonInt(j, "confidence", 80);
    r.explanation = jsonString(j, "explanation");
}

void from_json(const json& j, ExtractionResult& r) {
    r.memories.clear();
    if (auto it = j.find("memories"); it != j.end() && it->is_array()) {
        for (const auto& m : *it) {
            auto mem = m.get<ExtractedMemory>();
            if (!mem.text.empty())
                r.memories.push_back(std::move(mem));
        }
    }
    r.entities.clear();
    if (auto it = j.find("entities"); it != j.end() && it->is_array()) {
        for (const auto& e : *it) {
            auto ent = e.get<ExtractedEntity>();
            if (!ent.name.empty())
                r.entities.push_back(std::move(ent));
        }
    }
    r.relations.clear();
    if (auto it = j.find("relations"); it != j.end() && it->is_array())
        r.relations = it->get<std::vector<ExtractedRelation>>();
}

MemoryExtractor::MemoryExtractor(std::shared_ptr<ILlmProvider> provider)
    : provider_(std::move(provider)) {}

Result<ExtractionResult> MemoryExtractor::extract(const std::string& text,
                                                  const std::string& userId,
                                                  bool extractEntities, bool extractRelations) {
    spdlog::info("Extracting memories from text: {}... (user={})", text.substr(0, 50), userId);

    auto response = provider_->generate(buildSystemPrompt(extractEntities, extractRelations),
                                        "Extract information from this text:\n\n" + text,
                                        std::string("json_object"));
    if (!response)
        return response.error();

    auto parsed = json::parse(response.value().text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object() || !parsed.contains("memories")) {
        spdlog::warn("Failed to parse extraction result: expected an object with memories");
        return ExtractionResult{};
    }
    try {
        auto result = parsed.get<ExtractionResult>();
        spdlog::debug("Extracted {} memories, {} entities, {} relations", result.memories.size(),
                      result.entities.size(), result.relations.size());
        return result;
    } catch (const json::exception& e) {
        spdlog::warn("Failed to parse extraction result: {}", e.what());
        return ExtractionResult{};
    }
}

std::string MemoryExtractor::buildSystemPrompt(bool extractEntities, bool extractRelations) {
    std::string prompt =
        R"(You are a memory extraction system. Analyze the text and extract structured information.

Output JSON with this structure:
{
  "memories": [
    {
      "text": "atomic fact or preference",
      "memory_type": "fact|preference|goal|opinion|experience",
      "certainty": 80,
      "importance": 50,
      "entities": ["entity_id1", "entity_id2"]
    }
  ])";

    if (extractEntities) {
        prompt += R"(,
  "entities": [
    {
      "id": "unique_id",
      "name": "Entity Name",
      "type": "person|organization|location|concept|system"
    }
  ])";
    } else {
        prompt += R"(,
  "entities": [])";
    }

    if (extractRelations) {
        prompt += R"(,
  "relations": [
    {
      "from_memory_content": "FULL content of source memory - must match a memory text exactly",
      "to_memory_content": "FULL content of target memory - must match a memory text exactly",
      "relation_type": "IMPLIES|BECAUSE|CONTRADICTS|SUPPORTS",
      "strength": 80,
      "confidence": 80,
      "explanation": "Why this relation exists"
    }
  ]

CRITICAL for relations: Both from_memory_content and to_memory_content MUST be the EXACT FULL TEXT of memories from the 'memories' array above. If you cannot match exactly, skip the relation.)";
    } else {
        prompt += R"(,
  "relations": [])";
    }

    prompt += "\n}\n\nExtract atomic, standalone facts. Each memory should be self-contained.";
    return prompt;
}

} // namespace omc::llm
