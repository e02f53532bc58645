#include <omc/config/config_helpers.h>
#include <omc/decision/decision_engine.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

namespace omc::decision {

using nlohmann::json;

namespace {

std::optional<std::string> optionalId(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string())
        return std::nullopt;
    auto value = it->get<std::string>();
    if (value.empty())
        return std::nullopt;
    return value;
}

std::string preview(const std::string& text, size_t maxLen) {
    if (text.size() <= maxLen)
        return text;
    size_t cut = maxLen;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80)
        --cut;
    return text.substr(0, cut);
}

} // namespace

const char* toString(MemoryOperation op) {
    switch (op) {
        case MemoryOperation::Add:
            return "ADD";
        case MemoryOperation::Update:
            return "UPDATE";
        case MemoryOperation::Delete:
            return "DELETE";
        case MemoryOperation::Noop:
            return "NOOP";
        case MemoryOperation::Supersede:
            return "SUPERSEDE";
        case MemoryOperation::Contradict:
            return "CONTRADICT";
    }
    return "ADD";
}

std::optional<MemoryOperation> parseMemoryOperation(std::string_view name) {
    auto n = config::toLower(config::trimmed(name));
    if (n == "add")
        return MemoryOperation::Add;
    if (n == "update")
        return MemoryOperation::Update;
    if (n == "delete")
        return MemoryOperation::Delete;
    if (n == "noop")
        return MemoryOperation::Noop;
    if (n == "supersede")
        return MemoryOperation::Supersede;
    if (n == "contradict")
        return MemoryOperation::Contradict;
    return std::nullopt;
}

MemoryDecision MemoryDecision::add(int confidence, std::string reasoning) {
    MemoryDecision d;
    d.operation = MemoryOperation::Add;
    d.confidence = confidence;
    d.reasoning = std::move(reasoning);
    return d;
}

MemoryDecision MemoryDecision::noop(int confidence, std::string reasoning) {
    MemoryDecision d;
    d.operation = MemoryOperation::Noop;
    d.confidence = confidence;
    d.reasoning = std::move(reasoning);
    return d;
}

MemoryDecision MemoryDecision::update(std::string targetId, std::string mergedContent,
                                      int confidence, std::string reasoning) {
    MemoryDecision d;
    d.operation = MemoryOperation::Update;
    d.target_memory_id = std::move(targetId);
    d.merged_content = std::move(mergedContent);
    d.confidence = confidence;
    d.reasoning = std::move(reasoning);
    return d;
}

MemoryDecision MemoryDecision::supersede(std::string supersedesId, int confidence,
                                         std::string reasoning) {
    MemoryDecision d;
    d.operation = MemoryOperation::Supersede;
    d.supersedes_memory_id = std::move(supersedesId);
    d.confidence = confidence;
    d.reasoning = std::move(reasoning);
    return d;
}

MemoryDecision MemoryDecision::contradict(std::string contradictsId, int confidence,
                                          std::string reasoning) {
    MemoryDecision d;
    d.operation = MemoryOperation::Contradict;
    d.contradicts_memory_id = std::move(contradictsId);
    d.confidence = confidence;
    d.reasoning = std::move(reasoning);
    return d;
}

Result<MemoryDecision> parseDecision(const json& j) {
    if (!j.is_object())
        return Error{ErrorCode::InvalidData, "decision is not a JSON object"};

    auto op = j.find("operation");
    if (op == j.end() || !op->is_string())
        return Error{ErrorCode::InvalidData, "missing field `operation`"};
    auto parsed = parseMemoryOperation(op->get<std::string>());
    if (!parsed)
        return Error{ErrorCode::InvalidData, "unknown operation " + op->get<std::string>()};

    auto conf = j.find("confidence");
    if (conf == j.end() || !conf->is_number())
        return Error{ErrorCode::InvalidData, "missing field `confidence`"};

    MemoryDecision d;
    d.operation = *parsed;
    d.confidence = std::clamp(static_cast<int>(conf->get<double>()), 0, 100);
    if (auto r = j.find("reasoning"); r != j.end() && r->is_string())
        d.reasoning = r->get<std::string>();
    d.target_memory_id = optionalId(j, "target_memory_id");
    d.merged_content = optionalId(j, "merged_content");
    d.supersedes_memory_id = optionalId(j, "supersedes_memory_id");
    d.contradicts_memory_id = optionalId(j, "contradicts_memory_id");

    if (auto rel = j.find("relates_to"); rel != j.end() && rel->is_array()) {
        for (const auto& pair : *rel) {
            if (pair.is_array() && pair.size() == 2 && pair[0].is_string() &&
                pair[1].is_string()) {
                d.relates_to.emplace_back(pair[0].get<std::string>(), pair[1].get<std::string>());
            }
        }
    }
    return d;
}

const std::string& DecisionEngine::systemPrompt() {
    static const std::string prompt =
        R"(You are a memory management expert. Analyze the new memory and similar existing memories to decide what operation to perform.

Your goal is to:
1. Prevent duplicate information
2. Keep memory coherent and up-to-date
3. Resolve conflicts (prefer newer information)
4. Maintain information quality

Always respond with valid JSON.)";
    return prompt;
}

std::string DecisionEngine::buildPrompt(const std::string& newMemory,
                                        const std::vector<SimilarMemory>& candidates,
                                        const std::string& userId) {
    std::string similar;
    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto& m = candidates[i];
        if (i > 0)
            similar += "\n";
        similar += fmt::format("  ID: {}\n  Content: {}\n  Similarity: {:.2f}\n  Created: {}\n",
                               m.id, m.content, m.score, m.created_at.value_or("unknown"));
    }

    return fmt::format(R"(Analyze this new memory and decide what operation to perform.

**New Memory:**
"{}"

**Similar Existing Memories:**
{}

**User ID:** {}

**Your Task:**
Decide what to do with the new memory. Choose ONE operation:

1. **ADD** - Add as completely new memory
   - Use when: Information is new and different

2. **UPDATE** - Update existing memory with new information
   - Use when: New memory enhances or extends existing one
   - Provide `merged_content` combining both memories

3. **DELETE** - Delete existing conflicting memory
   - Use when: New memory is correct and old one is wrong
   - Specify which memory to delete via `target_memory_id`

4. **NOOP** - Ignore (duplicate or redundant)
   - Use when: Information already exists

5. **SUPERSEDE** - Replace old memory with evolved version
   - Use when: Preference/opinion changed over time
   - Set `supersedes_memory_id` to old memory ID

6. **CONTRADICT** - Mark logical conflict between memories
   - Use when: Two memories contradict but both might be valid
   - Set `contradicts_memory_id` to conflicting memory ID

**Response Format (JSON):**
{{
  "operation": "ADD|UPDATE|DELETE|NOOP|SUPERSEDE|CONTRADICT",
  "target_memory_id": "mem_xxx" or null,
  "confidence": 0-100,
  "reasoning": "Why you made this decision",
  "merged_content": "New combined content" or null,
  "supersedes_memory_id": "mem_xxx" or null,
  "contradicts_memory_id": "mem_xxx" or null,
  "relates_to": [["mem_xxx", "IMPLIES"]] or null
}}

**Important:**
- SUPERSEDE for temporal evolution, UPDATE for adding details
- CONTRADICT keeps both, DELETE removes one
- Be conservative with DELETE
- Use NOOP to avoid duplicates)",
                       newMemory, similar, userId);
}

DecisionEngine::DecisionEngine(std::shared_ptr<llm::ILlmProvider> llm, double similarityThreshold)
    : llm_(std::move(llm)), threshold_(similarityThreshold) {
    spdlog::info("DecisionEngine initialized: provider={}",
                 llm_ ? llm_->providerName() : std::string("none"));
}

MemoryDecision DecisionEngine::decide(const std::string& newMemory,
                                      const std::vector<SimilarMemory>& similar,
                                      const std::string& userId) {
    spdlog::debug("Making decision: new_memory='{}...', similar_count={}", preview(newMemory, 50),
                  similar.size());

    if (similar.empty())
        return MemoryDecision::add(100, "No similar memories found, adding as new.");

    std::vector<SimilarMemory> candidates;
    std::copy_if(similar.begin(), similar.end(), std::back_inserter(candidates),
                 [this](const SimilarMemory& m) { return m.score >= threshold_; });

    if (candidates.empty()) {
        return MemoryDecision::add(
            95, fmt::format("No memories above {} similarity threshold, adding as new.",
                            threshold_));
    }

    if (!llm_) {
        if (isLikelyDuplicate(candidates))
            return MemoryDecision::noop(95, "Near-identical memory already stored.");
        return MemoryDecision::add(50, "No LLM provider configured, defaulting to ADD.");
    }

    spdlog::debug("Calling LLM for decision with {} candidates", candidates.size());
    auto res = llm_->generate(systemPrompt(), buildPrompt(newMemory, candidates, userId),
                              std::string("json_object"));
    if (!res) {
        spdlog::warn("LLM call failed: {}", res.error().message);
        return MemoryDecision::add(
            50, fmt::format("LLM call failed ({}), defaulting to ADD.", res.error().message));
    }

    const auto& text = res.value().text;
    auto parsed = json::parse(text, nullptr, false);
    auto decision = parsed.is_discarded()
                        ? Result<MemoryDecision>(Error{ErrorCode::InvalidData, "invalid JSON"})
                        : parseDecision(parsed);
    if (!decision) {
        spdlog::warn("Failed to parse LLM response as JSON: {}", decision.error().message);
        spdlog::warn("Response was: {}", preview(text, 200));
        return MemoryDecision::add(50, fmt::format("JSON parse failed ({}), defaulting to ADD.",
                                                   decision.error().message));
    }

    spdlog::info("Decision made: operation={}, confidence={}, target={}",
                 toString(decision.value().operation), decision.value().confidence,
                 decision.value().target_memory_id.value_or("none"));
    return std::move(decision).value();
}

bool DecisionEngine::isLikelyDuplicate(const std::vector<SimilarMemory>& similar) const {
    return std::any_of(similar.begin(), similar.end(),
                       [](const SimilarMemory& m) { return m.score >= kDuplicateScore; });
}

} // namespace omc::decision
