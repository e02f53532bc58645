#pragma once

#include <omc/core/types.h>
#include <omc/llm/llm_provider.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace omc::decision {

enum class MemoryOperation { Add, Update, Delete, Noop, Supersede, Contradict };

const char* toString(MemoryOperation op);
std::optional<MemoryOperation> parseMemoryOperation(std::string_view name);

struct MemoryDecision {
    MemoryOperation operation = MemoryOperation::Add;
    std::optional<std::string> target_memory_id;
    int confidence = 0; ///< 0..100
    std::string reasoning;
    std::optional<std::string> merged_content;
    std::optional<std::string> supersedes_memory_id;
    std::optional<std::string> contradicts_memory_id;
    std::vector<std::pair<std::string, std::string>> relates_to; ///< (memory_id, relation type)

    static MemoryDecision add(int confidence, std::string reasoning);
    static MemoryDecision noop(int confidence, std::string reasoning);
    static MemoryDecision update(std::string targetId, std::string mergedContent, int confidence,
                                 std::string reasoning);
    static MemoryDecision supersede(std::string supersedesId, int confidence,
                                    std::string reasoning);
    static MemoryDecision contradict(std::string contradictsId, int confidence,
                                     std::string reasoning);
};

// Strict decoding: operation and confidence are required
Result<MemoryDecision> parseDecision(const nlohmann::json& j);

struct SimilarMemory {
    std::string id;
    std::string content;
    double score = 0.0;
    std::optional<std::string> created_at;
};

/**
 * @brief LLM arbitration between a new memory and its near neighbours.
 *
 * Never fails: provider and parse errors degrade to ADD with confidence 50.
 */
class DecisionEngine {
public:
    static constexpr double kDefaultThreshold = 0.92;
    static constexpr double kDuplicateScore = 0.98;

    explicit DecisionEngine(std::shared_ptr<llm::ILlmProvider> llm,
                            double similarityThreshold = kDefaultThreshold);

    MemoryDecision decide(const std::string& newMemory, const std::vector<SimilarMemory>& similar,
                          const std::string& userId);

    bool isLikelyDuplicate(const std::vector<SimilarMemory>& similar) const;

    double threshold() const { return threshold_; }

    static const std::string& systemPrompt();
    static std::string buildPrompt(const std::string& newMemory,
                                   const std::vector<SimilarMemory>& candidates,
                                   const std::string& userId);

private:
    std::shared_ptr<llm::ILlmProvider> llm_;
    double threshold_;
};

} // namespace omc::decision
