#include <gtest/gtest.h>

#include "../../common/fake_providers.h"

#include <omc/llm/extractor.h>

using namespace omc;
using namespace omc::llm;
using omc::test::ScriptedLlmProvider;

namespace {

const char* kReply = R"({
  "memories": [
    {"text": "Alice prefers Rust", "memory_type": "preference", "certainty": 90,
     "importance": 70, "entities": ["rust", 7]},
    {"text": "Alice works at Acme"},
    {"text": ""}
  ],
  "entities": [
    {"id": "rust", "name": "Rust", "type": "technology"},
    {"name": "Acme"},
    {"id": "ghost"}
  ],
  "relations": [
    {"from_memory_content": "Alice works at Acme",
     "to_memory_content": "Alice prefers Rust",
     "relation_type": "SUPPORTS", "explanation": "Acme ships Rust"}
  ]
})";

} // namespace

TEST(MemoryExtractorTest, ParsesMemoriesEntitiesAndRelations) {
    auto provider = std::make_shared<ScriptedLlmProvider>(
        [](const std::string&, const std::string&) -> Result<std::string> {
            return std::string(kReply);
        });
    MemoryExtractor extractor(provider);

    auto res = extractor.extract("Alice prefers Rust and works at Acme", "alice");
    ASSERT_TRUE(res) << res.error().message;
    const auto& r = res.value();

    ASSERT_EQ(r.memories.size(), 2u);
    EXPECT_EQ(r.memories[0].memory_type, "preference");
    EXPECT_EQ(r.memories[0].certainty, 90);
    EXPECT_EQ(r.memories[0].entities, std::vector<std::string>{"rust"});
    EXPECT_EQ(r.memories[1].memory_type, "fact");
    EXPECT_EQ(r.memories[1].certainty, 80);
    EXPECT_EQ(r.memories[1].importance, 50);

    ASSERT_EQ(r.entities.size(), 2u);
    EXPECT_EQ(r.entities[1].id, "Acme");
    EXPECT_EQ(r.entities[1].type, "concept");

    ASSERT_EQ(r.relations.size(), 1u);
    EXPECT_EQ(r.relations[0].relation_type, "SUPPORTS");
    EXPECT_EQ(r.relations[0].strength, 80);
    EXPECT_EQ(r.relations[0].confidence, 80);
    EXPECT_FALSE(r.empty());

    auto prompts = provider->prompts();
    ASSERT_EQ(prompts.size(), 1u);
    EXPECT_NE(prompts[0].second.find("Alice prefers Rust and works at Acme"), std::string::npos);
}

TEST(MemoryExtractorTest, UnparseableReplyIsEmptyResult) {
    auto provider = std::make_shared<ScriptedLlmProvider>(
        [](const std::string&, const std::string&) -> Result<std::string> {
            return std::string("Sure! Here are your memories:");
        });
    MemoryExtractor extractor(provider);
    auto res = extractor.extract("anything", "alice");
    ASSERT_TRUE(res);
    EXPECT_TRUE(res.value().empty());

    provider->setHandler([](const std::string&, const std::string&) -> Result<std::string> {
        return std::string(R"({"facts": []})");
    });
    auto other = extractor.extract("anything", "alice");
    ASSERT_TRUE(other);
    EXPECT_TRUE(other.value().empty());
}

TEST(MemoryExtractorTest, ProviderErrorPropagates) {
    auto provider = std::make_shared<ScriptedLlmProvider>(
        [](const std::string&, const std::string&) -> Result<std::string> {
            return Error{ErrorCode::Timeout, "too slow"};
        });
    MemoryExtractor extractor(provider);
    auto res = extractor.extract("anything", "alice");
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::Timeout);
}

TEST(MemoryExtractorTest, PromptFollowsFlags) {
    auto full = MemoryExtractor::buildSystemPrompt(true, true);
    EXPECT_NE(full.find("from_memory_content"), std::string::npos);
    EXPECT_NE(full.find("\"type\": \"person|organization"), std::string::npos);

    auto bare = MemoryExtractor::buildSystemPrompt(false, false);
    EXPECT_EQ(bare.find("from_memory_content"), std::string::npos);
    EXPECT_NE(bare.find("\"entities\": []"), std::string::npos);
    EXPECT_NE(bare.find("\"relations\": []"), std::string::npos);
}
