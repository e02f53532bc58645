#include <gtest/gtest.h>

#include <omc/core/ids.h>
#include <omc/core/similarity.h>

#include <regex>
#include <set>
#include <vector>

using namespace omc::core;

TEST(SimilarityTest, IdenticalVectorsScoreOne) {
    std::vector<float> v{0.3f, -0.2f, 0.9f};
    EXPECT_NEAR(cosineSimilarity(v, v), 1.0, 1e-9);
    EXPECT_NEAR(rescaleCosine(cosineSimilarity(v, v)), 1.0, 1e-9);
}

TEST(SimilarityTest, CosineIsSymmetric) {
    std::vector<float> a{1.0f, 2.0f, 3.0f};
    std::vector<float> b{-1.0f, 0.5f, 2.0f};
    EXPECT_DOUBLE_EQ(cosineSimilarity(a, b), cosineSimilarity(b, a));
}

TEST(SimilarityTest, DegenerateInputsScoreZero) {
    std::vector<float> a{1.0f, 0.0f};
    std::vector<float> zero{0.0f, 0.0f};
    std::vector<float> longer{1.0f, 0.0f, 0.0f};
    EXPECT_EQ(cosineSimilarity(a, zero), 0.0);
    EXPECT_EQ(cosineSimilarity(a, longer), 0.0);
    EXPECT_EQ(cosineSimilarity({}, {}), 0.0);
}

TEST(SimilarityTest, RescaleMapsOntoUnitInterval) {
    EXPECT_DOUBLE_EQ(rescaleCosine(-1.0), 0.0);
    EXPECT_DOUBLE_EQ(rescaleCosine(0.0), 0.5);
    EXPECT_DOUBLE_EQ(rescaleCosine(1.0), 1.0);
    EXPECT_DOUBLE_EQ(rescaleCosine(3.0), 1.0);
    EXPECT_DOUBLE_EQ(rescaleCosine(-3.0), 0.0);
}

TEST(SimilarityTest, FreshnessDecays) {
    EXPECT_DOUBLE_EQ(temporalFreshness(0.0, 30.0), 1.0);
    EXPECT_NEAR(temporalFreshness(30.0, 30.0), 0.36787944, 1e-6);
    EXPECT_DOUBLE_EQ(temporalFreshness(-5.0, 30.0), 1.0);
    EXPECT_GT(temporalFreshness(1.0, 30.0), temporalFreshness(10.0, 30.0));
}

TEST(IdsTest, PrefixedIdsHaveTwelveHexDigits) {
    std::regex pattern("^mem_[0-9a-f]{12}$");
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        auto id = generateMemoryId();
        EXPECT_TRUE(std::regex_match(id, pattern)) << id;
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 100u);
    EXPECT_EQ(generateEntityId().rfind("ent_", 0), 0u);
    EXPECT_EQ(generateContextId().rfind("ctx_", 0), 0u);
}

TEST(IdsTest, ChunkIdsAreDerived) {
    EXPECT_EQ(makeChunkId("mem_abc", 0), "mem_abc_chunk_0");
    EXPECT_EQ(makeChunkId("mem_abc", 12), "mem_abc_chunk_12");
}
