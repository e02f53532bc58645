#include <gtest/gtest.h>

#include <omc/chunking/text_splitter.h>

#include <string>

using namespace omc::chunking;

namespace {

// Sentence of `words` single-letter words ending in a period
std::string sentence(size_t words) {
    std::string s;
    for (size_t i = 0; i < words; ++i) {
        if (i)
            s += ' ';
        s += static_cast<char>('a' + (i % 26));
    }
    return s + ".";
}

std::string paragraph(size_t sentences, size_t words) {
    std::string s;
    for (size_t i = 0; i < sentences; ++i) {
        if (i)
            s += ' ';
        s += sentence(words);
    }
    return s;
}

} // namespace

TEST(TextMetricsTest, CountsCodePointsWordsAndTokens) {
    EXPECT_EQ(codePointCount("héllo"), 5u);
    EXPECT_EQ(codePointCount("日本語"), 3u);
    EXPECT_EQ(wordCount("  one two\tthree\n"), 3u);
    EXPECT_EQ(estimateTokens("one two three"), 4u);
    EXPECT_EQ(estimateTokens(""), 0u);
}

TEST(TextMetricsTest, ThresholdIsInclusive) {
    EXPECT_FALSE(needsChunking(std::string(999, 'x')));
    EXPECT_TRUE(needsChunking(std::string(1000, 'x')));
    EXPECT_TRUE(needsChunking("abcd", 4));
}

TEST(SentenceSplitterTest, ShortTextIsOneChunk) {
    SentenceSplitter splitter;
    auto res = splitter.split("First sentence. Second one! Third?");
    ASSERT_TRUE(res);
    ASSERT_EQ(res.value().size(), 1u);
    EXPECT_EQ(res.value()[0].text, "First sentence. Second one! Third?");
    EXPECT_EQ(res.value()[0].start_pos, 0u);
}

TEST(SentenceSplitterTest, UnterminatedTailIsASentence) {
    SentenceSplitter splitter({4, 0, 1});
    auto res = splitter.split("One two three. Four five six seven");
    ASSERT_TRUE(res);
    ASSERT_EQ(res.value().size(), 2u);
    EXPECT_EQ(res.value()[1].text, "Four five six seven");
}

TEST(SentenceSplitterTest, EmptyContentIsInvalid) {
    SentenceSplitter splitter;
    auto res = splitter.split("   \n ");
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, omc::ErrorCode::InvalidArgument);
}

TEST(SentenceSplitterTest, PacksTwentyWordSentencesIntoThreeChunks) {
    SentenceSplitter splitter({512, 0, 2});
    auto res = splitter.split(paragraph(45, 20));
    ASSERT_TRUE(res);
    const auto& chunks = res.value();
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(wordCount(chunks[0].text), 380u);
    EXPECT_EQ(wordCount(chunks[1].text), 380u);
    EXPECT_EQ(wordCount(chunks[2].text), 140u);
    for (const auto& c : chunks)
        EXPECT_LE(c.token_count, 512u);
    EXPECT_LT(chunks[0].end_pos, chunks[1].start_pos);
}

TEST(SentenceSplitterTest, MinSentencesAllowsOversizedChunks) {
    SentenceSplitter splitter({10, 0, 2});
    auto res = splitter.split(paragraph(4, 20));
    ASSERT_TRUE(res);
    ASSERT_EQ(res.value().size(), 2u);
    EXPECT_EQ(wordCount(res.value()[0].text), 40u);
}

TEST(SentenceSplitterTest, OverlapCarriesWholeWords) {
    SentenceSplitter splitter({30, 12, 1});
    auto res = splitter.split(paragraph(2, 20));
    ASSERT_TRUE(res);
    ASSERT_EQ(res.value().size(), 2u);
    const auto& first = res.value()[0].text;
    const auto& second = res.value()[1].text;
    // the tail of the first chunk opens the second, starting at a word boundary
    auto carried = second.substr(0, second.find(sentence(20)));
    ASSERT_FALSE(carried.empty());
    EXPECT_NE(carried.front(), ' ');
    EXPECT_NE(first.find(carried.substr(0, carried.size() - 1)), std::string::npos);
}

TEST(SemanticSplitterTest, DelegatesToSentencePacking) {
    auto splitter = makeSplitter(SplitStrategy::Semantic, {512, 0, 2});
    EXPECT_EQ(splitter->strategy(), SplitStrategy::Semantic);
    auto res = splitter->split(paragraph(5, 10));
    ASSERT_TRUE(res);
    EXPECT_EQ(res.value().size(), 1u);
    EXPECT_STREQ(toString(SplitStrategy::Semantic), "semantic");
}
