#pragma once

#include <omc/core/types.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace omc::chunking {

struct TextChunk {
    std::string text;
    size_t token_count = 0;
    size_t start_pos = 0; ///< byte offset of the first full sentence in the source
    size_t end_pos = 0;   ///< byte offset one past the last sentence
};

enum class SplitStrategy { Sentence, Semantic };

const char* toString(SplitStrategy strategy);

/// Number of Unicode code points in UTF-8 text.
size_t codePointCount(std::string_view text);

/// Whitespace-separated word count.
size_t wordCount(std::string_view text);

/// Token estimate: floor(words / 0.75).
size_t estimateTokens(std::string_view text);

/// True when content has at least `threshold` code points.
bool needsChunking(std::string_view content, size_t threshold = 1000);

class ITextSplitter {
public:
    virtual ~ITextSplitter() = default;

    // Empty or whitespace-only content is InvalidArgument
    virtual Result<std::vector<TextChunk>> split(std::string_view content) const = 0;

    virtual SplitStrategy strategy() const = 0;
};

/**
 * @brief Greedy sentence packer.
 *
 * Sentences end at '.', '!' or '?'; an unterminated tail is the last sentence. A chunk is
 * flushed when the next sentence would push it over `chunkSize` tokens and it already holds
 * `minSentences` sentences. The last `overlap` characters of a flushed chunk, moved forward to
 * a word start, open the next one.
 */
class SentenceSplitter final : public ITextSplitter {
public:
    struct Config {
        size_t chunkSize = 512;
        size_t overlap = 128;
        size_t minSentences = 2;
    };

    explicit SentenceSplitter(Config config);
    SentenceSplitter() : SentenceSplitter(Config{}) {}

    Result<std::vector<TextChunk>> split(std::string_view content) const override;
    SplitStrategy strategy() const override { return SplitStrategy::Sentence; }

    const Config& config() const { return config_; }

private:
    Config config_;
};

// Topic-aware splitting is not implemented yet; delegates to sentence packing.
class SemanticSplitter final : public ITextSplitter {
public:
    explicit SemanticSplitter(size_t chunkSize = 512);

    Result<std::vector<TextChunk>> split(std::string_view content) const override;
    SplitStrategy strategy() const override { return SplitStrategy::Semantic; }

private:
    SentenceSplitter inner_;
};

std::unique_ptr<ITextSplitter> makeSplitter(SplitStrategy strategy,
                                            SentenceSplitter::Config config = {});

} // namespace omc::chunking
