#include <omc/chunking/text_splitter.h>

#include <cctype>

namespace omc::chunking {

namespace {

struct Sentence {
    std::string text;
    size_t start = 0;
    size_t end = 0;
    size_t words = 0;
};

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Trim [begin, end) of `content` and append it as a sentence if non-empty
void pushSentence(std::string_view content, size_t begin, size_t end, std::vector<Sentence>& out) {
    while (begin < end && isSpace(content[begin]))
        ++begin;
    while (end > begin && isSpace(content[end - 1]))
        --end;
    if (begin == end)
        return;
    Sentence s;
    s.text = std::string(content.substr(begin, end - begin));
    s.start = begin;
    s.end = end;
    s.words = wordCount(s.text);
    out.push_back(std::move(s));
}

std::vector<Sentence> segment(std::string_view content) {
    std::vector<Sentence> sentences;
    size_t begin = 0;
    for (size_t i = 0; i < content.size(); ++i) {
        char c = content[i];
        if (c == '.' || c == '!' || c == '?') {
            pushSentence(content, begin, i + 1, sentences);
            begin = i + 1;
        }
    }
    pushSentence(content, begin, content.size(), sentences);
    return sentences;
}

size_t tokensForWords(size_t words) {
    return static_cast<size_t>(static_cast<double>(words) / 0.75);
}

// Last `overlap` bytes of `text`, moved to a UTF-8 boundary and then to a word start
std::string overlapTail(const std::string& text, size_t overlap) {
    if (overlap == 0 || text.empty())
        return {};
    if (overlap >= text.size())
        return text;

    size_t start = text.size() - overlap;
    while (start < text.size() && (static_cast<unsigned char>(text[start]) & 0xC0) == 0x80)
        ++start;
    if (start > 0 && !isSpace(text[start - 1])) {
        while (start < text.size() && !isSpace(text[start]))
            ++start;
    }
    while (start < text.size() && isSpace(text[start]))
        ++start;
    return text.substr(start);
}

} // namespace

const char* toString(SplitStrategy strategy) {
    switch (strategy) {
        case SplitStrategy::Sentence:
            return "sentence";
        case SplitStrategy::Semantic:
            return "semantic";
    }
    return "sentence";
}

size_t codePointCount(std::string_view text) {
    size_t n = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80)
            ++n;
    }
    return n;
}

size_t wordCount(std::string_view text) {
    size_t words = 0;
    bool inWord = false;
    for (char c : text) {
        if (isSpace(c)) {
            inWord = false;
        } else if (!inWord) {
            inWord = true;
            ++words;
        }
    }
    return words;
}

size_t estimateTokens(std::string_view text) {
    return tokensForWords(wordCount(text));
}

bool needsChunking(std::string_view content, size_t threshold) {
    return codePointCount(content) >= threshold;
}

SentenceSplitter::SentenceSplitter(Config config) : config_(config) {
    if (config_.chunkSize == 0)
        config_.chunkSize = 1;
}

Result<std::vector<TextChunk>> SentenceSplitter::split(std::string_view content) const {
    auto sentences = segment(content);
    if (sentences.empty()) {
        return Error{ErrorCode::InvalidArgument, "content too short to split"};
    }

    std::vector<TextChunk> chunks;
    std::string current;
    size_t currentWords = 0;
    size_t currentSentences = 0;
    size_t chunkStart = sentences.front().start;
    size_t chunkEnd = chunkStart;

    auto flush = [&]() {
        TextChunk chunk;
        chunk.text = current;
        chunk.token_count = tokensForWords(currentWords);
        chunk.start_pos = chunkStart;
        chunk.end_pos = chunkEnd;
        chunks.push_back(std::move(chunk));
    };

    for (const auto& s : sentences) {
        if (currentSentences >= config_.minSentences &&
            tokensForWords(currentWords + s.words) > config_.chunkSize) {
            flush();
            current = overlapTail(current, config_.overlap);
            currentWords = wordCount(current);
            currentSentences = 0;
            chunkStart = s.start;
        }
        if (currentSentences == 0 && current.empty())
            chunkStart = s.start;
        if (!current.empty())
            current.push_back(' ');
        current += s.text;
        currentWords += s.words;
        ++currentSentences;
        chunkEnd = s.end;
    }
    if (currentSentences > 0)
        flush();

    return chunks;
}

SemanticSplitter::SemanticSplitter(size_t chunkSize)
    : inner_(SentenceSplitter::Config{chunkSize, 128, 2}) {}

Result<std::vector<TextChunk>> SemanticSplitter::split(std::string_view content) const {
    return inner_.split(content);
}

std::unique_ptr<ITextSplitter> makeSplitter(SplitStrategy strategy,
                                            SentenceSplitter::Config config) {
    if (strategy == SplitStrategy::Semantic)
        return std::make_unique<SemanticSplitter>(config.chunkSize);
    return std::make_unique<SentenceSplitter>(config);
}

} // namespace omc::chunking
