#include <omc/config/config_helpers.h>
#include <omc/evolution/contradiction_detector.h>

#include <cctype>
#include <unordered_set>
#include <utility>
#include <vector>

namespace omc::evolution {

namespace {

const std::vector<std::string>& negationWords() {
    static const std::vector<std::string> words = {
        "not",   "never",  "don't", "doesn't", "isn't",   "aren't",  "wasn't",
        "weren't", "no longer", "actually", "but", "however", "instead",
    };
    return words;
}

const std::vector<std::pair<std::string, std::string>>& sentimentPairs() {
    static const std::vector<std::pair<std::string, std::string>> pairs = {
        {"love", "hate"}, {"like", "dislike"}, {"best", "worst"}, {"prefer", "avoid"},
        {"always", "never"}, {"good", "bad"},
    };
    return pairs;
}

const std::vector<std::string>& changeMarkers() {
    static const std::vector<std::string> markers = {
        "changed my mind", "not anymore", "anymore", "used to", "switched to", "stopped",
    };
    return markers;
}

const std::unordered_set<std::string>& stopWords() {
    static const std::unordered_set<std::string> words = {
        "the", "and", "that", "this", "with", "from", "have", "has", "was", "were",
        "are", "for", "but", "not", "now", "very", "really", "they", "them", "their",
        "about", "into", "than", "then", "what", "when", "which", "while",
    };
    return words;
}

std::vector<std::string> tokenize(const std::string& lowered) {
    std::vector<std::string> out;
    std::string current;
    for (char ch : lowered) {
        if (std::isalnum(static_cast<unsigned char>(ch)) || ch == '\'') {
            current.push_back(ch);
        } else if (!current.empty()) {
            out.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty())
        out.push_back(std::move(current));
    return out;
}

// Whole-word (or whole-phrase) containment
bool containsPhrase(const std::string& text, const std::string& phrase) {
    size_t pos = 0;
    while ((pos = text.find(phrase, pos)) != std::string::npos) {
        bool startOk = pos == 0 || !std::isalnum(static_cast<unsigned char>(text[pos - 1]));
        size_t end = pos + phrase.size();
        bool endOk = end >= text.size() || !std::isalnum(static_cast<unsigned char>(text[end]));
        if (startOk && endOk)
            return true;
        pos = end;
    }
    return false;
}

bool sharesContentWord(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    std::unordered_set<std::string> left;
    for (const auto& w : a) {
        if (w.size() >= 3 && !stopWords().count(w))
            left.insert(w);
    }
    for (const auto& w : b) {
        if (left.count(w))
            return true;
    }
    return false;
}

} // namespace

std::optional<std::string> ContradictionDetector::detect(std::string_view oldContent,
                                                         std::string_view newContent) const {
    const auto oldText = config::toLower(oldContent);
    const auto newText = config::toLower(newContent);
    if (oldText.empty() || newText.empty() || oldText == newText)
        return std::nullopt;

    if (!sharesContentWord(tokenize(oldText), tokenize(newText)))
        return std::nullopt;

    for (const auto& marker : changeMarkers()) {
        if (containsPhrase(newText, marker) && !containsPhrase(oldText, marker))
            return "marker: " + marker;
    }

    for (const auto& [a, b] : sentimentPairs()) {
        if ((containsPhrase(oldText, a) && containsPhrase(newText, b)) ||
            (containsPhrase(oldText, b) && containsPhrase(newText, a)))
            return "sentiment: " + a + "/" + b;
    }

    for (const auto& word : negationWords()) {
        if (containsPhrase(newText, word) && !containsPhrase(oldText, word))
            return "negation: " + word;
    }
    return std::nullopt;
}

} // namespace omc::evolution
