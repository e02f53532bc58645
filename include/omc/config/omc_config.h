#pragma once

#include <omc/core/types.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace omc::config {

struct StoreConfig {
    std::string host = "localhost";
    uint16_t port = 6969;
    std::string instance = "dev";
    std::chrono::seconds timeout{30};
    uint32_t maxRetries = 3;

    std::string baseUrl() const;
};

struct LlmConfig {
    std::string provider = "cerebras";
    std::string model = "llama-3.3-70b";
    std::string apiKey;
    std::string baseUrl; ///< Empty means the provider default
    double temperature = 0.3;
    std::chrono::seconds timeout{600};

    bool fallbackEnabled = true;
    std::string fallbackUrl = "http://localhost:11434";
    std::string fallbackModel = "llama3.2";
};

struct EmbeddingConfig {
    std::string provider = "ollama";
    std::string model = "nomic-embed-text";
    std::string url = "http://localhost:11434";
    std::string apiKey;
    std::chrono::seconds timeout{30};

    bool fallbackEnabled = true;
    std::string fallbackProvider = "ollama";
    std::string fallbackModel = "nomic-embed-text";
    std::string fallbackUrl = "http://localhost:11434";

    size_t cacheSize = 1000;
    std::chrono::seconds cacheTtl{3600};
};

struct DefaultsConfig {
    int certainty = 80;
    int importance = 50;
    size_t searchLimit = 10;
    std::string searchMode = "recent";
};

struct ChunkingConfig {
    bool enabled = true;
    size_t threshold = 1000; ///< Code points at or above which content is chunked
    size_t chunkSize = 512;  ///< Estimated tokens per chunk
    size_t overlap = 128;    ///< Characters carried into the next chunk
};

/**
 * @brief Runtime configuration assembled from HELIX_* environment variables.
 *
 * Parsing never fails; malformed values are recorded and reported by validate().
 */
struct OmcConfig {
    StoreConfig store;
    LlmConfig llm;
    EmbeddingConfig embedding;
    DefaultsConfig defaults;
    ChunkingConfig chunking;

    using EnvGetter = std::function<std::optional<std::string>(const std::string&)>;

    static OmcConfig fromEnvironment();
    static OmcConfig fromEnvironment(const EnvGetter& getenv);

    Result<void> validate() const;

    /// Problems found while parsing (bad numbers, bad booleans)
    std::vector<std::string> parseErrors;
};

} // namespace omc::config
