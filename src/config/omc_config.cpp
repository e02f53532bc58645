#include <omc/config/config_helpers.h>
#include <omc/config/omc_config.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>
#include <fmt/format.h>

namespace omc::config {

namespace {

std::optional<std::string> systemEnv(const std::string& name) {
    const char* v = std::getenv(name.c_str());
    if (!v)
        return std::nullopt;
    return std::string(v);
}

class EnvReader {
public:
    EnvReader(const OmcConfig::EnvGetter& getenv, std::vector<std::string>& errors)
        : getenv_(getenv), errors_(errors) {}

    void string(const char* name, std::string& out) {
        if (auto v = getenv_(name)) {
            auto s = unquote(*v);
            if (!s.empty())
                out = std::move(s);
        }
    }

    template <typename T> void integer(const char* name, T& out) {
        auto v = getenv_(name);
        if (!v)
            return;
        auto s = unquote(*v);
        long long parsed = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), parsed);
        if (ec != std::errc{} || ptr != s.data() + s.size() || parsed < 0) {
            errors_.push_back(fmt::format("{}: invalid integer '{}'", name, s));
            return;
        }
        out = static_cast<T>(parsed);
    }

    void seconds(const char* name, std::chrono::seconds& out) {
        long long secs = out.count();
        integer(name, secs);
        out = std::chrono::seconds(secs);
    }

    void real(const char* name, double& out) {
        auto v = getenv_(name);
        if (!v)
            return;
        auto s = unquote(*v);
        char* end = nullptr;
        double parsed = std::strtod(s.c_str(), &end);
        if (s.empty() || end != s.c_str() + s.size()) {
            errors_.push_back(fmt::format("{}: invalid number '{}'", name, s));
            return;
        }
        out = parsed;
    }

    void boolean(const char* name, bool& out) {
        auto v = getenv_(name);
        if (!v)
            return;
        if (auto b = parseBool(*v)) {
            out = *b;
        } else {
            errors_.push_back(fmt::format("{}: invalid boolean '{}'", name, *v));
        }
    }

private:
    const OmcConfig::EnvGetter& getenv_;
    std::vector<std::string>& errors_;
};

bool isKnownLlmProvider(const std::string& p) {
    auto lp = toLower(p);
    return lp == "cerebras" || lp == "ollama" || lp == "openai" || lp == "openai-compatible";
}

bool isKnownEmbeddingProvider(const std::string& p) {
    auto lp = toLower(p);
    return lp == "ollama" || lp == "openai" || lp == "openai-compatible";
}

} // namespace

std::string StoreConfig::baseUrl() const {
    return fmt::format("http://{}:{}", host, port);
}

OmcConfig OmcConfig::fromEnvironment() {
    return fromEnvironment(systemEnv);
}

OmcConfig OmcConfig::fromEnvironment(const EnvGetter& getenv) {
    OmcConfig cfg;
    EnvReader env(getenv, cfg.parseErrors);

    env.string("HELIX_HOST", cfg.store.host);
    env.integer("HELIX_PORT", cfg.store.port);
    env.string("HELIX_INSTANCE", cfg.store.instance);
    env.seconds("HELIX_TIMEOUT", cfg.store.timeout);
    env.integer("HELIX_MAX_RETRIES", cfg.store.maxRetries);

    env.string("HELIX_LLM_PROVIDER", cfg.llm.provider);
    env.string("HELIX_LLM_MODEL", cfg.llm.model);
    env.string("HELIX_LLM_API_KEY", cfg.llm.apiKey);
    env.string("HELIX_LLM_BASE_URL", cfg.llm.baseUrl);
    env.real("HELIX_LLM_TEMPERATURE", cfg.llm.temperature);
    env.seconds("HELIX_LLM_TIMEOUT", cfg.llm.timeout);
    env.boolean("HELIX_LLM_FALLBACK_ENABLED", cfg.llm.fallbackEnabled);
    env.string("HELIX_LLM_FALLBACK_URL", cfg.llm.fallbackUrl);
    env.string("HELIX_LLM_FALLBACK_MODEL", cfg.llm.fallbackModel);

    env.string("HELIX_EMBEDDING_PROVIDER", cfg.embedding.provider);
    env.string("HELIX_EMBEDDING_MODEL", cfg.embedding.model);
    env.string("HELIX_EMBEDDING_URL", cfg.embedding.url);
    env.string("HELIX_EMBEDDING_API_KEY", cfg.embedding.apiKey);
    env.seconds("HELIX_EMBEDDING_TIMEOUT", cfg.embedding.timeout);
    env.boolean("HELIX_EMBEDDING_FALLBACK_ENABLED", cfg.embedding.fallbackEnabled);
    env.string("HELIX_EMBEDDING_FALLBACK_PROVIDER", cfg.embedding.fallbackProvider);
    env.string("HELIX_EMBEDDING_FALLBACK_MODEL", cfg.embedding.fallbackModel);
    env.string("HELIX_EMBEDDING_FALLBACK_URL", cfg.embedding.fallbackUrl);

    env.integer("HELIX_DEFAULT_CERTAINTY", cfg.defaults.certainty);
    env.integer("HELIX_DEFAULT_IMPORTANCE", cfg.defaults.importance);
    env.integer("HELIX_SEARCH_LIMIT", cfg.defaults.searchLimit);
    env.string("HELIX_SEARCH_MODE", cfg.defaults.searchMode);

    env.boolean("HELIX_CHUNKING_ENABLED", cfg.chunking.enabled);
    env.integer("HELIX_CHUNK_THRESHOLD", cfg.chunking.threshold);
    env.integer("HELIX_CHUNK_SIZE", cfg.chunking.chunkSize);
    env.integer("HELIX_CHUNK_OVERLAP", cfg.chunking.overlap);

    for (const auto& e : cfg.parseErrors) {
        spdlog::warn("[Config] {}", e);
    }
    return cfg;
}

Result<void> OmcConfig::validate() const {
    if (!parseErrors.empty()) {
        return Error{ErrorCode::ConfigurationError, parseErrors.front()};
    }
    if (store.host.empty()) {
        return Error{ErrorCode::ConfigurationError, "HELIX_HOST must not be empty"};
    }
    if (store.port == 0) {
        return Error{ErrorCode::ConfigurationError, "HELIX_PORT must be in 1..65535"};
    }
    if (!isKnownLlmProvider(llm.provider)) {
        return Error{ErrorCode::ConfigurationError,
                     fmt::format("Unknown LLM provider: {}", llm.provider)};
    }
    if (!isKnownEmbeddingProvider(embedding.provider)) {
        return Error{ErrorCode::ConfigurationError,
                     fmt::format("Unknown embedding provider: {}", embedding.provider)};
    }
    if (llm.temperature < 0.0 || llm.temperature > 2.0) {
        return Error{ErrorCode::ConfigurationError, "HELIX_LLM_TEMPERATURE must be in 0..2"};
    }
    if (defaults.certainty < 0 || defaults.certainty > 100) {
        return Error{ErrorCode::ConfigurationError, "HELIX_DEFAULT_CERTAINTY must be in 0..100"};
    }
    if (defaults.importance < 0 || defaults.importance > 100) {
        return Error{ErrorCode::ConfigurationError, "HELIX_DEFAULT_IMPORTANCE must be in 0..100"};
    }
    if (defaults.searchLimit == 0) {
        return Error{ErrorCode::ConfigurationError, "HELIX_SEARCH_LIMIT must be positive"};
    }
    if (chunking.chunkSize == 0) {
        return Error{ErrorCode::ConfigurationError, "HELIX_CHUNK_SIZE must be positive"};
    }
    return {};
}

} // namespace omc::config
