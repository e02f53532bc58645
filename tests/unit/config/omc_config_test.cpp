#include <gtest/gtest.h>

#include <omc/config/config_helpers.h>
#include <omc/config/omc_config.h>

#include <map>
#include <string>

using omc::ErrorCode;
using omc::config::OmcConfig;

namespace {

OmcConfig::EnvGetter envFrom(std::map<std::string, std::string> values) {
    return [values = std::move(values)](const std::string& name) -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end())
            return std::nullopt;
        return it->second;
    };
}

} // namespace

TEST(OmcConfigTest, DefaultsWithEmptyEnvironment) {
    auto cfg = OmcConfig::fromEnvironment(envFrom({}));
    EXPECT_EQ(cfg.store.host, "localhost");
    EXPECT_EQ(cfg.store.port, 6969);
    EXPECT_EQ(cfg.store.baseUrl(), "http://localhost:6969");
    EXPECT_EQ(cfg.defaults.certainty, 80);
    EXPECT_EQ(cfg.defaults.importance, 50);
    EXPECT_EQ(cfg.chunking.threshold, 1000u);
    EXPECT_TRUE(cfg.parseErrors.empty());
    EXPECT_TRUE(cfg.validate());
}

TEST(OmcConfigTest, ReadsOverrides) {
    auto cfg = OmcConfig::fromEnvironment(envFrom({{"HELIX_HOST", "db.internal"},
                                                   {"HELIX_PORT", "7000"},
                                                   {"HELIX_LLM_PROVIDER", "ollama"},
                                                   {"HELIX_LLM_TEMPERATURE", "0.7"},
                                                   {"HELIX_LLM_FALLBACK_ENABLED", "off"},
                                                   {"HELIX_SEARCH_LIMIT", "25"},
                                                   {"HELIX_EMBEDDING_TIMEOUT", "5"},
                                                   {"HELIX_CHUNK_SIZE", "\"256\""}}));
    EXPECT_EQ(cfg.store.baseUrl(), "http://db.internal:7000");
    EXPECT_EQ(cfg.llm.provider, "ollama");
    EXPECT_DOUBLE_EQ(cfg.llm.temperature, 0.7);
    EXPECT_FALSE(cfg.llm.fallbackEnabled);
    EXPECT_EQ(cfg.defaults.searchLimit, 25u);
    EXPECT_EQ(cfg.embedding.timeout.count(), 5);
    EXPECT_EQ(cfg.chunking.chunkSize, 256u);
    EXPECT_TRUE(cfg.validate());
}

TEST(OmcConfigTest, MalformedValuesFailValidation) {
    auto cfg = OmcConfig::fromEnvironment(envFrom({{"HELIX_PORT", "abc"}}));
    ASSERT_EQ(cfg.parseErrors.size(), 1u);
    EXPECT_EQ(cfg.store.port, 6969);
    auto v = cfg.validate();
    ASSERT_FALSE(v);
    EXPECT_EQ(v.error().code, ErrorCode::ConfigurationError);

    auto badBool = OmcConfig::fromEnvironment(envFrom({{"HELIX_CHUNKING_ENABLED", "maybe"}}));
    EXPECT_FALSE(badBool.validate());
}

TEST(OmcConfigTest, ValidateRejectsOutOfRangeValues) {
    auto cfg = OmcConfig::fromEnvironment(envFrom({}));
    cfg.llm.provider = "mystery";
    EXPECT_EQ(cfg.validate().error().code, ErrorCode::ConfigurationError);

    cfg = OmcConfig::fromEnvironment(envFrom({{"HELIX_DEFAULT_CERTAINTY", "150"}}));
    EXPECT_FALSE(cfg.validate());

    cfg = OmcConfig::fromEnvironment(envFrom({{"HELIX_LLM_TEMPERATURE", "3.5"}}));
    EXPECT_FALSE(cfg.validate());

    cfg = OmcConfig::fromEnvironment(envFrom({}));
    cfg.store.port = 0;
    EXPECT_FALSE(cfg.validate());
}

TEST(ConfigHelpersTest, ParseBool) {
    using omc::config::parseBool;
    EXPECT_EQ(parseBool("TRUE"), std::optional<bool>(true));
    EXPECT_EQ(parseBool(" yes "), std::optional<bool>(true));
    EXPECT_EQ(parseBool("'0'"), std::optional<bool>(false));
    EXPECT_EQ(parseBool("off"), std::optional<bool>(false));
    EXPECT_FALSE(parseBool("2").has_value());
}

TEST(ConfigHelpersTest, Trimming) {
    EXPECT_EQ(omc::config::trimmed("  a b \n"), "a b");
    EXPECT_EQ(omc::config::unquote(" \"quoted\" "), "quoted");
    EXPECT_EQ(omc::config::toLower("MiXeD"), "mixed");
}
