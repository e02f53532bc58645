#include <gtest/gtest.h>

#include "../../common/fake_providers.h"
#include "../../common/fake_store.h"

#include <omc/core/executor.h>
#include <omc/core/time_utils.h>
#include <omc/search/search_common.h>
#include <omc/search/search_modes.h>
#include <omc/search/smart_traversal.h>

#include <atomic>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <thread>

using namespace omc;
using namespace omc::search;
using omc::test::axisVector;
using omc::test::FakeStoreTransport;
using omc::test::makeClient;
using omc::test::memoryRecord;
using omc::test::vectorWithCosine;

namespace {

SearchResult scored(std::string id, double combined) {
    SearchResult r;
    r.memory_id = std::move(id);
    r.combined_score = combined;
    return r;
}

// Throws while expanding mem_hit; expansions of other seeds finish slowly
class ThrowingExpansionTransport : public store::IStoreTransport {
public:
    explicit ThrowingExpansionTransport(std::shared_ptr<FakeStoreTransport> inner)
        : inner_(std::move(inner)) {}

    Result<nlohmann::json> call(const std::string& query, const nlohmann::json& params) override {
        if (query == "getMemoryLogicalConnections") {
            if (params.value("memory_id", "") == "mem_hit")
                throw std::runtime_error("connection reset");
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            auto res = inner_->call(query, params);
            ++finished;
            return res;
        }
        return inner_->call(query, params);
    }

    std::atomic<int> finished{0};

private:
    std::shared_ptr<FakeStoreTransport> inner_;
};

SearchConfig makeSearchConfig(size_t graphDepth) {
    SearchConfig c;
    c.vector_top_k = 10;
    c.graph_depth = graphDepth;
    c.min_vector_score = 0.5;
    c.min_combined_score = 0.3;
    return c;
}

} // namespace

TEST(SearchModesTest, DefaultsAndParsing) {
    EXPECT_EQ(parseSearchMode("DEEP"), SearchMode::Deep);
    EXPECT_EQ(parseSearchMode("whatever"), SearchMode::Recent);
    EXPECT_STREQ(toString(SearchMode::Contextual), "contextual");

    auto full = defaultsFor(SearchMode::Full);
    EXPECT_EQ(full.max_results, 100u);
    EXPECT_EQ(full.vector_top_k, 100u);
    EXPECT_FALSE(full.temporal_days.has_value());

    auto contextual = SearchConfig::fromMode(SearchMode::Contextual);
    EXPECT_EQ(contextual.graph_depth, 2u);
    EXPECT_DOUBLE_EQ(contextual.min_combined_score, 0.3);
}

TEST(SearchModesTest, TemporalCutoff) {
    const auto now = std::chrono::system_clock::now();
    auto recent = temporalCutoff(SearchMode::Recent, now);
    ASSERT_TRUE(recent.has_value());
    using Seconds = std::chrono::duration<double>;
    EXPECT_NEAR(std::chrono::duration_cast<Seconds>(now - *recent).count(), 4 * 3600.0, 1e-3);
    auto deep = temporalCutoff(SearchMode::Deep, now);
    ASSERT_TRUE(deep.has_value());
    EXPECT_NEAR(std::chrono::duration_cast<Seconds>(now - *deep).count(), 90 * 86400.0, 1e-3);
    EXPECT_FALSE(temporalCutoff(SearchMode::Full, now).has_value());
}

TEST(SearchCommonTest, EdgeWeightsAndKeys) {
    EXPECT_DOUBLE_EQ(edgeWeight("because_out"), 0.95);
    EXPECT_DOUBLE_EQ(edgeWeight("implies_in"), 0.8);
    EXPECT_DOUBLE_EQ(edgeWeight("mystery_out"), 0.5);
    EXPECT_EQ(relationOfKey("contradicts_in"), "contradicts");
    EXPECT_EQ(relationOfKey("plain"), "plain");
}

TEST(SearchCommonTest, FiltersAndScores) {
    const auto now = std::chrono::system_clock::now();
    auto m = memoryRecord("mem_x", "text", "alice", 10).get<store::MemoryRecord>();

    EXPECT_TRUE(passesFilters(m, std::nullopt, std::nullopt, now));
    EXPECT_TRUE(passesFilters(m, std::string("alice"), std::nullopt, now));
    EXPECT_FALSE(passesFilters(m, std::string("bob"), std::nullopt, now));
    EXPECT_FALSE(passesFilters(m, std::nullopt, now - std::chrono::hours(24), now));
    EXPECT_TRUE(passesFilters(m, std::nullopt, now - std::chrono::hours(24 * 11), now));

    m.is_deleted = true;
    EXPECT_FALSE(passesFilters(m, std::nullopt, std::nullopt, now));
    m.is_deleted = false;
    m.valid_until = core::formatTimestamp(now - std::chrono::hours(1));
    EXPECT_FALSE(passesFilters(m, std::nullopt, std::nullopt, now));

    const auto q = axisVector(0);
    EXPECT_NEAR(vectorScore(q, vectorWithCosine(0, 1, 0.6), 0.1), 0.6, 1e-5);
    EXPECT_DOUBLE_EQ(vectorScore(q, vectorWithCosine(0, 1, -0.6), 0.9), 0.0);
    EXPECT_NEAR(vectorScore(q, axisVector(1), 0.9), 0.0, 1e-9);
    EXPECT_DOUBLE_EQ(vectorScore(q, std::nullopt, 1.7), 1.0);
    EXPECT_NEAR(semanticScore(q, vectorWithCosine(0, 1, 0.6)), 0.8, 1e-5);
    EXPECT_NEAR(semanticScore(q, axisVector(1)), 0.5, 1e-9);
    EXPECT_DOUBLE_EQ(semanticScore(q, std::nullopt), 0.5);
    EXPECT_DOUBLE_EQ(semanticScore(q, std::nullopt, 0.25), 0.25);
    EXPECT_DOUBLE_EQ(temporalScore("garbage", 30.0, now), 0.5);
    EXPECT_NEAR(temporalScore(core::formatTimestamp(now - std::chrono::hours(24 * 30)), 30.0, now),
                std::exp(-1.0), 1e-3);
}

TEST(SearchCommonTest, RankKeepsBestPerMemory) {
    auto ranked = rankAndFilter({scored("a", 0.4), scored("b", 0.9), scored("a", 0.7),
                                 scored("c", 0.2), scored("d", 0.5)},
                                0.3);
    ASSERT_EQ(ranked.size(), 3u);
    EXPECT_EQ(ranked[0].memory_id, "b");
    EXPECT_EQ(ranked[1].memory_id, "a");
    EXPECT_DOUBLE_EQ(ranked[1].combined_score, 0.7);
    EXPECT_EQ(ranked[2].memory_id, "d");
}

class SmartTraversalTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<FakeStoreTransport>();
        transport_->putMemory(memoryRecord("mem_hit", "Alice writes Rust daily"), axisVector(0));
        transport_->putMemory(memoryRecord("mem_mid", "Alice tried Zig"),
                              vectorWithCosine(0, 1, 0.6));
        transport_->putMemory(memoryRecord("mem_low", "Alice bakes bread"),
                              vectorWithCosine(0, 2, -0.6));
        transport_->putMemory(memoryRecord("mem_old", "Alice wrote Rust in 2019", "alice", 60),
                              vectorWithCosine(0, 3, 0.999));
        transport_->putMemory(memoryRecord("mem_bob", "Bob writes Rust", "bob"), axisVector(0));
        auto gone = memoryRecord("mem_gone", "Alice wrote C++", "alice");
        gone["is_deleted"] = true;
        transport_->putMemory(gone, axisVector(0));

        transport_->putMemory(memoryRecord("mem_neighbor", "Alice likes memory safety"));
        transport_->putMemory(memoryRecord("mem_deep", "Alice was bitten by a use-after-free"));
        transport_->addEdge("IMPLIES", "mem_hit", "mem_neighbor", 90);
        transport_->addEdge("BECAUSE", "mem_neighbor", "mem_deep", 80);

        store_ = makeClient(transport_, 1);
        traversal_ = std::make_unique<SmartTraversal>(store_, pool_.get_executor());
    }

    std::optional<TimePoint> lastMonth() const {
        return std::chrono::system_clock::now() - std::chrono::hours(24 * 30);
    }

    core::WorkerPool pool_{2};
    std::shared_ptr<FakeStoreTransport> transport_;
    std::shared_ptr<store::StoreClient> store_;
    std::unique_ptr<SmartTraversal> traversal_;
    const Embedding query_ = axisVector(0);
};

TEST_F(SmartTraversalTest, VectorPhaseFiltersAndScores) {
    auto res = traversal_->search("rust", query_, std::string("alice"), makeSearchConfig(0), lastMonth());
    ASSERT_TRUE(res) << res.error().message;
    const auto& results = res.value();
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].memory_id, "mem_hit");
    EXPECT_NEAR(results[0].combined_score, 1.0, 1e-3);
    EXPECT_EQ(results[0].source, ResultSource::Vector);
    EXPECT_EQ(results[1].memory_id, "mem_mid");
    EXPECT_NEAR(results[1].vector_score, 0.6, 1e-4);
    EXPECT_NEAR(results[1].combined_score, 0.72, 1e-3);
}

TEST(SmartTraversalThresholdTest, UnrelatedMemoriesNeverPassTheVectorThreshold) {
    auto transport = std::make_shared<FakeStoreTransport>();
    transport->putMemory(memoryRecord("mem_orthogonal", "Alice bakes bread"), axisVector(4));
    transport->putMemory(memoryRecord("mem_weak", "Alice tried Zig once"),
                         vectorWithCosine(0, 5, 0.3));
    core::WorkerPool pool{1};
    SmartTraversal traversal(makeClient(transport, 1), pool.get_executor());

    for (auto mode : {SearchMode::Recent, SearchMode::Contextual, SearchMode::Deep}) {
        auto res = traversal.search("rust", axisVector(0), std::string("alice"),
                                    SearchConfig::fromMode(mode), std::nullopt);
        ASSERT_TRUE(res) << res.error().message;
        EXPECT_TRUE(res.value().empty()) << toString(mode);
    }
}

TEST_F(SmartTraversalTest, CutoffExcludesOlderMemories) {
    auto cutoff = lastMonth();
    auto windowed = traversal_->search("rust", query_, std::string("alice"), makeSearchConfig(0), cutoff);
    ASSERT_TRUE(windowed);
    for (const auto& r : windowed.value()) {
        auto created = core::parseTimestamp(r.created_at);
        ASSERT_TRUE(created.has_value());
        EXPECT_GE(*created, *cutoff);
    }

    auto unbounded = traversal_->search("rust", query_, std::string("alice"), makeSearchConfig(0),
                                        std::nullopt);
    ASSERT_TRUE(unbounded);
    bool sawOld = false;
    for (const auto& r : unbounded.value())
        sawOld = sawOld || r.memory_id == "mem_old";
    EXPECT_TRUE(sawOld);
}

TEST_F(SmartTraversalTest, GraphPhaseFollowsReasoningEdges) {
    auto res = traversal_->search("rust", query_, std::string("alice"), makeSearchConfig(2), lastMonth());
    ASSERT_TRUE(res);
    const auto& results = res.value();
    ASSERT_EQ(results.size(), 4u);

    const SearchResult* neighbor = nullptr;
    const SearchResult* deep = nullptr;
    for (const auto& r : results) {
        if (r.memory_id == "mem_neighbor")
            neighbor = &r;
        if (r.memory_id == "mem_deep")
            deep = &r;
    }
    ASSERT_NE(neighbor, nullptr);
    ASSERT_NE(deep, nullptr);

    EXPECT_EQ(neighbor->source, ResultSource::Graph);
    EXPECT_EQ(neighbor->depth, 1u);
    EXPECT_EQ(neighbor->via_edge.value_or(""), "implies_out");
    EXPECT_EQ(neighbor->parent_id.value_or(""), "mem_hit");
    EXPECT_NEAR(neighbor->graph_score, 0.9, 1e-3);
    EXPECT_NEAR(neighbor->combined_score, 0.8, 1e-3);

    EXPECT_EQ(deep->depth, 2u);
    EXPECT_EQ(deep->via_edge.value_or(""), "because_out");
    EXPECT_NEAR(deep->graph_score, 0.76, 1e-3);

    for (size_t i = 1; i < results.size(); ++i)
        EXPECT_GE(results[i - 1].combined_score, results[i].combined_score);
}

TEST_F(SmartTraversalTest, NeighbourSemanticScoreUsesItsVector) {
    // below the vector threshold, so only reachable over the edge
    transport_->addEdge("IMPLIES", "mem_hit", "mem_low", 70);
    auto res = traversal_->search("rust", query_, std::string("alice"), makeSearchConfig(1), lastMonth());
    ASSERT_TRUE(res);

    const SearchResult* low = nullptr;
    for (const auto& r : res.value()) {
        if (r.memory_id == "mem_low")
            low = &r;
    }
    ASSERT_NE(low, nullptr);
    EXPECT_EQ(low->source, ResultSource::Graph);
    EXPECT_NEAR(low->vector_score, 0.2, 1e-4);
    EXPECT_NEAR(low->graph_score, 0.9, 1e-3);
    EXPECT_NEAR(low->combined_score, 0.71, 1e-3);
}

TEST_F(SmartTraversalTest, FailedExpansionWaitsForSiblingSeeds) {
    auto throwing = std::make_shared<ThrowingExpansionTransport>(transport_);
    store::RetryPolicy policy;
    policy.maxRetries = 1;
    policy.initialDelay = std::chrono::milliseconds(0);
    policy.maxDelay = std::chrono::milliseconds(0);
    SmartTraversal traversal(std::make_shared<store::StoreClient>(throwing, policy),
                             pool_.get_executor());

    // seeds are mem_hit and mem_mid
    EXPECT_THROW(
        (void)traversal.search("rust", query_, std::string("alice"), makeSearchConfig(1), lastMonth()),
        std::runtime_error);
    EXPECT_EQ(throwing->finished.load(), 1);
}

TEST_F(SmartTraversalTest, DepthAndEdgeTypeLimits) {
    auto shallow = traversal_->search("rust", query_, std::string("alice"), makeSearchConfig(1), lastMonth());
    ASSERT_TRUE(shallow);
    EXPECT_EQ(shallow.value().size(), 3u);

    auto c = makeSearchConfig(2);
    c.edge_types = std::vector<std::string>{"because"};
    auto filtered = traversal_->search("rust", query_, std::string("alice"), c, lastMonth());
    ASSERT_TRUE(filtered);
    EXPECT_EQ(filtered.value().size(), 2u);
}

TEST_F(SmartTraversalTest, ResultsAreCachedPerFingerprint) {
    const auto c = makeSearchConfig(1);
    const auto cutoff = lastMonth();
    ASSERT_TRUE(traversal_->search("rust", query_, std::string("alice"), c, cutoff));
    ASSERT_TRUE(traversal_->search("rust", query_, std::string("alice"), c, cutoff));
    EXPECT_EQ(transport_->callCount("smartVectorSearchWithChunks"), 1u);

    auto stats = traversal_->stats();
    EXPECT_EQ(stats.cache_hits, 1u);
    EXPECT_EQ(stats.cache_misses, 1u);
    EXPECT_DOUBLE_EQ(stats.cache_hit_rate, 0.5);
    EXPECT_EQ(stats.cache_size, 1u);

    ASSERT_TRUE(traversal_->search("rust", query_, std::string("bob"), c, cutoff));
    EXPECT_EQ(transport_->callCount("smartVectorSearchWithChunks"), 2u);

    traversal_->clearCache();
    ASSERT_TRUE(traversal_->search("rust", query_, std::string("alice"), c, cutoff));
    EXPECT_EQ(transport_->callCount("smartVectorSearchWithChunks"), 3u);
}

TEST(SmartTraversalKeyTest, CutoffIsKeyedToTheMinute) {
    const auto q = axisVector(3);
    const auto c = makeSearchConfig(1);
    const TimePoint minute{std::chrono::minutes(29'000'000)};
    auto a = SmartTraversal::cacheKey(q, std::string("alice"), c, minute + std::chrono::seconds(5));
    auto b = SmartTraversal::cacheKey(q, std::string("alice"), c, minute + std::chrono::seconds(50));
    auto later =
        SmartTraversal::cacheKey(q, std::string("alice"), c, minute + std::chrono::seconds(65));
    EXPECT_EQ(a, b);
    EXPECT_NE(a, later);
    EXPECT_EQ(a.size(), 64u);
    EXPECT_NE(a, SmartTraversal::cacheKey(q, std::nullopt, c, minute));
}

TEST_F(SmartTraversalTest, StoreFailuresSurfaceAsDatabaseErrors) {
    transport_->failQuery("smartVectorSearchWithChunks", Error{ErrorCode::NetworkError, "down"});
    auto res = traversal_->search("rust", query_, std::string("alice"), makeSearchConfig(1), lastMonth());
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::DatabaseError);

    transport_->failQuery("smartVectorSearchWithChunks", Error{ErrorCode::NotFound, "no index"});
    auto empty = traversal_->search("rust2", axisVector(1), std::string("alice"), makeSearchConfig(1),
                                    lastMonth());
    ASSERT_TRUE(empty);
    EXPECT_TRUE(empty.value().empty());
}
