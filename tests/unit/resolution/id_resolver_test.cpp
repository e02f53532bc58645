#include <gtest/gtest.h>

#include "../../common/fake_store.h"

#include <omc/core/executor.h>
#include <omc/resolution/batch_resolver.h>
#include <omc/resolution/id_resolver.h>

#include <chrono>
#include <stop_token>
#include <thread>

using namespace omc;
using omc::test::FakeStoreTransport;
using omc::test::makeClient;
using omc::test::memoryRecord;

class IdResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<FakeStoreTransport>();
        internalA_ = transport_->putMemory(memoryRecord("mem_a", "first"));
        internalB_ = transport_->putMemory(memoryRecord("mem_b", "second"));
        client_ = makeClient(transport_, 3);
    }

    std::shared_ptr<FakeStoreTransport> transport_;
    std::shared_ptr<store::StoreClient> client_;
    std::string internalA_;
    std::string internalB_;
};

TEST_F(IdResolverTest, CachesWithinTtl) {
    resolution::IdResolver resolver(client_);
    for (int i = 0; i < 5; ++i) {
        auto res = resolver.resolve("mem_a");
        ASSERT_TRUE(res);
        EXPECT_EQ(res.value(), internalA_);
    }
    EXPECT_EQ(transport_->callCount("getMemory"), 1u);
    EXPECT_EQ(resolver.stats().hits, 4u);
}

TEST_F(IdResolverTest, ExpiredEntriesCostOneLookup) {
    resolution::IdResolver resolver(client_, {100, std::chrono::milliseconds(20)});
    ASSERT_TRUE(resolver.resolve("mem_a"));
    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    ASSERT_TRUE(resolver.resolve("mem_a"));
    EXPECT_EQ(transport_->callCount("getMemory"), 2u);
}

TEST_F(IdResolverTest, UnknownIdsAreNotFoundAndNotCached) {
    resolution::IdResolver resolver(client_);
    for (int i = 0; i < 2; ++i) {
        auto res = resolver.resolve("mem_missing");
        ASSERT_FALSE(res);
        EXPECT_EQ(res.error().code, ErrorCode::NotFound);
    }
    EXPECT_EQ(transport_->callCount("getMemory"), 2u);
    EXPECT_EQ(resolver.stats().size, 0u);
}

TEST_F(IdResolverTest, LookupFailuresAreNotRetried) {
    resolution::IdResolver resolver(client_);
    transport_->failNext("getMemory", Error{ErrorCode::NetworkError, "reset"});
    auto res = resolver.resolve("mem_a");
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::NetworkError);
    EXPECT_EQ(transport_->callCount("getMemory"), 1u);
}

TEST_F(IdResolverTest, EmptyIdIsInvalid) {
    resolution::IdResolver resolver(client_);
    EXPECT_EQ(resolver.resolve("").error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(transport_->callCount("getMemory"), 0u);
}

TEST_F(IdResolverTest, RememberAndInvalidate) {
    resolution::IdResolver resolver(client_);
    resolver.remember("mem_a", "int_seeded");
    EXPECT_EQ(resolver.resolve("mem_a").value(), "int_seeded");
    EXPECT_EQ(transport_->callCount("getMemory"), 0u);

    resolver.invalidate("mem_a");
    EXPECT_EQ(resolver.resolve("mem_a").value(), internalA_);
    EXPECT_EQ(transport_->callCount("getMemory"), 1u);
}

TEST_F(IdResolverTest, ResolveManySkipsFailures) {
    resolution::IdResolver resolver(client_);
    auto out = resolver.resolveMany({"mem_a", "mem_missing", "mem_b", "mem_a"});
    EXPECT_EQ(out.size(), 2u);
    EXPECT_EQ(out["mem_b"], internalB_);
}

TEST_F(IdResolverTest, BatchResolvesConcurrentlyAndReportsFailures) {
    core::WorkerPool pool(4);
    auto resolver = std::make_shared<resolution::IdResolver>(client_);
    resolution::BatchResolver batch(resolver, pool.get_executor(),
                                    {2, 1, std::chrono::milliseconds(1)});

    auto res = batch.resolveBatch({"mem_a", "mem_b", "mem_a", "mem_missing"});
    ASSERT_TRUE(res);
    const auto& result = res.value();
    EXPECT_EQ(result.successCount(), 2u);
    ASSERT_EQ(result.failureCount(), 1u);
    EXPECT_EQ(result.failed.front().first, "mem_missing");
    EXPECT_EQ(result.failed.front().second.code, ErrorCode::NotFound);
    EXPECT_FALSE(result.isComplete());
    // NotFound is final: one lookup per unique id
    EXPECT_EQ(transport_->callCount("getMemory"), 3u);
}

TEST_F(IdResolverTest, BatchFailFastReturnsPartialFailure) {
    core::WorkerPool pool(2);
    auto resolver = std::make_shared<resolution::IdResolver>(client_);
    resolution::BatchResolver batch(resolver, pool.get_executor());
    auto res = batch.resolveBatch({"mem_a", "mem_missing"}, true);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::PartialFailure);
}

TEST_F(IdResolverTest, BatchRetriesTransientFailures) {
    core::WorkerPool pool(2);
    auto resolver = std::make_shared<resolution::IdResolver>(client_);
    resolution::BatchResolver batch(resolver, pool.get_executor(),
                                    {1, 2, std::chrono::milliseconds(1)});
    transport_->failNext("getMemory", Error{ErrorCode::NetworkError, "reset"}, 2);
    auto res = batch.resolveBatch({"mem_a"});
    ASSERT_TRUE(res);
    EXPECT_TRUE(res.value().isComplete());
    EXPECT_EQ(transport_->callCount("getMemory"), 3u);
}

TEST_F(IdResolverTest, BatchHonorsStopToken) {
    core::WorkerPool pool(2);
    auto resolver = std::make_shared<resolution::IdResolver>(client_);
    resolution::BatchResolver batch(resolver, pool.get_executor());
    std::stop_source source;
    source.request_stop();
    auto res = batch.resolveBatch({"mem_a", "mem_b"}, false, source.get_token());
    ASSERT_TRUE(res);
    EXPECT_EQ(res.value().failureCount(), 2u);
    EXPECT_EQ(res.value().failed.front().second.code, ErrorCode::OperationCancelled);
}
