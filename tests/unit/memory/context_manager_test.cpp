#include <gtest/gtest.h>

#include "../../common/fake_store.h"

#include <omc/memory/context_manager.h>

using namespace omc;
using omc::test::FakeStoreTransport;
using omc::test::makeClient;
using omc::test::memoryRecord;

class ContextManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<FakeStoreTransport>();
        transport_->putMemory(memoryRecord("mem_a", "A"));
        contexts_ = std::make_unique<memory::ContextManager>(makeClient(transport_, 1), 3);
    }

    std::shared_ptr<FakeStoreTransport> transport_;
    std::unique_ptr<memory::ContextManager> contexts_;
};

TEST_F(ContextManagerTest, CreateCachesAndPersists) {
    auto ctx = contexts_->createContext("work", {{"team", "core"}});
    ASSERT_TRUE(ctx);
    EXPECT_EQ(ctx.value().context_id.rfind("ctx_", 0), 0u);
    EXPECT_EQ(transport_->contexts().size(), 1u);

    transport_->resetCalls();
    auto cached = contexts_->getContext(ctx.value().context_id);
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->properties["team"], "core");
    EXPECT_EQ(transport_->callCount("getContext"), 0u);

    auto byName = contexts_->getContextByName("WORK");
    ASSERT_TRUE(byName.has_value());
    EXPECT_EQ(byName->context_id, ctx.value().context_id);
}

TEST_F(ContextManagerTest, StoreFailureStillCaches) {
    transport_->failNext("addContext", Error{ErrorCode::DatabaseError, "down"});
    auto ctx = contexts_->createContext("travel");
    ASSERT_TRUE(ctx);
    EXPECT_TRUE(transport_->contexts().empty());
    EXPECT_EQ(contexts_->cacheSize(), 1u);
}

TEST_F(ContextManagerTest, EmptyNameIsRejected) {
    EXPECT_EQ(contexts_->createContext("  ").error().code, ErrorCode::ValidationError);
}

TEST_F(ContextManagerTest, CacheIsBounded) {
    for (int i = 0; i < 5; ++i)
        ASSERT_TRUE(contexts_->createContext("ctx" + std::to_string(i)));
    EXPECT_EQ(contexts_->cacheSize(), 3u);
}

TEST_F(ContextManagerTest, LinkValidatesPriority) {
    auto ctx = contexts_->createContext("home").value();
    EXPECT_EQ(contexts_->linkMemoryToContext("mem_a", ctx.context_id, 101).error().code,
              ErrorCode::ValidationError);
    EXPECT_EQ(contexts_->linkMemoryToContext("mem_a", ctx.context_id, -1).error().code,
              ErrorCode::ValidationError);
    ASSERT_TRUE(contexts_->linkMemoryToContext("mem_a", ctx.context_id, 0));
    ASSERT_TRUE(contexts_->linkMemoryToContext("mem_a", ctx.context_id, 100));
    EXPECT_EQ(transport_->contextLinks().size(), 2u);
}

TEST_F(ContextManagerTest, UnknownContextIsNullopt) {
    EXPECT_FALSE(contexts_->getContext("ctx_missing").has_value());
    EXPECT_FALSE(contexts_->getContextByName("nothing").has_value());
}

TEST_F(ContextManagerTest, WarmUpLoadsOnce) {
    auto other = std::make_unique<memory::ContextManager>(makeClient(transport_, 1));
    ASSERT_TRUE(other->createContext("one"));
    ASSERT_TRUE(other->createContext("two"));

    transport_->resetCalls();
    EXPECT_EQ(contexts_->warmUp(), 2u);
    EXPECT_EQ(contexts_->warmUp(), 2u);
    EXPECT_EQ(transport_->callCount("getRecentContexts"), 1u);
}

TEST_F(ContextManagerTest, ActiveContextsPerUser) {
    contexts_->activateContext("alice", "ctx_1");
    contexts_->activateContext("alice", "ctx_1");
    contexts_->activateContext("alice", "ctx_2");
    EXPECT_EQ(contexts_->activeContexts("alice").size(), 2u);
    contexts_->deactivateContext("alice", "ctx_1");
    EXPECT_EQ(contexts_->activeContexts("alice"), std::vector<std::string>{"ctx_2"});
    EXPECT_TRUE(contexts_->activeContexts("bob").empty());
}
