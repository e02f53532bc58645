#include <gtest/gtest.h>

#include "../../common/fake_providers.h"
#include "../../common/fake_store.h"

#include <omc/memory/memory_crud.h>
#include <omc/memory/memory_types.h>
#include <omc/memory/user_linker.h>

using namespace omc;
using omc::test::FakeStoreTransport;
using omc::test::makeClient;
using omc::test::memoryRecord;

class MemoryCrudTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<FakeStoreTransport>();
        store_ = makeClient(transport_, 1);
        resolver_ = std::make_shared<resolution::IdResolver>(store_);
        provider_ = std::make_shared<test::FakeEmbeddingProvider>();
        users_ = std::make_shared<memory::UserLinker>(store_);
        crud_ = std::make_unique<memory::MemoryCrud>(store_, resolver_,
                                                     test::makeGenerator(provider_), users_,
                                                     memory::MemoryDefaults{70, 40});
    }

    memory::AddMemoryRequest request(std::string content, std::string user = "alice") {
        memory::AddMemoryRequest req;
        req.content = std::move(content);
        req.user_id = std::move(user);
        return req;
    }

    std::shared_ptr<FakeStoreTransport> transport_;
    std::shared_ptr<store::StoreClient> store_;
    std::shared_ptr<resolution::IdResolver> resolver_;
    std::shared_ptr<test::FakeEmbeddingProvider> provider_;
    std::shared_ptr<memory::UserLinker> users_;
    std::unique_ptr<memory::MemoryCrud> crud_;
};

TEST_F(MemoryCrudTest, AddWritesNodeEmbeddingAndOwnership) {
    auto req = request("  Alice prefers Rust over Go  ");
    req.memory_type = "Preference";
    auto res = crud_->addMemory(req);
    ASSERT_TRUE(res) << res.error().message;

    const auto& rec = res.value();
    EXPECT_EQ(rec.memory_id.rfind("mem_", 0), 0u);
    EXPECT_FALSE(rec.internal_id.empty());
    EXPECT_EQ(rec.content, "Alice prefers Rust over Go");
    EXPECT_EQ(rec.memory_type, "preference");
    EXPECT_EQ(rec.certainty, 70);
    EXPECT_EQ(rec.importance, 40);
    EXPECT_EQ(rec.created_at, rec.valid_from);

    ASSERT_TRUE(transport_->memory(rec.memory_id).has_value());
    EXPECT_TRUE(transport_->memoryVector(rec.memory_id).has_value());
    EXPECT_EQ(transport_->users().count("alice"), 1u);
    ASSERT_EQ(transport_->ownsEdges().size(), 1u);
    EXPECT_EQ(transport_->ownsEdges()[0], std::make_pair(std::string("alice"), rec.memory_id));

    // the returned internal id is cached for later lookups
    transport_->resetCalls();
    EXPECT_EQ(resolver_->resolve(rec.memory_id).value(), rec.internal_id);
    EXPECT_EQ(transport_->callCount("getMemory"), 0u);
}

TEST_F(MemoryCrudTest, ExistingUserIsNotRecreated) {
    ASSERT_TRUE(crud_->addMemory(request("first")));
    ASSERT_TRUE(crud_->addMemory(request("second")));
    EXPECT_EQ(transport_->callCount("addUser"), 1u);
    EXPECT_EQ(transport_->ownsEdges().size(), 2u);
}

TEST_F(MemoryCrudTest, UnknownTypeIsStoredAsFact) {
    auto req = request("something");
    req.memory_type = "rumour";
    EXPECT_EQ(crud_->addMemory(req).value().memory_type, "fact");
}

TEST_F(MemoryCrudTest, RejectsInvalidInput) {
    EXPECT_EQ(crud_->addMemory(request("   ")).error().code, ErrorCode::ValidationError);
    EXPECT_EQ(crud_->addMemory(request("text", "")).error().code, ErrorCode::ValidationError);

    auto req = request("text");
    req.certainty = 101;
    EXPECT_EQ(crud_->addMemory(req).error().code, ErrorCode::ValidationError);
    req.certainty = 50;
    req.importance = -1;
    EXPECT_EQ(crud_->addMemory(req).error().code, ErrorCode::ValidationError);
    EXPECT_EQ(transport_->callCount("addMemory"), 0u);
}

TEST_F(MemoryCrudTest, MissingInternalIdIsAnError) {
    transport_->setOmitInternalId(true);
    auto res = crud_->addMemory(request("text"));
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::MissingInternalId);
}

TEST_F(MemoryCrudTest, EmbeddingFailureIsNotFatal) {
    provider_->setFailing(true);
    auto res = crud_->addMemory(request("text"));
    ASSERT_TRUE(res);
    EXPECT_FALSE(transport_->memoryVector(res.value().memory_id).has_value());
    EXPECT_EQ(transport_->ownsEdges().size(), 1u);
}

TEST_F(MemoryCrudTest, PrecomputedVectorSkipsProvider) {
    auto req = request("text");
    req.vector = test::axisVector(3);
    auto res = crud_->addMemory(req);
    ASSERT_TRUE(res);
    EXPECT_EQ(provider_->calls(), 0u);
    EXPECT_EQ(*transport_->memoryVector(res.value().memory_id), test::axisVector(3));
}

TEST_F(MemoryCrudTest, NodeWriteFailureIsFatal) {
    transport_->failNext("addMemory", Error{ErrorCode::DatabaseError, "disk full"});
    auto res = crud_->addMemory(request("text"));
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::DatabaseError);
    EXPECT_TRUE(transport_->ownsEdges().empty());
}

TEST_F(MemoryCrudTest, GetAndList) {
    transport_->putMemory(memoryRecord("mem_a", "A"));
    transport_->putMemory(memoryRecord("mem_b", "B", "bob"));
    transport_->putMemory(memoryRecord("mem_c", "C"));

    auto got = crud_->getMemory("mem_a");
    ASSERT_TRUE(got);
    EXPECT_EQ(got.value().content, "A");
    EXPECT_EQ(crud_->getMemory("mem_x").error().code, ErrorCode::NotFound);

    auto listed = crud_->listMemories("alice", 10);
    ASSERT_TRUE(listed);
    EXPECT_EQ(listed.value().size(), 2u);
    EXPECT_EQ(crud_->listMemories("alice", 1).value().size(), 1u);
}

TEST(MemoryTypesTest, ParseAndNormalize) {
    EXPECT_EQ(memory::parseMemoryType(" GOAL "), memory::MemoryType::Goal);
    EXPECT_FALSE(memory::parseMemoryType("unknown").has_value());
    EXPECT_EQ(memory::normalizeMemoryType("Achievement"), "achievement");
    EXPECT_EQ(memory::normalizeMemoryType(""), "fact");
}
