#include <gtest/gtest.h>

#include "../../common/fake_store.h"

#include <omc/entity/entity_manager.h>

using namespace omc;
using omc::test::FakeStoreTransport;
using omc::test::makeClient;
using omc::test::memoryRecord;

class EntityManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<FakeStoreTransport>();
        transport_->putMemory(memoryRecord("mem_a", "Alice uses Rust at Acme"));
        store_ = makeClient(transport_, 1);
        entities_ = std::make_unique<entity::EntityManager>(store_);
    }

    std::shared_ptr<FakeStoreTransport> transport_;
    std::shared_ptr<store::StoreClient> store_;
    std::unique_ptr<entity::EntityManager> entities_;
};

TEST_F(EntityManagerTest, GetOrCreateIsIdempotentPerNormalizedName) {
    auto first = entities_->getOrCreate("Rust", "technology");
    ASSERT_TRUE(first);
    EXPECT_EQ(first.value().entity_id.rfind("ent_", 0), 0u);
    EXPECT_EQ(first.value().entity_type, entity::EntityType::Technology);

    auto second = entities_->getOrCreate("  rust ", "technology");
    ASSERT_TRUE(second);
    EXPECT_EQ(second.value().entity_id, first.value().entity_id);
    EXPECT_EQ(transport_->callCount("createEntity"), 1u);
    EXPECT_EQ(transport_->entities().size(), 1u);
}

TEST_F(EntityManagerTest, ExistingStoreEntityIsReused) {
    auto created = entities_->getOrCreate("Acme", "organization").value();

    entity::EntityManager fresh(store_);
    auto found = fresh.getOrCreate("ACME", "organization");
    ASSERT_TRUE(found);
    EXPECT_EQ(found.value().entity_id, created.entity_id);
    EXPECT_EQ(transport_->callCount("createEntity"), 1u);
}

TEST_F(EntityManagerTest, UnknownTypeIsKeptAsCustom) {
    auto e = entities_->getOrCreate("Zorblax", "Gadget").value();
    EXPECT_EQ(e.entity_type, entity::EntityType::Custom);
    EXPECT_EQ(e.type_name, "gadget");
    EXPECT_EQ(transport_->entities()[0]["entity_type"], "gadget");
}

TEST_F(EntityManagerTest, StoreFailureStillCaches) {
    transport_->failNext("createEntity", Error{ErrorCode::DatabaseError, "down"});
    auto first = entities_->getOrCreate("Paris", "location");
    ASSERT_TRUE(first);
    auto again = entities_->getOrCreate("paris", "location");
    EXPECT_EQ(again.value().entity_id, first.value().entity_id);
    EXPECT_TRUE(transport_->entities().empty());
}

TEST_F(EntityManagerTest, EmptyNameIsRejected) {
    EXPECT_EQ(entities_->getOrCreate("   ").error().code, ErrorCode::ValidationError);
}

TEST_F(EntityManagerTest, LinkAndListForMemory) {
    auto rust = entities_->getOrCreate("Rust", "technology").value();
    auto acme = entities_->getOrCreate("Acme", "organization").value();
    ASSERT_TRUE(entities_->linkToMemory("mem_a", rust.entity_id,
                                        entity::EntityEdgeType::ExtractedEntity));
    ASSERT_TRUE(entities_->linkToMemory("mem_a", acme.entity_id, entity::EntityEdgeType::Mentions,
                                        {80, "llm", 70, "positive"}));
    EXPECT_EQ(transport_->callCount("linkMentionsEntity"), 1u);

    auto list = entities_->getEntitiesForMemory("mem_a");
    ASSERT_TRUE(list);
    EXPECT_EQ(list.value().size(), 2u);

    EXPECT_EQ(entities_->linkToMemory("mem_a", "ent_missing",
                                      entity::EntityEdgeType::ExtractedEntity)
                  .error()
                  .code,
              ErrorCode::NotFound);
}

TEST_F(EntityManagerTest, SearchAndGet) {
    auto rust = entities_->getOrCreate("Rust", "technology", {{"paradigm", "systems"}}).value();
    ASSERT_TRUE(entities_->getOrCreate("Rustacean", "person"));
    ASSERT_TRUE(entities_->getOrCreate("Go", "technology"));

    auto found = entities_->searchEntities("rust", 10);
    ASSERT_TRUE(found);
    EXPECT_EQ(found.value().size(), 2u);
    EXPECT_EQ(entities_->searchEntities("rust", 1).value().size(), 1u);

    entity::EntityManager fresh(store_);
    auto got = fresh.getEntity(rust.entity_id);
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->properties["paradigm"], "systems");
    EXPECT_FALSE(fresh.getEntity("ent_nothing").has_value());
}

TEST(EntityTypeTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(entity::parseEntityType("PERSON"), entity::EntityType::Person);
    EXPECT_EQ(entity::parseEntityType("spaceship"), entity::EntityType::Custom);
    EXPECT_STREQ(entity::toString(entity::EntityType::Organization), "organization");
    EXPECT_EQ(entity::normalizeEntityName("  New York "), "new york");
}
