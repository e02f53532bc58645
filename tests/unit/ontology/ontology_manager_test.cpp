#include <gtest/gtest.h>

#include "../../common/fake_store.h"

#include <omc/memory/relation_manager.h>
#include <omc/ontology/concept_mapper.h>
#include <omc/ontology/ontology_manager.h>

using namespace omc;
using omc::test::FakeStoreTransport;
using omc::test::makeClient;
using omc::test::memoryRecord;

class OntologyManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<FakeStoreTransport>();
        ontology_ = std::make_unique<ontology::OntologyManager>(makeClient(transport_, 1));
    }

    std::shared_ptr<FakeStoreTransport> transport_;
    std::unique_ptr<ontology::OntologyManager> ontology_;
};

TEST_F(OntologyManagerTest, QueriesBeforeLoad) {
    EXPECT_FALSE(ontology_->isLoaded());
    EXPECT_EQ(ontology_->subtypes("Thing").error().code, ErrorCode::NotInitialized);
    EXPECT_TRUE(ontology_->ancestors("Preference").empty());
    EXPECT_TRUE(ontology_->classify("I love Rust").empty());
}

TEST_F(OntologyManagerTest, LoadBootstrapsMissingOntology) {
    ASSERT_TRUE(ontology_->load());
    EXPECT_TRUE(ontology_->isLoaded());
    EXPECT_EQ(transport_->callCount("initializeBaseOntology"), 1u);

    auto stats = ontology_->stats();
    EXPECT_EQ(stats.total_concepts, 11u);
    EXPECT_EQ(stats.total_relations, 10u);
    EXPECT_EQ(stats.max_depth, 3u);
    EXPECT_EQ(stats.concepts_by_type["abstract"], 10u);
    EXPECT_EQ(stats.concepts_by_type["concrete"], 1u);
}

TEST_F(OntologyManagerTest, LoadSkipsBootstrapWhenInitialized) {
    transport_->setOntologyInitialized(true);
    transport_->resetCalls();
    ASSERT_TRUE(ontology_->load());
    EXPECT_EQ(transport_->callCount("initializeBaseOntology"), 0u);
}

TEST_F(OntologyManagerTest, LoadFailsWhenCheckErrors) {
    transport_->failQuery("checkOntologyInitialized", Error{ErrorCode::NetworkError, "down"});
    auto res = ontology_->load();
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::DatabaseError);
    EXPECT_FALSE(ontology_->isLoaded());
}

TEST_F(OntologyManagerTest, HierarchyQueries) {
    ASSERT_TRUE(ontology_->load());

    auto ancestors = ontology_->ancestors("ProgrammingLanguagePreference");
    ASSERT_EQ(ancestors.size(), 3u);
    EXPECT_EQ(ancestors[0].concept_id, "Preference");
    EXPECT_EQ(ancestors[1].concept_id, "Attribute");
    EXPECT_EQ(ancestors[2].concept_id, "Thing");
    EXPECT_EQ(ontology_->depth("Thing"), 0u);

    auto subtypes = ontology_->subtypes("Attribute");
    ASSERT_TRUE(subtypes);
    std::vector<std::string> ids;
    for (const auto& c : subtypes.value())
        ids.push_back(c.concept_id);
    EXPECT_EQ(ids, (std::vector<std::string>{"Fact", "Goal", "Opinion", "Preference", "Skill"}));

    auto pref = ontology_->getConcept("Preference");
    ASSERT_TRUE(pref.has_value());
    EXPECT_EQ(pref->concept_type, ontology::ConceptType::Abstract);
    EXPECT_EQ(ontology_->getConcept("ProgrammingLanguagePreference")->concept_type,
              ontology::ConceptType::Concrete);
}

TEST_F(OntologyManagerTest, AddConceptValidatesLevels) {
    ASSERT_TRUE(ontology_->load());

    ontology::Concept rustPref;
    rustPref.concept_id = "RustPreference";
    rustPref.name = "RustPreference";
    rustPref.level = 4;
    rustPref.parent_concept = "ProgrammingLanguagePreference";
    ASSERT_TRUE(ontology_->addConcept(rustPref));
    EXPECT_EQ(ontology_->depth("RustPreference"), 4u);

    EXPECT_EQ(ontology_->addConcept(rustPref).error().code, ErrorCode::InvalidOperation);

    ontology::Concept bad;
    bad.concept_id = "Shallow";
    bad.level = 1;
    bad.parent_concept = "Preference";
    EXPECT_EQ(ontology_->addConcept(bad).error().code, ErrorCode::ValidationError);

    ontology::Concept orphan;
    orphan.concept_id = "ZigPreference";
    orphan.level = 5;
    orphan.parent_concept = "NoSuchConcept";
    auto rejected = ontology_->addConcept(orphan);
    ASSERT_FALSE(rejected);
    EXPECT_EQ(rejected.error().code, ErrorCode::ValidationError);
    EXPECT_FALSE(ontology_->getConcept("ZigPreference").has_value());
}

TEST_F(OntologyManagerTest, ClassifyByKeywords) {
    ASSERT_TRUE(ontology_->load());
    auto scores = ontology_->classify("I love and prefer Rust");
    ASSERT_EQ(scores.size(), 1u);
    EXPECT_EQ(scores[0].first, "Preference");
    EXPECT_NEAR(scores[0].second, 2.0 / 7.0, 1e-9);

    EXPECT_TRUE(ontology_->classify("I love Rust", 0.5).empty());
    EXPECT_EQ(ontology_->suggestConcepts("I love and prefer Rust", 1),
              std::vector<std::string>{"Preference"});
}

TEST(ConceptMapperTest, MapRanksByKeywordCoverage) {
    ontology::ConceptMapper mapper;
    auto matches = mapper.map("I love and prefer Rust");
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].concept_ref.id, "Preference");
    EXPECT_EQ(matches[0].matched_keywords, (std::vector<std::string>{"love", "prefer"}));
    EXPECT_TRUE(mapper.map("xyz qrs").empty());
}

TEST(ConceptMapperTest, LinksBestMatchAsInstanceOf) {
    auto transport = std::make_shared<FakeStoreTransport>();
    transport->putMemory(memoryRecord("mem_a", "x"));
    memory::RelationManager relations(makeClient(transport, 1));

    ontology::ConceptMapper mapper;
    std::vector<ontology::ConceptMatch> matches(2);
    matches[0].concept_ref = {"Goal", "Goal", ontology::ConceptKind::Goal};
    matches[0].confidence = 0.4;
    matches[1].concept_ref = {"Skill", "Skill", ontology::ConceptKind::Skill};
    matches[1].confidence = 0.2;

    EXPECT_EQ(mapper.linkMemoryToConcepts(relations, "mem_a", matches), 2u);
    auto instance = transport->conceptLinks("instance_of");
    ASSERT_EQ(instance.size(), 1u);
    EXPECT_EQ(instance[0].second, "Goal");
    EXPECT_EQ(transport->conceptLinks("belongs_to")[0].second, "Skill");
}

TEST(ConceptMapperTest, ClassifyQueryDedupesConcepts) {
    auto concepts = ontology::ConceptMapper::classifyQuery("what do I like and love, and my goals", 5);
    ASSERT_EQ(concepts.size(), 2u);
    EXPECT_EQ(concepts[0].concept_id, "Preference");
    EXPECT_EQ(concepts[1].concept_id, "Goal");
    EXPECT_DOUBLE_EQ(concepts[0].confidence, 0.8);
    EXPECT_EQ(ontology::ConceptMapper::classifyQuery("like goal", 1).size(), 1u);
}

TEST(ConceptMapperTest, ExtractQueryTagsInTableOrder) {
    auto tags = ontology::ConceptMapper::extractQueryTags("Rust and Python API work", 10);
    EXPECT_EQ(tags, (std::vector<std::string>{"python", "rust", "api", "work"}));
    EXPECT_EQ(ontology::ConceptMapper::extractQueryTags("Rust and Python", 1),
              std::vector<std::string>{"python"});
}
