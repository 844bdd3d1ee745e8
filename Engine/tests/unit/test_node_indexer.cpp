/**
 * @file test_node_indexer.cpp
 * @brief Unit tests for profile-driven indexing and text extraction
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <core/profile_registry.hpp>
#include <ingestion/node_indexer.hpp>
#include <ml/hashing_embedding_provider.hpp>
#include <storage/memory_catalog.hpp>
#include <storage/memory_vector_index.hpp>
#include "test_fixtures.hpp"

using namespace Cerebrum;
using namespace Cerebrum::test_support;

namespace {

constexpr size_t kDim = 64;

class NodeIndexerTest : public ::testing::Test {
protected:
    NodeIndexerTest() : profiles(ProfileRegistry::defaults().profiles()), index(kDim), embedder(kDim) {
        graph.put_entity(work_item("w1", "t1", "p1", "Checkout fails", "2024-01-02T00:00:00Z"));
        graph.put_entity(work_item("w2", "t1", "p1", "Search is slow", "2024-01-03T00:00:00Z"));
        graph.put_entity(make_entity("w3", EntityTypes::kWorkItem, "t1", "p1", {{"status", "open"}}));
        graph.put_entity(work_item("w-other", "t2", "p1", "Other tenant"));
        graph.put_entity(doc_item("d1", "t1", "p1", "Runbook"));
    }

    IndexRequest request(const std::string& profile_id) {
        IndexRequest r;
        r.profile_id = profile_id;
        r.scope = Scope{"t1", "p1", std::nullopt};
        return r;
    }

    MemoryGraphStore graph;
    MemoryProfileStore profiles;
    MemoryVectorIndex index;
    HashingEmbeddingProvider embedder;
};

IndexProfile profile_with(TextSource source) {
    IndexProfile profile;
    profile.id = "test.profile";
    profile.text_source = std::move(source);
    return profile;
}

} // namespace

TEST_F(NodeIndexerTest, IndexesTenantEntitiesOfTheProfileType) {
    NodeIndexer indexer(graph, profiles, index, embedder, kDim);
    auto result = indexer.index_nodes_for_profile(request(ProfileIds::kWorkSummary));

    EXPECT_EQ(result.indexed, 2u);
    EXPECT_EQ(result.skipped, 1u);
    EXPECT_EQ(index.size(), 2u);

    auto matches = index.query(ProfileIds::kWorkSummary, embedder.embed_one("search is slow"), 5,
                               VectorQueryFilter{"t1", {"p1"}, {"work"}});
    ASSERT_FALSE(matches.empty());
    EXPECT_EQ(matches[0].node_id, "w2");
    EXPECT_EQ(matches[0].metadata["raw"]["entityType"], EntityTypes::kWorkItem);
    EXPECT_EQ(matches[0].metadata["raw"]["title"], "Search is slow");
}

TEST_F(NodeIndexerTest, ReindexingIsIdempotent) {
    NodeIndexer indexer(graph, profiles, index, embedder, kDim);
    indexer.index_nodes_for_profile(request(ProfileIds::kWorkSummary));
    indexer.index_nodes_for_profile(request(ProfileIds::kWorkSummary));
    EXPECT_EQ(index.size(), 2u);
}

TEST_F(NodeIndexerTest, NodeIdsAndBatchesRestrictWork) {
    FixedEmbedder fixed(kDim, kDim);
    NodeIndexer indexer(graph, profiles, index, fixed, kDim);

    auto r = request(ProfileIds::kWorkSummary);
    r.node_ids = std::vector<std::string>{"w1", "w2", "w3"};
    r.batch_size = 1;
    auto result = indexer.index_nodes_for_profile(r);

    EXPECT_EQ(result.indexed, 2u);
    EXPECT_EQ(result.skipped, 1u);
    EXPECT_EQ(fixed.models.size(), 2u);
    EXPECT_EQ(fixed.models[0], "text-embedding-3-small");

    r.node_ids = std::vector<std::string>{"d1"};
    EXPECT_EQ(indexer.index_nodes_for_profile(r).indexed, 0u);
}

TEST_F(NodeIndexerTest, UnknownProfileThrows) {
    NodeIndexer indexer(graph, profiles, index, embedder, kDim);
    EXPECT_THROW(indexer.index_nodes_for_profile(request("missing.profile")), NotFoundError);
}

TEST_F(NodeIndexerTest, DisabledProfileIsANoOp) {
    auto profile = *profiles.get_profile(ProfileIds::kDocBody);
    profile.enabled = false;
    profiles.put(profile);

    NodeIndexer indexer(graph, profiles, index, embedder, kDim);
    auto result = indexer.index_nodes_for_profile(request(ProfileIds::kDocBody));
    EXPECT_EQ(result.indexed, 0u);
    EXPECT_EQ(index.size(), 0u);
}

TEST_F(NodeIndexerTest, ProviderShapeViolationsThrow) {
    FixedEmbedder short_vectors(kDim, kDim - 1);
    NodeIndexer wrong_dim(graph, profiles, index, short_vectors, kDim);
    EXPECT_THROW(wrong_dim.index_nodes_for_profile(request(ProfileIds::kWorkSummary)), ShapeError);

    FixedEmbedder extra_vectors(kDim, kDim, 1);
    NodeIndexer wrong_count(graph, profiles, index, extra_vectors, kDim);
    EXPECT_THROW(wrong_count.index_nodes_for_profile(request(ProfileIds::kWorkSummary)), ShapeError);
    EXPECT_EQ(index.size(), 0u);
}

TEST(ExtractIndexTextTest, PathWinsOverField) {
    TextSource source;
    source.path = {"fields", "description"};
    source.field = "summary";
    PropertyBag props = {{"summary", "short"}, {"fields", {{"description", "  long text  "}}}};
    EXPECT_EQ(extract_index_text(profile_with(source), props), "long text");
}

TEST(ExtractIndexTextTest, FieldIsFoundBelowTheRoot) {
    TextSource source;
    source.field = "abstract";
    PropertyBag props = {{"meta", {{"inner", {{"abstract", "nested"}}}}}};
    EXPECT_EQ(extract_index_text(profile_with(source), props), "nested");
}

TEST(ExtractIndexTextTest, FromSelectsNestedObject) {
    TextSource source;
    source.from = "payload";
    source.field = "summary";
    PropertyBag props = {{"summary", "outer"}, {"payload", {{"summary", "inner"}}}};
    EXPECT_EQ(extract_index_text(profile_with(source), props), "inner");
}

TEST(ExtractIndexTextTest, FallsBackToCommonKeys) {
    TextSource source;
    source.field = "missing";
    EXPECT_EQ(extract_index_text(profile_with(source), {{"content", "fallback"}}), "fallback");
    EXPECT_EQ(extract_index_text(profile_with(source), {{"body", " "}, {"text", "t"}}), "t");
    EXPECT_FALSE(extract_index_text(profile_with(source), {{"title", "only a title"}}).has_value());
}

TEST(ExtractIndexTextTest, StringArraysJoinWithNewlines) {
    TextSource source;
    source.path = {"lines"};
    PropertyBag props = {{"lines", {"first", 3, " ", "second"}}};
    EXPECT_EQ(extract_index_text(profile_with(source), props), "first\nsecond");
}

TEST(IndexProjectKeyTest, PropertiesThenMetadataThenScope) {
    Entity direct = make_entity("a", EntityTypes::kWorkItem, "t1", "scope-p", {{"sourceProjectKey", "SRC"}});
    EXPECT_EQ(index_project_key(direct), "SRC");

    Entity meta = make_entity("b", EntityTypes::kWorkItem, "t1", "scope-p", {{"_metadata", {{"project_key", "META"}}}});
    EXPECT_EQ(index_project_key(meta), "META");

    Entity scoped = make_entity("c", EntityTypes::kWorkItem, "t1", "scope-p");
    EXPECT_EQ(index_project_key(scoped), "scope-p");

    Entity none = make_entity("d", EntityTypes::kWorkItem, "t1", "");
    EXPECT_FALSE(index_project_key(none).has_value());
}
