/**
 * @file test_memory_stores.cpp
 * @brief Unit tests for the in-memory graph and vector stores
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <storage/memory_graph_store.hpp>
#include <storage/memory_vector_index.hpp>
#include "test_fixtures.hpp"

using namespace Cerebrum;
using namespace Cerebrum::test_support;

TEST(MemoryGraphStoreTest, UpsertPreservesCreatedAt) {
    FixedClock clock;
    MemoryGraphStore graph(clock.fn());
    Scope scope{"t1", "p1", std::nullopt};

    EntityInput input;
    input.id = "w1";
    input.entity_type = EntityTypes::kWorkItem;
    input.properties = {{"summary", "first"}};
    Entity first = graph.upsert_entity(input, scope);

    clock.now = at("2024-03-02T00:00:00Z");
    input.properties = {{"summary", "second"}};
    Entity second = graph.upsert_entity(input, scope);

    EXPECT_EQ(second.created_at, first.created_at);
    EXPECT_EQ(second.updated_at, at("2024-03-02T00:00:00Z"));
    EXPECT_EQ(second.display_name, "w1");
    EXPECT_EQ(graph.get_entity("w1", scope)->properties["summary"], "second");
    EXPECT_EQ(graph.entity_count(), 1u);
}

TEST(MemoryGraphStoreTest, TenantIsolation) {
    MemoryGraphStore graph;
    graph.put_entity(work_item("w1", "t1", "p1", "x"));

    EXPECT_TRUE(graph.get_entity("w1", Scope{"t1", "p1", std::nullopt}).has_value());
    EXPECT_FALSE(graph.get_entity("w1", Scope{"t2", "p1", std::nullopt}).has_value());
    EXPECT_TRUE(graph.list_entities({}, Scope{"t2", "p1", std::nullopt}).empty());
}

TEST(MemoryGraphStoreTest, SameIdUnderTwoTenantsStaysSeparate) {
    MemoryGraphStore graph;
    Scope a{"tenant-a", "p1", std::nullopt};
    Scope b{"tenant-b", "p1", std::nullopt};

    EntityInput input;
    input.id = "work-1";
    input.entity_type = EntityTypes::kWorkItem;
    input.properties = {{"summary", "from a"}};
    graph.upsert_entity(input, a);
    input.properties = {{"summary", "from b"}};
    graph.upsert_entity(input, b);

    EXPECT_EQ(graph.entity_count(), 2u);
    EXPECT_EQ(graph.get_entity("work-1", a)->properties["summary"], "from a");
    EXPECT_EQ(graph.get_entity("work-1", a)->tenant_id, "tenant-a");
    EXPECT_EQ(graph.get_entity("work-1", b)->properties["summary"], "from b");

    auto listed = graph.list_entities({}, a);
    ASSERT_EQ(listed.size(), 1u);
    EXPECT_EQ(listed[0].tenant_id, "tenant-a");
}

TEST(MemoryGraphStoreTest, EdgesAreIdempotentOnLogicalKey) {
    MemoryGraphStore graph;
    link(graph, EdgeTypes::kInCluster, "a", "c", "t1", "p1");
    link(graph, EdgeTypes::kInCluster, "a", "c", "t1", "p1");
    link(graph, EdgeTypes::kInCluster, "b", "c", "t1", "p1");
    link(graph, EdgeTypes::kInCluster, "a", "c", "t2", "p1");

    EXPECT_EQ(graph.edge_count(), 3u);

    EdgeFilter inbound;
    inbound.target_entity_id = "c";
    EXPECT_EQ(graph.list_edges(inbound, Scope{"t1", "p1", std::nullopt}).size(), 2u);

    inbound.limit = 1;
    auto limited = graph.list_edges(inbound, Scope{"t1", "p1", std::nullopt});
    ASSERT_EQ(limited.size(), 1u);
    EXPECT_EQ(limited[0].source_entity_id, "a");
    EXPECT_EQ(limited[0].id, edge_id_for(EdgeTypes::kInCluster, "a", "c"));
}

TEST(MemoryGraphStoreTest, EntityTypeFilter) {
    MemoryGraphStore graph;
    graph.put_entity(work_item("w1", "t1", "p1", "x"));
    graph.put_entity(doc_item("d1", "t1", "p1", "y"));

    EntityFilter filter;
    filter.entity_types = {EntityTypes::kDocItem};
    auto docs = graph.list_entities(filter, Scope{"t1", "p1", std::nullopt});
    ASSERT_EQ(docs.size(), 1u);
    EXPECT_EQ(docs[0].id, "d1");
}

namespace {

VectorIndexEntry entry(const std::string& node, const std::string& profile, Embedding v,
                       const std::string& tenant = "t1", const std::string& project = "p1",
                       const std::string& kind = "work") {
    VectorIndexEntry e;
    e.node_id = node;
    e.profile_id = profile;
    e.embedding = std::move(v);
    e.tenant_id = tenant;
    e.project_key = project;
    e.profile_kind = kind;
    e.raw_metadata = {{"title", "Title " + node}};
    return e;
}

} // namespace

TEST(MemoryVectorIndexTest, RanksByCosineSimilarity) {
    MemoryVectorIndex index(3);
    index.upsert_entries({
        entry("a", "prof", {1.0f, 0.0f, 0.0f}),
        entry("b", "prof", {0.7f, 0.7f, 0.0f}),
        entry("c", "prof", {0.0f, 0.0f, 1.0f}),
    });

    auto matches = index.query("prof", {1.0f, 0.0f, 0.0f}, 2, VectorQueryFilter{"t1", {}, {}});
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0].node_id, "a");
    EXPECT_NEAR(matches[0].score, 1.0, 1e-6);
    EXPECT_EQ(matches[1].node_id, "b");
    EXPECT_EQ(matches[0].metadata["profileKind"], "work");
    EXPECT_EQ(matches[0].metadata["raw"]["title"], "Title a");
}

TEST(MemoryVectorIndexTest, FiltersByTenantProjectAndKind) {
    MemoryVectorIndex index(2);
    index.upsert_entries({
        entry("a", "prof", {1.0f, 0.0f}, "t1", "p1", "work"),
        entry("b", "prof", {1.0f, 0.0f}, "t2", "p1", "work"),
        entry("c", "prof", {1.0f, 0.0f}, "t1", "p2", "work"),
        entry("d", "prof", {1.0f, 0.0f}, "t1", "p1", "doc"),
        entry("e", "other", {1.0f, 0.0f}, "t1", "p1", "work"),
    });

    auto matches = index.query("prof", {1.0f, 0.0f}, 10, VectorQueryFilter{"t1", {"p1"}, {"work"}});
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].node_id, "a");
}

TEST(MemoryVectorIndexTest, UpsertReplacesSlot) {
    MemoryVectorIndex index(2);
    index.upsert_entries({entry("a", "prof", {1.0f, 0.0f})});
    index.upsert_entries({entry("a", "prof", {0.0f, 1.0f})});

    EXPECT_EQ(index.size(), 1u);
    auto matches = index.query("prof", {0.0f, 1.0f}, 1, VectorQueryFilter{"t1", {}, {}});
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_NEAR(matches[0].score, 1.0, 1e-6);
}

TEST(MemoryVectorIndexTest, SameSlotUnderTwoTenantsStaysSeparate) {
    MemoryVectorIndex index(2);
    index.upsert_entries({entry("a", "prof", {1.0f, 0.0f}, "tenant-a")});
    index.upsert_entries({entry("a", "prof", {0.0f, 1.0f}, "tenant-b")});

    EXPECT_EQ(index.size(), 2u);
    auto matches = index.query("prof", {1.0f, 0.0f}, 5, VectorQueryFilter{"tenant-a", {}, {}});
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].node_id, "a");
    EXPECT_NEAR(matches[0].score, 1.0, 1e-6);
}

TEST(MemoryVectorIndexTest, DimensionMismatchIsAShapeError) {
    MemoryVectorIndex index(3);

    EXPECT_THROW(index.upsert_entries({entry("a", "prof", {1.0f, 0.0f})}), ShapeError);
    EXPECT_THROW(index.query("prof", {1.0f}, 5, VectorQueryFilter{}), ShapeError);
    EXPECT_EQ(index.size(), 0u);
}

TEST(MemoryVectorIndexTest, ZeroVectorsScoreZero) {
    EXPECT_DOUBLE_EQ(MemoryVectorIndex::cosine_similarity({0.0f, 0.0f}, {1.0f, 0.0f}), 0.0);
}
