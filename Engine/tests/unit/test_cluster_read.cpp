/**
 * @file test_cluster_read.cpp
 * @brief Unit tests for cluster listing
 */

#include <gtest/gtest.h>
#include <clustering/cluster_read.hpp>
#include "test_fixtures.hpp"

using namespace Cerebrum;
using namespace Cerebrum::test_support;

namespace {

Entity cluster_node(const std::string& id, const std::string& tenant, const std::string& project,
                    const std::string& updated_at, const std::string& kind = "work-doc-episode") {
    PropertyBag props = {{"tenantId", tenant}, {"projectKey", project}, {"updatedAt", updated_at}};
    if (!kind.empty()) props["clusterKind"] = kind;
    return make_entity(id, EntityTypes::kCluster, tenant, project, props);
}

} // namespace

TEST(ClusterReadTest, ListsClustersWithSortedUniqueMembers) {
    MemoryGraphStore graph;
    graph.put_entity(cluster_node("cluster:a", "t1", "p1", "2024-02-01T00:00:00Z"));
    link(graph, EdgeTypes::kInCluster, "work-2", "cluster:a", "t1", "p1");
    link(graph, EdgeTypes::kInCluster, "doc-1", "cluster:a", "t1", "p1");
    link(graph, EdgeTypes::kInCluster, "work-2", "cluster:a", "t1", "p1");
    link(graph, EdgeTypes::kHasSignal, "sig-1", "cluster:a", "t1", "p1");

    ClusterRead reader(graph);
    auto summaries = reader.list_clusters_for_project("t1", "p1");

    ASSERT_EQ(summaries.size(), 1u);
    EXPECT_EQ(summaries[0].cluster_node_id, "cluster:a");
    EXPECT_EQ(summaries[0].cluster_kind, "work-doc-episode");
    EXPECT_EQ(summaries[0].member_node_ids, (std::vector<std::string>{"doc-1", "work-2"}));
}

TEST(ClusterReadTest, ProjectAndTenantIsolation) {
    MemoryGraphStore graph;
    graph.put_entity(cluster_node("cluster:p1", "t1", "p1", "2024-02-01T00:00:00Z"));
    graph.put_entity(cluster_node("cluster:p2", "t1", "p2", "2024-02-01T00:00:00Z"));
    graph.put_entity(cluster_node("cluster:t2", "t2", "p1", "2024-02-01T00:00:00Z"));
    graph.put_entity(make_entity("cluster:anon", EntityTypes::kCluster, "t1", ""));

    ClusterRead reader(graph);
    auto summaries = reader.list_clusters_for_project("t1", "p1");

    ASSERT_EQ(summaries.size(), 1u);
    EXPECT_EQ(summaries[0].cluster_node_id, "cluster:p1");
    EXPECT_TRUE(summaries[0].member_node_ids.empty());
}

TEST(ClusterReadTest, WindowFiltersByClusterTimestamp) {
    MemoryGraphStore graph;
    graph.put_entity(cluster_node("cluster:jan", "t1", "p1", "2024-01-15T00:00:00Z"));
    graph.put_entity(cluster_node("cluster:feb", "t1", "p1", "2024-02-15T00:00:00Z", ""));

    TimeWindow february;
    february.start = at("2024-02-01T00:00:00Z");
    february.end = at("2024-02-29T00:00:00Z");

    ClusterRead reader(graph);
    auto summaries = reader.list_clusters_for_project("t1", "p1", february);

    ASSERT_EQ(summaries.size(), 1u);
    EXPECT_EQ(summaries[0].cluster_node_id, "cluster:feb");
    EXPECT_EQ(summaries[0].cluster_kind, "unknown");
    EXPECT_EQ(reader.list_clusters_for_project("t1", "p1").size(), 2u);
}
