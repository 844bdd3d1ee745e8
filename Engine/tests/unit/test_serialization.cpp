/**
 * @file test_serialization.cpp
 * @brief Unit tests for JSON views of read models
 */

#include <gtest/gtest.h>
#include <api/serialization.hpp>

using namespace Cerebrum;

TEST(SerializationTest, EpisodeUsesCamelCaseAndNulls) {
    Episode episode;
    episode.id = "cluster:abc";
    episode.tenant_id = "t1";
    episode.project_key = "p1";
    episode.cluster_kind = "work-doc-episode";
    episode.size = 2;
    episode.created_at = "2024-03-01T12:00:00.000Z";
    episode.updated_at = episode.created_at;
    episode.window_start = "2024-01-01T00:00:00.000Z";

    EpisodeMember member;
    member.node_id = "w1";
    member.node_type = "cdm.work.item";
    member.entity_kind = "work";
    member.work_key = "ENG-1";
    episode.members.push_back(member);
    episode.signals.push_back({"s1", "HIGH", "OPEN", "Latency spike", "latency"});

    nlohmann::json j = episode;
    EXPECT_EQ(j["tenantId"], "t1");
    EXPECT_EQ(j["clusterKind"], "work-doc-episode");
    EXPECT_EQ(j["size"], 2);
    EXPECT_EQ(j["windowStart"], "2024-01-01T00:00:00.000Z");
    EXPECT_TRUE(j["windowEnd"].is_null());
    EXPECT_TRUE(j["summary"].is_null());
    EXPECT_EQ(j["members"][0]["workKey"], "ENG-1");
    EXPECT_TRUE(j["members"][0]["docUrl"].is_null());
    EXPECT_EQ(j["signals"][0]["definitionSlug"], "latency");
}

TEST(SerializationTest, ConnectionCarriesTotalCount) {
    EpisodeConnection connection;
    connection.total_count = 7;
    nlohmann::json j = connection;
    EXPECT_TRUE(j["nodes"].is_array());
    EXPECT_EQ(j["totalCount"], 7);
}

TEST(SerializationTest, BrainSearchResultNestsGraphAndPromptPack) {
    BrainSearchResult result;
    result.graph_nodes.push_back({"w1", "cdm.work.item", std::string("Checkout"), {{"summary", "Checkout"}}});
    result.graph_edges.push_back({"IN_CLUSTER", "w1", "cluster:k", PropertyBag::object()});
    result.prompt_pack.context_markdown = "# Brain Search Context\nQuery: q";
    result.prompt_pack.citations.push_back({"w1", std::nullopt, std::string("Checkout"), "cdm.work.item"});

    nlohmann::json j = result;
    EXPECT_TRUE(j["hits"].empty());
    EXPECT_EQ(j["graph"]["nodes"][0]["nodeId"], "w1");
    EXPECT_EQ(j["graph"]["nodes"][0]["properties"]["summary"], "Checkout");
    EXPECT_EQ(j["graph"]["edges"][0]["fromNodeId"], "w1");
    EXPECT_EQ(j["graph"]["edges"][0]["toNodeId"], "cluster:k");
    EXPECT_EQ(j["promptPack"]["contextMarkdown"], "# Brain Search Context\nQuery: q");
    EXPECT_TRUE(j["promptPack"]["citations"][0]["url"].is_null());
    EXPECT_EQ(j["promptPack"]["citations"][0]["sourceNodeId"], "w1");
}

TEST(SerializationTest, BuildAndIndexCounters) {
    nlohmann::json built = ClusterBuildResult{3, 9};
    EXPECT_EQ(built, (nlohmann::json{{"clustersCreated", 3}, {"membersLinked", 9}}));

    nlohmann::json indexed = IndexResult{4, 1};
    EXPECT_EQ(indexed["indexed"], 4);
    EXPECT_EQ(indexed["skipped"], 1);
}
