/**
 * @file test_brain_search.cpp
 * @brief Unit tests for hybrid retrieval and graph expansion
 */

#include <gtest/gtest.h>
#include <api/serialization.hpp>
#include <core/errors.hpp>
#include <query/brain_search.hpp>
#include <utils/unicode.hpp>
#include <algorithm>
#include "test_fixtures.hpp"

using namespace Cerebrum;
using namespace Cerebrum::test_support;

namespace {

class BrainSearchTest : public ::testing::Test {
protected:
    BrainSearchTest() : registry(ProfileRegistry::defaults()) {
        graph.put_entity(work_item("work-a", "t1", "p1", "Checkout fails under load"));
        graph.put_entity(doc_item("doc-b", "t1", "p1", "Load test runbook"));
        graph.put_entity(work_item("work-c", "t1", "p1", "Autoscaling limits"));
        graph.put_entity(make_entity("cluster:k", EntityTypes::kCluster, "t1", "p1",
                                     {{"tenantId", "t1"},
                                      {"projectKey", "p1"},
                                      {"clusterKind", "work-doc-episode"},
                                      {"size", 3}}));
        graph.put_entity(make_entity("sig-1", EntityTypes::kSignal, "t1", "p1", {{"severity", "HIGH"}}));

        link(graph, EdgeTypes::kInCluster, "work-a", "cluster:k", "t1", "p1");
        link(graph, EdgeTypes::kHasSignal, "work-a", "sig-1", "t1", "p1");
        link(graph, EdgeTypes::kInCluster, "doc-b", "cluster:k", "t1", "p1");
        link(graph, EdgeTypes::kInCluster, "work-c", "cluster:k", "t1", "p1");

        search.on_profile(ProfileIds::kWorkSummary, {{"work-a", 0.6}});
        search.on_profile(ProfileIds::kDocBody, {{"doc-b", 0.4}});
    }

    BrainSearchRequest request(const std::string& query = "checkout load") {
        BrainSearchRequest r;
        r.query_text = query;
        r.filter.tenant_id = "t1";
        r.filter.project_key = "p1";
        r.actor_id = "user-1";
        return r;
    }

    BrainSearchResult run(const BrainSearchRequest& r, BrainSearchConfig config = {}) {
        BrainSearch brain(graph, search, registry, config);
        return brain.search(r);
    }

    static std::vector<std::string> node_ids(const BrainSearchResult& result) {
        std::vector<std::string> ids;
        for (const auto& node : result.graph_nodes) ids.push_back(node.node_id);
        return ids;
    }

    MemoryGraphStore graph;
    ScriptedSearch search;
    ProfileRegistry registry;
};

} // namespace

TEST_F(BrainSearchTest, EpisodeScoreSumsMemberHits) {
    auto result = run(request());

    ASSERT_EQ(result.hits.size(), 2u);
    EXPECT_EQ(result.hits[0].node_id, "work-a");
    EXPECT_EQ(result.hits[0].profile_kind, "work");
    EXPECT_EQ(result.hits[0].title, "Checkout fails under load");
    EXPECT_EQ(result.hits[1].node_id, "doc-b");
    EXPECT_EQ(result.hits[1].profile_kind, "doc");

    ASSERT_EQ(result.episodes.size(), 1u);
    const auto& episode = result.episodes[0];
    EXPECT_EQ(episode.cluster_node_id, "cluster:k");
    EXPECT_EQ(episode.cluster_kind, "work-doc-episode");
    EXPECT_EQ(episode.project_key, "p1");
    EXPECT_DOUBLE_EQ(episode.score, 1.0);
    EXPECT_DOUBLE_EQ(episode.size, 3.0);
    EXPECT_EQ(episode.member_node_ids, (std::vector<std::string>{"doc-b", "work-a"}));

    EXPECT_NE(result.prompt_pack.context_markdown.find("1. cluster:k [work-doc-episode] score=1.000 members=doc-b,work-a"),
              std::string::npos);
}

TEST_F(BrainSearchTest, GraphIsSortedAndBounded) {
    auto result = run(request());

    EXPECT_EQ(node_ids(result), (std::vector<std::string>{"cluster:k", "doc-b", "sig-1", "work-a"}));

    ASSERT_EQ(result.graph_edges.size(), 3u);
    EXPECT_EQ(result.graph_edges[0].edge_type, EdgeTypes::kHasSignal);
    EXPECT_EQ(result.graph_edges[1].from_node_id, "doc-b");
    EXPECT_EQ(result.graph_edges[2].from_node_id, "work-a");
    EXPECT_EQ(result.graph_edges[2].to_node_id, "cluster:k");
}

TEST_F(BrainSearchTest, OutputIsDeterministic) {
    nlohmann::json first = run(request());
    nlohmann::json second = run(request());

    EXPECT_EQ(first.dump(), second.dump());
    EXPECT_EQ(first["promptPack"]["citations"].size(), 2u);
}

TEST_F(BrainSearchTest, DepthZeroReturnsOnlyHits) {
    auto r = request();
    r.options.expand_depth = 0;
    auto result = run(r);

    EXPECT_EQ(node_ids(result), (std::vector<std::string>{"doc-b", "work-a"}));
    EXPECT_TRUE(result.graph_edges.empty());
    EXPECT_TRUE(result.episodes.empty());
}

TEST_F(BrainSearchTest, DeeperExpansionReachesOtherMembers) {
    auto r = request();
    r.options.expand_depth = 2;
    auto result = run(r);

    auto ids = node_ids(result);
    EXPECT_NE(std::find(ids.begin(), ids.end(), "work-c"), ids.end());
    ASSERT_EQ(result.episodes.size(), 1u);
    EXPECT_EQ(result.episodes[0].member_node_ids, (std::vector<std::string>{"doc-b", "work-a", "work-c"}));
    EXPECT_DOUBLE_EQ(result.episodes[0].score, 1.0);
}

TEST_F(BrainSearchTest, MaxNodesCapsTheGraph) {
    auto r = request();
    r.options.max_nodes = 3;
    auto result = run(r);
    EXPECT_EQ(result.graph_nodes.size(), 3u);

    r.options.max_nodes = 1;
    result = run(r);
    EXPECT_EQ(node_ids(result), (std::vector<std::string>{"work-a"}));
    EXPECT_EQ(result.hits.size(), 2u);
}

TEST_F(BrainSearchTest, IncludeFlagsPruneEdgeTypes) {
    auto r = request();
    r.options.include_signals = false;
    auto result = run(r);
    for (const auto& edge : result.graph_edges) EXPECT_NE(edge.edge_type, EdgeTypes::kHasSignal);
    EXPECT_EQ(result.episodes.size(), 1u);

    r.options.include_episodes = false;
    r.options.include_clusters = false;
    result = run(r);
    EXPECT_TRUE(result.episodes.empty());
    EXPECT_TRUE(result.graph_edges.empty());
}

TEST_F(BrainSearchTest, TopKLimitsHits) {
    auto r = request();
    r.options.top_k = 1;
    auto result = run(r);

    ASSERT_EQ(result.hits.size(), 1u);
    EXPECT_EQ(result.hits[0].node_id, "work-a");
    for (const auto& sent : search.requests) EXPECT_EQ(sent.top_k, 1u);
}

TEST_F(BrainSearchTest, SecuredEntitiesAreHiddenByDefault) {
    Entity secured = doc_item("doc-b", "t1", "p1", "Load test runbook");
    secured.properties["secured"] = true;
    graph.put_entity(secured);

    auto result = run(request());
    ASSERT_EQ(result.hits.size(), 1u);
    EXPECT_EQ(result.hits[0].node_id, "work-a");

    auto r = request();
    r.filter.secured = false;
    r.actor_id.reset();
    result = run(r);
    EXPECT_EQ(result.hits.size(), 2u);
}

TEST_F(BrainSearchTest, ValidationErrors) {
    auto r = request();
    r.filter.tenant_id = " ";
    EXPECT_THROW(run(r), ValidationError);

    r = request();
    r.actor_id.reset();
    EXPECT_THROW(run(r), ValidationError);
    EXPECT_TRUE(search.requests.empty());
}

TEST_F(BrainSearchTest, ProjectFilterDropsForeignHits) {
    graph.put_entity(work_item("work-x", "t1", "p2", "Checkout elsewhere"));
    search.on_profile(ProfileIds::kWorkSummary, {{"work-x", 0.9}, {"work-a", 0.6}});

    auto result = run(request());
    ASSERT_FALSE(search.requests.empty());
    EXPECT_EQ(search.requests[0].project_key_in, (std::vector<std::string>{"p1"}));
    for (const auto& hit : result.hits) EXPECT_NE(hit.node_id, "work-x");

    search.requests.clear();
    auto r = request();
    r.filter.project_key.reset();
    result = run(r);
    EXPECT_TRUE(search.requests[0].project_key_in.empty());
    ASSERT_EQ(result.hits.size(), 3u);
    EXPECT_EQ(result.hits[0].node_id, "work-x");
}

TEST_F(BrainSearchTest, OtherTenantsAreInvisible) {
    graph.put_entity(work_item("work-t2", "t2", "p1", "Checkout"));
    search.on_profile(ProfileIds::kWorkSummary, {{"work-t2", 0.99}, {"work-a", 0.6}});

    auto result = run(request());
    for (const auto& hit : result.hits) EXPECT_NE(hit.node_id, "work-t2");
    EXPECT_EQ(search.requests[0].tenant_id, "t1");
}

TEST_F(BrainSearchTest, PassageBudgetsCountCodePoints) {
    ScriptedSearch::Scripted hits;
    for (int i = 1; i <= 6; ++i) {
        std::string id = "work-" + std::to_string(i);
        std::string text;
        for (int c = 0; c < 300; ++c) text += (i == 1 ? "\xC3\xA9" : "x");
        graph.put_entity(work_item(id, "t1", "p1", text));
        hits.push_back({id, 1.0 - i * 0.1});
    }
    search.on_profile(ProfileIds::kWorkSummary, hits);
    search.on_profile(ProfileIds::kDocBody, {});

    // Below-minimum budgets clamp to 1000 total / 200 per node
    auto result = run(request(), BrainSearchConfig{10, 10});

    ASSERT_EQ(result.passages.size(), 5u);
    for (const auto& passage : result.passages) {
        EXPECT_EQ(utf8_length(passage.text), 200u);
        EXPECT_EQ(passage.source_kind, "work");
    }
    EXPECT_EQ(result.passages[0].source_node_id, "work-1");
    EXPECT_EQ(result.passages[0].text.size(), 400u);
}
