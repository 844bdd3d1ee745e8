/**
 * @file test_prompt_pack.cpp
 * @brief Unit tests for prompt pack rendering
 */

#include <gtest/gtest.h>
#include <query/prompt_pack.hpp>

using namespace Cerebrum;

TEST(PromptPackTest, FormatScoreUsesThreeDecimals) {
    EXPECT_EQ(format_score(0.6), "0.600");
    EXPECT_EQ(format_score(1.0), "1.000");
    EXPECT_EQ(format_score(0.12345), "0.123");
    EXPECT_EQ(format_score(0.0), "0.000");
}

TEST(PromptPackTest, QueryOnlyWhenNothingFound) {
    auto pack = build_prompt_pack("anything", {}, {}, {});
    EXPECT_EQ(pack.context_markdown, "# Brain Search Context\nQuery: anything");
    EXPECT_TRUE(pack.citations.empty());
}

TEST(PromptPackTest, FullLayout) {
    BrainSearchHit titled{"work-a", "cdm.work.item", "cdm.work.summary", "work", 0.6,
                          std::string("Checkout fails"), std::string("https://tracker/A-1")};
    BrainSearchHit untitled{"doc-b", "cdm.doc.item", "cdm.doc.body", "doc", 0.4, std::nullopt, std::nullopt};

    BrainSearchEpisode episode;
    episode.cluster_node_id = "cluster:k";
    episode.cluster_kind = "work-doc-episode";
    episode.score = 1.0;
    episode.member_node_ids = {"doc-b", "work-a"};

    Passage passage{"work-a", "work", "Checkout fails under load", std::nullopt};

    auto pack = build_prompt_pack("checkout", {titled, untitled}, {episode}, {passage});

    EXPECT_EQ(pack.context_markdown,
              "# Brain Search Context\n"
              "Query: checkout\n"
              "Episodes:\n"
              "1. cluster:k [work-doc-episode] score=1.000 members=doc-b,work-a\n"
              "Hits:\n"
              "1. Checkout fails (cdm.work.item) score=0.600 id=work-a\n"
              "2. doc-b (cdm.doc.item) score=0.400 id=doc-b\n"
              "Passages:\n"
              "1. (work) Checkout fails under load");

    ASSERT_EQ(pack.citations.size(), 2u);
    EXPECT_EQ(pack.citations[0].source_node_id, "work-a");
    EXPECT_EQ(pack.citations[0].url, "https://tracker/A-1");
    EXPECT_EQ(pack.citations[0].node_type, "cdm.work.item");
    EXPECT_FALSE(pack.citations[1].title.has_value());
}

TEST(PromptPackTest, EqualInputsGiveEqualBytes) {
    BrainSearchHit hit{"n1", "t", "p", "work", 0.25, std::nullopt, std::nullopt};
    auto first = build_prompt_pack("q", {hit}, {}, {});
    auto second = build_prompt_pack("q", {hit}, {}, {});
    EXPECT_EQ(first.context_markdown, second.context_markdown);
    EXPECT_EQ(first.context_markdown,
              "# Brain Search Context\nQuery: q\nHits:\n1. n1 (t) score=0.250 id=n1");
}
