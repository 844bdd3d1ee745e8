/**
 * @file test_hashing_embedding.cpp
 * @brief Unit tests for the feature-hashing embedder
 */

#include <gtest/gtest.h>
#include <ml/hashing_embedding_provider.hpp>
#include <storage/memory_vector_index.hpp>
#include <cmath>
#include <stdexcept>

using namespace Cerebrum;

namespace {

double norm(const Embedding& v) {
    double sum = 0.0;
    for (float x : v) sum += static_cast<double>(x) * x;
    return std::sqrt(sum);
}

} // namespace

TEST(HashingEmbeddingTest, Tokenization) {
    auto tokens = HashingEmbeddingProvider::tokenize("Fix the LOGIN-page, v2!");
    std::vector<std::string> expected = {"fix", "the", "login", "page", "v2"};
    EXPECT_EQ(tokens, expected);

    auto unicode = HashingEmbeddingProvider::tokenize("caf\xC3\xA9 au lait");
    ASSERT_EQ(unicode.size(), 3u);
    EXPECT_EQ(unicode[0], "caf\xC3\xA9");
}

TEST(HashingEmbeddingTest, DeterministicUnitVectors) {
    HashingEmbeddingProvider embedder(64);
    auto vectors = embedder.embed_text("ignored", {"login page broken", "login page broken", ""});

    ASSERT_EQ(vectors.size(), 3u);
    EXPECT_EQ(vectors[0].size(), 64u);
    EXPECT_EQ(vectors[0], vectors[1]);
    EXPECT_NEAR(norm(vectors[0]), 1.0, 1e-5);
    EXPECT_DOUBLE_EQ(norm(vectors[2]), 0.0);
}

TEST(HashingEmbeddingTest, CaseAndPunctuationInsensitive) {
    HashingEmbeddingProvider embedder(128);
    EXPECT_EQ(embedder.embed_one("Login page: broken"), embedder.embed_one("login PAGE broken"));
}

TEST(HashingEmbeddingTest, OverlapTracksSimilarity) {
    HashingEmbeddingProvider embedder(1024);
    auto query = embedder.embed_one("payment gateway timeout on checkout");
    auto close = embedder.embed_one("checkout payment gateway timeout");
    auto far = embedder.embed_one("update onboarding documentation");

    double close_score = MemoryVectorIndex::cosine_similarity(query, close);
    double far_score = MemoryVectorIndex::cosine_similarity(query, far);
    EXPECT_GT(close_score, 0.7);
    EXPECT_GT(close_score, far_score);
}

TEST(HashingEmbeddingTest, ZeroDimensionRejected) {
    EXPECT_THROW(HashingEmbeddingProvider(0), std::invalid_argument);
    EXPECT_EQ(HashingEmbeddingProvider().dimension(), HashingEmbeddingProvider::DEFAULT_DIMENSION);
}
