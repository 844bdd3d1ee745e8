/**
 * @file hashing_embedding_provider.hpp
 * @brief Deterministic feature-hashing embedder for tests and offline runs
 */

#pragma once

#include <ml/embedding_provider.hpp>
#include <export.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace Cerebrum {

/**
 * @brief Bag-of-tokens embedding via the hashing trick.
 *
 * Each lower-cased alphanumeric token is hashed with BLAKE3; the low bits
 * select a bucket and one further bit selects the sign. The result is
 * L2-normalized, so identical token multisets embed identically and
 * cosine similarity tracks token overlap. The model name is ignored.
 */
class CEREBRUM_API HashingEmbeddingProvider : public EmbeddingProvider {
public:
    static constexpr size_t DEFAULT_DIMENSION = 1536;

    explicit HashingEmbeddingProvider(size_t dimension = DEFAULT_DIMENSION);

    std::vector<Embedding> embed_text(const std::string& model, const std::vector<std::string>& texts) override;
    size_t dimension() const override { return dimension_; }

    Embedding embed_one(std::string_view text) const;

    static std::vector<std::string> tokenize(std::string_view text);

private:
    size_t dimension_;
};

} // namespace Cerebrum
