#include <ml/hashing_embedding_provider.hpp>
#include <core/errors.hpp>
#include <hashing/content_hash.hpp>
#include <Eigen/Core>
#include <cctype>

namespace Cerebrum {

HashingEmbeddingProvider::HashingEmbeddingProvider(size_t dimension) : dimension_(dimension) {
    if (dimension_ == 0) {
        throw std::invalid_argument("Embedding dimension must be positive");
    }
}

std::vector<std::string> HashingEmbeddingProvider::tokenize(std::string_view text) {
    std::vector<std::string> tokens;
    std::string current;
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        // Non-ASCII bytes stay inside tokens so UTF-8 words hash as a whole.
        if (std::isalnum(c) || c >= 0x80) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) tokens.push_back(std::move(current));
    return tokens;
}

Embedding HashingEmbeddingProvider::embed_one(std::string_view text) const {
    Eigen::VectorXf v = Eigen::VectorXf::Zero(static_cast<Eigen::Index>(dimension_));

    for (const auto& token : tokenize(text)) {
        uint64_t h = ContentHash::hash64(token);
        auto bucket = static_cast<Eigen::Index>(h % dimension_);
        float sign = ((h >> 63) & 1u) ? -1.0f : 1.0f;
        v[bucket] += sign;
    }

    float norm = v.norm();
    if (norm > 0.0f) v /= norm;

    return Embedding(v.data(), v.data() + v.size());
}

std::vector<Embedding> HashingEmbeddingProvider::embed_text(const std::string& /*model*/,
                                                            const std::vector<std::string>& texts) {
    std::vector<Embedding> out;
    out.reserve(texts.size());
    for (const auto& text : texts) {
        out.push_back(embed_one(text));
    }
    return out;
}

} // namespace Cerebrum
