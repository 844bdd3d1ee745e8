#pragma once

#include <storage/vector_index_store.hpp>
#include <string>
#include <vector>

namespace Cerebrum {

/**
 * @brief Text → vector contract.
 *
 * embed_text returns exactly one vector per input text, each of dimension().
 */
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual std::vector<Embedding> embed_text(const std::string& model, const std::vector<std::string>& texts) = 0;
    virtual size_t dimension() const = 0;
};

} // namespace Cerebrum
