/**
 * @file vector_search.hpp
 * @brief Multi-profile nearest-neighbor search over the vector index
 */

#pragma once

#include <ml/embedding_provider.hpp>
#include <storage/index_profile_store.hpp>
#include <storage/vector_index_store.hpp>
#include <export.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Cerebrum {

struct VectorSearchRequest {
    std::string profile_id;
    std::string query_text;
    size_t top_k = 10;
    std::string tenant_id;
    std::vector<std::string> project_key_in;  // empty = any project
    std::vector<std::string> profile_kind_in; // non-empty broadens the profile set
};

struct SearchHit {
    std::string node_id;
    std::string profile_id;
    std::string profile_kind;
    double score = 0.0;
    std::optional<std::string> title;
    std::optional<std::string> url;
    std::optional<std::string> project_key;
    PropertyBag metadata = PropertyBag::object();
};

/**
 * @brief Seam consumed by ClusterBuilder and BrainSearch; tests script it.
 */
class VectorSearch {
public:
    virtual ~VectorSearch() = default;

    /// Ranked best-first, at most request.top_k hits, one per node id.
    virtual std::vector<SearchHit> search(const VectorSearchRequest& request) = 0;
};

/**
 * @brief Embeds the query once per model and fans out across profiles.
 *
 * Algorithm:
 * 1. Resolve the requested profile (NotFoundError if unknown)
 * 2. Broaden to every profile whose kind is in profile_kind_in
 * 3. Embed once per distinct embedding model
 * 4. Query each profile, keep the max score per node, stable sort, truncate
 */
class CEREBRUM_API VectorSearchGateway : public VectorSearch {
public:
    VectorSearchGateway(IndexProfileStore& profiles, VectorIndexStore& index, EmbeddingProvider& embedder);

    std::vector<SearchHit> search(const VectorSearchRequest& request) override;

private:
    std::vector<IndexProfile> target_profiles(const IndexProfile& base, const std::vector<std::string>& kinds);

    IndexProfileStore& profiles_;
    VectorIndexStore& index_;
    EmbeddingProvider& embedder_;
};

/**
 * @brief Keep the highest-scoring hit per node (earlier position wins ties),
 * stable-sort by score descending and truncate to top_k.
 */
std::vector<SearchHit> merge_hits(const std::vector<SearchHit>& hits, size_t top_k);

} // namespace Cerebrum
