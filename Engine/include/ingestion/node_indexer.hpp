/**
 * @file node_indexer.hpp
 * @brief Embeds graph entities into the vector index, one profile at a time
 */

#pragma once

#include <ml/embedding_provider.hpp>
#include <storage/graph_store.hpp>
#include <storage/index_profile_store.hpp>
#include <storage/vector_index_store.hpp>
#include <export.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Cerebrum {

struct IndexRequest {
    std::string profile_id;
    Scope scope;
    std::optional<std::vector<std::string>> node_ids; // restrict to these ids
    size_t batch_size = 25;
};

struct IndexResult {
    size_t indexed = 0;
    size_t skipped = 0; // entities with no extractable text
};

/**
 * @brief Batch indexer for one profile.
 *
 * Algorithm:
 * 1. Resolve the profile (NotFoundError if unknown, no-op when disabled)
 * 2. List the profile's node type for the tenant, most recent first
 * 3. Per batch: extract text, embed with the profile model, upsert entries
 *
 * The provider must return one vector per text, each of the index dimension.
 */
class CEREBRUM_API NodeIndexer {
public:
    NodeIndexer(GraphStore& graph, IndexProfileStore& profiles, VectorIndexStore& index,
                EmbeddingProvider& embedder, size_t index_dimension);

    IndexResult index_nodes_for_profile(const IndexRequest& request);

private:
    VectorIndexEntry make_entry(const Entity& entity, const IndexProfile& profile, Embedding embedding,
                                const Scope& scope) const;

    GraphStore& graph_;
    IndexProfileStore& profiles_;
    VectorIndexStore& index_;
    EmbeddingProvider& embedder_;
    size_t index_dimension_;
};

/**
 * @brief Text the profile says to embed, or nullopt.
 *
 * text_source.path, then text_source.field (direct, then anywhere below),
 * then summary, body, text, content. String arrays join with newlines.
 */
std::optional<std::string> extract_index_text(const IndexProfile& profile, const PropertyBag& properties);

/**
 * @brief Project key for index filtering; also looks inside "_metadata".
 */
std::optional<std::string> index_project_key(const Entity& entity);

} // namespace Cerebrum
