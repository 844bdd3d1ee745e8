/**
 * @file pg_vector_index_store.hpp
 * @brief pgvector-backed VectorIndexStore
 */

#pragma once

#include <database/postgres_connection.hpp>
#include <storage/vector_index_store.hpp>
#include <export.hpp>

namespace Cerebrum {

/**
 * @brief Vector index in cerebrum.vector_index_entry.
 *
 * Similarity is cosine: score = 1 - (embedding <=> query). The column is
 * declared vector(dimension) so every stored and queried vector must match.
 */
class CEREBRUM_API PgVectorIndexStore : public VectorIndexStore {
public:
    PgVectorIndexStore(PostgresConnection& db, size_t dimension) : db_(db), dimension_(dimension) {}

    /// Create the pgvector extension, table and indexes if missing.
    void ensure_schema();

    void upsert_entries(const std::vector<VectorIndexEntry>& entries) override;
    std::vector<VectorMatch> query(const std::string& profile_id, const Embedding& embedding,
                                   size_t top_k, const VectorQueryFilter& filter) override;

    size_t dimension() const { return dimension_; }

private:
    void check_dimension(const Embedding& embedding, const char* what) const;

    PostgresConnection& db_;
    size_t dimension_;
};

} // namespace Cerebrum
