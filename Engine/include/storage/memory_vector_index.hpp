/**
 * @file memory_vector_index.hpp
 * @brief Brute-force cosine-similarity VectorIndexStore (Eigen)
 */

#pragma once

#include <storage/vector_index_store.hpp>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace Cerebrum {

class MemoryVectorIndex : public VectorIndexStore {
public:
    /**
     * @param dimension Required length of every stored and queried vector
     */
    explicit MemoryVectorIndex(size_t dimension);

    void upsert_entries(const std::vector<VectorIndexEntry>& entries) override;
    std::vector<VectorMatch> query(const std::string& profile_id, const Embedding& embedding,
                                   size_t top_k, const VectorQueryFilter& filter) override;

    size_t size() const;
    size_t dimension() const { return dimension_; }

    static double cosine_similarity(const Embedding& a, const Embedding& b);

private:
    void check_dimension(const Embedding& embedding, const char* what) const;

    size_t dimension_;
    mutable std::shared_mutex mutex_;
    std::vector<VectorIndexEntry> entries_;
    std::unordered_map<std::string, size_t> slots_; // tenant#node|profile|chunk -> position
};

} // namespace Cerebrum
