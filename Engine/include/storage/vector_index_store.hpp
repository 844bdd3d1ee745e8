#pragma once

#include <core/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Cerebrum {

using Embedding = std::vector<float>;

struct VectorIndexEntry {
    std::string node_id;
    std::string profile_id;
    std::string chunk_id = "chunk-0";
    Embedding embedding;
    std::string tenant_id;
    std::optional<std::string> project_key;
    std::string profile_kind;
    std::optional<std::string> source_system;
    PropertyBag raw_metadata = PropertyBag::object();
};

struct VectorQueryFilter {
    std::string tenant_id;
    std::vector<std::string> project_key_in;  // empty = any project
    std::vector<std::string> profile_kind_in; // empty = any kind
};

/**
 * @brief One nearest-neighbor match. Higher score = more similar.
 *
 * metadata carries profileId, profileKind, projectKey, tenantId and the raw
 * metadata stored with the entry.
 */
struct VectorMatch {
    std::string node_id;
    double score = 0.0;
    PropertyBag metadata = PropertyBag::object();
};

class VectorIndexStore {
public:
    virtual ~VectorIndexStore() = default;

    /// Idempotent on (tenant_id, node_id, profile_id, chunk_id).
    virtual void upsert_entries(const std::vector<VectorIndexEntry>& entries) = 0;

    /// Ranked best-first, at most top_k results.
    virtual std::vector<VectorMatch> query(const std::string& profile_id, const Embedding& embedding,
                                           size_t top_k, const VectorQueryFilter& filter) = 0;
};

} // namespace Cerebrum
