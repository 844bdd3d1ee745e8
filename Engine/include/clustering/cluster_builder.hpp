/**
 * @file cluster_builder.hpp
 * @brief Batch clustering of work/doc entities by vector neighborhood
 */

#pragma once

#include <core/profile_registry.hpp>
#include <core/scope.hpp>
#include <query/vector_search.hpp>
#include <storage/graph_store.hpp>
#include <storage/run_lock.hpp>
#include <export.hpp>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace Cerebrum {

struct ClusterBuilderConfig {
    std::string cluster_kind = "work-doc-episode";
    std::string algo_label = "vector-neighbors-v1";
    double score_threshold = 0.35;   // neighbors scoring below are rejected
    int max_neighbors = 5;           // clamped to >= 1
    std::function<TimePoint()> now; // defaults to the system clock
    RunLock* run_lock = nullptr;     // optional; serializes runs per tenant+project
};

struct ClusterBuildRequest {
    std::string tenant_id;
    std::string project_key;
    TimeWindow window;
    std::optional<int> max_seeds;        // clamped 1..200, default 25
    std::optional<int> max_cluster_size; // at least 2, default 5
};

struct ClusterBuildResult {
    size_t clusters_created = 0;
    size_t members_linked = 0;
};

/**
 * @brief Content-addressed cluster id for a cluster key.
 *
 * "cluster:" followed by the first 16 hex digits of the key's BLAKE3 digest.
 */
std::string cluster_id_for_key(const std::string& key);

/**
 * @brief "tenant::project::windowStart|windowEnd::m1|m2|..." with members sorted.
 */
std::string cluster_key(const std::string& tenant_id, const std::string& project_key,
                        const TimeWindow& window, const std::set<std::string>& members);

/**
 * @brief Seeds → neighbors → merged clusters → idempotent persistence.
 *
 * Algorithm:
 * 1. Load work/doc entities in project and window, most recent first, capped at max_seeds
 * 2. Search neighbors of each seed through its profile; admit in-project members
 *    scoring at or above the threshold until max_cluster_size
 * 3. Drop singletons; merge drafts that share a cluster key
 * 4. Upsert each cluster node, then one IN_CLUSTER edge per member
 *
 * Re-running over unchanged data creates nothing new: ids derive from the key.
 */
class CEREBRUM_API ClusterBuilder {
public:
    static constexpr int DEFAULT_MAX_SEEDS = 25;
    static constexpr int MAX_SEEDS_LIMIT = 200;
    static constexpr int DEFAULT_MAX_CLUSTER_SIZE = 5;

    ClusterBuilder(GraphStore& graph, VectorSearch& search, const ProfileRegistry& registry,
                   ClusterBuilderConfig config = {});

    ClusterBuildResult build_clusters_for_project(const ClusterBuildRequest& request);

private:
    struct Draft {
        std::string cluster_id;
        std::set<std::string> seed_node_ids;
        std::set<std::string> members;
        double score = 0.0;
    };

    struct SeedMembers {
        std::set<std::string> members;
        double top_score = 0.0;
    };

    ClusterBuildResult run(const ClusterBuildRequest& request);
    std::vector<Entity> load_seeds(const ClusterBuildRequest& request, const Scope& scope, size_t max_seeds);
    SeedMembers collect_members(const Entity& seed, const ClusterBuildRequest& request, const Scope& scope,
                                size_t max_cluster_size, std::unordered_map<std::string, Entity>& cache);
    std::optional<Entity> resolve_member(const std::string& node_id, const std::string& project_key,
                                         const Scope& scope, std::unordered_map<std::string, Entity>& cache);
    PropertyBag cluster_properties(const ClusterBuildRequest& request, const Draft& draft,
                                   const std::optional<Entity>& existing, TimePoint now) const;

    GraphStore& graph_;
    VectorSearch& search_;
    const ProfileRegistry& registry_;
    ClusterBuilderConfig config_;
};

/**
 * @brief Query text for a seed: first non-empty of the keys, then display name, then id.
 */
std::string resolve_query_text(const Entity& entity, const std::vector<std::string>& keys);

} // namespace Cerebrum
