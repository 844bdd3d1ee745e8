/**
 * @file episode_read.hpp
 * @brief Hydrates persisted clusters into episode views
 */

#pragma once

#include <clustering/cluster_read.hpp>
#include <core/scope.hpp>
#include <storage/graph_store.hpp>
#include <storage/signal_store.hpp>
#include <export.hpp>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Cerebrum {

struct EpisodeMember {
    std::string node_id;
    std::string node_type;
    std::string entity_kind;
    std::optional<std::string> cdm_model_id;
    std::optional<std::string> title;
    std::optional<std::string> summary;
    std::optional<std::string> project_key;
    std::optional<std::string> doc_url;   // doc members only
    std::optional<std::string> work_key;  // work members only
};

struct EpisodeSignal {
    std::string id;
    std::string severity;
    std::string status;
    std::string summary;
    std::string definition_slug;
};

struct Episode {
    std::string id;
    std::string tenant_id;
    std::string project_key;
    std::string cluster_kind;
    size_t size = 0;
    std::string created_at;
    std::string updated_at;
    std::optional<std::string> window_start;
    std::optional<std::string> window_end;
    std::optional<std::string> summary;
    std::vector<EpisodeMember> members;
    std::vector<EpisodeSignal> signals;
};

struct EpisodeConnection {
    std::vector<Episode> nodes;
    size_t total_count = 0;
};

struct EpisodeListRequest {
    std::string tenant_id;
    std::string project_key;
    TimeWindow window;
    size_t offset = 0;
    std::optional<size_t> limit; // unset = everything after offset
    std::optional<std::string> actor_id;
};

struct EpisodeGetRequest {
    std::string tenant_id;
    std::string project_key;
    std::string id;
    std::optional<std::string> actor_id;
};

/**
 * @brief Read-only episode projection over clusters, members and signals.
 *
 * Listing silently drops clusters whose declared scope disagrees with the
 * request; a direct lookup of such a cluster throws ScopeMismatchError.
 * Missing members and signals are skipped. All caches live for one call.
 */
class CEREBRUM_API EpisodeRead {
public:
    static constexpr size_t MAX_SIGNALS_PER_SOURCE = 200;
    static constexpr size_t MAX_MEMBER_EDGES = 500;

    EpisodeRead(GraphStore& graph, ClusterReader& clusters, SignalStore& signals,
                std::function<TimePoint()> now = {});

    EpisodeConnection list_episodes(const EpisodeListRequest& request);

    /**
     * @return nullopt when the id is unknown or not a cluster
     * @throws ScopeMismatchError when the cluster belongs to another tenant/project
     */
    std::optional<Episode> get_episode(const EpisodeGetRequest& request);

private:
    using SlugCache = std::unordered_map<std::string, std::optional<std::string>>;

    Episode hydrate(const Entity& cluster, const std::vector<std::string>& member_ids, const Scope& scope);
    std::vector<EpisodeMember> load_members(const std::vector<std::string>& member_ids, const Scope& scope,
                                            const std::string& project_key);
    std::vector<EpisodeSignal> load_signals(const std::vector<std::string>& source_ids, const Scope& scope);
    std::optional<std::string> definition_slug(const std::string& definition_id, SlugCache& cache);
    std::vector<std::string> member_ids_from_edges(const std::string& cluster_id, const Scope& scope);

    GraphStore& graph_;
    ClusterReader& clusters_;
    SignalStore& signals_;
    std::function<TimePoint()> now_;
};

/**
 * @brief Typed member summary; work_key/doc_url are set only for their kind.
 */
EpisodeMember map_member(const Entity& entity, const std::string& fallback_project_key);

} // namespace Cerebrum
