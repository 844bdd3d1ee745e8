#include <clustering/cluster_builder.hpp>
#include <core/errors.hpp>
#include <core/properties.hpp>
#include <hashing/content_hash.hpp>
#include <utils/logger.hpp>
#include <utils/unicode.hpp>
#include <algorithm>
#include <map>

namespace Cerebrum {

namespace {

std::string join(const std::set<std::string>& values, const char* sep) {
    std::string out;
    for (const auto& value : values) {
        if (!out.empty()) out += sep;
        out += value;
    }
    return out;
}

} // namespace

std::string cluster_id_for_key(const std::string& key) {
    return "cluster:" + ContentHash::hex_prefix(key, 16);
}

std::string cluster_key(const std::string& tenant_id, const std::string& project_key,
                        const TimeWindow& window, const std::set<std::string>& members) {
    return tenant_id + "::" + project_key + "::" + window.key() + "::" + join(members, "|");
}

std::string resolve_query_text(const Entity& entity, const std::vector<std::string>& keys) {
    if (auto text = props::first_string(entity.properties, keys)) {
        return *text;
    }
    if (!trim(entity.display_name).empty()) {
        return entity.display_name;
    }
    return entity.id;
}

ClusterBuilder::ClusterBuilder(GraphStore& graph, VectorSearch& search, const ProfileRegistry& registry,
                               ClusterBuilderConfig config)
    : graph_(graph), search_(search), registry_(registry), config_(std::move(config)) {
    config_.max_neighbors = std::max(1, config_.max_neighbors);
    if (!config_.now) {
        config_.now = [] { return Clock::now(); };
    }
}

ClusterBuildResult ClusterBuilder::build_clusters_for_project(const ClusterBuildRequest& request) {
    if (trim(request.tenant_id).empty() || trim(request.project_key).empty()) {
        throw ValidationError("tenantId and projectKey are required to build clusters");
    }

    if (config_.run_lock) {
        RunLockGuard guard(*config_.run_lock, RunLock::key_for(request.tenant_id, request.project_key));
        return run(request);
    }
    return run(request);
}

ClusterBuildResult ClusterBuilder::run(const ClusterBuildRequest& request) {
    Timer timer;
    Scope scope{request.tenant_id, request.project_key, std::nullopt};

    size_t max_seeds = static_cast<size_t>(
        std::clamp(request.max_seeds.value_or(DEFAULT_MAX_SEEDS), 1, MAX_SEEDS_LIMIT));
    size_t max_cluster_size = static_cast<size_t>(
        std::max(2, request.max_cluster_size.value_or(DEFAULT_MAX_CLUSTER_SIZE)));

    Logger::step("Building clusters for " + request.tenant_id + "/" + request.project_key);

    auto seeds = load_seeds(request, scope, max_seeds);

    // Per-run cache of resolved members; seeds are already known to be eligible.
    std::unordered_map<std::string, Entity> cache;
    for (const auto& seed : seeds) cache.emplace(seed.id, seed);

    // Keyed by cluster key; std::map keeps persistence order deterministic.
    std::map<std::string, Draft> drafts;

    for (const auto& seed : seeds) {
        auto found = collect_members(seed, request, scope, max_cluster_size, cache);
        if (found.members.size() < 2) {
            Logger::debug("Seed " + seed.id + " has no eligible neighbors");
            continue;
        }

        std::string key = cluster_key(request.tenant_id, request.project_key, request.window, found.members);
        auto it = drafts.find(key);
        if (it != drafts.end()) {
            it->second.members.insert(found.members.begin(), found.members.end());
            it->second.seed_node_ids.insert(seed.id);
            it->second.score = std::max(it->second.score, found.top_score);
            continue;
        }

        Draft draft;
        draft.cluster_id = cluster_id_for_key(key);
        draft.seed_node_ids.insert(seed.id);
        draft.members = std::move(found.members);
        draft.score = found.top_score;
        drafts.emplace(std::move(key), std::move(draft));
    }

    ClusterBuildResult result;
    for (const auto& [key, draft] : drafts) {
        auto existing = graph_.get_entity(draft.cluster_id, scope);
        if (!existing) {
            ++result.clusters_created;
        }

        EntityInput node;
        node.id = draft.cluster_id;
        node.entity_type = EntityTypes::kCluster;
        node.display_name = draft.cluster_id;
        node.properties = cluster_properties(request, draft, existing, config_.now());
        graph_.upsert_entity(node, scope);

        for (const auto& member_id : draft.members) {
            EdgeInput edge;
            edge.edge_type = EdgeTypes::kInCluster;
            edge.source_entity_id = member_id;
            edge.target_entity_id = draft.cluster_id;
            graph_.upsert_edge(edge, scope);
            ++result.members_linked;
        }
    }

    Logger::success("Clusters for " + request.tenant_id + "/" + request.project_key + ": " +
                    std::to_string(seeds.size()) + " seeds, " +
                    std::to_string(drafts.size()) + " clusters (" +
                    std::to_string(result.clusters_created) + " new), " +
                    std::to_string(result.members_linked) + " members linked in " +
                    std::to_string(static_cast<long long>(timer.elapsed_ms())) + " ms");
    return result;
}

std::vector<Entity> ClusterBuilder::load_seeds(const ClusterBuildRequest& request, const Scope& scope,
                                               size_t max_seeds) {
    EntityFilter filter;
    filter.entity_types = registry_.member_entity_types();
    if (filter.entity_types.empty()) {
        Logger::warn("No work/doc index profiles registered; nothing to cluster");
        return {};
    }

    std::vector<Entity> seeds;
    for (auto& entity : graph_.list_entities(filter, scope)) {
        if (!belongs_to_project(entity, request.project_key)) continue;
        if (!within_window(entity, request.window)) continue;
        seeds.push_back(std::move(entity));
    }

    std::stable_sort(seeds.begin(), seeds.end(), more_recent);
    if (seeds.size() > max_seeds) seeds.resize(max_seeds);
    return seeds;
}

ClusterBuilder::SeedMembers ClusterBuilder::collect_members(const Entity& seed, const ClusterBuildRequest& request,
                                                            const Scope& scope, size_t max_cluster_size,
                                                            std::unordered_map<std::string, Entity>& cache) {
    SeedMembers out;
    out.members.insert(seed.id);

    const IndexProfile* profile = registry_.for_entity_type(seed.entity_type);
    if (!profile) {
        return out;
    }

    VectorSearchRequest search;
    search.profile_id = profile->id;
    search.query_text = resolve_query_text(seed, profile->query_fields);
    search.top_k = std::min(static_cast<size_t>(config_.max_neighbors), std::max<size_t>(1, max_cluster_size - 1));
    search.tenant_id = request.tenant_id;
    search.project_key_in = {request.project_key};
    search.profile_kind_in = {profile->profile_kind};

    auto hits = search_.search(search);
    std::stable_sort(hits.begin(), hits.end(),
                     [](const SearchHit& a, const SearchHit& b) { return a.score > b.score; });

    for (const auto& hit : hits) {
        if (hit.node_id == seed.id) continue;

        out.top_score = std::max(out.top_score, hit.score);
        if (hit.score < config_.score_threshold) continue;

        auto member = resolve_member(hit.node_id, request.project_key, scope, cache);
        if (!member) {
            Logger::debug("Skipping neighbor " + hit.node_id + " of " + seed.id);
            continue;
        }

        out.members.insert(member->id);
        if (out.members.size() >= max_cluster_size) break;
    }
    return out;
}

std::optional<Entity> ClusterBuilder::resolve_member(const std::string& node_id, const std::string& project_key,
                                                     const Scope& scope,
                                                     std::unordered_map<std::string, Entity>& cache) {
    auto cached = cache.find(node_id);
    if (cached != cache.end()) {
        return cached->second;
    }

    auto entity = graph_.get_entity(node_id, scope);
    if (!entity) return std::nullopt;
    if (!registry_.is_member_type(entity->entity_type)) return std::nullopt;
    if (!belongs_to_project(*entity, project_key)) return std::nullopt;

    cache.emplace(node_id, *entity);
    return entity;
}

PropertyBag ClusterBuilder::cluster_properties(const ClusterBuildRequest& request, const Draft& draft,
                                               const std::optional<Entity>& existing, TimePoint now) const {
    std::string now_iso = to_iso_string(now);
    std::string created_at = now_iso;
    if (existing) {
        if (auto previous = props::time_at(existing->properties, "createdAt")) {
            created_at = to_iso_string(*previous);
        }
    }

    PropertyBag properties = {
        {"tenantId", request.tenant_id},
        {"projectKey", request.project_key},
        {"clusterKind", config_.cluster_kind},
        {"seedNodeIds", std::vector<std::string>(draft.seed_node_ids.begin(), draft.seed_node_ids.end())},
        {"size", draft.members.size()},
        {"createdAt", created_at},
        {"updatedAt", now_iso},
        {"score", draft.score},
        {"algo", config_.algo_label},
    };
    if (request.window.start) properties["windowStart"] = to_iso_string(*request.window.start);
    if (request.window.end) properties["windowEnd"] = to_iso_string(*request.window.end);
    return properties;
}

} // namespace Cerebrum
