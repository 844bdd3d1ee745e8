#include <episodes/episode_read.hpp>
#include <core/errors.hpp>
#include <core/properties.hpp>
#include <utils/unicode.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_set>

namespace Cerebrum {

namespace {

void require_scope(const std::string& tenant_id, const std::string& project_key) {
    if (trim(tenant_id).empty() || trim(project_key).empty()) {
        throw ValidationError("tenantId and projectKey are required for episode reads");
    }
}

std::optional<std::string> non_empty(const std::string& value) {
    std::string t = trim(value);
    if (t.empty()) return std::nullopt;
    return t;
}

} // namespace

EpisodeMember map_member(const Entity& entity, const std::string& fallback_project_key) {
    const auto& raw = entity.properties;
    EntityView view(entity);

    EpisodeMember member;
    member.node_id = entity.id;
    member.node_type = entity.entity_type;
    member.entity_kind = props::string_at(raw, "entityKind").value_or(entity.entity_type);
    member.cdm_model_id = props::first_string(raw, {"cdmModelId", "modelId"});
    member.project_key = view.project_key().value_or(fallback_project_key);

    switch (entity.kind()) {
        case EntityKind::Work: member.work_key = WorkItemView(entity).work_key(); break;
        case EntityKind::Doc:  member.doc_url = DocItemView(entity).doc_url(); break;
        default: break;
    }

    member.title = props::first_string(raw, {"title", "displayName"});
    if (!member.title) member.title = view.display_name();
    if (!member.title) member.title = member.work_key ? member.work_key : member.doc_url;

    member.summary = props::first_string(raw, {"summary", "description"});
    if (!member.summary) member.summary = view.display_name();

    return member;
}

EpisodeRead::EpisodeRead(GraphStore& graph, ClusterReader& clusters, SignalStore& signals,
                         std::function<TimePoint()> now)
    : graph_(graph), clusters_(clusters), signals_(signals), now_(std::move(now)) {
    if (!now_) {
        now_ = [] { return Clock::now(); };
    }
}

EpisodeConnection EpisodeRead::list_episodes(const EpisodeListRequest& request) {
    require_scope(request.tenant_id, request.project_key);
    Scope scope{request.tenant_id, request.project_key, request.actor_id};

    auto summaries = clusters_.list_clusters_for_project(request.tenant_id, request.project_key, request.window);

    struct Row {
        Entity cluster;
        const ClusterSummary* summary;
    };

    std::vector<Row> scoped;
    std::unordered_set<std::string> seen;
    for (const auto& summary : summaries) {
        if (!seen.insert(summary.cluster_node_id).second) continue;

        auto cluster = graph_.get_entity(summary.cluster_node_id, scope);
        if (!cluster) continue;
        if (!matches_scope(*cluster, request.tenant_id, request.project_key)) continue;
        scoped.push_back({std::move(*cluster), &summary});
    }

    std::stable_sort(scoped.begin(), scoped.end(),
                     [](const Row& a, const Row& b) { return more_recent(a.cluster, b.cluster); });

    EpisodeConnection connection;
    connection.total_count = scoped.size();

    size_t begin = std::min(request.offset, scoped.size());
    size_t end = request.limit ? begin + std::min(*request.limit, scoped.size() - begin) : scoped.size();
    for (size_t i = begin; i < end; ++i) {
        connection.nodes.push_back(hydrate(scoped[i].cluster, scoped[i].summary->member_node_ids, scope));
    }
    return connection;
}

std::optional<Episode> EpisodeRead::get_episode(const EpisodeGetRequest& request) {
    require_scope(request.tenant_id, request.project_key);
    Scope scope{request.tenant_id, request.project_key, request.actor_id};

    auto cluster = graph_.get_entity(request.id, scope);
    if (!cluster || cluster->kind() != EntityKind::Cluster) {
        return std::nullopt;
    }
    if (!matches_scope(*cluster, request.tenant_id, request.project_key)) {
        throw ScopeMismatchError(request.id, request.tenant_id, request.project_key);
    }

    // Listing is unwindowed here; clusters it still misses fall back to raw edges.
    std::vector<std::string> member_ids;
    bool listed = false;
    for (const auto& summary : clusters_.list_clusters_for_project(request.tenant_id, request.project_key)) {
        if (summary.cluster_node_id == request.id) {
            member_ids = summary.member_node_ids;
            listed = true;
            break;
        }
    }
    if (!listed) {
        member_ids = member_ids_from_edges(request.id, scope);
    }

    return hydrate(*cluster, member_ids, scope);
}

std::vector<std::string> EpisodeRead::member_ids_from_edges(const std::string& cluster_id, const Scope& scope) {
    EdgeFilter filter;
    filter.edge_types = {EdgeTypes::kInCluster};
    filter.target_entity_id = cluster_id;
    filter.limit = MAX_MEMBER_EDGES;

    std::vector<std::string> ids;
    std::unordered_set<std::string> seen;
    for (const auto& edge : graph_.list_edges(filter, scope)) {
        if (seen.insert(edge.source_entity_id).second) {
            ids.push_back(edge.source_entity_id);
        }
    }
    return ids;
}

Episode EpisodeRead::hydrate(const Entity& cluster, const std::vector<std::string>& member_ids, const Scope& scope) {
    ClusterView view(cluster);

    Episode episode;
    episode.id = cluster.id;
    episode.project_key = view.project_key().value_or(scope.project_id);
    episode.tenant_id = view.tenant_id().value_or(scope.tenant_id);
    episode.cluster_kind = view.cluster_kind();

    episode.members = load_members(member_ids, scope, episode.project_key);

    std::vector<std::string> sources = member_ids;
    sources.push_back(cluster.id);
    episode.signals = load_signals(sources, scope);

    auto size = view.size();
    constexpr double kMaxSize = static_cast<double>(std::numeric_limits<long long>::max());
    bool usable = size && std::isfinite(*size) && *size >= 0 && *size < kMaxSize;
    episode.size = usable ? static_cast<size_t>(std::llround(*size)) : episode.members.size();

    auto created = view.created_at();
    episode.created_at = to_iso_string(created ? *created : now_());
    auto updated = view.updated_at();
    episode.updated_at = updated ? to_iso_string(*updated) : episode.created_at;

    if (auto start = view.window_start()) episode.window_start = to_iso_string(*start);
    if (auto end = view.window_end()) episode.window_end = to_iso_string(*end);
    episode.summary = view.summary();

    return episode;
}

std::vector<EpisodeMember> EpisodeRead::load_members(const std::vector<std::string>& member_ids, const Scope& scope,
                                                     const std::string& project_key) {
    std::vector<EpisodeMember> members;
    for (const auto& id : member_ids) {
        auto entity = graph_.get_entity(id, scope);
        if (!entity || !matches_scope(*entity, scope.tenant_id, project_key)) {
            continue;
        }
        members.push_back(map_member(*entity, project_key));
    }
    return members;
}

std::optional<std::string> EpisodeRead::definition_slug(const std::string& definition_id, SlugCache& cache) {
    auto it = cache.find(definition_id);
    if (it != cache.end()) {
        return it->second;
    }

    std::optional<std::string> slug;
    if (auto definition = signals_.get_definition(definition_id)) {
        slug = non_empty(definition->slug);
    }
    cache.emplace(definition_id, slug);
    return slug;
}

std::vector<EpisodeSignal> EpisodeRead::load_signals(const std::vector<std::string>& source_ids, const Scope& scope) {
    std::vector<std::string> signal_ids;
    std::unordered_set<std::string> seen;
    for (const auto& source : source_ids) {
        EdgeFilter filter;
        filter.edge_types = {EdgeTypes::kHasSignal};
        filter.source_entity_id = source;
        filter.limit = MAX_SIGNALS_PER_SOURCE;
        for (const auto& edge : graph_.list_edges(filter, scope)) {
            if (seen.insert(edge.target_entity_id).second) {
                signal_ids.push_back(edge.target_entity_id);
            }
        }
    }

    std::vector<EpisodeSignal> out;
    SlugCache slugs;
    for (const auto& signal_id : signal_ids) {
        auto instance = signals_.get_instance(signal_id);
        auto node = graph_.get_entity(signal_id, scope);
        if (!instance && !node) {
            continue;
        }

        const PropertyBag empty = PropertyBag::object();
        const PropertyBag& node_props = node ? node->properties : empty;

        std::optional<std::string> definition_id = instance ? non_empty(instance->definition_id) : std::nullopt;
        if (!definition_id) definition_id = props::string_at(node_props, "definitionId");

        std::optional<std::string> slug;
        if (instance && instance->definition) slug = non_empty(instance->definition->slug);
        if (!slug && definition_id) slug = definition_slug(*definition_id, slugs);

        auto pick = [&](const std::string* from_instance, const char* key) -> std::optional<std::string> {
            if (from_instance) {
                if (auto value = non_empty(*from_instance)) return value;
            }
            return props::string_at(node_props, key);
        };

        EpisodeSignal signal;
        signal.id = instance ? instance->id : node->id;
        signal.severity = pick(instance ? &instance->severity : nullptr, "severity").value_or("INFO");
        signal.status = pick(instance ? &instance->status : nullptr, "status").value_or("OPEN");

        auto summary = pick(instance ? &instance->summary : nullptr, "summary");
        if (!summary && node) summary = EntityView(*node).display_name();
        signal.summary = summary.value_or(signal_id);

        signal.definition_slug = slug ? *slug : definition_id.value_or("unknown");
        out.push_back(std::move(signal));
    }
    return out;
}

} // namespace Cerebrum
