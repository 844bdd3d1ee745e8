#include <query/brain_search.hpp>
#include <core/errors.hpp>
#include <core/properties.hpp>
#include <core/scope.hpp>
#include <utils/logger.hpp>
#include <utils/unicode.hpp>
#include <algorithm>
#include <deque>
#include <set>
#include <tuple>
#include <unordered_set>

namespace Cerebrum {

namespace {

int clamp_option(const std::optional<int>& value, int lo, int hi, int fallback) {
    if (!value) return fallback;
    return std::clamp(*value, lo, hi);
}

std::optional<std::string> passage_text(const Entity& entity) {
    for (const char* key : {"summary", "description", "body", "text", "content", "title"}) {
        auto it = entity.properties.find(key);
        if (it != entity.properties.end() && it->is_string()) {
            const auto& value = it->get_ref<const std::string&>();
            if (!trim(value).empty()) return value;
        }
    }
    if (!trim(entity.display_name).empty()) return entity.display_name;
    return std::nullopt;
}

} // namespace

BrainSearch::BrainSearch(GraphStore& graph, VectorSearch& search, const ProfileRegistry& registry,
                         BrainSearchConfig config)
    : graph_(graph), search_(search), registry_(registry), config_(config) {
    config_.max_passage_chars = std::max<size_t>(1000, config_.max_passage_chars);
    config_.max_passage_per_node = std::max<size_t>(200, config_.max_passage_per_node);
}

BrainSearchResult BrainSearch::search(const BrainSearchRequest& request) {
    Timer timer;

    std::string tenant_id = trim(request.filter.tenant_id);
    if (tenant_id.empty()) {
        throw ValidationError("tenantId is required for brain search");
    }

    Context ctx;
    ctx.enforce_secured = request.filter.secured.value_or(true);
    if (ctx.enforce_secured && (!request.actor_id || trim(*request.actor_id).empty())) {
        throw ValidationError("Brain search requires an authenticated principal when secured=true");
    }

    if (request.filter.project_key) {
        std::string project = trim(*request.filter.project_key);
        if (!project.empty()) ctx.project_filter = project;
    }
    ctx.scope = Scope{tenant_id, ctx.project_filter.value_or(DEFAULT_PROJECT_KEY), request.actor_id};

    const auto& options = request.options;
    size_t top_k = static_cast<size_t>(clamp_option(options.top_k, 1, 200, 20));
    size_t max_episodes = static_cast<size_t>(clamp_option(options.max_episodes, 0, 200, 10));
    ctx.expand_depth = clamp_option(options.expand_depth, 0, 3, 1);
    ctx.max_nodes = static_cast<size_t>(clamp_option(options.max_nodes, 1, 1000, 200));
    bool include_episodes = options.include_episodes.value_or(true);
    ctx.include_signals = options.include_signals.value_or(true);
    // Episodes are found through cluster edges
    ctx.include_clusters = options.include_clusters.value_or(true) || include_episodes;

    auto vector_hits = run_vector_search(request, top_k, ctx.project_filter);

    BrainSearchResult result;
    std::unordered_map<std::string, Entity> hit_entities;
    std::vector<const Entity*> seeds;
    for (const auto& hit : vector_hits) {
        auto entity = graph_.get_entity(hit.node_id, ctx.scope);
        if (!entity || !admissible(*entity, ctx)) {
            Logger::debug("Dropping hit " + hit.node_id);
            continue;
        }

        EntityView view(*entity);
        BrainSearchHit out;
        out.node_id = entity->id;
        out.node_type = entity->entity_type;
        out.profile_id = hit.profile_id;
        out.profile_kind = trim(hit.profile_kind);
        if (out.profile_kind.empty()) {
            auto kind = registry_.kind_for_entity_type(entity->entity_type);
            out.profile_kind = kind == ProfileKind::Other ? "unknown" : to_string(kind);
        }
        out.score = hit.score;
        out.title = view.title();
        out.url = view.url();
        result.hits.push_back(std::move(out));

        auto [it, inserted] = hit_entities.emplace(entity->id, std::move(*entity));
        if (inserted) seeds.push_back(&it->second);
    }

    auto graph = expand(seeds, ctx);

    if (include_episodes) {
        result.episodes = build_episodes(graph, result.hits, ctx, max_episodes);
    }

    for (const auto& [id, entity] : graph.nodes) {
        GraphNodeView node;
        node.node_id = entity.id;
        node.node_type = entity.entity_type;
        node.label = EntityView(entity).display_name();
        node.properties = entity.properties;
        result.graph_nodes.push_back(std::move(node));
    }
    std::sort(result.graph_nodes.begin(), result.graph_nodes.end(),
              [](const GraphNodeView& a, const GraphNodeView& b) { return a.node_id < b.node_id; });

    for (const auto& [id, edge] : graph.edges) {
        result.graph_edges.push_back({edge.edge_type, edge.source_entity_id, edge.target_entity_id, edge.metadata});
    }
    std::sort(result.graph_edges.begin(), result.graph_edges.end(),
              [](const GraphEdgeView& a, const GraphEdgeView& b) {
                  return std::tie(a.edge_type, a.from_node_id, a.to_node_id) <
                         std::tie(b.edge_type, b.from_node_id, b.to_node_id);
              });

    result.passages = build_passages(result.hits, graph);
    result.prompt_pack = build_prompt_pack(request.query_text, result.hits, result.episodes, result.passages);

    Logger::debug("Brain search for " + tenant_id + "/" + ctx.scope.project_id + ": " +
                  std::to_string(result.hits.size()) + " hits, " +
                  std::to_string(result.graph_nodes.size()) + " nodes, " +
                  std::to_string(result.episodes.size()) + " episodes in " +
                  std::to_string(static_cast<long long>(timer.elapsed_ms())) + " ms");
    return result;
}

std::vector<SearchHit> BrainSearch::run_vector_search(const BrainSearchRequest& request, size_t top_k,
                                                      const std::optional<std::string>& project_filter) {
    std::vector<std::string> kinds;
    for (const auto& kind : request.filter.profile_kind_in) {
        std::string k = trim(kind);
        if (!k.empty()) kinds.push_back(k);
    }

    std::vector<SearchHit> combined;
    for (const auto& profile : registry_.search_profiles()) {
        VectorSearchRequest search;
        search.profile_id = profile.id;
        search.query_text = request.query_text;
        search.top_k = top_k;
        search.tenant_id = trim(request.filter.tenant_id);
        if (project_filter) search.project_key_in = {*project_filter};
        search.profile_kind_in = kinds;

        auto hits = search_.search(search);
        combined.insert(combined.end(), hits.begin(), hits.end());
    }
    return merge_hits(combined, top_k);
}

bool BrainSearch::admissible(const Entity& entity, const Context& ctx) const {
    if (!matches_tenant(entity, ctx.scope.tenant_id)) return false;
    if (ctx.project_filter && !matches_scope(entity, ctx.scope.tenant_id, *ctx.project_filter)) return false;
    if (ctx.enforce_secured && EntityView(entity).is_secured()) return false;
    return true;
}

std::vector<Edge> BrainSearch::collect_edges(const std::string& node_id, const Context& ctx, size_t remaining) {
    EdgeFilter outbound;
    outbound.source_entity_id = node_id;
    outbound.limit = std::max<size_t>(10, std::min<size_t>(remaining * 4, 500));

    EdgeFilter inbound;
    inbound.target_entity_id = node_id;
    inbound.limit = outbound.limit;

    std::vector<Edge> out;
    std::unordered_set<std::string> seen;
    for (auto* filter : {&outbound, &inbound}) {
        for (auto& edge : graph_.list_edges(*filter, ctx.scope)) {
            if (seen.insert(edge.id).second) out.push_back(std::move(edge));
        }
    }
    return out;
}

BrainSearch::Expansion BrainSearch::expand(const std::vector<const Entity*>& seeds, const Context& ctx) {
    struct Item {
        std::string id;
        int depth;
    };

    Expansion graph;
    std::deque<Item> queue;
    for (const auto* seed : seeds) {
        if (graph.nodes.size() >= ctx.max_nodes) break;
        if (graph.nodes.emplace(seed->id, *seed).second) {
            queue.push_back({seed->id, 0});
        }
    }

    while (!queue.empty() && graph.nodes.size() < ctx.max_nodes) {
        Item current = std::move(queue.front());
        queue.pop_front();
        if (current.depth >= ctx.expand_depth) continue;

        for (auto& edge : collect_edges(current.id, ctx, ctx.max_nodes - graph.nodes.size())) {
            if (!ctx.include_signals && edge.edge_type == EdgeTypes::kHasSignal) continue;
            if (!ctx.include_clusters && edge.edge_type == EdgeTypes::kInCluster) continue;

            const std::string neighbor_id =
                edge.source_entity_id == current.id ? edge.target_entity_id : edge.source_entity_id;

            if (graph.nodes.count(neighbor_id) || graph.nodes.size() >= ctx.max_nodes) {
                graph.edges.emplace(edge.id, std::move(edge));
                continue;
            }

            auto neighbor = graph_.get_entity(neighbor_id, ctx.scope);
            if (!neighbor || !admissible(*neighbor, ctx)) {
                continue;
            }

            graph.nodes.emplace(neighbor_id, std::move(*neighbor));
            graph.edges.emplace(edge.id, std::move(edge));
            queue.push_back({neighbor_id, current.depth + 1});
        }
    }
    return graph;
}

std::vector<BrainSearchEpisode> BrainSearch::build_episodes(const Expansion& graph,
                                                            const std::vector<BrainSearchHit>& hits,
                                                            const Context& ctx, size_t max_episodes) const {
    std::unordered_map<std::string, double> hit_scores;
    for (const auto& hit : hits) hit_scores.emplace(hit.node_id, hit.score);

    std::map<std::string, std::set<std::string>> members_by_cluster;
    for (const auto& [id, edge] : graph.edges) {
        if (edge.edge_type != EdgeTypes::kInCluster) continue;
        members_by_cluster[edge.target_entity_id].insert(edge.source_entity_id);
    }

    std::vector<BrainSearchEpisode> episodes;
    for (const auto& [cluster_id, members] : members_by_cluster) {
        double score = 0.0;
        for (const auto& member : members) {
            auto it = hit_scores.find(member);
            if (it != hit_scores.end()) score += it->second;
        }
        if (score <= 0.0) continue;

        BrainSearchEpisode episode;
        episode.cluster_node_id = cluster_id;
        episode.cluster_kind = "unknown";
        episode.project_key = ctx.scope.project_id;
        episode.size = static_cast<double>(members.size());

        auto node = graph.nodes.find(cluster_id);
        if (node != graph.nodes.end()) {
            ClusterView view(node->second);
            episode.cluster_kind = view.cluster_kind();
            if (auto project = props::first_string(node->second.properties,
                                                   {"projectKey", "project_key", "projectId", "project", "sourceProjectKey"})) {
                episode.project_key = *project;
            } else if (!node->second.project_id.empty()) {
                episode.project_key = node->second.project_id;
            }
            if (auto size = view.size()) episode.size = *size;
        }

        episode.score = score;
        episode.member_node_ids.assign(members.begin(), members.end());
        episodes.push_back(std::move(episode));
    }

    std::sort(episodes.begin(), episodes.end(), [](const BrainSearchEpisode& a, const BrainSearchEpisode& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.cluster_node_id < b.cluster_node_id;
    });
    if (episodes.size() > max_episodes) episodes.resize(max_episodes);
    return episodes;
}

std::vector<Passage> BrainSearch::build_passages(const std::vector<BrainSearchHit>& hits,
                                                 const Expansion& graph) const {
    std::vector<Passage> passages;
    size_t remaining = config_.max_passage_chars;

    for (const auto& hit : hits) {
        if (remaining == 0) break;

        auto node = graph.nodes.find(hit.node_id);
        if (node == graph.nodes.end()) continue;

        auto text = passage_text(node->second);
        if (!text) continue;

        std::string snippet = utf8_truncate(*text, std::min(config_.max_passage_per_node, remaining));
        if (snippet.empty()) continue;

        Passage passage;
        passage.source_node_id = hit.node_id;
        auto kind = registry_.kind_for_entity_type(node->second.entity_type);
        passage.source_kind = kind != ProfileKind::Other ? to_string(kind)
                                                         : (hit.profile_kind.empty() ? "other" : hit.profile_kind);
        passage.text = snippet;
        passage.url = EntityView(node->second).url();
        remaining -= std::min(remaining, utf8_length(snippet));
        passages.push_back(std::move(passage));
    }
    return passages;
}

} // namespace Cerebrum
