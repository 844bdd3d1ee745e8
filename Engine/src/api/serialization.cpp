#include <api/serialization.hpp>

namespace Cerebrum {

namespace {

nlohmann::json opt(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

void to_json(nlohmann::json& j, const EpisodeMember& member) {
    j = {
        {"nodeId", member.node_id},
        {"nodeType", member.node_type},
        {"entityKind", member.entity_kind},
        {"cdmModelId", opt(member.cdm_model_id)},
        {"title", opt(member.title)},
        {"summary", opt(member.summary)},
        {"projectKey", opt(member.project_key)},
        {"docUrl", opt(member.doc_url)},
        {"workKey", opt(member.work_key)},
    };
}

void to_json(nlohmann::json& j, const EpisodeSignal& signal) {
    j = {
        {"id", signal.id},
        {"severity", signal.severity},
        {"status", signal.status},
        {"summary", signal.summary},
        {"definitionSlug", signal.definition_slug},
    };
}

void to_json(nlohmann::json& j, const Episode& episode) {
    j = {
        {"id", episode.id},
        {"tenantId", episode.tenant_id},
        {"projectKey", episode.project_key},
        {"clusterKind", episode.cluster_kind},
        {"size", episode.size},
        {"createdAt", episode.created_at},
        {"updatedAt", episode.updated_at},
        {"windowStart", opt(episode.window_start)},
        {"windowEnd", opt(episode.window_end)},
        {"summary", opt(episode.summary)},
        {"members", episode.members},
        {"signals", episode.signals},
    };
}

void to_json(nlohmann::json& j, const EpisodeConnection& connection) {
    j = {{"nodes", connection.nodes}, {"totalCount", connection.total_count}};
}

void to_json(nlohmann::json& j, const ClusterSummary& summary) {
    j = {
        {"clusterNodeId", summary.cluster_node_id},
        {"clusterKind", summary.cluster_kind},
        {"memberNodeIds", summary.member_node_ids},
    };
}

void to_json(nlohmann::json& j, const ClusterBuildResult& result) {
    j = {{"clustersCreated", result.clusters_created}, {"membersLinked", result.members_linked}};
}

void to_json(nlohmann::json& j, const SearchHit& hit) {
    j = {
        {"nodeId", hit.node_id},
        {"profileId", hit.profile_id},
        {"profileKind", hit.profile_kind},
        {"score", hit.score},
        {"title", opt(hit.title)},
        {"url", opt(hit.url)},
        {"projectKey", opt(hit.project_key)},
    };
}

void to_json(nlohmann::json& j, const IndexResult& result) {
    j = {{"indexed", result.indexed}, {"skipped", result.skipped}};
}

void to_json(nlohmann::json& j, const BrainSearchHit& hit) {
    j = {
        {"nodeId", hit.node_id},
        {"nodeType", hit.node_type},
        {"profileId", hit.profile_id},
        {"profileKind", hit.profile_kind},
        {"score", hit.score},
        {"title", opt(hit.title)},
        {"url", opt(hit.url)},
    };
}

void to_json(nlohmann::json& j, const BrainSearchEpisode& episode) {
    j = {
        {"clusterNodeId", episode.cluster_node_id},
        {"clusterKind", episode.cluster_kind},
        {"projectKey", episode.project_key},
        {"score", episode.score},
        {"size", episode.size},
        {"memberNodeIds", episode.member_node_ids},
    };
}

void to_json(nlohmann::json& j, const GraphNodeView& node) {
    j = {
        {"nodeId", node.node_id},
        {"nodeType", node.node_type},
        {"label", opt(node.label)},
        {"properties", node.properties},
    };
}

void to_json(nlohmann::json& j, const GraphEdgeView& edge) {
    j = {
        {"edgeType", edge.edge_type},
        {"fromNodeId", edge.from_node_id},
        {"toNodeId", edge.to_node_id},
        {"properties", edge.properties},
    };
}

void to_json(nlohmann::json& j, const Passage& passage) {
    j = {
        {"sourceNodeId", passage.source_node_id},
        {"sourceKind", passage.source_kind},
        {"text", passage.text},
        {"url", opt(passage.url)},
    };
}

void to_json(nlohmann::json& j, const Citation& citation) {
    j = {
        {"sourceNodeId", citation.source_node_id},
        {"url", opt(citation.url)},
        {"title", opt(citation.title)},
        {"nodeType", citation.node_type},
    };
}

void to_json(nlohmann::json& j, const PromptPack& pack) {
    j = {{"contextMarkdown", pack.context_markdown}, {"citations", pack.citations}};
}

void to_json(nlohmann::json& j, const BrainSearchResult& result) {
    j = {
        {"hits", result.hits},
        {"episodes", result.episodes},
        {"graph", {{"nodes", result.graph_nodes}, {"edges", result.graph_edges}}},
        {"passages", result.passages},
        {"promptPack", result.prompt_pack},
    };
}

} // namespace Cerebrum
