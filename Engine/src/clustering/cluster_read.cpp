#include <clustering/cluster_read.hpp>
#include <core/properties.hpp>
#include <set>

namespace Cerebrum {

std::vector<ClusterSummary> ClusterRead::list_clusters_for_project(const std::string& tenant_id,
                                                                   const std::string& project_key,
                                                                   const TimeWindow& window) {
    Scope scope{tenant_id, project_key, std::nullopt};

    EntityFilter filter;
    filter.entity_types = {EntityTypes::kCluster};

    std::vector<ClusterSummary> summaries;
    for (const auto& cluster : graph_.list_entities(filter, scope)) {
        if (!belongs_to_project(cluster, project_key)) continue;
        if (!within_window(cluster, window)) continue;

        EdgeFilter edges;
        edges.edge_types = {EdgeTypes::kInCluster};
        edges.target_entity_id = cluster.id;

        std::set<std::string> members;
        for (const auto& edge : graph_.list_edges(edges, scope)) {
            members.insert(edge.source_entity_id);
        }

        ClusterSummary summary;
        summary.cluster_node_id = cluster.id;
        summary.cluster_kind = ClusterView(cluster).cluster_kind();
        summary.member_node_ids.assign(members.begin(), members.end());
        summaries.push_back(std::move(summary));
    }
    return summaries;
}

} // namespace Cerebrum
