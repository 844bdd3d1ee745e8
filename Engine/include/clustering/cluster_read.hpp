/**
 * @file cluster_read.hpp
 * @brief Read side of persisted clusters
 */

#pragma once

#include <core/scope.hpp>
#include <storage/graph_store.hpp>
#include <export.hpp>
#include <string>
#include <vector>

namespace Cerebrum {

struct ClusterSummary {
    std::string cluster_node_id;
    std::string cluster_kind;
    std::vector<std::string> member_node_ids; // deduplicated, sorted
};

class ClusterReader {
public:
    virtual ~ClusterReader() = default;

    virtual std::vector<ClusterSummary> list_clusters_for_project(const std::string& tenant_id,
                                                                  const std::string& project_key,
                                                                  const TimeWindow& window = {}) = 0;
};

/**
 * @brief Lists kg.cluster entities of a project with members recovered from IN_CLUSTER edges.
 */
class CEREBRUM_API ClusterRead : public ClusterReader {
public:
    explicit ClusterRead(GraphStore& graph) : graph_(graph) {}

    std::vector<ClusterSummary> list_clusters_for_project(const std::string& tenant_id,
                                                          const std::string& project_key,
                                                          const TimeWindow& window = {}) override;

private:
    GraphStore& graph_;
};

} // namespace Cerebrum
