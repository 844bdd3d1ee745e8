/**
 * @file serialization.hpp
 * @brief JSON views of read models (camelCase keys, absent optionals as null)
 */

#pragma once

#include <clustering/cluster_builder.hpp>
#include <clustering/cluster_read.hpp>
#include <episodes/episode_read.hpp>
#include <ingestion/node_indexer.hpp>
#include <query/brain_search.hpp>
#include <nlohmann/json.hpp>

namespace Cerebrum {

void to_json(nlohmann::json& j, const EpisodeMember& member);
void to_json(nlohmann::json& j, const EpisodeSignal& signal);
void to_json(nlohmann::json& j, const Episode& episode);
void to_json(nlohmann::json& j, const EpisodeConnection& connection);

void to_json(nlohmann::json& j, const ClusterSummary& summary);
void to_json(nlohmann::json& j, const ClusterBuildResult& result);

void to_json(nlohmann::json& j, const SearchHit& hit);
void to_json(nlohmann::json& j, const IndexResult& result);

void to_json(nlohmann::json& j, const BrainSearchHit& hit);
void to_json(nlohmann::json& j, const BrainSearchEpisode& episode);
void to_json(nlohmann::json& j, const GraphNodeView& node);
void to_json(nlohmann::json& j, const GraphEdgeView& edge);
void to_json(nlohmann::json& j, const Passage& passage);
void to_json(nlohmann::json& j, const Citation& citation);
void to_json(nlohmann::json& j, const PromptPack& pack);
void to_json(nlohmann::json& j, const BrainSearchResult& result);

} // namespace Cerebrum
