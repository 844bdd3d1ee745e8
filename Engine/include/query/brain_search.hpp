/**
 * @file brain_search.hpp
 * @brief Hybrid retrieval: vector search, bounded graph expansion, episodes, prompt pack
 */

#pragma once

#include <core/profile_registry.hpp>
#include <query/prompt_pack.hpp>
#include <query/vector_search.hpp>
#include <storage/graph_store.hpp>
#include <export.hpp>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Cerebrum {

struct BrainSearchFilter {
    std::string tenant_id;
    std::optional<std::string> project_key;   // absent: no project filter, labelled "global"
    std::vector<std::string> profile_kind_in;
    std::optional<bool> secured;              // unset counts as true
};

struct BrainSearchOptions {
    std::optional<int> top_k;          // 1..200, default 20
    std::optional<int> max_episodes;   // 0..200, default 10
    std::optional<int> expand_depth;   // 0..3, default 1
    std::optional<int> max_nodes;      // 1..1000, default 200
    std::optional<bool> include_episodes;
    std::optional<bool> include_signals;
    std::optional<bool> include_clusters;
};

struct BrainSearchRequest {
    std::string query_text;
    BrainSearchFilter filter;
    BrainSearchOptions options;
    std::optional<std::string> actor_id;
};

struct GraphNodeView {
    std::string node_id;
    std::string node_type;
    std::optional<std::string> label;
    PropertyBag properties = PropertyBag::object();
};

struct GraphEdgeView {
    std::string edge_type;
    std::string from_node_id;
    std::string to_node_id;
    PropertyBag properties = PropertyBag::object();
};

struct BrainSearchResult {
    std::vector<BrainSearchHit> hits;
    std::vector<BrainSearchEpisode> episodes;
    std::vector<GraphNodeView> graph_nodes;  // sorted by id
    std::vector<GraphEdgeView> graph_edges;  // sorted by type, from, to
    std::vector<Passage> passages;
    PromptPack prompt_pack;
};

struct BrainSearchConfig {
    size_t max_passage_chars = 30000;    // total budget, at least 1000
    size_t max_passage_per_node = 2000;  // per hit, at least 200
};

/**
 * @brief Answers a query with ranked hits, their neighborhood and a prompt pack.
 *
 * Algorithm:
 * 1. Search every default profile, keep the max score per node, cap to top_k
 * 2. Drop hits whose entity is missing, out of scope or secured
 * 3. Breadth-first expansion from the hits under depth and node budgets
 * 4. Score clusters reached through IN_CLUSTER edges by their member hits
 * 5. Extract passages under code-point budgets and render the prompt pack
 *
 * Every ordering is total, so identical inputs give identical output.
 */
class CEREBRUM_API BrainSearch {
public:
    static constexpr const char* DEFAULT_PROJECT_KEY = "global";

    BrainSearch(GraphStore& graph, VectorSearch& search, const ProfileRegistry& registry,
                BrainSearchConfig config = {});

    BrainSearchResult search(const BrainSearchRequest& request);

private:
    struct Context {
        Scope scope;
        std::optional<std::string> project_filter;
        bool enforce_secured = true;
        int expand_depth = 1;
        size_t max_nodes = 200;
        bool include_signals = true;
        bool include_clusters = true;
    };

    struct Expansion {
        std::unordered_map<std::string, Entity> nodes;
        std::map<std::string, Edge> edges; // by edge id
    };

    std::vector<SearchHit> run_vector_search(const BrainSearchRequest& request, size_t top_k,
                                             const std::optional<std::string>& project_filter);
    bool admissible(const Entity& entity, const Context& ctx) const;
    Expansion expand(const std::vector<const Entity*>& seeds, const Context& ctx);
    std::vector<Edge> collect_edges(const std::string& node_id, const Context& ctx, size_t remaining);
    std::vector<BrainSearchEpisode> build_episodes(const Expansion& graph, const std::vector<BrainSearchHit>& hits,
                                                   const Context& ctx, size_t max_episodes) const;
    std::vector<Passage> build_passages(const std::vector<BrainSearchHit>& hits, const Expansion& graph) const;

    GraphStore& graph_;
    VectorSearch& search_;
    const ProfileRegistry& registry_;
    BrainSearchConfig config_;
};

} // namespace Cerebrum
