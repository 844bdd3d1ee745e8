/**
 * @file memory_graph_store.hpp
 * @brief Process-local GraphStore for tests, fixtures and offline runs
 */

#pragma once

#include <storage/graph_store.hpp>
#include <functional>
#include <map>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Cerebrum {

/**
 * @brief In-memory graph keyed by tenant and entity id.
 *
 * The same id under two tenants is two entities. Entities list in id order, edges in insertion order. Reads take a shared
 * lock, so concurrent requests are safe.
 */
class MemoryGraphStore : public GraphStore {
public:
    using NowFn = std::function<TimePoint()>;

    explicit MemoryGraphStore(NowFn now = [] { return Clock::now(); });

    std::optional<Entity> get_entity(const std::string& id, const Scope& scope) override;
    std::vector<Entity> list_entities(const EntityFilter& filter, const Scope& scope) override;
    std::vector<Edge> list_edges(const EdgeFilter& filter, const Scope& scope) override;
    Entity upsert_entity(const EntityInput& input, const Scope& scope) override;
    Edge upsert_edge(const EdgeInput& input, const Scope& scope) override;

    /**
     * @brief Store a fully specified entity as-is (timestamps and scope included).
     */
    void put_entity(const Entity& entity);

    size_t entity_count() const;
    size_t edge_count() const;

private:
    using EntityKey = std::pair<std::string, std::string>; // tenant, id

    NowFn now_;
    mutable std::shared_mutex mutex_;
    std::map<EntityKey, Entity> entities_;
    std::vector<Edge> edges_;
    std::unordered_map<std::string, size_t> edge_index_; // tenant + logical key -> position
};

} // namespace Cerebrum
