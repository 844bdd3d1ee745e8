/**
 * @file pg_graph_store.hpp
 * @brief GraphStore over cerebrum.graph_node / cerebrum.graph_edge
 */

#pragma once

#include <database/postgres_connection.hpp>
#include <storage/graph_store.hpp>
#include <export.hpp>

namespace Cerebrum {

/**
 * @brief PostgreSQL graph store.
 *
 * Properties and metadata are JSONB. Every statement is filtered by tenant;
 * entities list in id order and edges in insertion order, like the in-memory store.
 */
class CEREBRUM_API PgGraphStore : public GraphStore {
public:
    explicit PgGraphStore(PostgresConnection& db) : db_(db) {}

    /// Create the schema, tables and indexes if missing.
    void ensure_schema();

    std::optional<Entity> get_entity(const std::string& id, const Scope& scope) override;
    std::vector<Entity> list_entities(const EntityFilter& filter, const Scope& scope) override;
    std::vector<Edge> list_edges(const EdgeFilter& filter, const Scope& scope) override;
    Entity upsert_entity(const EntityInput& input, const Scope& scope) override;
    Edge upsert_edge(const EdgeInput& input, const Scope& scope) override;

private:
    PostgresConnection& db_;
};

} // namespace Cerebrum
