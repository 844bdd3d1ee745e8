#include <storage/pg_graph_store.hpp>
#include <database/pg_format.hpp>
#include <core/errors.hpp>
#include <stdexcept>

namespace Cerebrum {

namespace {

std::string entity_columns() {
    return "id, tenant_id, COALESCE(project_id, ''), entity_type, display_name, COALESCE(canonical_path, ''), "
           "properties::text, " + pg::iso_column("created_at") + ", " + pg::iso_column("updated_at");
}

const char* kEdgeColumns =
    "id, tenant_id, COALESCE(project_id, ''), edge_type, source_id, target_id, metadata::text";

PropertyBag parse_bag(const std::string& text) {
    if (text.empty()) return PropertyBag::object();
    auto bag = PropertyBag::parse(text, nullptr, false);
    if (bag.is_discarded() || !bag.is_object()) {
        throw ShapeError("Stored JSON is not an object: " + text.substr(0, 80));
    }
    return bag;
}

Entity entity_from_row(const PostgresConnection::Row& row) {
    Entity entity;
    entity.id = row[0];
    entity.tenant_id = row[1];
    entity.project_id = row[2];
    entity.entity_type = row[3];
    entity.display_name = row[4];
    entity.canonical_path = pg::nullable(row[5]);
    entity.properties = parse_bag(row[6]);
    entity.created_at = parse_iso_time(row[7]);
    entity.updated_at = parse_iso_time(row[8]);
    return entity;
}

Edge edge_from_row(const PostgresConnection::Row& row) {
    Edge edge;
    edge.id = row[0];
    edge.tenant_id = row[1];
    edge.project_id = row[2];
    edge.edge_type = row[3];
    edge.source_entity_id = row[4];
    edge.target_entity_id = row[5];
    edge.metadata = parse_bag(row[6]);
    return edge;
}

std::string bag_text(const PropertyBag& bag) {
    return bag.is_object() ? bag.dump() : std::string("{}");
}

} // namespace

void PgGraphStore::ensure_schema() {
    db_.execute("CREATE SCHEMA IF NOT EXISTS cerebrum");
    db_.execute(R"(
        CREATE TABLE IF NOT EXISTS cerebrum.graph_node (
            id              TEXT NOT NULL,
            tenant_id       TEXT NOT NULL,
            project_id      TEXT,
            entity_type     TEXT NOT NULL,
            display_name    TEXT NOT NULL,
            canonical_path  TEXT,
            properties      JSONB NOT NULL DEFAULT '{}'::jsonb,
            created_at      TIMESTAMPTZ NOT NULL DEFAULT now(),
            updated_at      TIMESTAMPTZ NOT NULL DEFAULT now(),
            PRIMARY KEY (tenant_id, id)
        )
    )");
    db_.execute("CREATE INDEX IF NOT EXISTS graph_node_tenant_type_idx "
                "ON cerebrum.graph_node (tenant_id, entity_type, updated_at)");
    db_.execute(R"(
        CREATE TABLE IF NOT EXISTS cerebrum.graph_edge (
            seq             BIGSERIAL,
            id              TEXT NOT NULL,
            tenant_id       TEXT NOT NULL,
            project_id      TEXT,
            edge_type       TEXT NOT NULL,
            source_id       TEXT NOT NULL,
            target_id       TEXT NOT NULL,
            logical_key     TEXT NOT NULL,
            metadata        JSONB NOT NULL DEFAULT '{}'::jsonb,
            created_at      TIMESTAMPTZ NOT NULL DEFAULT now(),
            updated_at      TIMESTAMPTZ NOT NULL DEFAULT now(),
            PRIMARY KEY (tenant_id, logical_key)
        )
    )");
    db_.execute("CREATE INDEX IF NOT EXISTS graph_edge_source_idx ON cerebrum.graph_edge (tenant_id, source_id)");
    db_.execute("CREATE INDEX IF NOT EXISTS graph_edge_target_idx ON cerebrum.graph_edge (tenant_id, target_id)");
}

std::optional<Entity> PgGraphStore::get_entity(const std::string& id, const Scope& scope) {
    std::optional<Entity> entity;
    db_.query(
        "SELECT " + entity_columns() + " FROM cerebrum.graph_node WHERE id = $1 AND tenant_id = $2",
        {id, scope.tenant_id},
        [&](const PostgresConnection::Row& row) { entity = entity_from_row(row); }
    );
    return entity;
}

std::vector<Entity> PgGraphStore::list_entities(const EntityFilter& filter, const Scope& scope) {
    std::vector<Entity> out;
    PostgresConnection::Params params{scope.tenant_id};
    std::string sql = "SELECT " + entity_columns() + " FROM cerebrum.graph_node WHERE tenant_id = $1";
    if (!filter.entity_types.empty()) {
        params.push_back(pg::text_array(filter.entity_types));
        sql += " AND entity_type = ANY($2::text[])";
    }
    sql += " ORDER BY id";

    db_.query(sql, params, [&](const PostgresConnection::Row& row) { out.push_back(entity_from_row(row)); });
    return out;
}

std::vector<Edge> PgGraphStore::list_edges(const EdgeFilter& filter, const Scope& scope) {
    PostgresConnection::Params params{scope.tenant_id};
    std::string sql = std::string("SELECT ") + kEdgeColumns + " FROM cerebrum.graph_edge WHERE tenant_id = $1";

    auto bind = [&](const std::string& clause, const std::string& value) {
        params.push_back(value);
        sql += " AND " + clause + "$" + std::to_string(params.size());
    };

    if (!filter.edge_types.empty()) {
        params.push_back(pg::text_array(filter.edge_types));
        sql += " AND edge_type = ANY($" + std::to_string(params.size()) + "::text[])";
    }
    if (filter.source_entity_id) bind("source_id = ", *filter.source_entity_id);
    if (filter.target_entity_id) bind("target_id = ", *filter.target_entity_id);

    sql += " ORDER BY seq";
    if (filter.limit) sql += " LIMIT " + std::to_string(*filter.limit);

    std::vector<Edge> out;
    db_.query(sql, params, [&](const PostgresConnection::Row& row) { out.push_back(edge_from_row(row)); });
    return out;
}

Entity PgGraphStore::upsert_entity(const EntityInput& input, const Scope& scope) {
    std::optional<Entity> entity;
    db_.query(
        R"(
        INSERT INTO cerebrum.graph_node
            (id, tenant_id, project_id, entity_type, display_name, canonical_path, properties)
        VALUES ($1, $2, $3, $4, $5, $6, $7::jsonb)
        ON CONFLICT (tenant_id, id) DO UPDATE SET
            project_id = EXCLUDED.project_id,
            entity_type = EXCLUDED.entity_type,
            display_name = EXCLUDED.display_name,
            canonical_path = EXCLUDED.canonical_path,
            properties = EXCLUDED.properties,
            updated_at = now()
        RETURNING )" + entity_columns(),
        {input.id, scope.tenant_id, pg::nullable(scope.project_id), input.entity_type,
         input.display_name.empty() ? input.id : input.display_name, input.canonical_path,
         bag_text(input.properties)},
        [&](const PostgresConnection::Row& row) { entity = entity_from_row(row); }
    );
    if (!entity) {
        throw std::runtime_error("Upsert returned no row for entity " + input.id);
    }
    return *entity;
}

Edge PgGraphStore::upsert_edge(const EdgeInput& input, const Scope& scope) {
    std::optional<Edge> edge;
    db_.query(
        std::string(R"(
        INSERT INTO cerebrum.graph_edge
            (id, tenant_id, project_id, edge_type, source_id, target_id, logical_key, metadata)
        VALUES ($1, $2, $3, $4, $5, $6, $7, $8::jsonb)
        ON CONFLICT (tenant_id, logical_key) DO UPDATE SET
            project_id = EXCLUDED.project_id,
            metadata = EXCLUDED.metadata,
            updated_at = now()
        RETURNING )") + kEdgeColumns,
        {edge_id_for(input.edge_type, input.source_entity_id, input.target_entity_id), scope.tenant_id,
         pg::nullable(scope.project_id), input.edge_type, input.source_entity_id, input.target_entity_id,
         edge_logical_key(input.edge_type, input.source_entity_id, input.target_entity_id),
         bag_text(input.metadata)},
        [&](const PostgresConnection::Row& row) { edge = edge_from_row(row); }
    );
    if (!edge) {
        throw std::runtime_error("Upsert returned no row for edge " + input.edge_type + " " +
                                 input.source_entity_id + " -> " + input.target_entity_id);
    }
    return *edge;
}

} // namespace Cerebrum
