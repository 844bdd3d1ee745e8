#include <storage/pg_vector_index_store.hpp>
#include <database/pg_format.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <algorithm>

namespace Cerebrum {

namespace {

std::optional<std::string> array_or_null(const std::vector<std::string>& values) {
    if (values.empty()) return std::nullopt;
    return pg::text_array(values);
}

PropertyBag nullable_json(const std::string& value) {
    return value.empty() ? PropertyBag(nullptr) : PropertyBag(value);
}

} // namespace

void PgVectorIndexStore::ensure_schema() {
    db_.execute("CREATE EXTENSION IF NOT EXISTS vector");
    db_.execute("CREATE SCHEMA IF NOT EXISTS cerebrum");
    db_.execute(R"(
        CREATE TABLE IF NOT EXISTS cerebrum.vector_index_entry (
            node_id         TEXT NOT NULL,
            profile_id      TEXT NOT NULL,
            chunk_id        TEXT NOT NULL DEFAULT 'chunk-0',
            tenant_id       TEXT NOT NULL,
            project_key     TEXT,
            profile_kind    TEXT NOT NULL,
            source_system   TEXT,
            embedding       vector()" + std::to_string(dimension_) + R"() NOT NULL,
            raw_metadata    JSONB NOT NULL DEFAULT '{}'::jsonb,
            updated_at      TIMESTAMPTZ NOT NULL DEFAULT now(),
            PRIMARY KEY (tenant_id, node_id, profile_id, chunk_id)
        )
    )");
    db_.execute("CREATE INDEX IF NOT EXISTS vector_index_entry_scope_idx "
                "ON cerebrum.vector_index_entry (profile_id, tenant_id, project_key)");
    db_.execute("CREATE INDEX IF NOT EXISTS vector_index_entry_hnsw_idx "
                "ON cerebrum.vector_index_entry USING hnsw (embedding vector_cosine_ops)");
}

void PgVectorIndexStore::check_dimension(const Embedding& embedding, const char* what) const {
    if (embedding.size() != dimension_) {
        throw ShapeError(std::string(what) + " dimension " + std::to_string(embedding.size()) +
                         " does not match index dimension " + std::to_string(dimension_));
    }
}

void PgVectorIndexStore::upsert_entries(const std::vector<VectorIndexEntry>& entries) {
    if (entries.empty()) return;
    for (const auto& entry : entries) {
        check_dimension(entry.embedding, "Entry embedding");
    }

    PostgresConnection::Transaction txn(db_);
    for (const auto& entry : entries) {
        db_.execute(R"(
            INSERT INTO cerebrum.vector_index_entry
                (node_id, profile_id, chunk_id, tenant_id, project_key, profile_kind,
                 source_system, embedding, raw_metadata)
            VALUES ($1, $2, $3, $4, $5, $6, $7, $8::vector, $9::jsonb)
            ON CONFLICT (tenant_id, node_id, profile_id, chunk_id) DO UPDATE SET
                project_key = EXCLUDED.project_key,
                profile_kind = EXCLUDED.profile_kind,
                source_system = EXCLUDED.source_system,
                embedding = EXCLUDED.embedding,
                raw_metadata = EXCLUDED.raw_metadata,
                updated_at = now()
        )",
            {entry.node_id, entry.profile_id, entry.chunk_id, entry.tenant_id, entry.project_key,
             entry.profile_kind, entry.source_system, pg::vector_literal(entry.embedding),
             entry.raw_metadata.is_object() ? entry.raw_metadata.dump() : std::string("{}")});
    }
    txn.commit();
    Logger::debug("Upserted " + std::to_string(entries.size()) + " vector index entries");
}

std::vector<VectorMatch> PgVectorIndexStore::query(const std::string& profile_id, const Embedding& embedding,
                                                   size_t top_k, const VectorQueryFilter& filter) {
    check_dimension(embedding, "Query embedding");

    std::vector<VectorMatch> out;
    db_.query(R"(
        SELECT node_id,
               1 - (embedding <=> $1::vector) AS score,
               profile_kind,
               COALESCE(project_key, ''),
               COALESCE(source_system, ''),
               tenant_id,
               raw_metadata::text
        FROM cerebrum.vector_index_entry
        WHERE profile_id = $2
          AND ($3::text IS NULL OR tenant_id = $3)
          AND ($4::text[] IS NULL OR project_key = ANY($4::text[]))
          AND ($5::text[] IS NULL OR profile_kind = ANY($5::text[]))
        ORDER BY embedding <=> $1::vector, node_id
        LIMIT $6
    )",
        {pg::vector_literal(embedding), profile_id, pg::nullable(filter.tenant_id),
         array_or_null(filter.project_key_in), array_or_null(filter.profile_kind_in),
         std::to_string(std::max<size_t>(1, top_k))},
        [&](const PostgresConnection::Row& row) {
            VectorMatch match;
            match.node_id = row[0];
            match.score = std::stod(row[1]);
            auto raw = PropertyBag::parse(row[6], nullptr, false);
            match.metadata = {
                {"profileId", profile_id},
                {"profileKind", row[2]},
                {"projectKey", nullable_json(row[3])},
                {"sourceSystem", nullable_json(row[4])},
                {"tenantId", row[5]},
                {"raw", raw.is_object() ? raw : PropertyBag::object()},
            };
            out.push_back(std::move(match));
        });
    return out;
}

} // namespace Cerebrum
