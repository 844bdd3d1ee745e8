#include <storage/pg_signal_store.hpp>

namespace Cerebrum {

void PgSignalStore::ensure_schema() {
    db_.execute("CREATE SCHEMA IF NOT EXISTS cerebrum");
    db_.execute(R"(
        CREATE TABLE IF NOT EXISTS cerebrum.signal_definition (
            id          TEXT PRIMARY KEY,
            slug        TEXT NOT NULL UNIQUE,
            title       TEXT NOT NULL DEFAULT '',
            severity    TEXT NOT NULL DEFAULT 'INFO',
            created_at  TIMESTAMPTZ NOT NULL DEFAULT now()
        )
    )");
    db_.execute(R"(
        CREATE TABLE IF NOT EXISTS cerebrum.signal_instance (
            id              TEXT PRIMARY KEY,
            definition_id   TEXT NOT NULL REFERENCES cerebrum.signal_definition(id),
            entity_ref      TEXT NOT NULL,
            severity        TEXT NOT NULL DEFAULT 'INFO',
            status          TEXT NOT NULL DEFAULT 'OPEN',
            summary         TEXT NOT NULL DEFAULT '',
            created_at      TIMESTAMPTZ NOT NULL DEFAULT now()
        )
    )");
    db_.execute("CREATE INDEX IF NOT EXISTS signal_instance_entity_idx ON cerebrum.signal_instance (entity_ref)");
}

std::optional<SignalDefinition> PgSignalStore::get_definition(const std::string& id) {
    std::optional<SignalDefinition> out;
    db_.query("SELECT id, slug, title, severity FROM cerebrum.signal_definition WHERE id = $1", {id},
              [&](const PostgresConnection::Row& row) {
                  out = SignalDefinition{row[0], row[1], row[2], row[3]};
              });
    return out;
}

std::optional<SignalInstance> PgSignalStore::get_instance(const std::string& id) {
    std::optional<SignalInstance> out;
    db_.query(R"(
        SELECT i.id, i.definition_id, i.entity_ref, i.severity, i.status, i.summary,
               COALESCE(d.id, ''), COALESCE(d.slug, ''), COALESCE(d.title, ''), COALESCE(d.severity, '')
        FROM cerebrum.signal_instance i
        LEFT JOIN cerebrum.signal_definition d ON d.id = i.definition_id
        WHERE i.id = $1
    )", {id}, [&](const PostgresConnection::Row& row) {
        SignalInstance instance;
        instance.id = row[0];
        instance.definition_id = row[1];
        instance.entity_ref = row[2];
        instance.severity = row[3];
        instance.status = row[4];
        instance.summary = row[5];
        if (!row[6].empty()) {
            instance.definition = SignalDefinition{row[6], row[7], row[8], row[9]};
        }
        out = std::move(instance);
    });
    return out;
}

} // namespace Cerebrum
