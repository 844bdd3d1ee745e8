#include <storage/pg_profile_store.hpp>
#include <database/pg_format.hpp>
#include <core/types.hpp>
#include <utils/logger.hpp>

namespace Cerebrum {

namespace {

const char* kProfileColumns =
    "id, family, node_type, embedding_model, profile_kind, text_source::text, query_fields::text, enabled";

TextSource parse_text_source(const std::string& text) {
    TextSource source;
    auto doc = nlohmann::json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) return source;

    if (auto it = doc.find("from"); it != doc.end() && it->is_string()) source.from = it->get<std::string>();
    if (auto it = doc.find("field"); it != doc.end() && it->is_string()) source.field = it->get<std::string>();
    if (auto it = doc.find("path"); it != doc.end() && it->is_array()) {
        for (const auto& part : *it) {
            if (part.is_string()) source.path.push_back(part.get<std::string>());
        }
    }
    return source;
}

std::string text_source_json(const TextSource& source) {
    nlohmann::json doc = nlohmann::json::object();
    if (source.from) doc["from"] = *source.from;
    if (source.field) doc["field"] = *source.field;
    if (!source.path.empty()) doc["path"] = source.path;
    return doc.dump();
}

std::vector<std::string> parse_string_list(const std::string& text) {
    std::vector<std::string> out;
    auto doc = nlohmann::json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_array()) return out;
    for (const auto& item : doc) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

IndexProfile profile_from_row(const PostgresConnection::Row& row) {
    IndexProfile profile;
    profile.id = row[0];
    profile.family = row[1];
    profile.node_type = row[2];
    profile.embedding_model = row[3];
    profile.profile_kind = row[4];
    profile.text_source = parse_text_source(row[5]);
    profile.query_fields = parse_string_list(row[6]);
    profile.enabled = pg::as_bool(row[7]);
    return profile;
}

PostgresConnection::Params profile_params(const IndexProfile& profile) {
    return {profile.id, profile.family, profile.node_type, profile.embedding_model, profile.profile_kind,
            text_source_json(profile.text_source), nlohmann::json(profile.query_fields).dump(),
            profile.enabled ? "true" : "false"};
}

} // namespace

void PgProfileStore::ensure_schema() {
    db_.execute("CREATE SCHEMA IF NOT EXISTS cerebrum");
    db_.execute(R"(
        CREATE TABLE IF NOT EXISTS cerebrum.vector_index_profile (
            id              TEXT PRIMARY KEY,
            family          TEXT NOT NULL,
            node_type       TEXT NOT NULL,
            embedding_model TEXT NOT NULL,
            profile_kind    TEXT NOT NULL,
            text_source     JSONB NOT NULL DEFAULT '{}'::jsonb,
            query_fields    JSONB NOT NULL DEFAULT '[]'::jsonb,
            enabled         BOOLEAN NOT NULL DEFAULT true,
            updated_at      TIMESTAMPTZ NOT NULL DEFAULT now()
        )
    )");
}

void PgProfileStore::upsert_profile(const IndexProfile& profile) {
    db_.execute(R"(
        INSERT INTO cerebrum.vector_index_profile
            (id, family, node_type, embedding_model, profile_kind, text_source, query_fields, enabled)
        VALUES ($1, $2, $3, $4, $5, $6::jsonb, $7::jsonb, $8::boolean)
        ON CONFLICT (id) DO UPDATE SET
            family = EXCLUDED.family,
            node_type = EXCLUDED.node_type,
            embedding_model = EXCLUDED.embedding_model,
            profile_kind = EXCLUDED.profile_kind,
            text_source = EXCLUDED.text_source,
            query_fields = EXCLUDED.query_fields,
            enabled = EXCLUDED.enabled,
            updated_at = now()
    )", profile_params(profile));
}

size_t PgProfileStore::seed_defaults(const std::vector<IndexProfile>& profiles) {
    size_t inserted = 0;
    for (const auto& profile : profiles) {
        auto id = db_.query_single(R"(
            INSERT INTO cerebrum.vector_index_profile
                (id, family, node_type, embedding_model, profile_kind, text_source, query_fields, enabled)
            VALUES ($1, $2, $3, $4, $5, $6::jsonb, $7::jsonb, $8::boolean)
            ON CONFLICT (id) DO NOTHING
            RETURNING id
        )", profile_params(profile));
        if (id) ++inserted;
    }
    if (inserted > 0) {
        Logger::info("Seeded " + std::to_string(inserted) + " index profiles");
    }
    return inserted;
}

std::vector<IndexProfile> PgProfileStore::list_profiles() {
    std::vector<IndexProfile> out;
    db_.query(std::string("SELECT ") + kProfileColumns + " FROM cerebrum.vector_index_profile ORDER BY id",
              [&](const PostgresConnection::Row& row) { out.push_back(profile_from_row(row)); });
    return out;
}

std::optional<IndexProfile> PgProfileStore::get_profile(const std::string& id) {
    std::optional<IndexProfile> out;
    db_.query(std::string("SELECT ") + kProfileColumns + " FROM cerebrum.vector_index_profile WHERE id = $1",
              {id}, [&](const PostgresConnection::Row& row) { out = profile_from_row(row); });
    return out;
}

} // namespace Cerebrum
