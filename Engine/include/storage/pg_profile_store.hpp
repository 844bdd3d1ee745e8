/**
 * @file pg_profile_store.hpp
 * @brief Index profiles in cerebrum.vector_index_profile
 */

#pragma once

#include <database/postgres_connection.hpp>
#include <storage/index_profile_store.hpp>
#include <export.hpp>

namespace Cerebrum {

class CEREBRUM_API PgProfileStore : public IndexProfileStore {
public:
    explicit PgProfileStore(PostgresConnection& db) : db_(db) {}

    void ensure_schema();

    /// Insert or replace a profile by id.
    void upsert_profile(const IndexProfile& profile);

    /// Insert the given profiles only where no row with the same id exists.
    size_t seed_defaults(const std::vector<IndexProfile>& profiles);

    std::vector<IndexProfile> list_profiles() override;
    std::optional<IndexProfile> get_profile(const std::string& id) override;

private:
    PostgresConnection& db_;
};

} // namespace Cerebrum
