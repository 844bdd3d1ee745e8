/**
 * @file pg_signal_store.hpp
 * @brief Signal definitions and instances in PostgreSQL
 */

#pragma once

#include <database/postgres_connection.hpp>
#include <storage/signal_store.hpp>
#include <export.hpp>

namespace Cerebrum {

/**
 * @brief SignalStore over cerebrum.signal_definition / cerebrum.signal_instance.
 *
 * get_instance joins the definition in the same round trip.
 */
class CEREBRUM_API PgSignalStore : public SignalStore {
public:
    explicit PgSignalStore(PostgresConnection& db) : db_(db) {}

    void ensure_schema();

    std::optional<SignalDefinition> get_definition(const std::string& id) override;
    std::optional<SignalInstance> get_instance(const std::string& id) override;

private:
    PostgresConnection& db_;
};

} // namespace Cerebrum
