/**
 * @file postgres_connection.hpp
 * @brief PostgreSQL connection and query interface
 */

#pragma once

#include <export.hpp>
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <libpq-fe.h>

namespace Cerebrum {

/**
 * @brief PostgreSQL connection wrapper
 *
 * One connection serves one request at a time. Values travel in text format;
 * SQL NULL reads back as an empty string unless the caller asks for nullability.
 */
class CEREBRUM_API PostgresConnection {
public:
    /// Positional parameters; nullopt binds SQL NULL.
    using Params = std::vector<std::optional<std::string>>;
    using Row = std::vector<std::string>;
    using RowCallback = std::function<void(const Row&)>;

    /**
     * @brief Connect using environment variables
     *
     * Uses: PGHOST, PGPORT, PGDATABASE, PGUSER, PGPASSWORD
     * Defaults: localhost, 5432, cerebrum, postgres, (no password)
     */
    PostgresConnection();

    /**
     * @brief Connect with explicit connection string
     */
    explicit PostgresConnection(const std::string& conninfo);

    ~PostgresConnection();

    // No copy
    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    // Move OK
    PostgresConnection(PostgresConnection&& other) noexcept;
    PostgresConnection& operator=(PostgresConnection&& other) noexcept;

    /**
     * @brief Connection string from the PG* environment variables
     */
    static std::string conninfo_from_env();

    bool is_connected() const;

    void execute(const std::string& sql);
    void execute(const std::string& sql, const Params& params);

    /**
     * @brief First column of the first row, if any (NULL reads as nullopt)
     */
    std::optional<std::string> query_single(const std::string& sql, const Params& params = {});

    /**
     * @brief Execute query with params and iterate rows
     * @param callback Called for each row: callback(row_data)
     */
    void query(const std::string& sql, const Params& params, const RowCallback& callback);
    void query(const std::string& sql, const RowCallback& callback) { query(sql, {}, callback); }

    void begin();
    void commit();
    void rollback();

    /**
     * @brief RAII transaction guard; rolls back unless committed
     */
    class Transaction {
    public:
        explicit Transaction(PostgresConnection& conn);
        ~Transaction();

        void commit();
        void rollback();

    private:
        PostgresConnection& conn_;
        bool committed_ = false;
        bool rolled_back_ = false;
    };

    std::string last_error() const;

private:
    void connect(const std::string& conninfo);
    void disconnect();
    void ensure_connected() const;
    PGresult* exec(const std::string& sql, const Params& params);
    void check_result(PGresult* result);

    PGconn* conn_ = nullptr;
    std::string last_error_;
};

} // namespace Cerebrum
