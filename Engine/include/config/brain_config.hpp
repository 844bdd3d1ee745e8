/**
 * @file brain_config.hpp
 * @brief Runtime configuration: defaults, then JSON file, then environment
 */

#pragma once

#include <clustering/cluster_builder.hpp>
#include <query/brain_search.hpp>
#include <export.hpp>
#include <nlohmann/json.hpp>
#include <functional>
#include <string>

namespace Cerebrum {

/**
 * @brief PostgreSQL connection settings (standard PG* variables)
 */
struct DbSettings {
    std::string host = "localhost";
    std::string port = "5432";
    std::string dbname = "cerebrum";
    std::string user = "postgres";
    std::string password;

    /// libpq keyword/value connection string
    std::string conninfo() const;
};

struct CEREBRUM_API BrainConfig {
    using EnvLookup = std::function<const char*(const char*)>;

    DbSettings db;

    double score_threshold = 0.35;
    int max_neighbors = 5;
    std::string cluster_kind = "work-doc-episode";
    std::string algo_label = "vector-neighbors-v1";

    size_t max_passage_chars = 30000;
    size_t max_passage_per_node = 2000;

    std::string embedding_model = "text-embedding-3-small";
    size_t embedding_dimension = 1536;

    std::string log_level = "info";

    /**
     * @brief Defaults, then the JSON file named by CEREBRUM_CONFIG (if set), then env overrides
     * @throws ConfigError on unreadable files or malformed values
     */
    static BrainConfig load(const EnvLookup& env = default_env());

    /**
     * @brief Overlay keys present in a JSON document:
     * { "database": {...}, "clustering": {...}, "search": {...}, "embedding": {...}, "logLevel": "..." }
     */
    void apply_json(const nlohmann::json& doc);
    void apply_file(const std::string& path);

    /**
     * @brief Overlay PGHOST/PGPORT/PGDATABASE/PGUSER/PGPASSWORD and CEREBRUM_* variables
     */
    void apply_env(const EnvLookup& env);

    /// @throws ConfigError when a value is out of range
    void validate() const;

    ClusterBuilderConfig cluster_builder_config() const;
    BrainSearchConfig brain_search_config() const;

    static EnvLookup default_env();
};

} // namespace Cerebrum
