#include <config/brain_config.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace Cerebrum {

namespace {

double parse_double(const std::string& name, const char* text) {
    char* end = nullptr;
    double value = std::strtod(text, &end);
    if (end == text || *end != '\0' || !std::isfinite(value)) {
        throw ConfigError(name + " must be a number, got '" + text + "'");
    }
    return value;
}

long long parse_integer(const std::string& name, const char* text) {
    char* end = nullptr;
    long long value = std::strtoll(text, &end, 10);
    if (end == text || *end != '\0') {
        throw ConfigError(name + " must be an integer, got '" + text + "'");
    }
    return value;
}

size_t parse_size(const std::string& name, const char* text) {
    long long value = parse_integer(name, text);
    if (value < 0) {
        throw ConfigError(name + " must not be negative");
    }
    return static_cast<size_t>(value);
}

template <typename T>
void read_key(const nlohmann::json& section, const char* key, T& out) {
    auto it = section.find(key);
    if (it != section.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

} // namespace

std::string DbSettings::conninfo() const {
    std::ostringstream conninfo;
    conninfo << "host=" << host << " port=" << port << " dbname=" << dbname << " user=" << user;
    if (!password.empty()) {
        conninfo << " password=" << password;
    }
    return conninfo.str();
}

BrainConfig::EnvLookup BrainConfig::default_env() {
    return [](const char* name) -> const char* { return std::getenv(name); };
}

BrainConfig BrainConfig::load(const EnvLookup& env) {
    BrainConfig config;
    if (const char* path = env("CEREBRUM_CONFIG")) {
        if (*path) config.apply_file(path);
    }
    config.apply_env(env);
    config.validate();
    return config;
}

void BrainConfig::apply_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open config file: " + path);
    }

    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Malformed config file " + path + ": " + e.what());
    }
    apply_json(doc);
    Logger::debug("Loaded configuration from " + path);
}

void BrainConfig::apply_json(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }

    try {
        if (auto it = doc.find("database"); it != doc.end()) {
            read_key(*it, "host", db.host);
            read_key(*it, "port", db.port);
            read_key(*it, "dbname", db.dbname);
            read_key(*it, "user", db.user);
            read_key(*it, "password", db.password);
        }
        if (auto it = doc.find("clustering"); it != doc.end()) {
            read_key(*it, "scoreThreshold", score_threshold);
            read_key(*it, "maxNeighbors", max_neighbors);
            read_key(*it, "clusterKind", cluster_kind);
            read_key(*it, "algo", algo_label);
        }
        if (auto it = doc.find("search"); it != doc.end()) {
            read_key(*it, "maxPassageChars", max_passage_chars);
            read_key(*it, "maxPassagePerNode", max_passage_per_node);
        }
        if (auto it = doc.find("embedding"); it != doc.end()) {
            read_key(*it, "model", embedding_model);
            read_key(*it, "dimension", embedding_dimension);
        }
        read_key(doc, "logLevel", log_level);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid configuration value: ") + e.what());
    }
}

void BrainConfig::apply_env(const EnvLookup& env) {
    auto str = [&](const char* name, std::string& out) {
        if (const char* value = env(name)) out = value;
    };

    str("PGHOST", db.host);
    str("PGPORT", db.port);
    str("PGDATABASE", db.dbname);
    str("PGUSER", db.user);
    str("PGPASSWORD", db.password);

    if (const char* v = env("CEREBRUM_SCORE_THRESHOLD")) score_threshold = parse_double("CEREBRUM_SCORE_THRESHOLD", v);
    if (const char* v = env("CEREBRUM_MAX_NEIGHBORS")) max_neighbors = static_cast<int>(parse_integer("CEREBRUM_MAX_NEIGHBORS", v));
    str("CEREBRUM_CLUSTER_KIND", cluster_kind);
    str("CEREBRUM_ALGO", algo_label);
    if (const char* v = env("CEREBRUM_MAX_PASSAGE_CHARS")) max_passage_chars = parse_size("CEREBRUM_MAX_PASSAGE_CHARS", v);
    if (const char* v = env("CEREBRUM_MAX_PASSAGE_PER_NODE")) max_passage_per_node = parse_size("CEREBRUM_MAX_PASSAGE_PER_NODE", v);
    str("CEREBRUM_EMBEDDING_MODEL", embedding_model);
    if (const char* v = env("CEREBRUM_EMBEDDING_DIMENSION")) embedding_dimension = parse_size("CEREBRUM_EMBEDDING_DIMENSION", v);
    str("CEREBRUM_LOG_LEVEL", log_level);
}

void BrainConfig::validate() const {
    if (!std::isfinite(score_threshold)) {
        throw ConfigError("scoreThreshold must be finite");
    }
    if (max_neighbors < 1) {
        throw ConfigError("maxNeighbors must be at least 1");
    }
    if (embedding_dimension == 0) {
        throw ConfigError("embedding dimension must be positive");
    }
    if (cluster_kind.empty() || algo_label.empty()) {
        throw ConfigError("clusterKind and algo must not be empty");
    }
    static const char* levels[] = {"debug", "info", "warn", "warning", "error", "off", "none"};
    for (const char* level : levels) {
        if (log_level == level) return;
    }
    throw ConfigError("Unknown log level: " + log_level);
}

ClusterBuilderConfig BrainConfig::cluster_builder_config() const {
    ClusterBuilderConfig out;
    out.cluster_kind = cluster_kind;
    out.algo_label = algo_label;
    out.score_threshold = score_threshold;
    out.max_neighbors = max_neighbors;
    return out;
}

BrainSearchConfig BrainConfig::brain_search_config() const {
    BrainSearchConfig out;
    out.max_passage_chars = max_passage_chars;
    out.max_passage_per_node = max_passage_per_node;
    return out;
}

} // namespace Cerebrum
