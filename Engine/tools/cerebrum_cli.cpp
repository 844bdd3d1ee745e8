/**
 * @file cerebrum_cli.cpp
 * @brief Command-line front end for the brain core
 *
 * Usage: cerebrum <command> --tenant <id> [--project <key>] [options]
 *
 * Results are printed to stdout as JSON; progress goes to the log on stderr.
 */

#include <api/serialization.hpp>
#include <clustering/cluster_builder.hpp>
#include <clustering/cluster_read.hpp>
#include <config/brain_config.hpp>
#include <core/errors.hpp>
#include <core/profile_registry.hpp>
#include <database/postgres_connection.hpp>
#include <episodes/episode_read.hpp>
#include <ingestion/node_indexer.hpp>
#include <ml/hashing_embedding_provider.hpp>
#include <query/brain_search.hpp>
#include <query/vector_search.hpp>
#include <storage/pg_graph_store.hpp>
#include <storage/pg_profile_store.hpp>
#include <storage/pg_signal_store.hpp>
#include <storage/pg_vector_index_store.hpp>
#include <storage/run_lock.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace Cerebrum;

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <command> --tenant <id> [--project <key>] [options]\n"
              << "\nCommands:\n"
              << "  init-schema                      Create tables and seed default index profiles\n"
              << "  index --profile <id> [--nodes a,b] [--batch N]\n"
              << "  build-clusters [--window-start ISO] [--window-end ISO] [--max-seeds N] [--max-cluster-size N]\n"
              << "  clusters [--window-start ISO] [--window-end ISO]\n"
              << "  episodes [--window-start ISO] [--window-end ISO] [--offset N] [--limit N]\n"
              << "  episode --id <cluster id>\n"
              << "  search --query <text> [--top-k N] [--max-episodes N] [--depth N] [--max-nodes N]\n"
              << "         [--kind work|doc ...] [--include-secured] [--no-episodes] [--no-signals] [--no-clusters]\n"
              << "\nConnection and tuning come from PG* / CEREBRUM_* variables and CEREBRUM_CONFIG.\n";
}

/**
 * @brief --name value pairs plus bare --flags. Repeated options accumulate.
 */
class Args {
public:
    Args(int argc, char** argv, int first) {
        for (int i = first; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg.rfind("--", 0) != 0) {
                throw ValidationError("Unexpected argument: " + arg);
            }
            std::string name = arg.substr(2);
            if (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
                values_[name].push_back(argv[++i]);
            } else {
                values_[name];
            }
        }
    }

    bool has(const std::string& name) const { return values_.count(name) > 0; }

    std::optional<std::string> get(const std::string& name) const {
        auto it = values_.find(name);
        if (it == values_.end() || it->second.empty()) return std::nullopt;
        return it->second.back();
    }

    std::string require(const std::string& name) const {
        auto value = get(name);
        if (!value || value->empty()) {
            throw ValidationError("--" + name + " is required");
        }
        return *value;
    }

    std::vector<std::string> all(const std::string& name) const {
        auto it = values_.find(name);
        return it == values_.end() ? std::vector<std::string>{} : it->second;
    }

    std::optional<int> integer(const std::string& name) const {
        auto value = get(name);
        if (!value) return std::nullopt;
        try {
            size_t used = 0;
            int parsed = std::stoi(*value, &used);
            if (used != value->size()) throw std::invalid_argument(*value);
            return parsed;
        } catch (const std::logic_error&) {
            throw ValidationError("--" + name + " must be an integer, got '" + *value + "'");
        }
    }

    TimeWindow window() const {
        TimeWindow window;
        window.start = time("window-start");
        window.end = time("window-end");
        return window;
    }

private:
    std::optional<TimePoint> time(const std::string& name) const {
        auto value = get(name);
        if (!value) return std::nullopt;
        auto parsed = parse_iso_time(*value);
        if (!parsed) {
            throw ValidationError("--" + name + " is not an ISO-8601 timestamp: " + *value);
        }
        return parsed;
    }

    std::map<std::string, std::vector<std::string>> values_;
};

std::vector<std::string> split_csv(const std::string& text) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        if (comma == std::string::npos) comma = text.size();
        if (comma > start) out.push_back(text.substr(start, comma - start));
        start = comma + 1;
    }
    return out;
}

/**
 * @brief Stores and services wired over one connection.
 */
struct Brain {
    explicit Brain(const BrainConfig& config)
        : db(config.db.conninfo()),
          graph(db),
          profiles(db),
          signals(db),
          index(db, config.embedding_dimension),
          embedder(config.embedding_dimension),
          gateway(profiles, index, embedder),
          run_lock(db) {}

    ProfileRegistry registry(const BrainConfig& config) {
        ProfileRegistry loaded = ProfileRegistry::load(profiles);
        if (loaded.profiles().empty()) {
            Logger::warn("No enabled index profiles stored; using built-in defaults");
            return ProfileRegistry::defaults(config.embedding_model);
        }
        return loaded;
    }

    PostgresConnection db;
    PgGraphStore graph;
    PgProfileStore profiles;
    PgSignalStore signals;
    PgVectorIndexStore index;
    HashingEmbeddingProvider embedder;
    VectorSearchGateway gateway;
    PgAdvisoryRunLock run_lock;
};

nlohmann::json run_command(const std::string& command, const Args& args, const BrainConfig& config) {
    Brain brain(config);
    if (!brain.db.is_connected()) {
        throw std::runtime_error("Failed to connect to database. Check PG environment variables.");
    }

    if (command == "init-schema") {
        brain.graph.ensure_schema();
        brain.profiles.ensure_schema();
        brain.signals.ensure_schema();
        brain.index.ensure_schema();
        size_t seeded = brain.profiles.seed_defaults(ProfileRegistry::defaults(config.embedding_model).profiles());
        return {{"profilesSeeded", seeded}};
    }

    const std::string tenant = args.require("tenant");

    if (command == "index") {
        IndexRequest request;
        request.profile_id = args.require("profile");
        request.scope.tenant_id = tenant;
        request.scope.project_id = args.get("project").value_or("");
        if (auto nodes = args.get("nodes")) request.node_ids = split_csv(*nodes);
        if (auto batch = args.integer("batch")) request.batch_size = static_cast<size_t>(std::max(1, *batch));

        NodeIndexer indexer(brain.graph, brain.profiles, brain.index, brain.embedder, config.embedding_dimension);
        return indexer.index_nodes_for_profile(request);
    }

    if (command == "build-clusters") {
        ProfileRegistry registry = brain.registry(config);
        ClusterBuilderConfig builder_config = config.cluster_builder_config();
        builder_config.run_lock = &brain.run_lock;

        ClusterBuildRequest request;
        request.tenant_id = tenant;
        request.project_key = args.require("project");
        request.window = args.window();
        request.max_seeds = args.integer("max-seeds");
        request.max_cluster_size = args.integer("max-cluster-size");

        ClusterBuilder builder(brain.graph, brain.gateway, registry, builder_config);
        return builder.build_clusters_for_project(request);
    }

    if (command == "clusters") {
        ClusterRead reader(brain.graph);
        return reader.list_clusters_for_project(tenant, args.require("project"), args.window());
    }

    if (command == "episodes" || command == "episode") {
        ClusterRead reader(brain.graph);
        EpisodeRead episodes(brain.graph, reader, brain.signals);

        if (command == "episode") {
            EpisodeGetRequest request{tenant, args.require("project"), args.require("id"), args.get("actor")};
            auto episode = episodes.get_episode(request);
            return episode ? nlohmann::json(*episode) : nlohmann::json(nullptr);
        }

        EpisodeListRequest request;
        request.tenant_id = tenant;
        request.project_key = args.require("project");
        request.window = args.window();
        request.offset = static_cast<size_t>(std::max(0, args.integer("offset").value_or(0)));
        if (auto limit = args.integer("limit")) request.limit = static_cast<size_t>(std::max(0, *limit));
        request.actor_id = args.get("actor");
        return episodes.list_episodes(request);
    }

    if (command == "search") {
        ProfileRegistry registry = brain.registry(config);
        BrainSearch search(brain.graph, brain.gateway, registry, config.brain_search_config());

        BrainSearchRequest request;
        request.query_text = args.require("query");
        request.filter.tenant_id = tenant;
        request.filter.project_key = args.get("project");
        request.filter.profile_kind_in = args.all("kind");
        if (args.has("include-secured")) request.filter.secured = false;
        request.options.top_k = args.integer("top-k");
        request.options.max_episodes = args.integer("max-episodes");
        request.options.expand_depth = args.integer("depth");
        request.options.max_nodes = args.integer("max-nodes");
        if (args.has("no-episodes")) request.options.include_episodes = false;
        if (args.has("no-signals")) request.options.include_signals = false;
        if (args.has("no-clusters")) request.options.include_clusters = false;
        request.actor_id = args.get("actor");
        return search.search(request);
    }

    throw ValidationError("Unknown command: " + command);
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2 || std::string(argv[1]) == "--help") {
        print_usage(argv[0]);
        return argc < 2 ? 1 : 0;
    }

    try {
        BrainConfig config = BrainConfig::load();
        Logger::set_level(Logger::parse_level(config.log_level));

        Args args(argc, argv, 2);
        Timer timer;
        nlohmann::json out = run_command(argv[1], args, config);
        std::cout << out.dump(2) << "\n";
        Logger::debug(std::string(argv[1]) + " finished in " + std::to_string(timer.elapsed_ms()) + " ms");
        return 0;
    } catch (const ValidationError& e) {
        Logger::error(e.what());
        print_usage(argv[0]);
        return 2;
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }
}
