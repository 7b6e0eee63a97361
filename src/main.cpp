#include "config/config_loader.hpp"
#include "core/database_type.hpp"
#include "core/guarded_sql_tool.hpp"
#include "core/query_input.hpp"
#include "core/query_rewriter.hpp"
#include "core/utils.hpp"
#include "db/backend_registry.hpp"
#include "db/generic_query_executor.hpp"
#include "db/idb_backend.hpp"
#include "db/iconnection_pool.hpp"
#include "schema/schema_describer.hpp"
#include "security/admission_filter.hpp"

#ifdef ENABLE_POSTGRESQL
#include "db/postgresql/pg_backend.hpp"
#endif
#ifdef ENABLE_MYSQL
#include "db/mysql/mysql_backend.hpp"
#endif
#ifdef ENABLE_SQLITE
#include "db/sqlite/sqlite_backend.hpp"
#endif

#include <atomic>
#include <chrono>
#include <signal.h>
#include <cstring>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

using namespace sqlguard;

namespace {

std::atomic<bool> g_stop{false};

constexpr std::string_view kDefaultConfigPath = "config/sqlguard.toml";
constexpr std::string_view kDescribeSchemaFlag = "--describe-schema";

// =========================================================================
// Explicit Backend Registration
// =========================================================================

void register_backends() {
    #ifdef ENABLE_POSTGRESQL
    BackendRegistry::instance().register_backend(
        DatabaseType::POSTGRESQL,
        [] { return std::make_unique<PgBackend>(); });
    #endif

    #ifdef ENABLE_MYSQL
    BackendRegistry::instance().register_backend(
        DatabaseType::MYSQL,
        [] { return std::make_unique<MysqlBackend>(); });
    #endif

    #ifdef ENABLE_SQLITE
    BackendRegistry::instance().register_backend(
        DatabaseType::SQLITE,
        [] { return std::make_unique<SqliteBackend>(); });
    #endif
}

void signal_handler(int) {
    g_stop.store(true);
}

// No SA_RESTART: a blocked read on stdin returns so the loop can exit
void install_signal_handlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

// Multi-line driver diagnostics must not break the one-line-per-call framing
std::string single_line(std::string text) {
    for (char& c : text) {
        if (c == '\n' || c == '\r') c = ' ';
    }
    return text;
}

void print_usage(const char* argv0) {
    std::cerr << std::format("Usage: {} [config.toml] [{}]\n", argv0, kDescribeSchemaFlag);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string config_file(kDefaultConfigPath);
    bool describe_schema = false;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        if (arg == kDescribeSchemaFlag) {
            describe_schema = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg.starts_with("-")) {
            print_usage(argv[0]);
            return 1;
        } else {
            config_file = arg;
        }
    }

    register_backends();

    // [1/4] Configuration: any error is fatal before the first tool call
    auto config_result = ConfigLoader::load_from_file(config_file);
    if (!config_result.success) {
        utils::log::error(config_result.error_message);
        return 1;
    }
    const GuardConfig& cfg = config_result.config;

    if (const auto level = utils::log::parse_level(cfg.logging.level)) {
        utils::log::set_level(*level);
    }
    utils::log::info(std::format("[1/4] Loaded configuration from {}", config_file));

    std::shared_ptr<IConnectionPool> pool;
    std::unique_ptr<IDbBackend> backend;
    DatabaseType db_type = DatabaseType::POSTGRESQL;

    try {
        // [2/4] Backend and pool
        db_type = parse_database_type(cfg.database.type_str);
        backend = BackendRegistry::instance().create(db_type);
        pool = backend->create_pool("primary", ConfigLoader::to_pool_config(cfg.database));
    } catch (const std::exception& e) {
        utils::log::error(std::format("Failed to initialize database backend: {}", e.what()));
        return 1;
    }

    // Fail fast when the database is unreachable (min_connections may be 0)
    if (!pool->acquire(std::chrono::milliseconds(cfg.database.pool_acquire_timeout_ms))) {
        utils::log::error("No database connection could be established");
        pool->drain();
        return 1;
    }
    utils::log::info(std::format("[2/4] Connection pool ready ({})", database_type_to_string(db_type)));

    auto executor = std::make_shared<GenericQueryExecutor>(
        pool, ConfigLoader::to_executor_config(cfg.database));

    // [3/4] Optional schema description
    if (describe_schema) {
        SchemaDescriber describer(pool, backend->create_schema_loader(), executor, db_type, {
            .sample_rows = cfg.schema.sample_rows,
            .acquire_timeout = std::chrono::milliseconds(cfg.database.pool_acquire_timeout_ms),
        });

        const auto description = describer.describe(cfg.schema.include_tables);
        pool->drain();
        if (!description) {
            utils::log::error("Failed to describe schema");
            return 1;
        }
        std::cout << *description << std::endl;
        return 0;
    }

    // [4/4] Serve one tool call per stdin line
    GuardedSqlTool tool(
        AdmissionFilter(QueryRewriter({.default_limit = cfg.admission.default_limit})),
        executor);

    install_signal_handlers();
    utils::log::info(std::format("[4/4] Serving {} on stdin", tool::kName));

    std::string line;
    while (!g_stop.load() && std::getline(std::cin, line)) {
        if (utils::trim(line).empty()) {
            continue;
        }
        std::cout << single_line(tool.run(line)) << std::endl;
    }

    const auto stats = tool.get_stats();
    utils::log::info(std::format("Shutting down: {} calls, {} rejected, {} executed",
        stats.invocations, stats.rejected, stats.executed));

    pool->drain();
    return 0;
}
