#include "db/sqlite/sqlite_backend.hpp"
#include "db/sqlite/sqlite_connection.hpp"
#include "db/sqlite/sqlite_schema_loader.hpp"
#include "db/generic_connection_pool.hpp"

namespace sqlguard {

std::shared_ptr<IConnectionPool> SqliteBackend::create_pool(
    const std::string& db_name,
    const PoolConfig& config) {

    // The connect timeout doubles as the busy timeout on a locked database
    auto factory = std::make_shared<SqliteConnectionFactory>(config.connection_timeout);
    return std::make_shared<GenericConnectionPool>(db_name, config, std::move(factory));
}

std::shared_ptr<ISchemaLoader> SqliteBackend::create_schema_loader() {
    return std::make_shared<SqliteSchemaLoader>();
}

} // namespace sqlguard
