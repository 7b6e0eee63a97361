#include "db/postgresql/pg_backend.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_schema_loader.hpp"
#include "db/generic_connection_pool.hpp"

namespace sqlguard {

std::shared_ptr<IConnectionPool> PgBackend::create_pool(
    const std::string& db_name,
    const PoolConfig& config) {

    auto factory = std::make_shared<PgConnectionFactory>(config.connection_timeout);
    return std::make_shared<GenericConnectionPool>(db_name, config, std::move(factory));
}

std::shared_ptr<ISchemaLoader> PgBackend::create_schema_loader() {
    return std::make_shared<PgSchemaLoader>();
}

} // namespace sqlguard
