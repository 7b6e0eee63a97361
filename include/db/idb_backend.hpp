#pragma once

#include "core/database_type.hpp"
#include "db/iconnection_pool.hpp"
#include "db/ischema_loader.hpp"
#include <memory>
#include <string>

namespace sqlguard {

/**
 * @brief Abstract database backend - creates all DB-specific components
 *
 * Usage:
 *   auto backend = BackendRegistry::instance().create(DatabaseType::POSTGRESQL);
 *   auto pool = backend->create_pool("primary", pool_config);
 *   auto loader = backend->create_schema_loader();
 */
class IDbBackend {
public:
    virtual ~IDbBackend() = default;

    [[nodiscard]] virtual DatabaseType type() const = 0;

    [[nodiscard]] virtual std::shared_ptr<IConnectionPool> create_pool(
        const std::string& db_name,
        const PoolConfig& config) = 0;

    [[nodiscard]] virtual std::shared_ptr<ISchemaLoader> create_schema_loader() = 0;
};

} // namespace sqlguard
