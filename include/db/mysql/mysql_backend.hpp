#pragma once

#include "db/idb_backend.hpp"

namespace sqlguard {

/**
 * @brief MySQL / MariaDB backend (libmysqlclient)
 *
 * MysqlConnectionFactory behind a GenericConnectionPool, plus MysqlSchemaLoader.
 */
class MysqlBackend : public IDbBackend {
public:
    [[nodiscard]] DatabaseType type() const override {
        return DatabaseType::MYSQL;
    }

    [[nodiscard]] std::shared_ptr<IConnectionPool> create_pool(
        const std::string& db_name,
        const PoolConfig& config) override;

    [[nodiscard]] std::shared_ptr<ISchemaLoader> create_schema_loader() override;
};

} // namespace sqlguard
