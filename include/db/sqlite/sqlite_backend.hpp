#pragma once

#include "db/idb_backend.hpp"

namespace sqlguard {

/**
 * @brief SQLite backend (libsqlite3)
 */
class SqliteBackend : public IDbBackend {
public:
    [[nodiscard]] DatabaseType type() const override {
        return DatabaseType::SQLITE;
    }

    [[nodiscard]] std::shared_ptr<IConnectionPool> create_pool(
        const std::string& db_name,
        const PoolConfig& config) override;

    [[nodiscard]] std::shared_ptr<ISchemaLoader> create_schema_loader() override;
};

} // namespace sqlguard
