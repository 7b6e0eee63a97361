#pragma once

#include "db/ischema_loader.hpp"

namespace sqlguard {

/**
 * @brief MySQL schema loader
 *
 * Queries information_schema.COLUMNS and KEY_COLUMN_USAGE, skipping the
 * server's own system schemas.
 */
class MysqlSchemaLoader : public ISchemaLoader {
public:
    ~MysqlSchemaLoader() override = default;

    [[nodiscard]] std::shared_ptr<SchemaMap> load_schema(IDbConnection& conn) override;
};

} // namespace sqlguard
