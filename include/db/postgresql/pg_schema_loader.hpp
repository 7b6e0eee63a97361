#pragma once

#include "db/ischema_loader.hpp"

namespace sqlguard {

/**
 * @brief PostgreSQL schema loader
 *
 * Queries information_schema.columns for columns and pg_catalog for
 * primary keys.
 */
class PgSchemaLoader : public ISchemaLoader {
public:
    ~PgSchemaLoader() override = default;

    [[nodiscard]] std::shared_ptr<SchemaMap> load_schema(IDbConnection& conn) override;
};

} // namespace sqlguard
