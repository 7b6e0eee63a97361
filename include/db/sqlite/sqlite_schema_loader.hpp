#pragma once

#include "db/ischema_loader.hpp"

namespace sqlguard {

/**
 * @brief SQLite schema loader
 *
 * Lists tables and views from sqlite_master and their columns through the
 * pragma_table_info() table-valued function. Everything is reported under
 * the "main" schema.
 */
class SqliteSchemaLoader : public ISchemaLoader {
public:
    ~SqliteSchemaLoader() override = default;

    [[nodiscard]] std::shared_ptr<SchemaMap> load_schema(IDbConnection& conn) override;
};

} // namespace sqlguard
