#include "db/sqlite/sqlite_schema_loader.hpp"
#include "db/sqlite/sqlite_type_map.hpp"
#include "db/schema_map_builder.hpp"
#include "core/utils.hpp"
#include <format>

namespace sqlguard {

namespace {

constexpr const char* kColumnsQuery =
    "SELECT "
    "    'main' AS table_schema, "
    "    m.name AS table_name, "
    "    p.name AS column_name, "
    "    p.type AS data_type, "
    "    CASE WHEN p.\"notnull\" THEN 'NO' ELSE 'YES' END AS is_nullable "
    "FROM sqlite_master m "
    "JOIN pragma_table_info(m.name) p "
    "WHERE m.type IN ('table', 'view') "
    "  AND m.name NOT LIKE 'sqlite\\_%' ESCAPE '\\' "
    "ORDER BY m.name, p.cid";

constexpr const char* kPrimaryKeyQuery =
    "SELECT "
    "    'main' AS table_schema, "
    "    m.name AS table_name, "
    "    p.name AS column_name "
    "FROM sqlite_master m "
    "JOIN pragma_table_info(m.name) p "
    "WHERE m.type = 'table' "
    "  AND p.pk > 0 "
    "  AND m.name NOT LIKE 'sqlite\\_%' ESCAPE '\\' "
    "ORDER BY m.name, p.pk";

} // anonymous namespace

std::shared_ptr<SchemaMap> SqliteSchemaLoader::load_schema(IDbConnection& conn) {
    SchemaMapBuilder builder(&SqliteTypeMap::type_name_to_generic);

    const auto columns = conn.execute(kColumnsQuery);
    if (!builder.add_columns(columns)) {
        utils::log::error(std::format("Failed to load SQLite schema: {}", columns.error_message));
        return nullptr;
    }

    const auto pks = conn.execute(kPrimaryKeyQuery);
    if (!pks.success) {
        utils::log::warn("Failed to load SQLite primary keys");
    }
    builder.mark_primary_keys(pks);

    return builder.take();
}

} // namespace sqlguard
