#include "db/mysql/mysql_schema_loader.hpp"
#include "db/mysql/mysql_type_map.hpp"
#include "db/schema_map_builder.hpp"
#include "core/utils.hpp"
#include <format>

namespace sqlguard {

namespace {

constexpr const char* kColumnsQuery =
    "SELECT "
    "    TABLE_SCHEMA, "
    "    TABLE_NAME, "
    "    COLUMN_NAME, "
    "    DATA_TYPE, "
    "    IS_NULLABLE "
    "FROM information_schema.COLUMNS "
    "WHERE TABLE_SCHEMA NOT IN ('mysql', 'information_schema', 'performance_schema', 'sys') "
    "ORDER BY TABLE_SCHEMA, TABLE_NAME, ORDINAL_POSITION";

constexpr const char* kPrimaryKeyQuery =
    "SELECT "
    "    TABLE_SCHEMA, "
    "    TABLE_NAME, "
    "    COLUMN_NAME "
    "FROM information_schema.KEY_COLUMN_USAGE "
    "WHERE CONSTRAINT_NAME = 'PRIMARY' "
    "  AND TABLE_SCHEMA NOT IN ('mysql', 'information_schema', 'performance_schema', 'sys')";

} // anonymous namespace

std::shared_ptr<SchemaMap> MysqlSchemaLoader::load_schema(IDbConnection& conn) {
    SchemaMapBuilder builder(&MysqlTypeMap::type_name_to_generic);

    const auto columns = conn.execute(kColumnsQuery);
    if (!builder.add_columns(columns)) {
        utils::log::error(std::format("Failed to load MySQL schema: {}", columns.error_message));
        return nullptr;
    }

    const auto pks = conn.execute(kPrimaryKeyQuery);
    if (!pks.success) {
        utils::log::warn("Failed to load MySQL primary keys");
    }
    builder.mark_primary_keys(pks);

    return builder.take();
}

} // namespace sqlguard
