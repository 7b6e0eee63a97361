#include "db/postgresql/pg_schema_loader.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "db/schema_map_builder.hpp"
#include "core/utils.hpp"
#include <format>

namespace sqlguard {

namespace {

constexpr const char* kColumnsQuery =
    "SELECT "
    "    table_schema, "
    "    table_name, "
    "    column_name, "
    "    data_type, "
    "    is_nullable "
    "FROM information_schema.columns "
    "WHERE table_schema NOT IN ('pg_catalog', 'information_schema') "
    "ORDER BY table_schema, table_name, ordinal_position";

constexpr const char* kPrimaryKeyQuery =
    "SELECT "
    "    n.nspname AS table_schema, "
    "    c.relname AS table_name, "
    "    a.attname AS column_name "
    "FROM pg_index i "
    "JOIN pg_class c ON c.oid = i.indrelid "
    "JOIN pg_namespace n ON n.oid = c.relnamespace "
    "JOIN pg_attribute a ON a.attrelid = c.oid AND a.attnum = ANY(i.indkey) "
    "WHERE i.indisprimary "
    "  AND n.nspname NOT IN ('pg_catalog', 'information_schema')";

} // anonymous namespace

std::shared_ptr<SchemaMap> PgSchemaLoader::load_schema(IDbConnection& conn) {
    SchemaMapBuilder builder(&PgTypeMap::type_name_to_generic);

    const auto columns = conn.execute(kColumnsQuery);
    if (!builder.add_columns(columns)) {
        utils::log::error(std::format("Failed to load PostgreSQL schema: {}",
            utils::trim_trailing_newlines(columns.error_message)));
        return nullptr;
    }

    const auto pks = conn.execute(kPrimaryKeyQuery);
    if (!pks.success) {
        utils::log::warn("Failed to load PostgreSQL primary keys");
    }
    builder.mark_primary_keys(pks);

    return builder.take();
}

} // namespace sqlguard
