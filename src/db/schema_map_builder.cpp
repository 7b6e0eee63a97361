#include "db/schema_map_builder.hpp"
#include "db/schema_constants.hpp"
#include "core/utils.hpp"

namespace sqlguard {

namespace {

const std::string& cell_or_empty(const Cell& cell) {
    static const std::string kEmpty;
    return cell ? *cell : kEmpty;
}

} // anonymous namespace

SchemaMapBuilder::SchemaMapBuilder(TypeResolver resolve_type)
    : resolve_type_(std::move(resolve_type)),
      schema_(std::make_shared<SchemaMap>()) {}

std::string SchemaMapBuilder::make_key(const std::string& schema, const std::string& table) {
    std::string key;
    key.reserve(schema.size() + 1 + table.size());
    key = schema;
    key += db::kDot;
    key += table;
    return key;
}

bool SchemaMapBuilder::add_columns(const DbResultSet& result) {
    if (!result.success || !result.has_rows) {
        return false;
    }

    std::string current_key;
    std::shared_ptr<TableMetadata> current_table;

    for (const auto& row : result.rows) {
        if (row.size() < db::kCatalogColumns) continue;

        std::string schema_name = utils::to_lower(cell_or_empty(row[db::kColSchema]));
        std::string table_name  = utils::to_lower(cell_or_empty(row[db::kColTable]));
        std::string data_type   = utils::to_lower(cell_or_empty(row[db::kColDataType]));
        const std::string& nullable_str = cell_or_empty(row[db::kColNullable]);

        std::string key = make_key(schema_name, table_name);
        if (key != current_key) {
            auto& slot = (*schema_)[key];
            if (!slot) {
                slot = std::make_shared<TableMetadata>();
                slot->schema = std::move(schema_name);
                slot->name = std::move(table_name);
            }
            current_table = slot;
            current_key = std::move(key);
        }

        ColumnMetadata col;
        col.name = utils::to_lower(cell_or_empty(row[db::kColColumn]));
        col.generic_type = resolve_type_(data_type);
        col.type = std::move(data_type);
        col.nullable = (nullable_str == db::kYes || nullable_str == db::kYesLow);

        current_table->column_index[col.name] = current_table->columns.size();
        current_table->columns.push_back(std::move(col));
    }

    return true;
}

void SchemaMapBuilder::mark_primary_keys(const DbResultSet& result) {
    if (!result.success || !result.has_rows) {
        return;
    }

    for (const auto& row : result.rows) {
        if (row.size() < db::kPkColumns) continue;

        const auto it = schema_->find(make_key(
            utils::to_lower(cell_or_empty(row[db::kColSchema])),
            utils::to_lower(cell_or_empty(row[db::kColTable]))));
        if (it == schema_->end()) continue;

        if (auto* col = it->second->find_column(utils::to_lower(cell_or_empty(row[db::kColColumn])))) {
            col->is_primary_key = true;
        }
    }
}

} // namespace sqlguard
