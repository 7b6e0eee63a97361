#include "schema/schema_describer.hpp"
#include "db/pooled_connection.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace sqlguard {

namespace {

constexpr std::string_view kIndent = "\t";
constexpr std::string_view kNullSample = "NULL";

} // anonymous namespace

SchemaDescriber::SchemaDescriber(
    std::shared_ptr<IConnectionPool> pool,
    std::shared_ptr<ISchemaLoader> loader,
    std::shared_ptr<IQueryExecutor> executor,
    DatabaseType db_type,
    const Config& config)
    : pool_(std::move(pool)),
      loader_(std::move(loader)),
      executor_(std::move(executor)),
      db_type_(db_type),
      config_(config) {}

std::shared_ptr<const TableMetadata> SchemaDescriber::find_table(
    const SchemaMap& schema, const std::string& entry) {

    const std::string wanted = utils::to_lower(utils::trim(entry));

    if (wanted.contains('.')) {
        const auto it = schema.find(wanted);
        return it != schema.end() ? it->second : nullptr;
    }

    const std::string* best_key = nullptr;
    std::shared_ptr<const TableMetadata> best;
    for (const auto& [key, table] : schema) {
        if (table && table->name == wanted && (!best_key || key < *best_key)) {
            best_key = &key;
            best = table;
        }
    }
    return best;
}

std::string SchemaDescriber::render_table(const TableMetadata& table) {
    std::string out = std::format("CREATE TABLE {} (\n", table.name);

    std::vector<std::string> lines;
    std::vector<std::string> primary_key;
    lines.reserve(table.columns.size() + 1);

    for (const auto& col : table.columns) {
        std::string line = std::format("{}{} {}", kIndent, col.name,
            col.type.empty() ? std::string(generic_column_type_to_string(col.generic_type))
                             : utils::to_upper(col.type));
        if (!col.nullable) {
            line += " NOT NULL";
        }
        lines.push_back(std::move(line));

        if (col.is_primary_key) {
            primary_key.push_back(col.name);
        }
    }

    if (!primary_key.empty()) {
        std::string pk = std::format("{}PRIMARY KEY (", kIndent);
        for (size_t i = 0; i < primary_key.size(); ++i) {
            if (i > 0) pk += ", ";
            pk += primary_key[i];
        }
        pk += ')';
        lines.push_back(std::move(pk));
    }

    for (size_t i = 0; i < lines.size(); ++i) {
        out += lines[i];
        out += (i + 1 < lines.size()) ? ",\n" : "\n";
    }
    out += ')';
    return out;
}

std::string SchemaDescriber::render_samples(const std::string& table_name, const QueryRows& rows) {
    std::string out = std::format("/*\n{} rows from {} table:\n", rows.rows.size(), table_name);

    for (size_t i = 0; i < rows.columns.size(); ++i) {
        if (i > 0) out += '\t';
        out += rows.columns[i];
    }
    out += '\n';

    for (const auto& row : rows.rows) {
        for (size_t i = 0; i < row.size(); ++i) {
            if (i > 0) out += '\t';
            // Keep one sample per line
            std::string value = row[i] ? *row[i] : std::string(kNullSample);
            std::replace(value.begin(), value.end(), '\n', ' ');
            out += value;
        }
        out += '\n';
    }

    out += "*/";
    return out;
}

std::string SchemaDescriber::sample_query(const TableMetadata& table) const {
    return std::format("SELECT * FROM {}.{} LIMIT {}",
        quote_identifier(db_type_, table.schema),
        quote_identifier(db_type_, table.name),
        config_.sample_rows);
}

std::optional<std::string> SchemaDescriber::describe(const std::vector<std::string>& tables) {
    std::shared_ptr<SchemaMap> schema;
    {
        // Hold the connection only while reading the catalog
        auto conn = pool_->acquire(config_.acquire_timeout);
        if (!conn || !conn->is_valid()) {
            utils::log::error("Schema description: failed to acquire database connection");
            return std::nullopt;
        }
        schema = loader_->load_schema(*conn->get());
    }

    if (!schema) {
        return std::nullopt;
    }

    std::vector<std::shared_ptr<const TableMetadata>> selected;
    if (tables.empty()) {
        std::vector<std::string> keys;
        keys.reserve(schema->size());
        for (const auto& [key, table] : *schema) {
            keys.push_back(key);
        }
        std::sort(keys.begin(), keys.end());
        for (const auto& key : keys) {
            selected.push_back(schema->at(key));
        }
    } else {
        for (const auto& entry : tables) {
            auto table = find_table(*schema, entry);
            if (!table) {
                utils::log::warn(std::format("Schema description: table '{}' not found, skipping", entry));
                continue;
            }
            selected.push_back(std::move(table));
        }
    }

    std::string out;
    for (const auto& table : selected) {
        if (!out.empty()) {
            out += "\n\n";
        }
        out += render_table(*table);

        if (config_.sample_rows == 0) {
            continue;
        }

        const auto result = executor_->execute(sample_query(*table));
        if (const auto* rows = std::get_if<QueryRows>(&result)) {
            out += "\n\n";
            out += render_samples(table->name, *rows);
        } else {
            utils::log::warn(std::format("Schema description: could not sample '{}': {}",
                table->name, std::get<ExecutionError>(result).message));
        }
    }

    utils::log::info(std::format("Described {} tables", selected.size()));
    return out;
}

} // namespace sqlguard
