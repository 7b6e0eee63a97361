#pragma once

#include "core/database_type.hpp"
#include "core/types.hpp"
#include "db/iconnection_pool.hpp"
#include "db/iquery_executor.hpp"
#include "db/ischema_loader.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sqlguard {

/**
 * @brief Renders a human-readable description of allowlisted tables
 *
 * Run once at start-up to prime the agent's instructions; never on the
 * per-query path. Each table becomes a CREATE TABLE-style block (column
 * type, NOT NULL, PRIMARY KEY) followed by up to sample_rows sample rows
 * inside a C-style comment block, tab separated. Blocks are separated by
 * a blank line.
 */
class SchemaDescriber {
public:
    struct Config {
        size_t sample_rows = 3;
        std::chrono::milliseconds acquire_timeout{5000};
    };

    SchemaDescriber(
        std::shared_ptr<IConnectionPool> pool,
        std::shared_ptr<ISchemaLoader> loader,
        std::shared_ptr<IQueryExecutor> executor,
        DatabaseType db_type,
        const Config& config);

    /**
     * @brief Describe the allowlisted tables, in allowlist order
     * @param tables "table" or "schema.table" names (case-insensitive);
     *               empty means every user table, ordered by schema.table
     * @return Description text, or nullopt if the catalog could not be read
     *
     * Tables missing from the database are skipped with a warning.
     */
    [[nodiscard]] std::optional<std::string> describe(const std::vector<std::string>& tables);

    /**
     * @brief Resolve an allowlist entry against a loaded schema
     *
     * An unqualified name matches any schema; on ambiguity the
     * lexicographically smallest "schema.table" wins.
     */
    [[nodiscard]] static std::shared_ptr<const TableMetadata> find_table(
        const SchemaMap& schema, const std::string& entry);

    [[nodiscard]] static std::string render_table(const TableMetadata& table);
    [[nodiscard]] static std::string render_samples(const std::string& table_name, const QueryRows& rows);

private:
    [[nodiscard]] std::string sample_query(const TableMetadata& table) const;

    std::shared_ptr<IConnectionPool> pool_;
    std::shared_ptr<ISchemaLoader> loader_;
    std::shared_ptr<IQueryExecutor> executor_;
    DatabaseType db_type_;
    Config config_;
};

} // namespace sqlguard
