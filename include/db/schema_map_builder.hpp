#pragma once

#include "core/types.hpp"
#include "db/idb_connection.hpp"
#include <functional>
#include <memory>
#include <string>

namespace sqlguard {

/**
 * @brief Accumulates catalog rows into a SchemaMap
 *
 * Expects the column rows ordered by (schema, table, ordinal) so that all
 * columns of one table arrive consecutively. Keys and names are lowercased.
 */
class SchemaMapBuilder {
public:
    using TypeResolver = std::function<GenericColumnType(const std::string&)>;

    explicit SchemaMapBuilder(TypeResolver resolve_type);

    /**
     * @brief Consume a (schema, table, column, data_type, is_nullable) result set
     * @return false if the result set is unusable
     */
    bool add_columns(const DbResultSet& result);

    /**
     * @brief Consume a (schema, table, column) primary key result set
     */
    void mark_primary_keys(const DbResultSet& result);

    [[nodiscard]] std::shared_ptr<SchemaMap> take() { return std::move(schema_); }

    [[nodiscard]] static std::string make_key(const std::string& schema, const std::string& table);

private:
    TypeResolver resolve_type_;
    std::shared_ptr<SchemaMap> schema_;
};

} // namespace sqlguard
