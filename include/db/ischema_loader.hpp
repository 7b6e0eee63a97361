#pragma once

#include "core/types.hpp"
#include "db/idb_connection.hpp"
#include <memory>

namespace sqlguard {

/**
 * @brief Abstract schema loader interface
 *
 * Each backend queries its own catalog tables
 * (information_schema + pg_catalog for PG, information_schema for MySQL)
 * over a connection borrowed from the pool.
 */
class ISchemaLoader {
public:
    virtual ~ISchemaLoader() = default;

    /**
     * @brief Load the user-table schema through an open connection
     * @return Populated SchemaMap, or nullptr if the catalog query failed
     */
    [[nodiscard]] virtual std::shared_ptr<SchemaMap> load_schema(IDbConnection& conn) = 0;
};

} // namespace sqlguard
