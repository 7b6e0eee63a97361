#pragma once

#include "core/column_type.hpp"
#include <cstdint>
#include <string>

namespace sqlguard {

/**
 * @brief PostgreSQL type mapping utilities
 *
 * Maps PG type names (information_schema.columns.data_type) and result
 * column OIDs (PQftype) onto GenericColumnType.
 */
class PgTypeMap {
public:
    /**
     * @brief Map PostgreSQL type name to its built-in OID
     * @param type_name Lowercase PostgreSQL type name
     * @return Type OID, or 0 if unknown
     */
    [[nodiscard]] static uint32_t type_name_to_oid(const std::string& type_name);

    [[nodiscard]] static GenericColumnType oid_to_generic_type(uint32_t oid);

    [[nodiscard]] static GenericColumnType type_name_to_generic(const std::string& type_name);
};

} // namespace sqlguard
