#pragma once

#include "core/column_type.hpp"
#include <string>

namespace sqlguard {

/**
 * @brief SQLite type mapping utilities
 *
 * Declared column types follow SQLite's affinity rules, refined where the
 * declared name is specific (BIGINT, VARCHAR, DATE). Expression columns
 * have no declared type and are classified by the storage class of their
 * first value.
 */
class SqliteTypeMap {
public:
    /**
     * @param type_name Lowercase declared type, e.g. "varchar(40)"
     */
    [[nodiscard]] static GenericColumnType type_name_to_generic(const std::string& type_name);

    /**
     * @param storage_class SQLITE_INTEGER, SQLITE_FLOAT, SQLITE_TEXT, SQLITE_BLOB or SQLITE_NULL
     */
    [[nodiscard]] static GenericColumnType storage_class_to_generic(int storage_class);
};

} // namespace sqlguard
