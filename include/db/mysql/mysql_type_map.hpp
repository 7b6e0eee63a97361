#pragma once

#include "core/column_type.hpp"
#include <mysql/mysql.h>
#include <string>

namespace sqlguard {

/**
 * @brief MySQL type mapping utilities
 *
 * Maps result field types (MYSQL_FIELD::type) and information_schema
 * DATA_TYPE names onto GenericColumnType.
 */
class MysqlTypeMap {
public:
    [[nodiscard]] static GenericColumnType field_type_to_generic(enum_field_types field_type);

    /**
     * @param type_name MySQL type name (e.g., "int", "VARCHAR"), any case
     */
    [[nodiscard]] static GenericColumnType type_name_to_generic(const std::string& type_name);
};

} // namespace sqlguard
