#include "db/mysql/mysql_type_map.hpp"
#include "core/utils.hpp"
#include <unordered_map>

namespace sqlguard {

GenericColumnType MysqlTypeMap::field_type_to_generic(enum_field_types field_type) {
    switch (field_type) {
        case MYSQL_TYPE_TINY:
        case MYSQL_TYPE_SHORT:
            return GenericColumnType::SMALLINT;
        case MYSQL_TYPE_LONG:
        case MYSQL_TYPE_INT24:
        case MYSQL_TYPE_YEAR:
            return GenericColumnType::INTEGER;
        case MYSQL_TYPE_LONGLONG:
            return GenericColumnType::BIGINT;
        case MYSQL_TYPE_FLOAT:
            return GenericColumnType::REAL;
        case MYSQL_TYPE_DOUBLE:
            return GenericColumnType::DOUBLE_PRECISION;
        case MYSQL_TYPE_DECIMAL:
        case MYSQL_TYPE_NEWDECIMAL:
            return GenericColumnType::NUMERIC;
        case MYSQL_TYPE_STRING:
            return GenericColumnType::CHAR;
        case MYSQL_TYPE_VAR_STRING:
        case MYSQL_TYPE_VARCHAR:
        case MYSQL_TYPE_ENUM:
        case MYSQL_TYPE_SET:
            return GenericColumnType::VARCHAR;
        case MYSQL_TYPE_BLOB:
        case MYSQL_TYPE_TINY_BLOB:
        case MYSQL_TYPE_MEDIUM_BLOB:
        case MYSQL_TYPE_LONG_BLOB:
            return GenericColumnType::BLOB;
        case MYSQL_TYPE_DATE:
        case MYSQL_TYPE_NEWDATE:
            return GenericColumnType::DATE;
        case MYSQL_TYPE_TIME:
            return GenericColumnType::TIME;
        case MYSQL_TYPE_DATETIME:
        case MYSQL_TYPE_TIMESTAMP:
            return GenericColumnType::TIMESTAMP;
        case MYSQL_TYPE_JSON:
            return GenericColumnType::JSON;
        case MYSQL_TYPE_BIT:
        case MYSQL_TYPE_GEOMETRY:
            return GenericColumnType::VENDOR_SPECIFIC;
        default:
            return GenericColumnType::UNKNOWN;
    }
}

GenericColumnType MysqlTypeMap::type_name_to_generic(const std::string& type_name) {
    static const std::unordered_map<std::string, GenericColumnType> TYPE_MAP = {
        {"tinyint", GenericColumnType::SMALLINT},
        {"smallint", GenericColumnType::SMALLINT},
        {"mediumint", GenericColumnType::INTEGER},
        {"int", GenericColumnType::INTEGER},
        {"integer", GenericColumnType::INTEGER},
        {"year", GenericColumnType::INTEGER},
        {"bigint", GenericColumnType::BIGINT},
        {"float", GenericColumnType::REAL},
        {"double", GenericColumnType::DOUBLE_PRECISION},
        {"decimal", GenericColumnType::NUMERIC},
        {"numeric", GenericColumnType::NUMERIC},
        {"char", GenericColumnType::CHAR},
        {"varchar", GenericColumnType::VARCHAR},
        {"enum", GenericColumnType::VARCHAR},
        {"set", GenericColumnType::VARCHAR},
        {"tinytext", GenericColumnType::TEXT},
        {"text", GenericColumnType::TEXT},
        {"mediumtext", GenericColumnType::TEXT},
        {"longtext", GenericColumnType::TEXT},
        {"binary", GenericColumnType::BLOB},
        {"varbinary", GenericColumnType::BLOB},
        {"tinyblob", GenericColumnType::BLOB},
        {"blob", GenericColumnType::BLOB},
        {"mediumblob", GenericColumnType::BLOB},
        {"longblob", GenericColumnType::BLOB},
        {"date", GenericColumnType::DATE},
        {"time", GenericColumnType::TIME},
        {"datetime", GenericColumnType::TIMESTAMP},
        {"timestamp", GenericColumnType::TIMESTAMP},
        {"json", GenericColumnType::JSON},
        {"bit", GenericColumnType::VENDOR_SPECIFIC},
        {"geometry", GenericColumnType::VENDOR_SPECIFIC},
    };

    const auto it = TYPE_MAP.find(utils::to_lower(type_name));
    return it != TYPE_MAP.end() ? it->second : GenericColumnType::UNKNOWN;
}

} // namespace sqlguard
