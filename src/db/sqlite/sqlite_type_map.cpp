#include "db/sqlite/sqlite_type_map.hpp"
#include <sqlite3.h>

namespace sqlguard {

GenericColumnType SqliteTypeMap::type_name_to_generic(const std::string& type_name) {
    if (type_name.empty()) {
        return GenericColumnType::UNKNOWN;
    }

    // Affinity rule 1: any "int" substring means INTEGER affinity
    if (type_name.contains("int")) {
        if (type_name.starts_with("bigint")) return GenericColumnType::BIGINT;
        if (type_name.starts_with("smallint") || type_name.starts_with("tinyint")) {
            return GenericColumnType::SMALLINT;
        }
        return GenericColumnType::INTEGER;
    }

    // Rule 2: TEXT affinity
    if (type_name.contains("varchar")) return GenericColumnType::VARCHAR;
    if (type_name.contains("char")) return GenericColumnType::CHAR;
    if (type_name.contains("text") || type_name.contains("clob")) return GenericColumnType::TEXT;

    // Rule 3: BLOB affinity
    if (type_name.contains("blob")) return GenericColumnType::BLOB;

    // Rule 4: REAL affinity
    if (type_name.starts_with("real")) return GenericColumnType::REAL;
    if (type_name.contains("floa") || type_name.contains("doub")) {
        return GenericColumnType::DOUBLE_PRECISION;
    }

    // Rule 5: NUMERIC affinity; dates and booleans are stored as text or numbers
    if (type_name.starts_with("datetime") || type_name.starts_with("timestamp")) {
        return GenericColumnType::TIMESTAMP;
    }
    if (type_name == "date") return GenericColumnType::DATE;
    if (type_name == "time") return GenericColumnType::TIME;
    if (type_name == "json") return GenericColumnType::JSON;

    return GenericColumnType::NUMERIC;
}

GenericColumnType SqliteTypeMap::storage_class_to_generic(int storage_class) {
    switch (storage_class) {
        case SQLITE_INTEGER: return GenericColumnType::INTEGER;
        case SQLITE_FLOAT:   return GenericColumnType::DOUBLE_PRECISION;
        case SQLITE_TEXT:    return GenericColumnType::TEXT;
        case SQLITE_BLOB:    return GenericColumnType::BLOB;
        default:             return GenericColumnType::UNKNOWN;
    }
}

} // namespace sqlguard
