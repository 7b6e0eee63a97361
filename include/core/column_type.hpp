#pragma once

#include <cstdint>

namespace sqlguard {

/**
 * @brief Database-agnostic column type classification
 *
 * Maps from vendor-specific types (PG OIDs, MySQL field types).
 * Decides how a cell is rendered in the JSON observation.
 */
enum class GenericColumnType : uint16_t {
    UNKNOWN = 0,

    // Integer family
    SMALLINT,
    INTEGER,
    BIGINT,

    // Floating point
    REAL,
    DOUBLE_PRECISION,
    NUMERIC,

    // String family
    TEXT,
    VARCHAR,
    CHAR,

    BOOLEAN,

    // Date/Time
    DATE,
    TIME,
    TIMESTAMP,
    TIMESTAMP_TZ,
    INTERVAL,

    BLOB,
    JSON,
    UUID,
    ARRAY,

    // Vendor-specific fallback
    VENDOR_SPECIFIC,
};

[[nodiscard]] inline const char* generic_column_type_to_string(GenericColumnType type) {
    switch (type) {
        case GenericColumnType::UNKNOWN: return "UNKNOWN";
        case GenericColumnType::SMALLINT: return "SMALLINT";
        case GenericColumnType::INTEGER: return "INTEGER";
        case GenericColumnType::BIGINT: return "BIGINT";
        case GenericColumnType::REAL: return "REAL";
        case GenericColumnType::DOUBLE_PRECISION: return "DOUBLE_PRECISION";
        case GenericColumnType::NUMERIC: return "NUMERIC";
        case GenericColumnType::TEXT: return "TEXT";
        case GenericColumnType::VARCHAR: return "VARCHAR";
        case GenericColumnType::CHAR: return "CHAR";
        case GenericColumnType::BOOLEAN: return "BOOLEAN";
        case GenericColumnType::DATE: return "DATE";
        case GenericColumnType::TIME: return "TIME";
        case GenericColumnType::TIMESTAMP: return "TIMESTAMP";
        case GenericColumnType::TIMESTAMP_TZ: return "TIMESTAMP_TZ";
        case GenericColumnType::INTERVAL: return "INTERVAL";
        case GenericColumnType::BLOB: return "BLOB";
        case GenericColumnType::JSON: return "JSON";
        case GenericColumnType::UUID: return "UUID";
        case GenericColumnType::ARRAY: return "ARRAY";
        case GenericColumnType::VENDOR_SPECIFIC: return "VENDOR_SPECIFIC";
        default: return "UNKNOWN";
    }
}

// Integer and floating point families render as bare JSON numbers
[[nodiscard]] inline constexpr bool is_numeric_type(GenericColumnType type) {
    switch (type) {
        case GenericColumnType::SMALLINT:
        case GenericColumnType::INTEGER:
        case GenericColumnType::BIGINT:
        case GenericColumnType::REAL:
        case GenericColumnType::DOUBLE_PRECISION:
        case GenericColumnType::NUMERIC:
            return true;
        default:
            return false;
    }
}

} // namespace sqlguard
