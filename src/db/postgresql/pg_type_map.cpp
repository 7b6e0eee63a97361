#include "db/postgresql/pg_type_map.hpp"
#include <unordered_map>

namespace sqlguard {

uint32_t PgTypeMap::type_name_to_oid(const std::string& type_name) {
    static const std::unordered_map<std::string, uint32_t> TYPE_OIDS = {
        {"integer", 23},    {"int4", 23},
        {"smallint", 21},   {"int2", 21},
        {"bigint", 20},     {"int8", 20},
        {"real", 700},      {"float4", 700},
        {"double precision", 701}, {"float8", 701},
        {"numeric", 1700},  {"decimal", 1700},
        {"text", 25},
        {"varchar", 1043},  {"character varying", 1043},
        {"char", 1042},     {"character", 1042},
        {"boolean", 16},    {"bool", 16},
        {"date", 1082},
        {"time", 1083},     {"time without time zone", 1083},
        {"timetz", 1266},   {"time with time zone", 1266},
        {"timestamp", 1114},{"timestamp without time zone", 1114},
        {"timestamptz", 1184}, {"timestamp with time zone", 1184},
        {"interval", 1186},
        {"uuid", 2950},
        {"json", 114},      {"jsonb", 3802},
        {"bytea", 17},
        {"oid", 26},
        {"money", 790},
        {"array", 2277},
    };

    auto it = TYPE_OIDS.find(type_name);
    return it != TYPE_OIDS.end() ? it->second : 0;
}

GenericColumnType PgTypeMap::oid_to_generic_type(uint32_t oid) {
    static const std::unordered_map<uint32_t, GenericColumnType> OID_TO_GENERIC = {
        {21, GenericColumnType::SMALLINT},
        {23, GenericColumnType::INTEGER},
        {20, GenericColumnType::BIGINT},
        {26, GenericColumnType::INTEGER},   // oid
        {700, GenericColumnType::REAL},
        {701, GenericColumnType::DOUBLE_PRECISION},
        {1700, GenericColumnType::NUMERIC},
        {25, GenericColumnType::TEXT},
        {1043, GenericColumnType::VARCHAR},
        {1042, GenericColumnType::CHAR},
        {16, GenericColumnType::BOOLEAN},
        {1082, GenericColumnType::DATE},
        {1083, GenericColumnType::TIME},
        {1266, GenericColumnType::TIME},
        {1114, GenericColumnType::TIMESTAMP},
        {1184, GenericColumnType::TIMESTAMP_TZ},
        {1186, GenericColumnType::INTERVAL},
        {17, GenericColumnType::BLOB},
        {114, GenericColumnType::JSON},
        {3802, GenericColumnType::JSON},
        {2950, GenericColumnType::UUID},
        {790, GenericColumnType::VENDOR_SPECIFIC},  // money renders with a currency symbol
        {2277, GenericColumnType::ARRAY},
    };

    auto it = OID_TO_GENERIC.find(oid);
    return it != OID_TO_GENERIC.end() ? it->second : GenericColumnType::UNKNOWN;
}

GenericColumnType PgTypeMap::type_name_to_generic(const std::string& type_name) {
    const uint32_t oid = type_name_to_oid(type_name);
    if (oid == 0) {
        return GenericColumnType::UNKNOWN;
    }
    return oid_to_generic_type(oid);
}

} // namespace sqlguard
