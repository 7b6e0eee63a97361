#include <catch2/catch_test_macros.hpp>
#include "db/postgresql/pg_type_map.hpp"

using namespace sqlguard;

TEST_CASE("PgTypeMap: information_schema names", "[postgresql]") {
    CHECK(PgTypeMap::type_name_to_oid("integer") == 23);
    CHECK(PgTypeMap::type_name_to_oid("character varying") == 1043);
    CHECK(PgTypeMap::type_name_to_oid("user-defined") == 0);
    CHECK(PgTypeMap::type_name_to_generic("timestamp with time zone") == GenericColumnType::TIMESTAMP_TZ);
    CHECK(PgTypeMap::type_name_to_generic("user-defined") == GenericColumnType::UNKNOWN);
}

TEST_CASE("PgTypeMap: result column OIDs", "[postgresql]") {
    CHECK(PgTypeMap::oid_to_generic_type(20) == GenericColumnType::BIGINT);
    CHECK(PgTypeMap::oid_to_generic_type(16) == GenericColumnType::BOOLEAN);
    CHECK(PgTypeMap::oid_to_generic_type(3802) == GenericColumnType::JSON);
    // money carries a currency symbol, so it must not render as a number
    CHECK(PgTypeMap::oid_to_generic_type(790) == GenericColumnType::VENDOR_SPECIFIC);
    CHECK(PgTypeMap::oid_to_generic_type(999999) == GenericColumnType::UNKNOWN);
}
