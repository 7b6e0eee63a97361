#include <catch2/catch_test_macros.hpp>
#include "core/database_type.hpp"
#include "db/backend_registry.hpp"

using namespace sqlguard;

TEST_CASE("DatabaseType: parse accepts aliases in any case", "[database_type]") {
    CHECK(parse_database_type("postgresql") == DatabaseType::POSTGRESQL);
    CHECK(parse_database_type("Postgres") == DatabaseType::POSTGRESQL);
    CHECK(parse_database_type("PG") == DatabaseType::POSTGRESQL);
    CHECK(parse_database_type("mysql") == DatabaseType::MYSQL);
    CHECK(parse_database_type("MariaDB") == DatabaseType::MYSQL);
    CHECK(parse_database_type("sqlite") == DatabaseType::SQLITE);
    CHECK(parse_database_type("SQLite3") == DatabaseType::SQLITE);
    CHECK_THROWS_AS(parse_database_type("oracle"), std::runtime_error);
}

TEST_CASE("DatabaseType: identifier quoting per dialect", "[database_type]") {
    CHECK(quote_identifier(DatabaseType::POSTGRESQL, "orders") == "\"orders\"");
    CHECK(quote_identifier(DatabaseType::POSTGRESQL, "we\"ird") == "\"we\"\"ird\"");
    CHECK(quote_identifier(DatabaseType::MYSQL, "orders") == "`orders`");
    CHECK(quote_identifier(DatabaseType::MYSQL, "a`b") == "`a``b`");
    CHECK(quote_identifier(DatabaseType::SQLITE, "order items") == "\"order items\"");
}

TEST_CASE("BackendRegistry: unknown backend throws", "[database_type]") {
    // The test binary registers no backends
    CHECK_FALSE(BackendRegistry::instance().has_backend(DatabaseType::MYSQL));
    CHECK_THROWS_AS(BackendRegistry::instance().create(DatabaseType::MYSQL), std::runtime_error);
}
