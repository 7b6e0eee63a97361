#include <catch2/catch_test_macros.hpp>
#include "core/guarded_sql_tool.hpp"
#include "db/generic_query_executor.hpp"
#include "db/pooled_connection.hpp"
#include "db/sqlite/sqlite_backend.hpp"
#include "db/sqlite/sqlite_connection.hpp"
#include "db/sqlite/sqlite_schema_loader.hpp"
#include "db/sqlite/sqlite_type_map.hpp"
#include "schema/schema_describer.hpp"

#include <sqlite3.h>
#include <filesystem>

using namespace sqlguard;

namespace {

constexpr std::chrono::milliseconds kAcquireTimeout{1000};

// One in-memory database lives as long as the pool's single connection
struct SqliteFixture {
    SqliteBackend backend;
    std::shared_ptr<IConnectionPool> pool;

    SqliteFixture() {
        PoolConfig config;
        config.connection_string = ":memory:";
        config.min_connections = 1;
        config.max_connections = 1;
        pool = backend.create_pool("test", config);

        auto conn = pool->acquire(kAcquireTimeout);
        REQUIRE(conn);
        for (const char* sql : {
                "CREATE TABLE customers (id INTEGER PRIMARY KEY, name TEXT NOT NULL, balance REAL)",
                "INSERT INTO customers VALUES (1, 'Alice', 10.5)",
                "INSERT INTO customers VALUES (2, 'Bob', NULL)",
                "CREATE TABLE orders (id INTEGER, customer_id INTEGER NOT NULL, "
                "status VARCHAR(20), PRIMARY KEY (id))"}) {
            INFO(sql);
            REQUIRE(conn->get()->execute(sql).success);
        }
    }

    ~SqliteFixture() {
        pool->drain();
    }
};

} // anonymous namespace

TEST_CASE("SqliteConnectionFactory: URL forms resolve to file names", "[sqlite]") {
    CHECK(SqliteConnectionFactory::resolve_path("sqlite:///sql_agent_class.db") == "sql_agent_class.db");
    CHECK(SqliteConnectionFactory::resolve_path("sqlite:////var/lib/app.db") == "/var/lib/app.db");
    CHECK(SqliteConnectionFactory::resolve_path("sqlite://") == ":memory:");
    CHECK(SqliteConnectionFactory::resolve_path("sqlite:///") == ":memory:");
    CHECK(SqliteConnectionFactory::resolve_path("data/shop.db") == "data/shop.db");
    CHECK(SqliteConnectionFactory::resolve_path("file:shop.db?mode=ro") == "file:shop.db?mode=ro");
}

TEST_CASE("SqliteConnectionFactory: missing database file is not created", "[sqlite]") {
    const auto path = std::filesystem::temp_directory_path() / "sqlguard_missing_database.db";
    std::filesystem::remove(path);

    SqliteConnectionFactory factory;
    CHECK(factory.create(path.string()) == nullptr);
    CHECK_FALSE(std::filesystem::exists(path));
}

TEST_CASE("SqliteTypeMap: declared types follow affinity", "[sqlite]") {
    CHECK(SqliteTypeMap::type_name_to_generic("integer") == GenericColumnType::INTEGER);
    CHECK(SqliteTypeMap::type_name_to_generic("bigint") == GenericColumnType::BIGINT);
    CHECK(SqliteTypeMap::type_name_to_generic("tinyint") == GenericColumnType::SMALLINT);
    CHECK(SqliteTypeMap::type_name_to_generic("varchar(20)") == GenericColumnType::VARCHAR);
    CHECK(SqliteTypeMap::type_name_to_generic("nchar(5)") == GenericColumnType::CHAR);
    CHECK(SqliteTypeMap::type_name_to_generic("text") == GenericColumnType::TEXT);
    CHECK(SqliteTypeMap::type_name_to_generic("blob") == GenericColumnType::BLOB);
    CHECK(SqliteTypeMap::type_name_to_generic("real") == GenericColumnType::REAL);
    CHECK(SqliteTypeMap::type_name_to_generic("double precision") == GenericColumnType::DOUBLE_PRECISION);
    CHECK(SqliteTypeMap::type_name_to_generic("decimal(10,2)") == GenericColumnType::NUMERIC);
    CHECK(SqliteTypeMap::type_name_to_generic("datetime") == GenericColumnType::TIMESTAMP);
    CHECK(SqliteTypeMap::type_name_to_generic("date") == GenericColumnType::DATE);
    CHECK(SqliteTypeMap::type_name_to_generic("") == GenericColumnType::UNKNOWN);

    CHECK(SqliteTypeMap::storage_class_to_generic(SQLITE_INTEGER) == GenericColumnType::INTEGER);
    CHECK(SqliteTypeMap::storage_class_to_generic(SQLITE_FLOAT) == GenericColumnType::DOUBLE_PRECISION);
    CHECK(SqliteTypeMap::storage_class_to_generic(SQLITE_NULL) == GenericColumnType::UNKNOWN);
}

TEST_CASE("SqliteConnection: rows keep NULLs and column types", "[sqlite]") {
    SqliteFixture fx;
    auto conn = fx.pool->acquire(kAcquireTimeout);
    REQUIRE(conn);

    const auto result = conn->get()->execute("SELECT id, name, balance, count(*) OVER () AS n FROM customers ORDER BY id");
    REQUIRE(result.success);
    CHECK(result.has_rows);
    CHECK(result.column_names == std::vector<std::string>{"id", "name", "balance", "n"});
    CHECK(result.column_types == std::vector<GenericColumnType>{
        GenericColumnType::INTEGER, GenericColumnType::TEXT,
        GenericColumnType::REAL, GenericColumnType::INTEGER});
    REQUIRE(result.rows.size() == 2);
    CHECK(result.rows[0][1] == "Alice");
    CHECK(result.rows[0][2] == "10.5");
    CHECK_FALSE(result.rows[1][2].has_value());
}

TEST_CASE("SqliteConnection: only one statement is executed", "[sqlite]") {
    SqliteFixture fx;
    auto conn = fx.pool->acquire(kAcquireTimeout);
    REQUIRE(conn);

    CHECK(conn->get()->execute("SELECT 1;").success);

    const auto result = conn->get()->execute("SELECT 1; DELETE FROM customers");
    CHECK_FALSE(result.success);
    CHECK(conn->get()->execute("SELECT id FROM customers").rows.size() == 2);
}

TEST_CASE("SqliteConnection: statement timeout interrupts a long query", "[sqlite]") {
    SqliteFixture fx;
    auto conn = fx.pool->acquire(kAcquireTimeout);
    REQUIRE(conn);

    REQUIRE(conn->get()->set_query_timeout(50));
    const auto result = conn->get()->execute(
        "WITH RECURSIVE n(i) AS (SELECT 1 UNION ALL SELECT i + 1 FROM n) "
        "SELECT count(*) FROM n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message == "statement timeout of 50ms exceeded");
    CHECK(result.rows.empty());
}

TEST_CASE("GuardedSqlTool: missing column reports the driver diagnostic", "[sqlite][tool]") {
    SqliteFixture fx;
    GuardedSqlTool tool(AdmissionFilter{}, std::make_shared<GenericQueryExecutor>(fx.pool));

    const auto observation = tool.run_sql("SELECT email FROM customers");
    CHECK(observation.starts_with("ERROR: "));
    CHECK(observation.contains("no such column: email"));

    // The connection went back to the pool
    CHECK(fx.pool->get_stats().active_connections == 0);
}

TEST_CASE("GuardedSqlTool: SQLite rows render as JSON", "[sqlite][tool]") {
    SqliteFixture fx;
    GuardedSqlTool tool(AdmissionFilter{}, std::make_shared<GenericQueryExecutor>(fx.pool));

    CHECK(tool.run_sql("SELECT id, name, balance FROM customers ORDER BY id") ==
          R"({"columns":["id","name","balance"],"rows":[[1,"Alice",10.5],[2,"Bob",null]]})");
    CHECK(tool.run_sql("SELECT count(*) AS n FROM customers") ==
          R"({"columns":["n"],"rows":[[2]]})");
}

TEST_CASE("GuardedSqlTool: write against SQLite is rejected before execution", "[sqlite][tool]") {
    SqliteFixture fx;
    GuardedSqlTool tool(AdmissionFilter{}, std::make_shared<GenericQueryExecutor>(fx.pool));

    CHECK(tool.run_sql("DELETE FROM customers WHERE id = 1") ==
          "ERROR: write operations are not allowed.");
    CHECK(tool.run_sql("SELECT count(*) AS n FROM customers") ==
          R"({"columns":["n"],"rows":[[2]]})");
}

TEST_CASE("SqliteSchemaLoader: columns, nullability and primary keys", "[sqlite][schema]") {
    SqliteFixture fx;
    auto conn = fx.pool->acquire(kAcquireTimeout);
    REQUIRE(conn);

    SqliteSchemaLoader loader;
    const auto schema = loader.load_schema(*conn->get());
    REQUIRE(schema);
    REQUIRE(schema->contains("main.customers"));
    REQUIRE(schema->contains("main.orders"));

    const auto& orders = *schema->at("main.orders");
    REQUIRE(orders.columns.size() == 3);
    CHECK(orders.columns[1].name == "customer_id");
    CHECK_FALSE(orders.columns[1].nullable);
    CHECK(orders.columns[2].type == "varchar(20)");
    CHECK(orders.columns[2].generic_type == GenericColumnType::VARCHAR);

    const auto* id = orders.find_column("id");
    REQUIRE(id != nullptr);
    CHECK(id->is_primary_key);
}

TEST_CASE("SchemaDescriber: describes an SQLite table with samples", "[sqlite][schema]") {
    SqliteFixture fx;
    auto executor = std::make_shared<GenericQueryExecutor>(fx.pool);
    SchemaDescriber describer(fx.pool, fx.backend.create_schema_loader(), executor,
        DatabaseType::SQLITE, {.sample_rows = 1, .acquire_timeout = kAcquireTimeout});

    const auto text = describer.describe({"customers"});
    REQUIRE(text);
    CHECK(text->starts_with("CREATE TABLE customers (\n"));
    CHECK(text->contains("\tname TEXT NOT NULL"));
    CHECK(text->contains("\tPRIMARY KEY (id)"));
    CHECK(text->contains("1 rows from customers table:"));
    CHECK(text->contains("1\tAlice\t10.5"));
}
