#include <catch2/catch_test_macros.hpp>
#include "core/guarded_sql_tool.hpp"
#include "db/generic_connection_pool.hpp"
#include "db/generic_query_executor.hpp"
#include "mocks/mock_connection.hpp"
#include "mocks/mock_query_executor.hpp"

using namespace sqlguard;
using namespace sqlguard::testing;

TEST_CASE("GuardedSqlTool: accepted query is bounded and executed", "[tool]") {
    auto executor = std::make_shared<MockQueryExecutor>(
        QueryRows{{"id"}, {GenericColumnType::INTEGER}, {{"1"}, {"2"}}});
    GuardedSqlTool tool(AdmissionFilter{}, executor);

    const auto observation = tool.run(R"({"sql": "SELECT id FROM customers"})");

    CHECK(observation == R"({"columns":["id"],"rows":[[1],[2]]})");
    REQUIRE(executor->execute_count() == 1);
    CHECK(executor->statements().front() == "SELECT id FROM customers LIMIT 200");
}

TEST_CASE("GuardedSqlTool: rejected query never reaches the executor", "[tool]") {
    auto executor = std::make_shared<MockQueryExecutor>();
    GuardedSqlTool tool(AdmissionFilter{}, executor);

    CHECK(tool.run(R"({"sql": "UPDATE orders SET status='x'"})") ==
          "ERROR: write operations are not allowed.");
    CHECK(tool.run(R"({"sql": "SELECT * FROM customers; SELECT * FROM orders"})") ==
          "ERROR: multiple statements are not allowed.");
    CHECK(tool.run(R"({"sql": "SHOW TABLES"})") ==
          "ERROR: only SELECT statements are allowed.");
    CHECK(tool.run(R"({"statement": "SELECT 1"})") ==
          "ERROR: expected a single SQL string argument.");

    CHECK(executor->execute_count() == 0);

    const auto stats = tool.get_stats();
    CHECK(stats.invocations == 4);
    CHECK(stats.rejected == 4);
    CHECK(stats.executed == 0);
}

TEST_CASE("GuardedSqlTool: rejected query never acquires a connection", "[tool][pool]") {
    auto factory = std::make_shared<MockFactory>();
    PoolConfig config;
    config.min_connections = 1;
    config.max_connections = 1;
    auto pool = std::make_shared<GenericConnectionPool>("test-db", config, factory);
    auto executor = std::make_shared<GenericQueryExecutor>(pool);

    GuardedSqlTool tool(AdmissionFilter{}, executor);
    CHECK(tool.run(R"({"sql": "DELETE FROM orders WHERE id=1"})") ==
          "ERROR: write operations are not allowed.");

    CHECK(pool->get_stats().total_acquires == 0);
}

TEST_CASE("GuardedSqlTool: execution failure is an ERROR observation", "[tool]") {
    auto executor = std::make_shared<MockQueryExecutor>(
        ExecutionError{"column \"nonexistent\" does not exist"});
    GuardedSqlTool tool(AdmissionFilter{}, executor);

    CHECK(tool.run(R"({"sql": "SELECT nonexistent FROM customers"})") ==
          "ERROR: column \"nonexistent\" does not exist");
    CHECK(executor->execute_count() == 1);
}

TEST_CASE("GuardedSqlTool: run_sql skips argument parsing", "[tool]") {
    auto executor = std::make_shared<MockQueryExecutor>();
    GuardedSqlTool tool(AdmissionFilter(QueryRewriter({.default_limit = 10})), executor);

    static_cast<void>(tool.run_sql("select name from products;"));
    REQUIRE(executor->execute_count() == 1);
    CHECK(executor->statements().front() == "select name from products LIMIT 10");
}
