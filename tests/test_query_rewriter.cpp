#include <catch2/catch_test_macros.hpp>
#include "core/query_rewriter.hpp"

using namespace sqlguard;

TEST_CASE("QueryRewriter: appends LIMIT to query without one", "[rewriter]") {
    QueryRewriter rewriter;
    CHECK(rewriter.rewrite("SELECT * FROM customers") == "SELECT * FROM customers LIMIT 200");
}

TEST_CASE("QueryRewriter: returns empty when LIMIT already present", "[rewriter]") {
    QueryRewriter rewriter;
    CHECK(rewriter.rewrite("SELECT * FROM customers LIMIT 50").empty());
    CHECK(rewriter.rewrite("SELECT * FROM customers\nLIMIT\t50").empty());
}

TEST_CASE("QueryRewriter: LIMIT needs an integer argument", "[rewriter]") {
    CHECK_FALSE(QueryRewriter::has_limit_clause("SELECT * FROM t LIMIT ALL"));
    CHECK_FALSE(QueryRewriter::has_limit_clause("SELECT rate_limit FROM plans"));
    CHECK(QueryRewriter::has_limit_clause("select * from t limit 1 offset 5"));
}

TEST_CASE("QueryRewriter: aggregate detection", "[rewriter]") {
    CHECK(QueryRewriter::has_aggregate("SELECT COUNT(*) FROM t"));
    CHECK(QueryRewriter::has_aggregate("SELECT a FROM t group by a"));
    CHECK(QueryRewriter::has_aggregate("SELECT a FROM t GROUP\t\tBY a"));
    CHECK(QueryRewriter::has_aggregate("SELECT sum(x), avg(y) FROM t"));
    CHECK_FALSE(QueryRewriter::has_aggregate("SELECT discount FROM t"));
    CHECK_FALSE(QueryRewriter::has_aggregate("SELECT summary FROM t"));
    CHECK_FALSE(QueryRewriter::has_aggregate("SELECT groupby FROM t"));
}

TEST_CASE("QueryRewriter: custom limit value", "[rewriter]") {
    QueryRewriter rewriter({.default_limit = 1000});
    CHECK(rewriter.default_limit() == 1000);
    CHECK(rewriter.rewrite("SELECT id FROM t") == "SELECT id FROM t LIMIT 1000");
}

TEST_CASE("QueryRewriter: scan form collapses whitespace and digit runs", "[rewriter]") {
    CHECK(QueryRewriter::scan_form("SELECT  a\n\tFROM t LIMIT 12345") == "SELECT a FROM t LIMIT 1");
    CHECK(QueryRewriter::scan_form("x 1 2") == "x 1 2");
    CHECK(QueryRewriter::scan_form("") == "");
}

TEST_CASE("QueryRewriter: detection is unchanged by run length", "[rewriter]") {
    const std::string spaces(100000, ' ');
    const std::string digits(100000, '5');

    CHECK(QueryRewriter::has_limit_clause("SELECT a FROM t LIMIT" + spaces + digits));
    CHECK(QueryRewriter::has_aggregate("SELECT a FROM t group" + spaces + "by a"));
    CHECK_FALSE(QueryRewriter::has_limit_clause("SELECT a FROM t LIMIT " + digits + "abc"));
}
