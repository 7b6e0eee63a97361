#include <catch2/catch_test_macros.hpp>
#include "core/observation.hpp"

using namespace sqlguard;

TEST_CASE("Observation: rejection texts", "[tool][observation]") {
    CHECK(render_observation(Rejected{RejectionReason::WRITE_OPERATION_FORBIDDEN}) ==
          "ERROR: write operations are not allowed.");
    CHECK(render_observation(Rejected{RejectionReason::MULTIPLE_STATEMENTS_FORBIDDEN}) ==
          "ERROR: multiple statements are not allowed.");
    CHECK(render_observation(Rejected{RejectionReason::ONLY_SELECT_ALLOWED}) ==
          "ERROR: only SELECT statements are allowed.");
    CHECK(render_observation(Rejected{RejectionReason::INVALID_INPUT}) ==
          "ERROR: expected a single SQL string argument.");
}

TEST_CASE("Observation: execution error carries the diagnostic", "[tool][observation]") {
    const QueryResult result = ExecutionError{"column \"nonexistent\" does not exist\n"};
    CHECK(render_observation(result) == "ERROR: column \"nonexistent\" does not exist");
}

TEST_CASE("Observation: rows render as JSON", "[tool][observation]") {
    QueryRows rows;
    rows.columns = {"id", "name", "total", "active", "note"};
    rows.column_types = {
        GenericColumnType::INTEGER, GenericColumnType::TEXT, GenericColumnType::NUMERIC,
        GenericColumnType::BOOLEAN, GenericColumnType::TEXT};
    rows.rows = {
        {"1", "Alice", "19.99", "t", std::nullopt},
        {"2", "Bob \"B\"", "-3", "f", "line1\nline2"},
    };

    CHECK(render_observation(QueryResult{rows}) ==
        R"({"columns":["id","name","total","active","note"],)"
        R"("rows":[[1,"Alice",19.99,true,null],[2,"Bob \"B\"",-3,false,"line1\nline2"]]})");
}

TEST_CASE("Observation: empty result keeps the columns", "[tool][observation]") {
    QueryRows rows;
    rows.columns = {"id"};
    rows.column_types = {GenericColumnType::INTEGER};
    CHECK(render_observation(rows) == R"({"columns":["id"],"rows":[]})");
}

TEST_CASE("Observation: cell rendering by type", "[tool][observation]") {
    CHECK(render_cell(std::nullopt, GenericColumnType::INTEGER) == "null");
    CHECK(render_cell("42", GenericColumnType::BIGINT) == "42");
    CHECK(render_cell("1.5e10", GenericColumnType::DOUBLE_PRECISION) == "1.5e10");
    // Values without a JSON number form fall back to strings
    CHECK(render_cell("NaN", GenericColumnType::DOUBLE_PRECISION) == "\"NaN\"");
    CHECK(render_cell("Infinity", GenericColumnType::REAL) == "\"Infinity\"");
    CHECK(render_cell("true", GenericColumnType::BOOLEAN) == "true");
    CHECK(render_cell("yes", GenericColumnType::BOOLEAN) == "\"yes\"");
    CHECK(render_cell("42", GenericColumnType::TEXT) == "\"42\"");
    CHECK(render_cell("2024-01-31", GenericColumnType::DATE) == "\"2024-01-31\"");
    CHECK(render_cell("$1.00", GenericColumnType::VENDOR_SPECIFIC) == "\"$1.00\"");
}

TEST_CASE("Observation: JSON number grammar", "[tool][observation]") {
    CHECK(is_json_number("0"));
    CHECK(is_json_number("-0.5"));
    CHECK(is_json_number("123"));
    CHECK(is_json_number("1E+3"));
    CHECK_FALSE(is_json_number(""));
    CHECK_FALSE(is_json_number("-"));
    CHECK_FALSE(is_json_number("007"));
    CHECK_FALSE(is_json_number("1."));
    CHECK_FALSE(is_json_number(".5"));
    CHECK_FALSE(is_json_number("+1"));
    CHECK_FALSE(is_json_number("1e"));
    CHECK_FALSE(is_json_number(" 1"));
}
