#pragma once

#include "core/types.hpp"
#include <string>
#include <string_view>
#include <variant>

namespace sqlguard {

namespace tool {
    inline constexpr std::string_view kName = "execute_sql";
    inline constexpr std::string_view kDescription =
        "Execute exactly one SELECT statement; DML/DDL is forbidden.";
    inline constexpr std::string_view kSqlArgument = "sql";
    inline constexpr std::string_view kSqlArgumentDescription =
        "A single read-only SELECT statement, bounded with LIMIT when returning many rows.";
}

/**
 * @brief The single argument of an execute_sql tool call
 *
 * Immutable once built. Structural validation happens in from_json(),
 * before the text ever reaches AdmissionFilter.
 */
class QueryInput {
public:
    explicit QueryInput(std::string sql) : sql_(std::move(sql)) {}

    [[nodiscard]] const std::string& sql() const { return sql_; }

    /**
     * @brief Parse a tool-call argument object: {"sql": "<text>"}
     *
     * Extra keys are ignored. Malformed JSON, a non-object document, or a
     * missing / non-string "sql" yields Rejected{INVALID_INPUT}.
     */
    [[nodiscard]] static std::variant<QueryInput, Rejected> from_json(std::string_view args);

private:
    std::string sql_;
};

} // namespace sqlguard
