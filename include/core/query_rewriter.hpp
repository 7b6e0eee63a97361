#pragma once

#include <string>
#include <string_view>

namespace sqlguard {

/**
 * @brief Query rewriter - bounding rewrite for unbounded SELECTs
 *
 * Appends " LIMIT N" to a SELECT that has neither an explicit
 * "LIMIT <integer>" clause nor an aggregate/grouping construct
 * (COUNT(, SUM(, AVG(, MAX(, MIN(, GROUP BY). Aggregated queries are
 * assumed to return few rows and are left alone.
 *
 * Stateless after construction; safe to share across threads.
 */
class QueryRewriter {
public:
    static constexpr int kDefaultLimit = 200;

    struct Config {
        int default_limit = kDefaultLimit;
    };

    QueryRewriter() = default;
    explicit QueryRewriter(Config config) : config_(config) {}

    /**
     * @brief Apply the bounding rewrite
     * @param sql Normalized single SELECT statement (no terminator)
     * @return Rewritten SQL (empty if no changes)
     */
    [[nodiscard]] std::string rewrite(const std::string& sql) const;

    [[nodiscard]] static bool has_limit_clause(std::string_view sql);
    [[nodiscard]] static bool has_aggregate(std::string_view sql);

    [[nodiscard]] int default_limit() const { return config_.default_limit; }

    /**
     * @brief Copy of sql used for pattern detection only
     *
     * Each whitespace run becomes one space and each digit run one digit.
     * Detection results are unchanged; regex recursion stays shallow.
     */
    [[nodiscard]] static std::string scan_form(std::string_view sql);

private:
    static std::string enforce_limit(const std::string& sql, int limit_value);

    Config config_;
};

} // namespace sqlguard
