#pragma once

#include "core/query_rewriter.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>

namespace sqlguard {

/**
 * @brief Admission filter - allowlist policy for agent-generated SQL
 *
 * Rules run in order; the first one that matches decides:
 * 1. Normalize: trim whitespace, strip at most one trailing ';'
 * 2. Any whole-word write keyword (INSERT, UPDATE, DELETE, DROP, TRUNCATE,
 *    ALTER, CREATE, REPLACE) -> WRITE_OPERATION_FORBIDDEN
 * 3. Any remaining ';' -> MULTIPLE_STATEMENTS_FORBIDDEN
 * 4. Does not start with SELECT -> ONLY_SELECT_ALLOWED
 * 5. Bounding rewrite (see QueryRewriter)
 * 6. Accepted
 *
 * Keyword matching is lexical: occurrences inside string literals are not
 * exempted, so WHERE name = 'update' is rejected as a write.
 *
 * Pure and stateless after construction; safe under arbitrary concurrency.
 */
class AdmissionFilter {
public:
    AdmissionFilter() = default;
    explicit AdmissionFilter(QueryRewriter rewriter) : rewriter_(rewriter) {}

    /**
     * @brief Decide whether a candidate query may execute
     * @param text Raw candidate text from the agent
     * @return Accepted with the (possibly rewritten) final text, or Rejected
     */
    [[nodiscard]] AdmissionVerdict admit(std::string_view text) const;

    /**
     * @brief Step 1 normalization, exposed for tests and logging
     */
    [[nodiscard]] static std::string normalize(std::string_view text);

    [[nodiscard]] static bool contains_write_keyword(std::string_view sql);
    [[nodiscard]] static bool starts_with_select(std::string_view sql);

private:
    QueryRewriter rewriter_;
};

} // namespace sqlguard
