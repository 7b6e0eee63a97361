#pragma once

#include "core/types.hpp"
#include <string>

namespace sqlguard {

/**
 * @brief Abstract query executor interface (the execution adapter)
 *
 * GuardedSqlTool holds shared_ptr<IQueryExecutor>.
 */
class IQueryExecutor {
public:
    virtual ~IQueryExecutor() = default;

    /**
     * @brief Execute the final text of an Accepted verdict
     *
     * Callers must only pass admitted text; this is not re-checked.
     * Every failure is reported as ExecutionError, never thrown.
     */
    [[nodiscard]] virtual QueryResult execute(const std::string& final_text) = 0;
};

} // namespace sqlguard
