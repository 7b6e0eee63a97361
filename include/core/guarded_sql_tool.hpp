#pragma once

#include "core/types.hpp"
#include "db/iquery_executor.hpp"
#include "security/admission_filter.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace sqlguard {

/**
 * @brief One execute_sql tool invocation, end to end
 *
 * parse arguments -> admit -> execute (only if Accepted) -> render.
 * A rejected candidate never reaches the executor, so it never touches
 * a pooled connection. Always returns an observation; never throws
 * for bad input or database failures.
 */
class GuardedSqlTool {
public:
    GuardedSqlTool(AdmissionFilter filter, std::shared_ptr<IQueryExecutor> executor);

    /**
     * @param args Tool-call argument object as JSON text
     */
    [[nodiscard]] std::string run(std::string_view args);

    /**
     * @brief Same pipeline for a raw SQL candidate (no argument parsing)
     */
    [[nodiscard]] std::string run_sql(std::string_view candidate);

    struct Stats {
        uint64_t invocations;
        uint64_t rejected;
        uint64_t executed;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .invocations = invocations_.load(std::memory_order_relaxed),
            .rejected = rejected_.load(std::memory_order_relaxed),
            .executed = executed_.load(std::memory_order_relaxed),
        };
    }

private:
    AdmissionFilter filter_;
    std::shared_ptr<IQueryExecutor> executor_;

    std::atomic<uint64_t> invocations_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> executed_{0};
};

} // namespace sqlguard
