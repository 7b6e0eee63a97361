#pragma once

#include "db/iquery_executor.hpp"
#include "db/iconnection_pool.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace sqlguard {

/**
 * @brief Database-agnostic query executor
 *
 * Acquires a connection from IConnectionPool for exactly one statement and
 * releases it before returning, whatever the outcome. No retries: a single
 * failed attempt yields a single ExecutionError.
 */
class GenericQueryExecutor : public IQueryExecutor {
public:
    struct Config {
        uint32_t query_timeout_ms = 30000;
        bool enable_query_timeout = true;
        std::chrono::milliseconds acquire_timeout{5000};
    };

    GenericQueryExecutor(std::shared_ptr<IConnectionPool> pool, const Config& config);

    explicit GenericQueryExecutor(std::shared_ptr<IConnectionPool> pool)
        : GenericQueryExecutor(std::move(pool), Config{}) {}

    ~GenericQueryExecutor() override = default;

    QueryResult execute(const std::string& final_text) override;

    struct Stats {
        uint64_t executions;
        uint64_t failures;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .executions = executions_.load(std::memory_order_relaxed),
            .failures = failures_.load(std::memory_order_relaxed),
        };
    }

private:
    QueryResult execute_select(const std::string& sql);

    std::shared_ptr<IConnectionPool> pool_;
    Config config_;

    std::atomic<uint64_t> executions_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace sqlguard
