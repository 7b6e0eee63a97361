#pragma once

#include "db/iconnection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include "db/pooled_connection.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>

namespace sqlguard {

/**
 * @brief Database-agnostic connection pool
 *
 * Design:
 * - Bounded pool: max_connections enforced via counting_semaphore
 * - Pre-warmed with min_connections, then lazily grown up to max
 * - Health checking: connections idle longer than idle_timeout are
 *   validated with health_check_query before being handed out
 * - Lifetime: connections older than max_lifetime are replaced on checkout
 * - Thread-safe: mutex protects the idle deque, semaphore prevents oversubscription
 * - RAII: PooledConnection returns the connection on destruction
 */
class GenericConnectionPool : public IConnectionPool {
public:
    /**
     * @param db_name Database name (for logging)
     * @param config Pool configuration
     * @param factory Connection factory (creates IDbConnection instances)
     */
    GenericConnectionPool(
        std::string db_name,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    ~GenericConnectionPool() override;

    GenericConnectionPool(const GenericConnectionPool&) = delete;
    GenericConnectionPool& operator=(const GenericConnectionPool&) = delete;

    std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) override;

    PoolStats get_stats() const override;

    void drain() override;

    const std::string& name() const override { return db_name_; }

private:
    using Clock = std::chrono::steady_clock;

    std::unique_ptr<IDbConnection> create_connection();

    // Close and forget a connection that will not go back to the idle deque
    void discard_connection(std::unique_ptr<IDbConnection> conn);

    // Called by PooledConnection destructor
    void return_connection(std::unique_ptr<IDbConnection> conn);

    std::string db_name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    mutable std::mutex mutex_;

    std::counting_semaphore<> semaphore_;

    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> connections_recycled_{0};

    std::atomic<bool> shutdown_{false};

    // Guarded by mutex_
    std::unordered_map<const IDbConnection*, Clock::time_point> created_at_;
    std::unordered_map<const IDbConnection*, Clock::time_point> last_used_;
};

} // namespace sqlguard
