#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"
#include <cstddef>
#include <format>

namespace sqlguard {

GenericConnectionPool::GenericConnectionPool(
    std::string db_name,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory)
    : db_name_(std::move(db_name)),
      config_(config),
      factory_(std::move(factory)),
      semaphore_(static_cast<std::ptrdiff_t>(config.max_connections)) {

    // Pre-warm pool with min_connections
    for (size_t i = 0; i < config_.min_connections; ++i) {
        auto conn = create_connection();
        if (conn) {
            std::lock_guard lock(mutex_);
            const auto now = Clock::now();
            created_at_[conn.get()] = now;
            last_used_[conn.get()] = now;
            idle_connections_.emplace_back(std::move(conn));
        } else {
            utils::log::warn(std::format("Failed to create connection {} during pool initialization for database '{}'", i + 1, db_name_));
        }
    }

    utils::log::info(std::format("ConnectionPool initialized for database '{}': {} connections (min={}, max={})",
        db_name_, total_connections_.load(), config_.min_connections, config_.max_connections));
}

GenericConnectionPool::~GenericConnectionPool() {
    drain();
}

std::unique_ptr<PooledConnection> GenericConnectionPool::acquire(
    std::chrono::milliseconds timeout) {

    if (shutdown_.load(std::memory_order_acquire)) {
        return nullptr;
    }

    // Acquire semaphore slot (blocks if pool full)
    if (!semaphore_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Timed out acquiring connection for database '{}' after {}ms",
            db_name_, timeout.count()));
        return nullptr;
    }

    // Shutdown may have started while we waited on the semaphore
    if (shutdown_.load(std::memory_order_acquire)) {
        semaphore_.release();
        return nullptr;
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    std::unique_ptr<IDbConnection> conn;
    Clock::time_point birth{};
    Clock::time_point last_used{};

    {
        std::lock_guard lock(mutex_);
        if (!idle_connections_.empty()) {
            conn = std::move(idle_connections_.front());
            idle_connections_.pop_front();
            if (const auto it = created_at_.find(conn.get()); it != created_at_.end()) {
                birth = it->second;
            }
            if (const auto it = last_used_.find(conn.get()); it != last_used_.end()) {
                last_used = it->second;
            }
        }
    }

    const auto now = Clock::now();
    bool replace = false;

    if (conn) {
        // Recycle connections that outlived max_lifetime
        if (config_.max_lifetime.count() > 0 && now - birth > config_.max_lifetime) {
            connections_recycled_.fetch_add(1, std::memory_order_relaxed);
            replace = true;
        } else if (now - last_used > config_.idle_timeout &&
                   !conn->is_healthy(config_.health_check_query)) {
            // Only connections idle past idle_timeout pay for a health check round trip
            health_check_failures_.fetch_add(1, std::memory_order_relaxed);
            replace = true;
        }
    }

    if (replace) {
        discard_connection(std::move(conn));
    }

    if (!conn) {
        conn = create_connection();
        if (!conn) {
            semaphore_.release();
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            return nullptr;
        }
        std::lock_guard lock(mutex_);
        created_at_[conn.get()] = now;
        last_used_[conn.get()] = now;
    }

    auto return_fn = [this](std::unique_ptr<IDbConnection> c) {
        this->return_connection(std::move(c));
    };

    return std::make_unique<PooledConnection>(std::move(conn), std::move(return_fn));
}

PoolStats GenericConnectionPool::get_stats() const {
    std::lock_guard lock(mutex_);

    PoolStats stats;
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.idle_connections = idle_connections_.size();
    stats.active_connections = stats.total_connections >= stats.idle_connections
        ? stats.total_connections - stats.idle_connections : 0;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    stats.connections_recycled = connections_recycled_.load(std::memory_order_relaxed);
    return stats;
}

void GenericConnectionPool::drain() {
    if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::lock_guard lock(mutex_);

    for (auto& conn : idle_connections_) {
        if (conn) {
            created_at_.erase(conn.get());
            last_used_.erase(conn.get());
            conn->close();
            total_connections_.fetch_sub(1, std::memory_order_relaxed);
        }
    }
    idle_connections_.clear();

    utils::log::info(std::format("ConnectionPool drained for database '{}'", db_name_));
}

std::unique_ptr<IDbConnection> GenericConnectionPool::create_connection() {
    auto conn = factory_->create(config_.connection_string);
    if (conn) {
        total_connections_.fetch_add(1, std::memory_order_relaxed);
    } else {
        utils::log::error(std::format("Failed to open connection for database '{}'", db_name_));
    }
    return conn;
}

void GenericConnectionPool::discard_connection(std::unique_ptr<IDbConnection> conn) {
    if (!conn) {
        return;
    }
    {
        std::lock_guard lock(mutex_);
        created_at_.erase(conn.get());
        last_used_.erase(conn.get());
    }
    conn->close();
    total_connections_.fetch_sub(1, std::memory_order_relaxed);
}

void GenericConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn) {
    if (!conn) {
        return;
    }

    total_releases_.fetch_add(1, std::memory_order_relaxed);

    // Broken connections and connections returned after drain are closed
    if (shutdown_.load(std::memory_order_acquire) || !conn->is_connected()) {
        discard_connection(std::move(conn));
        semaphore_.release();
        return;
    }

    {
        std::lock_guard lock(mutex_);
        last_used_[conn.get()] = Clock::now();
        idle_connections_.emplace_back(std::move(conn));
    }

    semaphore_.release();
}

} // namespace sqlguard
