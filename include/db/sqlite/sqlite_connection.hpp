#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <sqlite3.h>
#include <chrono>
#include <string>

namespace sqlguard {

/**
 * @brief SQLite connection implementing IDbConnection
 *
 * Wraps sqlite3*. Statements run through sqlite3_prepare_v2/sqlite3_step;
 * only the first statement of the text is compiled.
 */
class SqliteConnection : public IDbConnection {
public:
    /**
     * @brief Construct from an open sqlite3* (takes ownership)
     */
    explicit SqliteConnection(sqlite3* db);

    ~SqliteConnection() override;

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;

    /**
     * @brief Arm a per-statement deadline
     *
     * SQLite has no server-side statement timeout. A progress handler
     * interrupts the statement once the deadline has passed.
     */
    bool set_query_timeout(uint32_t timeout_ms) override;
    void close() override;

private:
    static int on_progress(void* self);

    sqlite3* db_;
    uint32_t timeout_ms_ = 0;
    std::chrono::steady_clock::time_point deadline_{};
};

/**
 * @brief SQLite connection factory
 *
 * Accepts a file path, ":memory:", a "file:" URI, or the URL forms
 * "sqlite:///relative.db" and "sqlite:////absolute.db". The database file
 * must already exist.
 */
class SqliteConnectionFactory : public IConnectionFactory {
public:
    SqliteConnectionFactory() = default;
    explicit SqliteConnectionFactory(std::chrono::milliseconds busy_timeout)
        : busy_timeout_(busy_timeout) {}

    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;

    /**
     * @brief Map a connection string onto the filename given to sqlite3_open_v2
     */
    [[nodiscard]] static std::string resolve_path(const std::string& connection_string);

private:
    std::chrono::milliseconds busy_timeout_{0};
};

} // namespace sqlguard
