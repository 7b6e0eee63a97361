#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <chrono>
#include <string>

namespace sqlguard {

/**
 * @brief PostgreSQL connection implementing IDbConnection
 *
 * Wraps PGconn*. All libpq calls are encapsulated here.
 */
class PgConnection : public IDbConnection {
public:
    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    bool set_query_timeout(uint32_t timeout_ms) override;
    void close() override;

private:
    /**
     * @brief Copy a PGRES_TUPLES_OK result into an owned result set
     */
    static DbResultSet process_tuples_result(PGresult* res);

    PGconn* conn_;
};

/**
 * @brief PostgreSQL connection factory
 *
 * Accepts both libpq keyword strings ("host=... dbname=...") and
 * postgresql:// URIs, as PQconnectdb does.
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    PgConnectionFactory() = default;
    explicit PgConnectionFactory(std::chrono::milliseconds connect_timeout)
        : connect_timeout_(connect_timeout) {}

    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;

private:
    std::chrono::milliseconds connect_timeout_{0};
};

} // namespace sqlguard
