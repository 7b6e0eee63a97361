#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <format>
#include <memory>

namespace sqlguard {

namespace {

struct PGResultDeleter {
    void operator()(PGresult* res) const noexcept {
        if (res) {
            PQclear(res);
        }
    }
};
using PGResultPtr = std::unique_ptr<PGresult, PGResultDeleter>;

} // anonymous namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql) {
    DbResultSet result;

    if (!conn_) {
        result.error_message = "Connection is null";
        return result;
    }

    PGResultPtr res(PQexec(conn_, sql.c_str()));
    if (!res) {
        result.error_message = PQerrorMessage(conn_);
        return result;
    }

    switch (PQresultStatus(res.get())) {
        case PGRES_TUPLES_OK:
            return process_tuples_result(res.get());
        case PGRES_COMMAND_OK:
            result.success = true;
            result.has_rows = false;
            return result;
        default: {
            const char* message = PQresultErrorMessage(res.get());
            result.error_message = (message && *message) ? message : PQerrorMessage(conn_);
            return result;
        }
    }
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!is_connected()) {
        return false;
    }

    PGResultPtr res(PQexec(conn_, health_check_query.c_str()));
    if (!res) {
        return false;
    }

    const ExecStatusType status = PQresultStatus(res.get());
    return status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK;
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_) {
        return false;
    }

    const std::string timeout_sql = std::format("SET statement_timeout = {}", timeout_ms);
    PGResultPtr res(PQexec(conn_, timeout_sql.c_str()));
    return res && PQresultStatus(res.get()) == PGRES_COMMAND_OK;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const int ncols = PQnfields(res);
    result.column_names.reserve(ncols);
    result.column_types.reserve(ncols);
    for (int i = 0; i < ncols; ++i) {
        result.column_names.emplace_back(PQfname(res, i));
        result.column_types.push_back(
            PgTypeMap::oid_to_generic_type(static_cast<uint32_t>(PQftype(res, i))));
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(nrows);
    for (int i = 0; i < nrows; ++i) {
        Row row;
        row.reserve(ncols);
        for (int j = 0; j < ncols; ++j) {
            if (PQgetisnull(res, i, j)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::string(PQgetvalue(res, i, j),
                    static_cast<size_t>(PQgetlength(res, i, j))));
            }
        }
        result.rows.push_back(std::move(row));
    }

    return result;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> PgConnectionFactory::create(
    const std::string& connection_string) {

    // connect_timeout is whole seconds in libpq and overrides one given in the string
    const char* keywords[] = {"dbname", "connect_timeout", nullptr};
    std::string timeout_seconds;
    if (connect_timeout_.count() > 0) {
        timeout_seconds = std::to_string(std::max<long long>(
            1, std::chrono::ceil<std::chrono::seconds>(connect_timeout_).count()));
    }
    const char* values[] = {
        connection_string.c_str(),
        timeout_seconds.empty() ? nullptr : timeout_seconds.c_str(),
        nullptr
    };

    // expand_dbname=1: the dbname value may itself be a conninfo string or URI
    PGconn* conn = PQconnectdbParams(keywords, values, 1);

    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        utils::log::error(std::format("Failed to connect: {}",
            utils::trim_trailing_newlines(PQerrorMessage(conn))));
        PQfinish(conn);
        return nullptr;
    }

    return std::make_unique<PgConnection>(conn);
}

} // namespace sqlguard
