#include "db/mysql/mysql_connection.hpp"
#include "db/mysql/mysql_type_map.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <charconv>
#include <format>
#include <memory>

namespace sqlguard {

namespace {

struct MysqlResultDeleter {
    void operator()(MYSQL_RES* res) const noexcept {
        if (res) {
            mysql_free_result(res);
        }
    }
};
using MysqlResultPtr = std::unique_ptr<MYSQL_RES, MysqlResultDeleter>;

constexpr unsigned int kDefaultPort = 3306;
constexpr unsigned int kConnectTimeoutSeconds = 5;

} // anonymous namespace

MysqlConnection::MysqlConnection(MYSQL* conn)
    : conn_(conn) {}

MysqlConnection::~MysqlConnection() {
    close();
}

DbResultSet MysqlConnection::execute(const std::string& sql) {
    DbResultSet result;

    if (!conn_) {
        result.error_message = "Connection is null";
        return result;
    }

    if (mysql_real_query(conn_, sql.data(), static_cast<unsigned long>(sql.size())) != 0) {
        result.error_message = mysql_error(conn_);
        return result;
    }

    MysqlResultPtr res(mysql_store_result(conn_));
    if (res) {
        return process_result_set(res.get());
    }

    // No result set: either a statement without one (SET) or a fetch error
    if (mysql_field_count(conn_) == 0) {
        result.success = true;
        result.has_rows = false;
    } else {
        result.error_message = mysql_error(conn_);
    }
    return result;
}

DbResultSet MysqlConnection::process_result_set(MYSQL_RES* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const unsigned int num_fields = mysql_num_fields(res);
    const MYSQL_FIELD* fields = mysql_fetch_fields(res);

    result.column_names.reserve(num_fields);
    result.column_types.reserve(num_fields);
    for (unsigned int i = 0; i < num_fields; ++i) {
        result.column_names.emplace_back(fields[i].name);
        result.column_types.push_back(MysqlTypeMap::field_type_to_generic(fields[i].type));
    }

    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res)) != nullptr) {
        const unsigned long* lengths = mysql_fetch_lengths(res);
        Row row_data;
        row_data.reserve(num_fields);

        for (unsigned int i = 0; i < num_fields; ++i) {
            if (row[i]) {
                row_data.emplace_back(std::string(row[i], lengths[i]));
            } else {
                row_data.emplace_back(std::nullopt);
            }
        }

        result.rows.push_back(std::move(row_data));
    }

    return result;
}

bool MysqlConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_) {
        return false;
    }

    if (mysql_ping(conn_) != 0) {
        return false;
    }

    if (!health_check_query.empty()) {
        if (mysql_query(conn_, health_check_query.c_str()) != 0) {
            return false;
        }
        // Drain the result so the connection is ready for the next statement
        MysqlResultPtr res(mysql_store_result(conn_));
    }

    return true;
}

bool MysqlConnection::is_connected() const {
    return conn_ != nullptr;
}

bool MysqlConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_) {
        return false;
    }

    // max_execution_time applies to read-only SELECTs (MySQL 5.7.8+)
    const std::string sql = std::format("SET SESSION max_execution_time = {}", timeout_ms);
    return mysql_query(conn_, sql.c_str()) == 0;
}

void MysqlConnection::close() {
    if (conn_) {
        mysql_close(conn_);
        conn_ = nullptr;
    }
}

// ============================================================================
// MysqlConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> MysqlConnectionFactory::create(
    const std::string& connection_string) {

    const auto params = parse_connection_string(connection_string);

    MYSQL* conn = mysql_init(nullptr);
    if (!conn) {
        utils::log::error("mysql_init failed");
        return nullptr;
    }

    // MYSQL_OPT_CONNECT_TIMEOUT is whole seconds
    unsigned int timeout = kConnectTimeoutSeconds;
    if (connect_timeout_.count() > 0) {
        timeout = static_cast<unsigned int>(std::max<long long>(
            1, std::chrono::ceil<std::chrono::seconds>(connect_timeout_).count()));
    }
    mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);
    mysql_options(conn, MYSQL_SET_CHARSET_NAME, "utf8mb4");

    MYSQL* result = mysql_real_connect(
        conn,
        params.host.c_str(),
        params.user.c_str(),
        params.password.c_str(),
        params.database.empty() ? nullptr : params.database.c_str(),
        params.port,
        nullptr,  // unix socket
        0         // client flags
    );

    if (!result) {
        utils::log::error(std::format("MySQL connection failed: {}", mysql_error(conn)));
        mysql_close(conn);
        return nullptr;
    }

    return std::make_unique<MysqlConnection>(conn);
}

MysqlConnectionFactory::ConnParams MysqlConnectionFactory::parse_connection_string(
    const std::string& conn_str) {

    ConnParams params;
    std::string_view sv(conn_str);

    if (sv.starts_with("mysql://")) {
        sv.remove_prefix(8);
    } else if (sv.starts_with("mariadb://")) {
        sv.remove_prefix(10);
    }

    // Credentials end at the last '@' so passwords may contain '@'
    const size_t at_pos = sv.rfind('@');
    if (at_pos != std::string_view::npos) {
        const std::string_view creds = sv.substr(0, at_pos);
        sv.remove_prefix(at_pos + 1);

        const size_t colon_pos = creds.find(':');
        if (colon_pos != std::string_view::npos) {
            params.user = std::string(creds.substr(0, colon_pos));
            params.password = std::string(creds.substr(colon_pos + 1));
        } else {
            params.user = std::string(creds);
        }
    }

    std::string_view host_port = sv;
    const size_t slash_pos = sv.find('/');
    if (slash_pos != std::string_view::npos) {
        host_port = sv.substr(0, slash_pos);
        std::string_view database = sv.substr(slash_pos + 1);
        if (const size_t q = database.find('?'); q != std::string_view::npos) {
            database = database.substr(0, q);
        }
        params.database = std::string(database);
    }

    const size_t colon_pos = host_port.find(':');
    if (colon_pos != std::string_view::npos) {
        const std::string_view port_str = host_port.substr(colon_pos + 1);
        host_port = host_port.substr(0, colon_pos);

        unsigned int port = 0;
        const auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
        if (ec == std::errc{} && ptr == port_str.data() + port_str.size() && port > 0) {
            params.port = port;
        } else {
            utils::log::warn(std::format("Invalid MySQL port '{}', using {}", port_str, kDefaultPort));
        }
    }

    if (!host_port.empty()) {
        params.host = std::string(host_port);
    }

    return params;
}

} // namespace sqlguard
