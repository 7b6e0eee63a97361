#include "db/sqlite/sqlite_connection.hpp"
#include "db/sqlite/sqlite_type_map.hpp"
#include "core/utils.hpp"
#include <format>
#include <memory>
#include <string_view>

namespace sqlguard {

namespace {

struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const noexcept {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }
};
using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

// Virtual machine instructions between deadline checks
constexpr int kProgressInterval = 1000;

constexpr std::string_view kUrlPrefix = "sqlite:///";
constexpr std::string_view kMemoryUrl = "sqlite://";
constexpr std::string_view kMemoryPath = ":memory:";

} // anonymous namespace

// ============================================================================
// SqliteConnection
// ============================================================================

SqliteConnection::SqliteConnection(sqlite3* db)
    : db_(db) {}

SqliteConnection::~SqliteConnection() {
    close();
}

DbResultSet SqliteConnection::execute(const std::string& sql) {
    DbResultSet result;

    if (!db_) {
        result.error_message = "Connection is null";
        return result;
    }

    sqlite3_stmt* raw = nullptr;
    const char* tail = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &raw, &tail) != SQLITE_OK) {
        result.error_message = sqlite3_errmsg(db_);
        return result;
    }
    StmtPtr stmt(raw);

    const std::string rest = tail ? utils::trim(tail) : std::string{};
    if (!rest.empty() && rest != ";") {
        result.error_message = "Only a single statement can be executed";
        return result;
    }

    // Whitespace or comment only
    if (!stmt) {
        result.success = true;
        return result;
    }

    const int ncols = sqlite3_column_count(stmt.get());
    std::vector<bool> declared(ncols, false);
    result.column_names.reserve(ncols);
    result.column_types.reserve(ncols);
    for (int i = 0; i < ncols; ++i) {
        result.column_names.emplace_back(sqlite3_column_name(stmt.get(), i));
        const char* decl = sqlite3_column_decltype(stmt.get(), i);
        if (decl) {
            result.column_types.push_back(SqliteTypeMap::type_name_to_generic(utils::to_lower(decl)));
            declared[i] = true;
        } else {
            result.column_types.push_back(GenericColumnType::UNKNOWN);
        }
    }

    if (timeout_ms_ > 0) {
        deadline_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_);
        sqlite3_progress_handler(db_, kProgressInterval, &SqliteConnection::on_progress, this);
    }

    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        Row row;
        row.reserve(ncols);
        for (int j = 0; j < ncols; ++j) {
            const int storage_class = sqlite3_column_type(stmt.get(), j);
            if (!declared[j] && storage_class != SQLITE_NULL) {
                result.column_types[j] = SqliteTypeMap::storage_class_to_generic(storage_class);
                declared[j] = true;
            }

            if (storage_class == SQLITE_NULL) {
                row.emplace_back(std::nullopt);
            } else {
                const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), j));
                const int len = sqlite3_column_bytes(stmt.get(), j);
                row.emplace_back(std::string(text ? text : "", static_cast<size_t>(len)));
            }
        }
        result.rows.push_back(std::move(row));
    }

    if (timeout_ms_ > 0) {
        sqlite3_progress_handler(db_, 0, nullptr, nullptr);
    }

    if (rc != SQLITE_DONE) {
        result.rows.clear();
        result.error_message = (rc == SQLITE_INTERRUPT && timeout_ms_ > 0)
            ? std::format("statement timeout of {}ms exceeded", timeout_ms_)
            : std::string(sqlite3_errmsg(db_));
        return result;
    }

    result.success = true;
    result.has_rows = ncols > 0;
    return result;
}

bool SqliteConnection::is_healthy(const std::string& health_check_query) {
    if (!is_connected()) {
        return false;
    }
    return execute(health_check_query).success;
}

bool SqliteConnection::is_connected() const {
    return db_ != nullptr;
}

bool SqliteConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!db_) {
        return false;
    }
    timeout_ms_ = timeout_ms;
    return true;
}

void SqliteConnection::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

int SqliteConnection::on_progress(void* self) {
    const auto* conn = static_cast<const SqliteConnection*>(self);
    return std::chrono::steady_clock::now() >= conn->deadline_ ? 1 : 0;
}

// ============================================================================
// SqliteConnectionFactory
// ============================================================================

std::string SqliteConnectionFactory::resolve_path(const std::string& connection_string) {
    const std::string_view conn = connection_string;
    if (conn == kMemoryUrl) {
        return std::string(kMemoryPath);
    }
    if (conn.starts_with(kUrlPrefix)) {
        const auto path = conn.substr(kUrlPrefix.size());
        return path.empty() ? std::string(kMemoryPath) : std::string(path);
    }
    return connection_string;
}

std::unique_ptr<IDbConnection> SqliteConnectionFactory::create(
    const std::string& connection_string) {

    const std::string path = resolve_path(connection_string);

    // No SQLITE_OPEN_CREATE: a missing database file is a connection failure
    sqlite3* db = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_URI | SQLITE_OPEN_NOMUTEX;
    const int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);

    if (rc != SQLITE_OK) {
        utils::log::error(std::format("Failed to open SQLite database '{}': {}",
            path, db ? sqlite3_errmsg(db) : sqlite3_errstr(rc)));
        if (db) {
            sqlite3_close_v2(db);
        }
        return nullptr;
    }

    if (busy_timeout_.count() > 0) {
        sqlite3_busy_timeout(db, static_cast<int>(busy_timeout_.count()));
    }

    return std::make_unique<SqliteConnection>(db);
}

} // namespace sqlguard
