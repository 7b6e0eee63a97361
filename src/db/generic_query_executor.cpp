#include "db/generic_query_executor.hpp"
#include "db/pooled_connection.hpp"
#include "core/utils.hpp"
#include <exception>
#include <format>

namespace sqlguard {

GenericQueryExecutor::GenericQueryExecutor(
    std::shared_ptr<IConnectionPool> pool,
    const Config& config)
    : pool_(std::move(pool)),
      config_(config) {}

QueryResult GenericQueryExecutor::execute(const std::string& final_text) {
    executions_.fetch_add(1, std::memory_order_relaxed);

    utils::Timer timer;
    QueryResult result;

    try {
        result = execute_select(final_text);
    } catch (const std::exception& e) {
        result = ExecutionError{std::format("Database error: {}", e.what())};
    }

    if (const auto* err = std::get_if<ExecutionError>(&result)) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Query failed after {}us: {}",
            timer.elapsed_us().count(), err->message));
    } else {
        utils::log::debug(std::format("Query returned {} rows in {}us",
            std::get<QueryRows>(result).rows.size(), timer.elapsed_us().count()));
    }

    return result;
}

QueryResult GenericQueryExecutor::execute_select(const std::string& sql) {
    // Released back to the pool when conn_handle leaves scope
    auto conn_handle = pool_->acquire(config_.acquire_timeout);
    if (!conn_handle || !conn_handle->is_valid()) {
        return ExecutionError{"Failed to acquire database connection from pool"};
    }

    auto* conn = conn_handle->get();

    if (config_.enable_query_timeout &&
        !conn->set_query_timeout(config_.query_timeout_ms)) {
        utils::log::warn(std::format("Could not set statement timeout of {}ms", config_.query_timeout_ms));
    }

    auto db_result = conn->execute(sql);

    if (!db_result.success) {
        return ExecutionError{utils::trim_trailing_newlines(std::move(db_result.error_message))};
    }

    QueryRows rows;
    rows.columns = std::move(db_result.column_names);
    rows.column_types = std::move(db_result.column_types);
    rows.rows = std::move(db_result.rows);
    rows.column_types.resize(rows.columns.size(), GenericColumnType::UNKNOWN);
    return rows;
}

} // namespace sqlguard
