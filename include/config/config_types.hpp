#pragma once

#include "core/query_rewriter.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sqlguard {

struct LoggingConfig {
    std::string level = "info";
};

struct DatabaseConfig {
    std::string type_str = "postgresql";
    std::string connection_string;
    size_t min_connections = 1;
    size_t max_connections = 8;
    uint32_t connection_timeout_ms = 5000;
    uint32_t query_timeout_ms = 30000;      // 0 = no statement timeout
    uint32_t idle_timeout_seconds = 300;
    uint32_t max_lifetime_seconds = 3600;   // 0 = never recycle
    std::string health_check_query = "SELECT 1";
    uint32_t pool_acquire_timeout_ms = 5000;
};

struct AdmissionConfig {
    int default_limit = QueryRewriter::kDefaultLimit;
};

struct SchemaConfig {
    std::vector<std::string> include_tables;   // Empty = every user table
    size_t sample_rows = 3;
};

struct GuardConfig {
    LoggingConfig logging;
    DatabaseConfig database;
    AdmissionConfig admission;
    SchemaConfig schema;
};

} // namespace sqlguard
