#include "config/config_loader.hpp"
#include "core/database_type.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace sqlguard {

namespace {

constexpr int kMaxDefaultLimit = 100000;

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = ConfigLoader::expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = ConfigLoader::expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

std::vector<std::string> toml_string_array(const toml::table& tbl, std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

// Negative integers in the file are clamped to 0 and caught by validation
template<typename T>
T non_negative(int64_t value) {
    return value < 0 ? T{0} : static_cast<T>(value);
}

// ---- Section extraction ----------------------------------------------------

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* l = root["logging"].as_table();
    if (!l) return cfg;

    cfg.level = (*l)["level"].value_or("info"s);
    return cfg;
}

DatabaseConfig extract_database(const toml::table& root) {
    DatabaseConfig cfg;
    const auto* db = root["database"].as_table();
    if (!db) return cfg;

    cfg.type_str = (*db)["type"].value_or("postgresql"s);
    cfg.connection_string = (*db)["connection_string"].value_or(""s);
    cfg.min_connections = non_negative<size_t>((*db)["min_connections"].value_or(int64_t{1}));
    cfg.max_connections = non_negative<size_t>((*db)["max_connections"].value_or(int64_t{8}));
    cfg.connection_timeout_ms = non_negative<uint32_t>((*db)["connection_timeout_ms"].value_or(int64_t{5000}));
    cfg.query_timeout_ms = non_negative<uint32_t>((*db)["query_timeout_ms"].value_or(int64_t{30000}));
    cfg.idle_timeout_seconds = non_negative<uint32_t>((*db)["idle_timeout_seconds"].value_or(int64_t{300}));
    cfg.max_lifetime_seconds = non_negative<uint32_t>((*db)["max_lifetime_seconds"].value_or(int64_t{3600}));
    cfg.health_check_query = (*db)["health_check_query"].value_or("SELECT 1"s);
    cfg.pool_acquire_timeout_ms = non_negative<uint32_t>((*db)["pool_acquire_timeout_ms"].value_or(int64_t{5000}));
    return cfg;
}

AdmissionConfig extract_admission(const toml::table& root) {
    AdmissionConfig cfg;
    const auto* a = root["admission"].as_table();
    if (!a) return cfg;

    cfg.default_limit = static_cast<int>((*a)["default_limit"].value_or(
        int64_t{QueryRewriter::kDefaultLimit}));
    return cfg;
}

SchemaConfig extract_schema(const toml::table& root) {
    SchemaConfig cfg;
    const auto* s = root["schema"].as_table();
    if (!s) return cfg;

    cfg.include_tables = toml_string_array(*s, "include_tables");
    cfg.sample_rows = non_negative<size_t>((*s)["sample_rows"].value_or(int64_t{3}));
    return cfg;
}

GuardConfig extract_all_sections(const toml::table& root) {
    GuardConfig config;
    config.logging = extract_logging(root);
    config.database = extract_database(root);
    config.admission = extract_admission(root);
    config.schema = extract_schema(root);
    return config;
}

ConfigLoader::LoadResult validate_and_return(GuardConfig config) {
    const auto errors = ConfigLoader::validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

} // anonymous namespace

// ---- Public API ------------------------------------------------------------

std::string ConfigLoader::expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const GuardConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error; got '{}'", config.logging.level));
    }

    const auto& db = config.database;
    try {
        static_cast<void>(parse_database_type(db.type_str));
    } catch (const std::runtime_error& e) {
        errors.push_back(std::format("database.type: {}", e.what()));
    }
    if (db.connection_string.empty()) {
        errors.push_back("database.connection_string must not be empty");
    }
    if (db.max_connections == 0) {
        errors.push_back("database.max_connections must be > 0");
    }
    if (db.min_connections > db.max_connections) {
        errors.push_back(std::format(
            "database.min_connections ({}) > max_connections ({})",
            db.min_connections, db.max_connections));
    }
    if (db.pool_acquire_timeout_ms == 0) {
        errors.push_back("database.pool_acquire_timeout_ms must be > 0");
    }
    if (db.health_check_query.empty()) {
        errors.push_back("database.health_check_query must not be empty");
    }

    if (config.admission.default_limit <= 0 || config.admission.default_limit > kMaxDefaultLimit) {
        errors.push_back(std::format("admission.default_limit must be 1-{}, got {}",
            kMaxDefaultLimit, config.admission.default_limit));
    }

    for (size_t i = 0; i < config.schema.include_tables.size(); ++i) {
        if (utils::trim(config.schema.include_tables[i]).empty()) {
            errors.push_back(std::format("schema.include_tables[{}] must not be empty", i));
        }
    }

    return errors;
}

PoolConfig ConfigLoader::to_pool_config(const DatabaseConfig& db) {
    PoolConfig pool;
    pool.connection_string = db.connection_string;
    pool.min_connections = db.min_connections;
    pool.max_connections = db.max_connections;
    pool.connection_timeout = std::chrono::milliseconds(db.connection_timeout_ms);
    pool.idle_timeout = std::chrono::seconds(db.idle_timeout_seconds);
    pool.health_check_query = db.health_check_query;
    pool.max_lifetime = std::chrono::seconds(db.max_lifetime_seconds);
    return pool;
}

GenericQueryExecutor::Config ConfigLoader::to_executor_config(const DatabaseConfig& db) {
    GenericQueryExecutor::Config cfg;
    cfg.query_timeout_ms = db.query_timeout_ms;
    cfg.enable_query_timeout = db.query_timeout_ms > 0;
    cfg.acquire_timeout = std::chrono::milliseconds(db.pool_acquire_timeout_ms);
    return cfg;
}

} // namespace sqlguard
