#pragma once

#include "config/config_types.hpp"
#include "db/generic_query_executor.hpp"
#include "db/iconnection_pool.hpp"

#include <string>
#include <vector>

namespace sqlguard {

/**
 * @brief TOML configuration loader
 *
 * Sections: [logging], [database], [admission], [schema].
 * String values may reference environment variables as ${VAR}; unset
 * variables expand to an empty string. Every validation error is collected
 * and reported in a single message.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        GuardConfig config;

        static LoadResult ok(GuardConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file
     * @param config_path Path to sqlguard.toml
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML text
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check cross-field constraints
     * @return One message per violated constraint (empty when valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const GuardConfig& config);

    /**
     * @brief Expand ${VAR} references with environment values
     * @throws std::runtime_error on an unclosed "${"
     */
    [[nodiscard]] static std::string expand_env_vars(const std::string& input);

    [[nodiscard]] static PoolConfig to_pool_config(const DatabaseConfig& db);
    [[nodiscard]] static GenericQueryExecutor::Config to_executor_config(const DatabaseConfig& db);
};

} // namespace sqlguard
