#pragma once

#include "db/idb_backend.hpp"
#include "core/database_type.hpp"
#include <format>
#include <functional>
#include <memory>
#include <stdexcept>
#include <unordered_map>

namespace sqlguard {

/**
 * @brief Registry for database backends
 *
 * main() registers the backends compiled into the binary; the registry is
 * then queried with the configured DatabaseType.
 *
 *   BackendRegistry::instance().register_backend(
 *       DatabaseType::POSTGRESQL, []{ return std::make_unique<PgBackend>(); });
 *   auto backend = BackendRegistry::instance().create(DatabaseType::POSTGRESQL);
 */
class BackendRegistry {
public:
    using Factory = std::function<std::unique_ptr<IDbBackend>()>;

    static BackendRegistry& instance() {
        static BackendRegistry registry;
        return registry;
    }

    void register_backend(DatabaseType type, Factory factory) {
        factories_[type] = std::move(factory);
    }

    /**
     * @throws std::runtime_error if no backend was compiled in for @p type
     */
    [[nodiscard]] std::unique_ptr<IDbBackend> create(DatabaseType type) const {
        const auto it = factories_.find(type);
        if (it == factories_.end()) {
            throw std::runtime_error(std::format(
                "No backend registered for database type: {}", database_type_to_string(type)));
        }
        return it->second();
    }

    [[nodiscard]] bool has_backend(DatabaseType type) const {
        return factories_.contains(type);
    }

private:
    BackendRegistry() = default;

    struct DatabaseTypeHash {
        size_t operator()(DatabaseType t) const {
            return std::hash<int>()(static_cast<int>(t));
        }
    };

    std::unordered_map<DatabaseType, Factory, DatabaseTypeHash> factories_;
};

} // namespace sqlguard
