#pragma once

#include <algorithm>
#include <cctype>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>

namespace sqlguard {

namespace keys {
    inline constexpr std::string_view POSTGRES = "postgres";
    inline constexpr std::string_view POSTGRESQL = "postgresql";
    inline constexpr std::string_view PG = "pg";
    inline constexpr std::string_view MYSQL = "mysql";
    inline constexpr std::string_view MARIADB = "mariadb";
    inline constexpr std::string_view SQLITE = "sqlite";
    inline constexpr std::string_view SQLITE3 = "sqlite3";
}

enum class DatabaseType {
    POSTGRESQL,
    MYSQL,
    SQLITE,
};

[[nodiscard]] inline std::string_view database_type_to_string(DatabaseType type) {
    switch (type) {
        case DatabaseType::POSTGRESQL: return keys::POSTGRESQL;
        case DatabaseType::MYSQL: return keys::MYSQL;
        case DatabaseType::SQLITE: return keys::SQLITE;
        default: return "unknown";
    }
}

/**
 * @brief Quote an identifier for the given dialect (`x` for MySQL, "x" otherwise)
 *
 * Embedded quote characters are doubled.
 */
[[nodiscard]] inline std::string quote_identifier(DatabaseType type, std::string_view ident) {
    const char quote = type == DatabaseType::MYSQL ? '`' : '"';
    std::string result;
    result.reserve(ident.size() + 2);
    result += quote;
    for (const char c : ident) {
        if (c == quote) result += quote;
        result += c;
    }
    result += quote;
    return result;
}

/**
 * @brief Parse the [database].type config value (case-insensitive)
 * @throws std::runtime_error for an unknown type
 */
[[nodiscard]] inline DatabaseType parse_database_type(std::string_view type_str) {
    static const std::unordered_map<std::string_view, DatabaseType> lookup = {
        {keys::POSTGRESQL, DatabaseType::POSTGRESQL},
        {keys::POSTGRES,   DatabaseType::POSTGRESQL},
        {keys::PG,         DatabaseType::POSTGRESQL},
        {keys::MYSQL,      DatabaseType::MYSQL},
        {keys::MARIADB,    DatabaseType::MYSQL},
        {keys::SQLITE,     DatabaseType::SQLITE},
        {keys::SQLITE3,    DatabaseType::SQLITE}
    };

    if (const auto it = lookup.find(type_str); it != lookup.end()) {
        return it->second;
    }

    for (const auto& [key, value] : lookup) {
        if (key.size() == type_str.size()) {
            const bool match = std::equal(key.begin(), key.end(), type_str.begin(),
                [](char a, char b) {
                    return std::tolower(static_cast<unsigned char>(a)) ==
                           std::tolower(static_cast<unsigned char>(b));
                });
            if (match) return value;
        }
    }

    throw std::runtime_error(std::format("Unknown database type: {}", type_str));
}

} // namespace sqlguard
