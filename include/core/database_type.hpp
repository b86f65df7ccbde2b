#pragma once

#include "core/types.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>

namespace rowmap {

namespace keys {
    inline constexpr std::string_view POSTGRES = "postgres";
    inline constexpr std::string_view POSTGRESQL = "postgresql";
    inline constexpr std::string_view PG = "pg";
    inline constexpr std::string_view MYSQL = "mysql";
    inline constexpr std::string_view MARIADB = "mariadb";
}

enum class DatabaseType {
    POSTGRESQL,
    MYSQL,
};

[[nodiscard]] inline std::string_view database_type_to_string(DatabaseType type) {
    switch (type) {
        case DatabaseType::POSTGRESQL: return keys::POSTGRESQL;
        case DatabaseType::MYSQL: return keys::MYSQL;
        default: return "unknown";
    }
}

[[nodiscard]] inline DatabaseType parse_database_type(std::string_view type_str) {
    static const std::unordered_map<std::string_view, DatabaseType> lookup = {
        {keys::POSTGRESQL, DatabaseType::POSTGRESQL},
        {keys::POSTGRES,   DatabaseType::POSTGRESQL},
        {keys::PG,         DatabaseType::POSTGRESQL},
        {keys::MYSQL,      DatabaseType::MYSQL},
        {keys::MARIADB,    DatabaseType::MYSQL}
    };

    if (const auto it = lookup.find(type_str); it != lookup.end()) {
        return it->second;
    }

    for (const auto& [key, value] : lookup) {
        if (key.size() == type_str.size()) {
            const bool match = std::equal(key.begin(), key.end(), type_str.begin(),
                [](char a, char b) { return std::tolower(a) == std::tolower(b); });
            if (match) return value;
        }
    }

    throw std::runtime_error("Unknown database type: " + std::string(type_str));
}

/**
 * @brief Isolation level a server uses when BEGIN names none
 */
[[nodiscard]] inline IsolationLevel default_isolation_for(DatabaseType type) {
    switch (type) {
        case DatabaseType::POSTGRESQL: return IsolationLevel::READ_COMMITTED;
        case DatabaseType::MYSQL:      return IsolationLevel::REPEATABLE_READ;
        default:                       return IsolationLevel::READ_COMMITTED;
    }
}

} // namespace rowmap
