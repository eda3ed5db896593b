#pragma once

#include "core/utils.hpp"

#include <array>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace sqlrel {

/**
 * @brief SQL flavours a dialect can be registered for
 */
enum class DatabaseType {
    ANSI,
    POSTGRESQL,
    MYSQL,
};

namespace keys {
    inline constexpr std::string_view ANSI = "ansi";
    inline constexpr std::string_view POSTGRESQL = "postgresql";
    inline constexpr std::string_view MYSQL = "mysql";
}

[[nodiscard]] inline std::string_view database_type_to_string(DatabaseType type) {
    switch (type) {
        case DatabaseType::ANSI: return keys::ANSI;
        case DatabaseType::POSTGRESQL: return keys::POSTGRESQL;
        case DatabaseType::MYSQL: return keys::MYSQL;
    }
    return "unknown";
}

/**
 * @brief Resolve a dialect name from config ("pg", "MariaDB", ...)
 * @throws std::runtime_error for names outside the known set
 */
[[nodiscard]] inline DatabaseType parse_database_type(std::string_view name) {
    static constexpr std::array<std::pair<std::string_view, DatabaseType>, 7> names = {{
        {"ansi",       DatabaseType::ANSI},
        {"sql",        DatabaseType::ANSI},
        {"postgresql", DatabaseType::POSTGRESQL},
        {"postgres",   DatabaseType::POSTGRESQL},
        {"pg",         DatabaseType::POSTGRESQL},
        {"mysql",      DatabaseType::MYSQL},
        {"mariadb",    DatabaseType::MYSQL},
    }};

    const std::string lower = utils::to_lower(name);
    for (const auto& [key, type] : names) {
        if (key == lower) return type;
    }
    throw std::runtime_error("Unknown database type: " + std::string(name));
}

} // namespace sqlrel
