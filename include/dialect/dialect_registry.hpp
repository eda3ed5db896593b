#pragma once

#include "core/database_type.hpp"
#include "dialect/dialect.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace sqlrel {

/**
 * @brief Registry of SQL dialects by database type
 *
 * The ANSI, PostgreSQL and MySQL dialects are registered when the registry is
 * first used; callers may replace them or add their own.
 *
 * Usage:
 *   auto dialect = DialectRegistry::instance().create(parse_database_type(config.dialect));
 *   Criteria criteria(root, dialect);
 */
class DialectRegistry {
public:
    using Factory = std::function<std::shared_ptr<const Dialect>()>;

    static DialectRegistry& instance() {
        static DialectRegistry registry;
        return registry;
    }

    void register_dialect(DatabaseType type, Factory factory) {
        std::lock_guard<std::mutex> lock(mutex_);
        factories_[type] = std::move(factory);
    }

    /** @throws std::runtime_error if nothing is registered for type */
    [[nodiscard]] std::shared_ptr<const Dialect> create(DatabaseType type) const;

    [[nodiscard]] bool has_dialect(DatabaseType type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return factories_.count(type) > 0;
    }

private:
    DialectRegistry();

    struct DatabaseTypeHash {
        size_t operator()(DatabaseType t) const {
            return std::hash<int>()(static_cast<int>(t));
        }
    };

    mutable std::mutex mutex_;
    std::unordered_map<DatabaseType, Factory, DatabaseTypeHash> factories_;
};

} // namespace sqlrel
