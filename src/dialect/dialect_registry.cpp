#include "dialect/dialect_registry.hpp"
#include "dialect/ansi_dialect.hpp"

#include <stdexcept>

namespace sqlrel {

DialectRegistry::DialectRegistry() {
    factories_[DatabaseType::ANSI] = [] { return std::make_shared<const AnsiDialect>(); };
    factories_[DatabaseType::POSTGRESQL] = [] { return std::make_shared<const PostgresDialect>(); };
    factories_[DatabaseType::MYSQL] = [] { return std::make_shared<const MySqlDialect>(); };
}

std::shared_ptr<const Dialect> DialectRegistry::create(DatabaseType type) const {
    Factory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = factories_.find(type);
        if (it == factories_.end()) {
            throw std::runtime_error(
                std::string("No dialect registered for database type: ") +
                std::string(database_type_to_string(type)));
        }
        factory = it->second;
    }
    return factory();
}

} // namespace sqlrel
