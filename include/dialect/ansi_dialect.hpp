#pragma once

#include "dialect/dialect.hpp"

namespace sqlrel {

/**
 * @brief Standard SQL rendering; base for the vendor dialects
 *
 * Identifiers are emitted bare unless they contain characters outside
 * [a-z0-9_], start with a digit or are reserved words, in which case they are
 * double-quoted.
 */
class AnsiDialect : public Dialect {
public:
    [[nodiscard]] DatabaseType type() const override { return DatabaseType::ANSI; }

    [[nodiscard]] std::string inner_join() const override { return "inner join"; }
    [[nodiscard]] std::string left_join() const override { return "left join"; }
    [[nodiscard]] std::string right_join() const override { return "right join"; }
    [[nodiscard]] std::string full_join() const override { return "full join"; }

    [[nodiscard]] std::string quote(std::string_view identifier) const override;
    [[nodiscard]] std::string qualified_name(const Relation& relation) const override;

    [[nodiscard]] std::string table_alias(const Table& table, const std::string& alias) const override;
    [[nodiscard]] std::string view_alias(const View& view, const std::string& alias) const override;
    [[nodiscard]] std::string join(const JoinNode& node) const override;

    [[nodiscard]] std::string projection(const Projection& projection) const override;
    [[nodiscard]] std::string select(const SelectParts& parts) const override;

protected:
    [[nodiscard]] static bool needs_quoting(std::string_view identifier);

    [[nodiscard]] virtual char quote_char() const { return '"'; }

    /** @brief Trailing "limit n offset m" fragment, empty when neither is set */
    [[nodiscard]] virtual std::string limit_offset(const std::optional<size_t>& limit,
                                                   const std::optional<size_t>& offset) const;
};

/**
 * @brief PostgreSQL rendering (standard joins, double-quoted identifiers)
 */
class PostgresDialect : public AnsiDialect {
public:
    [[nodiscard]] DatabaseType type() const override { return DatabaseType::POSTGRESQL; }
};

/**
 * @brief MySQL / MariaDB rendering
 *
 * Backtick quoting. FULL JOIN is not supported by the server and fails at
 * render time. OFFSET requires a LIMIT, so a bare offset uses the maximum row count.
 */
class MySqlDialect : public AnsiDialect {
public:
    [[nodiscard]] DatabaseType type() const override { return DatabaseType::MYSQL; }

    /** @throws OrmError(UNSUPPORTED_FEATURE) */
    [[nodiscard]] std::string full_join() const override;

protected:
    [[nodiscard]] char quote_char() const override { return '`'; }

    [[nodiscard]] std::string limit_offset(const std::optional<size_t>& limit,
                                           const std::optional<size_t>& offset) const override;
};

} // namespace sqlrel
