#pragma once

#include "core/database_type.hpp"
#include "query/join_type.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlrel {

class JoinNode;
class Projection;
class Relation;
class Table;
class View;

/**
 * @brief Parts of a SELECT statement assembled by Criteria
 */
struct SelectParts {
    std::vector<std::string> projections;   // Rendered select-list items
    std::string from;                       // Rendered node tree
    std::vector<std::string> restrictions;  // AND-ed predicates
    std::vector<std::string> orders;
    std::optional<size_t> limit;
    std::optional<size_t> offset;
};

/**
 * @brief SQL rendering collaborator
 *
 * The query core never writes SQL keywords itself; it asks the active dialect
 * for FROM fragments, join clauses and the final statement.
 *
 * Usage:
 *   auto dialect = DialectRegistry::instance().create(DatabaseType::POSTGRESQL);
 *   std::string from = root->to_sql(*dialect);
 */
class Dialect {
public:
    virtual ~Dialect() = default;

    [[nodiscard]] virtual DatabaseType type() const = 0;

    // ---- Join keywords -----------------------------------------------------

    [[nodiscard]] virtual std::string inner_join() const = 0;
    [[nodiscard]] virtual std::string left_join() const = 0;
    [[nodiscard]] virtual std::string right_join() const = 0;
    [[nodiscard]] virtual std::string full_join() const = 0;

    /** @brief Keyword for the given join type (dispatches to the four above) */
    [[nodiscard]] std::string join_keyword(JoinType type) const;

    // ---- Identifiers -------------------------------------------------------

    /** @brief Quote an identifier when it would not survive unquoted */
    [[nodiscard]] virtual std::string quote(std::string_view identifier) const = 0;

    /** @brief "schema.name" or "name" */
    [[nodiscard]] virtual std::string qualified_name(const Relation& relation) const = 0;

    // ---- FROM clause -------------------------------------------------------

    /** @brief FROM fragment for a table leaf, e.g. "myschema.mytable as myalias" */
    [[nodiscard]] virtual std::string table_alias(const Table& table, const std::string& alias) const = 0;

    /** @brief FROM fragment for a view leaf */
    [[nodiscard]] virtual std::string view_alias(const View& view, const std::string& alias) const = 0;

    /** @brief Full join clause: left, join keyword, right and ON subclause */
    [[nodiscard]] virtual std::string join(const JoinNode& node) const = 0;

    // ---- SELECT ------------------------------------------------------------

    /** @brief Select-list fragment for one projection */
    [[nodiscard]] virtual std::string projection(const Projection& projection) const = 0;

    [[nodiscard]] virtual std::string select(const SelectParts& parts) const = 0;
};

} // namespace sqlrel
