#pragma once

#include "dialect/dialect.hpp"
#include "query/projection.hpp"
#include "query/relation_node.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sqlrel {

/**
 * @brief Column of a leaf node, qualified by that node's alias
 */
struct QualifiedColumn {
    std::string alias;
    Column column;

    [[nodiscard]] std::string full_name() const { return alias + "." + column.name; }

    /** @brief full_name() quoted for use in restrictions and orderings */
    [[nodiscard]] std::string full_name(const Dialect& dialect) const {
        return dialect.quote(alias) + "." + dialect.quote(column.name);
    }
};

/**
 * @brief SELECT builder over a relation-node tree
 *
 * The criteria works on its own deep copy of the tree, so the caller's nodes
 * are never renamed. Every leaf of the copy still carrying the "this" sentinel
 * is renamed to "this_<n>", where n comes from a counter owned by this
 * criteria (never shared with other queries). Aliases already taken in the
 * tree are skipped. Two leaves with the same explicit alias are rejected, and
 * so are two select-list items that would get the same output name (leaves
 * "x" and "x_book" both yield "x_book_id" for a book_id and an id column).
 *
 * Thread-safety: none; one criteria belongs to one query build.
 */
class Criteria {
public:
    /**
     * @throws OrmError(DUPLICATE_ALIAS) if two leaves share an alias or two
     *         projected columns share an output name
     * @throws OrmError(INTERNAL_ERROR) on a null root or dialect
     */
    Criteria(const std::shared_ptr<const RelationNode>& root, std::shared_ptr<const Dialect> dialect);

    [[nodiscard]] const RelationNode& root() const { return *root_; }
    [[nodiscard]] const Dialect& dialect() const { return *dialect_; }

    /** @brief Select list of the whole tree, left to right */
    [[nodiscard]] std::vector<Projection> projections() const;

    /** @brief Every column of every leaf, for predicate building */
    [[nodiscard]] std::vector<QualifiedColumn> columns() const;

    /**
     * @brief Column of the leaf with the given alias
     * @throws OrmError(SCHEMA_ERROR) if there is no such leaf or column
     */
    [[nodiscard]] QualifiedColumn column(const std::string& alias, const std::string& column_name) const;

    /** @brief Rendered node/join tree */
    [[nodiscard]] std::string from_clause() const;

    /** @brief AND a raw SQL predicate onto the WHERE clause */
    Criteria& add(std::string restriction);

    /** @brief Append an ORDER BY expression ("b.title desc") */
    Criteria& add_order(std::string expression);

    Criteria& limit(size_t n);
    Criteria& offset(size_t n);

    [[nodiscard]] const std::vector<std::string>& restrictions() const { return restrictions_; }
    [[nodiscard]] const std::vector<std::string>& orders() const { return orders_; }

    [[nodiscard]] std::string to_sql() const;

private:
    void resolve_aliases();
    void check_output_names() const;

    std::shared_ptr<RelationNode> root_;
    std::shared_ptr<const Dialect> dialect_;
    size_t alias_counter_ = 0;
    std::vector<std::string> restrictions_;
    std::vector<std::string> orders_;
    std::optional<size_t> limit_;
    std::optional<size_t> offset_;
};

} // namespace sqlrel
