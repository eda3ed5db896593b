#pragma once

#include "schema/column.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sqlrel {

class Dialect;
class RelationNode;

enum class ProjectionKind {
    RECORD,     // Every column of a node
    COLUMN      // A single column of a node
};

/**
 * @brief Descriptor of the output columns one node contributes to a query
 *
 * A projection is bound to the node it was created from, so the SQL it renders
 * always uses that node's current alias.
 */
class Projection {
public:
    [[nodiscard]] static Projection record(std::shared_ptr<const RelationNode> node);
    [[nodiscard]] static Projection column(std::shared_ptr<const RelationNode> node,
                                           Column column,
                                           std::string alias = "");

    [[nodiscard]] ProjectionKind kind() const { return kind_; }
    [[nodiscard]] const RelationNode& node() const { return *node_; }
    [[nodiscard]] const std::shared_ptr<const RelationNode>& node_ptr() const { return node_; }

    /** @brief Column for COLUMN projections, nullopt for RECORD projections */
    [[nodiscard]] const std::optional<Column>& target_column() const { return column_; }

    /** @brief Columns read by this projection, in select-list order */
    [[nodiscard]] std::vector<Column> columns() const;

    /**
     * @brief Output aliases, one per column ("<node alias>_<column>" unless an
     *        explicit alias was given for a COLUMN projection)
     */
    [[nodiscard]] std::vector<std::string> sql_aliases() const;

    [[nodiscard]] std::string to_sql(const Dialect& dialect) const;

    // Same node object, same kind, same column and output alias
    bool operator==(const Projection& other) const;

private:
    Projection(ProjectionKind kind, std::shared_ptr<const RelationNode> node,
               std::optional<Column> column, std::string alias);

    ProjectionKind kind_;
    std::shared_ptr<const RelationNode> node_;
    std::optional<Column> column_;
    std::string alias_;
};

} // namespace sqlrel
