#include "query/projection.hpp"
#include "query/relation_node.hpp"
#include "dialect/dialect.hpp"

namespace sqlrel {

Projection::Projection(ProjectionKind kind, std::shared_ptr<const RelationNode> node,
                       std::optional<Column> column, std::string alias)
    : kind_(kind), node_(std::move(node)), column_(std::move(column)), alias_(std::move(alias)) {
    if (!node_) {
        throw OrmError(ErrorCategory::INTERNAL_ERROR, "Projection requires a node");
    }
}

Projection Projection::record(std::shared_ptr<const RelationNode> node) {
    return Projection(ProjectionKind::RECORD, std::move(node), std::nullopt, "");
}

Projection Projection::column(std::shared_ptr<const RelationNode> node, Column column,
                              std::string alias) {
    return Projection(ProjectionKind::COLUMN, std::move(node), std::move(column), std::move(alias));
}

std::vector<Column> Projection::columns() const {
    if (kind_ == ProjectionKind::COLUMN) {
        return {*column_};
    }
    return node_->columns();
}

std::vector<std::string> Projection::sql_aliases() const {
    std::vector<std::string> result;
    if (kind_ == ProjectionKind::COLUMN && !alias_.empty()) {
        result.push_back(alias_);
        return result;
    }
    for (const auto& col : columns()) {
        result.push_back(node_->alias() + "_" + col.name);
    }
    return result;
}

std::string Projection::to_sql(const Dialect& dialect) const {
    return dialect.projection(*this);
}

bool Projection::operator==(const Projection& other) const {
    if (kind_ != other.kind_ || node_ != other.node_ || alias_ != other.alias_) {
        return false;
    }
    if (column_.has_value() != other.column_.has_value()) return false;
    return !column_ || column_->name == other.column_->name;
}

} // namespace sqlrel
