#include "query/criteria.hpp"
#include "query/join_node.hpp"
#include "core/utils.hpp"

#include <format>
#include <unordered_map>
#include <unordered_set>

namespace sqlrel {

namespace {

void collect_leaves(const std::shared_ptr<RelationNode>& node,
                    std::vector<std::shared_ptr<RelationNode>>& out) {
    if (const auto* join = dynamic_cast<const JoinNode*>(node.get())) {
        collect_leaves(join->left(), out);
        collect_leaves(join->right(), out);
        return;
    }
    out.push_back(node);
}

} // anonymous namespace

Criteria::Criteria(const std::shared_ptr<const RelationNode>& root,
                   std::shared_ptr<const Dialect> dialect)
    : dialect_(std::move(dialect)) {
    if (!root) {
        throw OrmError(ErrorCategory::INTERNAL_ERROR, "Criteria requires a root node");
    }
    if (!dialect_) {
        throw OrmError(ErrorCategory::INTERNAL_ERROR, "Criteria requires a dialect");
    }
    root_ = root->clone();
    resolve_aliases();
    check_output_names();
}

void Criteria::resolve_aliases() {
    std::vector<std::shared_ptr<RelationNode>> leaves;
    collect_leaves(root_, leaves);

    std::unordered_set<std::string> taken;
    for (const auto& leaf : leaves) {
        if (leaf->alias() == RelationNode::kDefaultAlias) continue;
        if (!taken.insert(leaf->alias()).second) {
            throw OrmError(ErrorCategory::DUPLICATE_ALIAS,
                std::format("Alias {} is used by more than one node in the query", leaf->alias()));
        }
    }

    for (const auto& leaf : leaves) {
        if (leaf->alias() != RelationNode::kDefaultAlias) continue;
        std::string alias;
        do {
            alias = std::format("{}_{}", RelationNode::kDefaultAlias, ++alias_counter_);
        } while (taken.contains(alias));
        taken.insert(alias);
        utils::log::debug(std::format("Aliased {} as {}", leaf->relation_name(), alias));
        leaf->as(std::move(alias));
    }
}

void Criteria::check_output_names() const {
    std::unordered_map<std::string, std::string> sources;  // output name -> alias.column
    for (const auto& projection : projections()) {
        const auto columns = projection.columns();
        const auto names = projection.sql_aliases();
        for (size_t i = 0; i < names.size() && i < columns.size(); ++i) {
            std::string source = projection.node().alias() + "." + columns[i].name;
            const auto [it, inserted] = sources.emplace(names[i], source);
            if (!inserted) {
                throw OrmError(ErrorCategory::DUPLICATE_ALIAS,
                    std::format("Output column {} is produced by both {} and {}",
                        names[i], it->second, source));
            }
        }
    }
}

std::vector<Projection> Criteria::projections() const {
    return root_->projections();
}

std::vector<QualifiedColumn> Criteria::columns() const {
    std::vector<QualifiedColumn> result;
    for (const auto& leaf : root_->leaves()) {
        for (const auto& col : leaf->columns()) {
            result.push_back(QualifiedColumn{leaf->alias(), col});
        }
    }
    return result;
}

QualifiedColumn Criteria::column(const std::string& alias, const std::string& column_name) const {
    for (const auto& leaf : root_->leaves()) {
        if (leaf->alias() != alias) continue;
        if (const Column* col = leaf->relation().find_column(column_name)) {
            return QualifiedColumn{alias, *col};
        }
        throw OrmError(ErrorCategory::SCHEMA_ERROR,
            std::format("Relation {} (alias {}) has no column {}",
                leaf->relation_name(), alias, column_name));
    }
    throw OrmError(ErrorCategory::SCHEMA_ERROR,
        std::format("No node aliased {} in this query", alias));
}

std::string Criteria::from_clause() const {
    return root_->to_sql(*dialect_);
}

Criteria& Criteria::add(std::string restriction) {
    restrictions_.push_back(std::move(restriction));
    return *this;
}

Criteria& Criteria::add_order(std::string expression) {
    orders_.push_back(std::move(expression));
    return *this;
}

Criteria& Criteria::limit(size_t n) {
    limit_ = n;
    return *this;
}

Criteria& Criteria::offset(size_t n) {
    offset_ = n;
    return *this;
}

std::string Criteria::to_sql() const {
    SelectParts parts;
    for (const auto& projection : projections()) {
        parts.projections.push_back(projection.to_sql(*dialect_));
    }
    parts.from = from_clause();
    parts.restrictions = restrictions_;
    parts.orders = orders_;
    parts.limit = limit_;
    parts.offset = offset_;
    return dialect_->select(parts);
}

} // namespace sqlrel
