#include "query/relation_node.hpp"
#include "query/criteria.hpp"
#include "query/join_node.hpp"
#include "dialect/dialect.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlrel {

namespace {

std::optional<Association> single_association(const Relation& child, const Relation& parent) {
    const auto candidates = child.associations_to(parent);
    if (candidates.empty()) return std::nullopt;
    if (candidates.size() > 1) {
        std::vector<std::string> described;
        described.reserve(candidates.size());
        for (const auto* assoc : candidates) {
            described.push_back(assoc->describe());
        }
        throw OrmError(ErrorCategory::AMBIGUOUS_ASSOCIATION,
            std::format("Found {} associations from {} to {} ({}); specify one explicitly",
                candidates.size(), child.qualified_name(), parent.qualified_name(),
                utils::join(described, ", ")));
    }
    return *candidates.front();
}

} // anonymous namespace

// ============================================================================
// RelationNode
// ============================================================================

std::shared_ptr<RelationNode> RelationNode::as(std::string alias) {
    assign_alias(std::move(alias));
    return shared_from_this();
}

std::vector<Projection> RelationNode::projections() const {
    return {record()};
}

std::vector<std::shared_ptr<const RelationNode>> RelationNode::leaves() const {
    return {shared_from_this()};
}

Projection RelationNode::record() const {
    return Projection::record(shared_from_this());
}

Projection RelationNode::projection(const std::string& column_name, std::string alias) const {
    const Column* column = relation().find_column(column_name);
    if (!column) {
        throw OrmError(ErrorCategory::SCHEMA_ERROR,
            std::format("Relation {} has no column {}", relation_name(), column_name));
    }
    return Projection::column(shared_from_this(), *column, std::move(alias));
}

// Join nodes resolve relation() through their left child, so both lookups
// below compare innermost relations however deeply the nodes are nested.

std::optional<Association> RelationNode::get_parent_association(const RelationNode& target) const {
    return get_parent_association(target.relation());
}

std::optional<Association> RelationNode::get_parent_association(const Relation& target) const {
    return single_association(relation(), target);
}

std::optional<Association> RelationNode::get_child_association(const RelationNode& target) const {
    return get_child_association(target.relation());
}

std::optional<Association> RelationNode::get_child_association(const Relation& target) const {
    return single_association(target, relation());
}

// ---- Joins ------------------------------------------------------------------

Result<std::shared_ptr<JoinNode>> RelationNode::infer_join(std::shared_ptr<RelationNode> node,
                                                           JoinType type) {
    if (!node) {
        return Result<std::shared_ptr<JoinNode>>::error(
            ErrorCategory::INTERNAL_ERROR, "Cannot join with a null node");
    }

    try {
        if (auto assoc = get_parent_association(*node)) {
            utils::log::debug(std::format("Inferred child-to-parent join on {}", assoc->describe()));
            std::shared_ptr<JoinNode> result =
                ChildToParentJoin::create(shared_from_this(), std::move(node), std::move(*assoc), type);
            return Result<std::shared_ptr<JoinNode>>::ok(std::move(result));
        }
        if (auto assoc = get_child_association(*node)) {
            utils::log::debug(std::format("Inferred parent-to-child join on {}", assoc->describe()));
            std::shared_ptr<JoinNode> result =
                ParentToChildJoin::create(shared_from_this(), std::move(node), std::move(*assoc), type);
            return Result<std::shared_ptr<JoinNode>>::ok(std::move(result));
        }
    } catch (const OrmError& e) {
        return Result<std::shared_ptr<JoinNode>>::error(e.category(), e.what());
    }

    return Result<std::shared_ptr<JoinNode>>::error(ErrorCategory::ASSOCIATION_NOT_FOUND,
        std::format("Failed to join {} with {}: no associations found",
            relation_name(), node->relation_name()));
}

Result<std::shared_ptr<JoinNode>> RelationNode::try_join(std::shared_ptr<RelationNode> node,
                                                         JoinType type) {
    return infer_join(std::move(node), type);
}

std::shared_ptr<JoinNode> RelationNode::join(std::shared_ptr<RelationNode> node, JoinType type) {
    auto result = infer_join(std::move(node), type);
    if (!result) {
        utils::log::warn(std::format("{} ({})", result.error_message(),
            error_category_to_string(result.error_category())));
    }
    return std::move(result.value_or_throw());
}

std::shared_ptr<JoinNode> RelationNode::join(std::shared_ptr<RelationNode> node,
                                             const Association& association,
                                             JoinType type) {
    if (!node) {
        throw OrmError(ErrorCategory::INTERNAL_ERROR, "Cannot join with a null node");
    }
    const auto& self_name = relation_name();
    const auto& node_name = node->relation_name();

    if (association.connects(self_name, node_name)) {
        return ChildToParentJoin::create(shared_from_this(), std::move(node), association, type);
    }
    if (association.connects(node_name, self_name)) {
        return ParentToChildJoin::create(shared_from_this(), std::move(node), association, type);
    }
    throw OrmError(ErrorCategory::INVALID_ASSOCIATION,
        std::format("Association {} does not connect {} and {}",
            association.describe(), self_name, node_name));
}

std::shared_ptr<ExplicitJoin> RelationNode::join(std::shared_ptr<RelationNode> node,
                                                 const std::string& on,
                                                 JoinType type) {
    if (!node) {
        throw OrmError(ErrorCategory::INTERNAL_ERROR, "Cannot join with a null node");
    }
    return ExplicitJoin::create(shared_from_this(), std::move(node), type, on);
}

std::shared_ptr<JoinNode> RelationNode::left_join(std::shared_ptr<RelationNode> node) {
    return join(std::move(node), JoinType::LEFT);
}

std::shared_ptr<JoinNode> RelationNode::left_join(std::shared_ptr<RelationNode> node,
                                                  const Association& association) {
    return join(std::move(node), association, JoinType::LEFT);
}

std::shared_ptr<ExplicitJoin> RelationNode::left_join(std::shared_ptr<RelationNode> node,
                                                      const std::string& on) {
    return join(std::move(node), on, JoinType::LEFT);
}

std::shared_ptr<JoinNode> RelationNode::right_join(std::shared_ptr<RelationNode> node) {
    return join(std::move(node), JoinType::RIGHT);
}

std::shared_ptr<JoinNode> RelationNode::right_join(std::shared_ptr<RelationNode> node,
                                                   const Association& association) {
    return join(std::move(node), association, JoinType::RIGHT);
}

std::shared_ptr<ExplicitJoin> RelationNode::right_join(std::shared_ptr<RelationNode> node,
                                                       const std::string& on) {
    return join(std::move(node), on, JoinType::RIGHT);
}

std::shared_ptr<JoinNode> RelationNode::inner_join(std::shared_ptr<RelationNode> node) {
    return join(std::move(node), JoinType::INNER);
}

std::shared_ptr<JoinNode> RelationNode::inner_join(std::shared_ptr<RelationNode> node,
                                                   const Association& association) {
    return join(std::move(node), association, JoinType::INNER);
}

std::shared_ptr<ExplicitJoin> RelationNode::inner_join(std::shared_ptr<RelationNode> node,
                                                       const std::string& on) {
    return join(std::move(node), on, JoinType::INNER);
}

std::shared_ptr<JoinNode> RelationNode::full_join(std::shared_ptr<RelationNode> node) {
    return join(std::move(node), JoinType::FULL);
}

std::shared_ptr<JoinNode> RelationNode::full_join(std::shared_ptr<RelationNode> node,
                                                  const Association& association) {
    return join(std::move(node), association, JoinType::FULL);
}

std::shared_ptr<ExplicitJoin> RelationNode::full_join(std::shared_ptr<RelationNode> node,
                                                      const std::string& on) {
    return join(std::move(node), on, JoinType::FULL);
}

Criteria RelationNode::criteria(std::shared_ptr<const Dialect> dialect) const {
    return Criteria(shared_from_this(), std::move(dialect));
}

// ============================================================================
// Leaf nodes
// ============================================================================

LeafNode::LeafNode(std::shared_ptr<const Relation> relation)
    : relation_(std::move(relation)) {
    if (!relation_) {
        throw OrmError(ErrorCategory::INTERNAL_ERROR, "Relation node requires a relation");
    }
}

std::shared_ptr<RelationNode> LeafNode::select(std::vector<std::string> column_names) {
    for (const auto& name : column_names) {
        if (!relation_->find_column(name)) {
            throw OrmError(ErrorCategory::SCHEMA_ERROR,
                std::format("Relation {} has no column {}", relation_->qualified_name(), name));
        }
    }
    selected_columns_ = std::move(column_names);
    return shared_from_this();
}

std::vector<Projection> LeafNode::projections() const {
    if (selected_columns_.empty()) {
        return RelationNode::projections();
    }
    std::vector<Projection> result;
    result.reserve(selected_columns_.size());
    for (const auto& name : selected_columns_) {
        result.push_back(projection(name));
    }
    return result;
}

std::shared_ptr<TableNode> TableNode::create(std::shared_ptr<const Table> table) {
    return std::make_shared<TableNode>(Passkey{}, std::move(table));
}

std::shared_ptr<RelationNode> TableNode::clone() const {
    return std::make_shared<TableNode>(Passkey{}, *this);
}

std::string TableNode::to_sql(const Dialect& dialect) const {
    return dialect.table_alias(table(), alias());
}

std::shared_ptr<ViewNode> ViewNode::create(std::shared_ptr<const View> view) {
    return std::make_shared<ViewNode>(Passkey{}, std::move(view));
}

std::shared_ptr<RelationNode> ViewNode::clone() const {
    return std::make_shared<ViewNode>(Passkey{}, *this);
}

std::string ViewNode::to_sql(const Dialect& dialect) const {
    return dialect.view_alias(view(), alias());
}

std::shared_ptr<LeafNode> make_node(const std::shared_ptr<const Relation>& relation,
                                    std::string alias) {
    if (!relation) {
        throw OrmError(ErrorCategory::INTERNAL_ERROR, "Relation node requires a relation");
    }

    std::shared_ptr<LeafNode> node;
    switch (relation->kind()) {
        case RelationKind::TABLE:
            if (auto table = std::dynamic_pointer_cast<const Table>(relation)) {
                node = TableNode::create(std::move(table));
            }
            break;
        case RelationKind::VIEW:
            if (auto view = std::dynamic_pointer_cast<const View>(relation)) {
                node = ViewNode::create(std::move(view));
            }
            break;
    }
    if (!node) {
        throw OrmError(ErrorCategory::INTERNAL_ERROR,
            std::format("Relation {} does not match its declared kind", relation->qualified_name()));
    }
    node->as(std::move(alias));
    return node;
}

} // namespace sqlrel
