#include "query/join_node.hpp"
#include "dialect/dialect.hpp"

#include <format>
#include <iterator>

namespace sqlrel {

// ============================================================================
// JoinNode
// ============================================================================

JoinNode::JoinNode(std::shared_ptr<RelationNode> left, std::shared_ptr<RelationNode> right,
                   JoinType type)
    : left_(std::move(left)), right_(std::move(right)), join_type_(type) {
    if (!left_ || !right_) {
        throw OrmError(ErrorCategory::INTERNAL_ERROR, "Join requires both a left and a right node");
    }
}

std::string JoinNode::on() const {
    return "on (" + conditions_expression() + ")";
}

std::shared_ptr<ExplicitJoin> JoinNode::on(std::string condition) const {
    return ExplicitJoin::create(left_, right_, join_type_, std::move(condition));
}

std::vector<Projection> JoinNode::projections() const {
    auto result = left_->projections();
    auto right_projections = right_->projections();
    result.insert(result.end(),
        std::make_move_iterator(right_projections.begin()),
        std::make_move_iterator(right_projections.end()));
    return result;
}

std::vector<std::shared_ptr<const RelationNode>> JoinNode::leaves() const {
    auto result = left_->leaves();
    auto right_leaves = right_->leaves();
    result.insert(result.end(), right_leaves.begin(), right_leaves.end());
    return result;
}

std::shared_ptr<JoinNode> JoinNode::replace_left(std::shared_ptr<RelationNode> new_left) {
    if (!new_left) {
        throw OrmError(ErrorCategory::INTERNAL_ERROR, "Cannot replace left child with a null node");
    }
    left_ = std::move(new_left);
    return std::static_pointer_cast<JoinNode>(shared_from_this());
}

std::shared_ptr<JoinNode> JoinNode::replace_right(std::shared_ptr<RelationNode> new_right) {
    if (!new_right) {
        throw OrmError(ErrorCategory::INTERNAL_ERROR, "Cannot replace right child with a null node");
    }
    right_ = std::move(new_right);
    return std::static_pointer_cast<JoinNode>(shared_from_this());
}

std::shared_ptr<RelationNode> JoinNode::clone() const {
    return clone_shallow()->replace_left(left_->clone())->replace_right(right_->clone());
}

std::string JoinNode::to_sql(const Dialect& dialect) const {
    return dialect.join(*this);
}

// ============================================================================
// ExplicitJoin
// ============================================================================

std::shared_ptr<ExplicitJoin> ExplicitJoin::create(std::shared_ptr<RelationNode> left,
                                                   std::shared_ptr<RelationNode> right,
                                                   JoinType type,
                                                   std::string condition) {
    return std::make_shared<ExplicitJoin>(
        Passkey{}, std::move(left), std::move(right), type, std::move(condition));
}

std::shared_ptr<JoinNode> ExplicitJoin::clone_shallow() const {
    return std::make_shared<ExplicitJoin>(Passkey{}, *this);
}

// ============================================================================
// Association joins
// ============================================================================

std::shared_ptr<ChildToParentJoin> ChildToParentJoin::create(std::shared_ptr<RelationNode> child,
                                                             std::shared_ptr<RelationNode> parent,
                                                             Association association,
                                                             JoinType type) {
    return std::make_shared<ChildToParentJoin>(
        Passkey{}, std::move(child), std::move(parent), std::move(association), type);
}

std::string ChildToParentJoin::conditions_expression() const {
    return std::format("{}.{} = {}.{}",
        left()->alias(), association_.child_column.name,
        right()->alias(), association_.parent_column.name);
}

std::string ChildToParentJoin::rendered_condition(const Dialect& dialect) const {
    return std::format("{}.{} = {}.{}",
        dialect.quote(left()->alias()), dialect.quote(association_.child_column.name),
        dialect.quote(right()->alias()), dialect.quote(association_.parent_column.name));
}

std::shared_ptr<JoinNode> ChildToParentJoin::clone_shallow() const {
    return std::make_shared<ChildToParentJoin>(Passkey{}, *this);
}

std::shared_ptr<ParentToChildJoin> ParentToChildJoin::create(std::shared_ptr<RelationNode> parent,
                                                             std::shared_ptr<RelationNode> child,
                                                             Association association,
                                                             JoinType type) {
    return std::make_shared<ParentToChildJoin>(
        Passkey{}, std::move(parent), std::move(child), std::move(association), type);
}

std::string ParentToChildJoin::conditions_expression() const {
    return std::format("{}.{} = {}.{}",
        right()->alias(), association_.child_column.name,
        left()->alias(), association_.parent_column.name);
}

std::string ParentToChildJoin::rendered_condition(const Dialect& dialect) const {
    return std::format("{}.{} = {}.{}",
        dialect.quote(right()->alias()), dialect.quote(association_.child_column.name),
        dialect.quote(left()->alias()), dialect.quote(association_.parent_column.name));
}

std::shared_ptr<JoinNode> ParentToChildJoin::clone_shallow() const {
    return std::make_shared<ParentToChildJoin>(Passkey{}, *this);
}

} // namespace sqlrel
