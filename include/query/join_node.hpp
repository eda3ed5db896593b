#pragma once

#include "query/relation_node.hpp"

#include <memory>
#include <string>
#include <vector>

namespace sqlrel {

/**
 * @brief Binary combinator over two nodes
 *
 * A join "is" its left side for further chaining: relation(), alias() and as()
 * all delegate to the left child. Its projections are the left child's
 * followed by the right child's, whatever the join type.
 */
class JoinNode : public RelationNode {
public:
    [[nodiscard]] const Relation& relation() const override { return left_->relation(); }
    [[nodiscard]] const std::string& alias() const override { return left_->alias(); }

    [[nodiscard]] const std::shared_ptr<RelationNode>& left() const { return left_; }
    [[nodiscard]] const std::shared_ptr<RelationNode>& right() const { return right_; }
    [[nodiscard]] JoinType join_type() const { return join_type_; }

    /** @brief Boolean SQL expression joining both sides, built from their current aliases */
    [[nodiscard]] virtual std::string conditions_expression() const = 0;

    /**
     * @brief Join condition as it goes into rendered SQL
     *
     * Generated conditions quote aliases and columns the same way the dialect
     * quotes them in the FROM clause. Caller-supplied conditions are verbatim.
     */
    [[nodiscard]] virtual std::string rendered_condition(const Dialect& /*dialect*/) const {
        return conditions_expression();
    }

    /** @brief The ON subclause, "on (<conditions>)" */
    [[nodiscard]] std::string on() const;

    /** @brief Explicit join over the same children with the given condition instead */
    [[nodiscard]] std::shared_ptr<ExplicitJoin> on(std::string condition) const;

    [[nodiscard]] std::vector<Projection> projections() const override;
    [[nodiscard]] std::vector<std::shared_ptr<const RelationNode>> leaves() const override;

    /** @brief Substitute the left child in place; returns this node */
    std::shared_ptr<JoinNode> replace_left(std::shared_ptr<RelationNode> new_left);

    /** @brief Substitute the right child in place; returns this node */
    std::shared_ptr<JoinNode> replace_right(std::shared_ptr<RelationNode> new_right);

    /** @brief Deep copy: both children are cloned, relations are shared */
    [[nodiscard]] std::shared_ptr<RelationNode> clone() const final;

    /** @brief Rendered by the dialect: left, join keyword, right and ON subclause */
    [[nodiscard]] std::string to_sql(const Dialect& dialect) const override;

protected:
    JoinNode(std::shared_ptr<RelationNode> left, std::shared_ptr<RelationNode> right, JoinType type);
    JoinNode(const JoinNode&) = default;

    void assign_alias(std::string alias) override { left_->as(std::move(alias)); }

    /** @brief Copy of this node that still shares both children */
    [[nodiscard]] virtual std::shared_ptr<JoinNode> clone_shallow() const = 0;

private:
    std::shared_ptr<RelationNode> left_;
    std::shared_ptr<RelationNode> right_;
    JoinType join_type_;
};

/**
 * @brief Join on a caller-supplied SQL condition (self-joins, composite or
 *        non-foreign-key conditions)
 */
class ExplicitJoin : public JoinNode {
public:
    [[nodiscard]] static std::shared_ptr<ExplicitJoin> create(std::shared_ptr<RelationNode> left,
                                                              std::shared_ptr<RelationNode> right,
                                                              JoinType type,
                                                              std::string condition);

    [[nodiscard]] std::string conditions_expression() const override { return condition_; }

    ExplicitJoin(Passkey, std::shared_ptr<RelationNode> left, std::shared_ptr<RelationNode> right,
                 JoinType type, std::string condition)
        : JoinNode(std::move(left), std::move(right), type), condition_(std::move(condition)) {}
    ExplicitJoin(Passkey, const ExplicitJoin& other) : ExplicitJoin(other) {}

protected:
    [[nodiscard]] std::shared_ptr<JoinNode> clone_shallow() const override;

private:
    ExplicitJoin(const ExplicitJoin&) = default;

    std::string condition_;
};

/**
 * @brief Association join in ascending direction: left is the child, right the parent
 */
class ChildToParentJoin : public JoinNode {
public:
    [[nodiscard]] static std::shared_ptr<ChildToParentJoin> create(std::shared_ptr<RelationNode> child,
                                                                   std::shared_ptr<RelationNode> parent,
                                                                   Association association,
                                                                   JoinType type);

    [[nodiscard]] const Association& association() const { return association_; }

    // <child alias>.<child column> = <parent alias>.<parent column>
    [[nodiscard]] std::string conditions_expression() const override;
    [[nodiscard]] std::string rendered_condition(const Dialect& dialect) const override;

    ChildToParentJoin(Passkey, std::shared_ptr<RelationNode> child, std::shared_ptr<RelationNode> parent,
                      Association association, JoinType type)
        : JoinNode(std::move(child), std::move(parent), type), association_(std::move(association)) {}
    ChildToParentJoin(Passkey, const ChildToParentJoin& other) : ChildToParentJoin(other) {}

protected:
    [[nodiscard]] std::shared_ptr<JoinNode> clone_shallow() const override;

private:
    ChildToParentJoin(const ChildToParentJoin&) = default;

    Association association_;
};

/**
 * @brief Association join in descending direction: left is the parent, right the child
 */
class ParentToChildJoin : public JoinNode {
public:
    [[nodiscard]] static std::shared_ptr<ParentToChildJoin> create(std::shared_ptr<RelationNode> parent,
                                                                   std::shared_ptr<RelationNode> child,
                                                                   Association association,
                                                                   JoinType type);

    [[nodiscard]] const Association& association() const { return association_; }

    // <child alias>.<child column> = <parent alias>.<parent column>
    [[nodiscard]] std::string conditions_expression() const override;
    [[nodiscard]] std::string rendered_condition(const Dialect& dialect) const override;

    ParentToChildJoin(Passkey, std::shared_ptr<RelationNode> parent, std::shared_ptr<RelationNode> child,
                      Association association, JoinType type)
        : JoinNode(std::move(parent), std::move(child), type), association_(std::move(association)) {}
    ParentToChildJoin(Passkey, const ParentToChildJoin& other) : ParentToChildJoin(other) {}

protected:
    [[nodiscard]] std::shared_ptr<JoinNode> clone_shallow() const override;

private:
    ParentToChildJoin(const ParentToChildJoin&) = default;

    Association association_;
};

} // namespace sqlrel
