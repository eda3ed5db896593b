#pragma once

#include "core/error.hpp"
#include "query/join_type.hpp"
#include "query/projection.hpp"
#include "schema/relation.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlrel {

class Criteria;
class Dialect;
class JoinNode;
class ExplicitJoin;

/**
 * @brief A relation (or a join sub-tree) tagged with a query-scoped alias
 *
 * Nodes are always owned through std::shared_ptr (every concrete node is built
 * by a static create()), which lets fluent calls such as as() and join() hand
 * back the same node.
 *
 * Equality and hashing look only at the underlying relation's qualified name,
 * never at the alias: two nodes wrapping the same relation are equal however
 * they are aliased.
 *
 * Trees are not shared between queries. A node that must appear in a second
 * join position has to be clone()d first.
 */
class RelationNode : public std::enable_shared_from_this<RelationNode> {
public:
    /** Sentinel alias, replaced by a query-unique alias when a Criteria is built */
    static constexpr std::string_view kDefaultAlias = "this";

    virtual ~RelationNode() = default;

    /** @brief Innermost relation; join nodes delegate to their left child */
    [[nodiscard]] virtual const Relation& relation() const = 0;

    [[nodiscard]] virtual const std::string& alias() const = 0;

    /** @brief Reassign the alias in place and return this node */
    std::shared_ptr<RelationNode> as(std::string alias);

    /**
     * @brief Independent copy of this node
     *
     * Leaves are copied shallowly (same relation, same alias); joins are copied
     * deeply (both children cloned recursively). Relations are never copied.
     */
    [[nodiscard]] virtual std::shared_ptr<RelationNode> clone() const = 0;

    [[nodiscard]] virtual std::vector<Projection> projections() const;

    /** @brief Leaf nodes of this sub-tree, left to right */
    [[nodiscard]] virtual std::vector<std::shared_ptr<const RelationNode>> leaves() const;

    /** @brief FROM-clause fragment for this node */
    [[nodiscard]] virtual std::string to_sql(const Dialect& dialect) const = 0;

    // ---- Relation proxies --------------------------------------------------

    [[nodiscard]] const std::string& relation_name() const { return relation().qualified_name(); }
    [[nodiscard]] const std::vector<Column>& columns() const { return relation().columns(); }
    [[nodiscard]] const Column* primary_key() const { return relation().primary_key(); }
    [[nodiscard]] const std::vector<Association>& associations() const {
        return relation().associations();
    }

    // ---- Projections -------------------------------------------------------

    /** @brief Whole-record projection of this node */
    [[nodiscard]] Projection record() const;

    /**
     * @brief Single-column projection of this node
     * @throws OrmError(SCHEMA_ERROR) if the relation has no such column
     */
    [[nodiscard]] Projection projection(const std::string& column_name,
                                        std::string alias = "") const;

    // ---- Association lookup ------------------------------------------------

    /**
     * @brief Association declared by this node's relation pointing at target's
     * @throws OrmError(AMBIGUOUS_ASSOCIATION) if more than one exists
     */
    [[nodiscard]] std::optional<Association> get_parent_association(const RelationNode& target) const;
    [[nodiscard]] std::optional<Association> get_parent_association(const Relation& target) const;

    /**
     * @brief Association declared by target's relation pointing at this node's
     * @throws OrmError(AMBIGUOUS_ASSOCIATION) if more than one exists
     */
    [[nodiscard]] std::optional<Association> get_child_association(const RelationNode& target) const;
    [[nodiscard]] std::optional<Association> get_child_association(const Relation& target) const;

    // ---- Joins -------------------------------------------------------------
    //
    // Without an association or condition the association is inferred: first
    // this -> node (child-to-parent), then node -> this (parent-to-child).
    // Unspecified join type means LEFT.

    /** @throws OrmError(ASSOCIATION_NOT_FOUND | AMBIGUOUS_ASSOCIATION) */
    std::shared_ptr<JoinNode> join(std::shared_ptr<RelationNode> node,
                                   JoinType type = JoinType::LEFT);

    /** @throws OrmError(INVALID_ASSOCIATION) if the association does not connect both nodes */
    std::shared_ptr<JoinNode> join(std::shared_ptr<RelationNode> node,
                                   const Association& association,
                                   JoinType type = JoinType::LEFT);

    std::shared_ptr<ExplicitJoin> join(std::shared_ptr<RelationNode> node,
                                       const std::string& on,
                                       JoinType type = JoinType::LEFT);

    /** @brief Inferring join that reports failure instead of throwing */
    [[nodiscard]] Result<std::shared_ptr<JoinNode>> try_join(std::shared_ptr<RelationNode> node,
                                                             JoinType type = JoinType::LEFT);

    std::shared_ptr<JoinNode> left_join(std::shared_ptr<RelationNode> node);
    std::shared_ptr<JoinNode> left_join(std::shared_ptr<RelationNode> node, const Association& association);
    std::shared_ptr<ExplicitJoin> left_join(std::shared_ptr<RelationNode> node, const std::string& on);

    std::shared_ptr<JoinNode> right_join(std::shared_ptr<RelationNode> node);
    std::shared_ptr<JoinNode> right_join(std::shared_ptr<RelationNode> node, const Association& association);
    std::shared_ptr<ExplicitJoin> right_join(std::shared_ptr<RelationNode> node, const std::string& on);

    std::shared_ptr<JoinNode> inner_join(std::shared_ptr<RelationNode> node);
    std::shared_ptr<JoinNode> inner_join(std::shared_ptr<RelationNode> node, const Association& association);
    std::shared_ptr<ExplicitJoin> inner_join(std::shared_ptr<RelationNode> node, const std::string& on);

    std::shared_ptr<JoinNode> full_join(std::shared_ptr<RelationNode> node);
    std::shared_ptr<JoinNode> full_join(std::shared_ptr<RelationNode> node, const Association& association);
    std::shared_ptr<ExplicitJoin> full_join(std::shared_ptr<RelationNode> node, const std::string& on);

    /** @brief Query over a deep copy of this tree */
    [[nodiscard]] Criteria criteria(std::shared_ptr<const Dialect> dialect) const;

    // ---- Identity ----------------------------------------------------------

    bool operator==(const RelationNode& other) const { return relation() == other.relation(); }
    bool operator==(const Relation& other) const { return relation() == other; }

    [[nodiscard]] size_t hash() const { return std::hash<std::string>{}(relation_name()); }

protected:
    /** @brief Tag that limits concrete node constructors to the create() factories */
    struct Passkey {
        explicit Passkey() = default;
    };

    RelationNode() = default;
    RelationNode(const RelationNode&) = default;

    virtual void assign_alias(std::string alias) = 0;

private:
    [[nodiscard]] Result<std::shared_ptr<JoinNode>> infer_join(std::shared_ptr<RelationNode> node,
                                                               JoinType type);
};

/**
 * @brief Common state of nodes that wrap a relation directly
 */
class LeafNode : public RelationNode {
public:
    [[nodiscard]] const Relation& relation() const override { return *relation_; }
    [[nodiscard]] const std::shared_ptr<const Relation>& relation_ptr() const { return relation_; }
    [[nodiscard]] const std::string& alias() const override { return alias_; }

    /**
     * @brief Restrict this node's projections to the given columns
     *
     * An empty list restores the default whole-record projection.
     * @throws OrmError(SCHEMA_ERROR) on unknown columns
     */
    std::shared_ptr<RelationNode> select(std::vector<std::string> column_names);

    [[nodiscard]] std::vector<Projection> projections() const override;

protected:
    explicit LeafNode(std::shared_ptr<const Relation> relation);
    LeafNode(const LeafNode&) = default;

    void assign_alias(std::string alias) override { alias_ = std::move(alias); }

private:
    std::shared_ptr<const Relation> relation_;
    std::string alias_{kDefaultAlias};
    std::vector<std::string> selected_columns_;
};

class TableNode : public LeafNode {
public:
    [[nodiscard]] static std::shared_ptr<TableNode> create(std::shared_ptr<const Table> table);

    [[nodiscard]] const Table& table() const { return static_cast<const Table&>(relation()); }

    [[nodiscard]] std::shared_ptr<RelationNode> clone() const override;

    /** @brief Qualified name with alias, e.g. "myschema.mytable as myalias" */
    [[nodiscard]] std::string to_sql(const Dialect& dialect) const override;

    TableNode(Passkey, std::shared_ptr<const Table> table) : LeafNode(std::move(table)) {}
    TableNode(Passkey, const TableNode& other) : TableNode(other) {}

private:
    TableNode(const TableNode&) = default;
};

class ViewNode : public LeafNode {
public:
    [[nodiscard]] static std::shared_ptr<ViewNode> create(std::shared_ptr<const View> view);

    [[nodiscard]] const View& view() const { return static_cast<const View&>(relation()); }

    [[nodiscard]] std::shared_ptr<RelationNode> clone() const override;

    [[nodiscard]] std::string to_sql(const Dialect& dialect) const override;

    ViewNode(Passkey, std::shared_ptr<const View> view) : LeafNode(std::move(view)) {}
    ViewNode(Passkey, const ViewNode& other) : ViewNode(other) {}

private:
    ViewNode(const ViewNode&) = default;
};

/**
 * @brief Leaf node for any registered relation (TableNode or ViewNode by kind)
 * @throws OrmError(INTERNAL_ERROR) if the relation's dynamic type does not match its kind
 */
[[nodiscard]] std::shared_ptr<LeafNode> make_node(const std::shared_ptr<const Relation>& relation,
                                                  std::string alias = std::string(RelationNode::kDefaultAlias));

// Hash/equality over node identity for unordered containers of node handles
struct RelationNodeHash {
    size_t operator()(const std::shared_ptr<const RelationNode>& node) const {
        return node ? node->hash() : 0;
    }
};

struct RelationNodeEqual {
    bool operator()(const std::shared_ptr<const RelationNode>& a,
                    const std::shared_ptr<const RelationNode>& b) const {
        if (!a || !b) return a == b;
        return *a == *b;
    }
};

} // namespace sqlrel
