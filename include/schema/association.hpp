#pragma once

#include "schema/column.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace sqlrel {

/**
 * @brief Referential action applied to the child rows when the parent row changes
 */
enum class ForeignKeyAction {
    NO_ACTION,
    RESTRICT,
    CASCADE,
    SET_NULL,
    SET_DEFAULT
};

[[nodiscard]] std::string_view foreign_key_action_to_string(ForeignKeyAction action);

// Accepts "no_action", "no action", "restrict", "cascade", "set_null", "set null", ...
[[nodiscard]] std::optional<ForeignKeyAction> parse_foreign_key_action(std::string_view name);

/**
 * @brief Directed foreign-key edge: child relation/column -> parent relation/column
 *
 * Identity is the (child relation, parent relation, child column) triple.
 * Relations are referenced by qualified name so descriptors can point at each
 * other (including themselves) without ownership cycles.
 */
struct Association {
    std::string child_relation;
    std::string parent_relation;
    Column child_column;
    Column parent_column;
    ForeignKeyAction on_delete = ForeignKeyAction::NO_ACTION;
    ForeignKeyAction on_update = ForeignKeyAction::NO_ACTION;

    [[nodiscard]] bool connects(std::string_view child, std::string_view parent) const {
        return child_relation == child && parent_relation == parent;
    }

    [[nodiscard]] bool is_self_reference() const {
        return child_relation == parent_relation;
    }

    // child_rel.child_col -> parent_rel.parent_col
    [[nodiscard]] std::string describe() const;

    bool operator==(const Association& other) const {
        return child_relation == other.child_relation &&
               parent_relation == other.parent_relation &&
               child_column.name == other.child_column.name;
    }
};

} // namespace sqlrel
