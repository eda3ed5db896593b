#include "schema/relation.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <unordered_map>

namespace sqlrel {

// ============================================================================
// ForeignKeyAction
// ============================================================================

std::string_view foreign_key_action_to_string(ForeignKeyAction action) {
    switch (action) {
        case ForeignKeyAction::NO_ACTION: return "no action";
        case ForeignKeyAction::RESTRICT: return "restrict";
        case ForeignKeyAction::CASCADE: return "cascade";
        case ForeignKeyAction::SET_NULL: return "set null";
        case ForeignKeyAction::SET_DEFAULT: return "set default";
    }
    return "no action";
}

std::optional<ForeignKeyAction> parse_foreign_key_action(std::string_view name) {
    static const std::unordered_map<std::string, ForeignKeyAction> lookup = {
        {"no_action",   ForeignKeyAction::NO_ACTION},
        {"no action",   ForeignKeyAction::NO_ACTION},
        {"restrict",    ForeignKeyAction::RESTRICT},
        {"cascade",     ForeignKeyAction::CASCADE},
        {"set_null",    ForeignKeyAction::SET_NULL},
        {"set null",    ForeignKeyAction::SET_NULL},
        {"set_default", ForeignKeyAction::SET_DEFAULT},
        {"set default", ForeignKeyAction::SET_DEFAULT},
    };

    const auto it = lookup.find(utils::to_lower(name));
    if (it == lookup.end()) return std::nullopt;
    return it->second;
}

std::string Association::describe() const {
    return std::format("{}.{} -> {}.{}",
        child_relation, child_column.name, parent_relation, parent_column.name);
}

// ============================================================================
// Relation
// ============================================================================

Relation::Relation(std::string name, std::string schema)
    : name_(std::move(name)), schema_(std::move(schema)) {
    if (name_.empty()) {
        throw OrmError(ErrorCategory::SCHEMA_ERROR, "Relation name must not be empty");
    }
    qualified_name_ = schema_.empty() ? name_ : (schema_ + "." + name_);
}

const Column* Relation::find_column(const std::string& column_name) const {
    const auto it = column_index_.find(column_name);
    if (it != column_index_.end() && it->second < columns_.size()) {
        return &columns_[it->second];
    }
    return nullptr;
}

const Column* Relation::primary_key() const {
    if (!primary_key_) return nullptr;
    return &columns_[*primary_key_];
}

std::vector<const Association*> Relation::associations_to(const Relation& parent) const {
    std::vector<const Association*> result;
    for (const auto& assoc : associations_) {
        if (assoc.parent_relation == parent.qualified_name()) {
            result.push_back(&assoc);
        }
    }
    return result;
}

Relation& Relation::add_column(Column column) {
    if (column.name.empty()) {
        throw OrmError(ErrorCategory::SCHEMA_ERROR,
            std::format("Column of relation {} must have a name", qualified_name_));
    }
    if (column_index_.contains(column.name)) {
        throw OrmError(ErrorCategory::SCHEMA_ERROR,
            std::format("Duplicate column {} in relation {}", column.name, qualified_name_));
    }
    column.relation_name = qualified_name_;
    column_index_.emplace(column.name, columns_.size());
    columns_.push_back(std::move(column));
    return *this;
}

Relation& Relation::set_primary_key(const std::string& column_name) {
    const auto it = column_index_.find(column_name);
    if (it == column_index_.end()) {
        throw OrmError(ErrorCategory::SCHEMA_ERROR,
            std::format("Primary key column {} not found in relation {}",
                column_name, qualified_name_));
    }
    primary_key_ = it->second;
    // A primary key is implicitly NOT NULL and UNIQUE
    columns_[it->second].nullable = false;
    columns_[it->second].unique = true;
    return *this;
}

Association Relation::references(const std::string& child_column,
                                 const Relation& parent,
                                 ForeignKeyAction on_delete,
                                 ForeignKeyAction on_update,
                                 const std::optional<std::string>& parent_column) {
    const Column* child_col = find_column(child_column);
    if (!child_col) {
        throw OrmError(ErrorCategory::SCHEMA_ERROR,
            std::format("Foreign key column {} not found in relation {}",
                child_column, qualified_name_));
    }

    const Column* parent_col = nullptr;
    if (parent_column) {
        parent_col = parent.find_column(*parent_column);
        if (!parent_col) {
            throw OrmError(ErrorCategory::SCHEMA_ERROR,
                std::format("Referenced column {} not found in relation {}",
                    *parent_column, parent.qualified_name()));
        }
    } else {
        parent_col = parent.primary_key();
        if (!parent_col) {
            throw OrmError(ErrorCategory::SCHEMA_ERROR,
                std::format("Relation {} has no primary key; {}.{} must name the referenced column",
                    parent.qualified_name(), qualified_name_, child_column));
        }
    }

    if (!column_types_comparable(child_col->type, parent_col->type)) {
        throw OrmError(ErrorCategory::SCHEMA_ERROR,
            std::format("Foreign key {}.{} ({}) is not comparable with {}.{} ({})",
                qualified_name_, child_col->name, column_type_to_string(child_col->type),
                parent.qualified_name(), parent_col->name,
                column_type_to_string(parent_col->type)));
    }

    Association assoc;
    assoc.child_relation = qualified_name_;
    assoc.parent_relation = parent.qualified_name();
    assoc.child_column = *child_col;
    assoc.parent_column = *parent_col;
    assoc.on_delete = on_delete;
    assoc.on_update = on_update;

    for (const auto& existing : associations_) {
        if (existing == assoc) {
            throw OrmError(ErrorCategory::SCHEMA_ERROR,
                std::format("Association {} is already declared", assoc.describe()));
        }
    }

    associations_.push_back(assoc);
    return assoc;
}

// ============================================================================
// Table / View
// ============================================================================

std::shared_ptr<Table> Table::create(std::string name, std::string schema) {
    return std::make_shared<Table>(Passkey{}, std::move(name), std::move(schema));
}

std::shared_ptr<View> View::create(std::string name, std::string schema, std::string definition) {
    return std::make_shared<View>(
        Passkey{}, std::move(name), std::move(schema), std::move(definition));
}

} // namespace sqlrel
