#pragma once

#include "schema/association.hpp"
#include "schema/column.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sqlrel {

enum class RelationKind {
    TABLE,
    VIEW
};

/**
 * @brief Schema-level description of a named source of rows
 *
 * A relation is built once (columns, primary key, outgoing associations) and
 * then registered; after registration it is only reachable through
 * shared_ptr<const Relation> and is shared by every query that references it.
 *
 * Identity is the qualified name ("schema.name", or "name" without schema).
 */
class Relation {
public:
    virtual ~Relation() = default;

    Relation(const Relation&) = delete;
    Relation& operator=(const Relation&) = delete;

    [[nodiscard]] virtual RelationKind kind() const = 0;

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& schema_name() const { return schema_; }
    [[nodiscard]] const std::string& qualified_name() const { return qualified_name_; }

    [[nodiscard]] const std::vector<Column>& columns() const { return columns_; }
    [[nodiscard]] const Column* find_column(const std::string& column_name) const;

    /** @brief Primary key column, or nullptr when none was declared */
    [[nodiscard]] const Column* primary_key() const;

    /** @brief Associations declared on this relation (this relation is the child) */
    [[nodiscard]] const std::vector<Association>& associations() const { return associations_; }

    /** @brief Every association from this relation to the given parent */
    [[nodiscard]] std::vector<const Association*> associations_to(const Relation& parent) const;

    // ---- Descriptor building (before registration) -------------------------

    /**
     * @brief Append a column
     * @throws OrmError(SCHEMA_ERROR) on empty or duplicate column name
     */
    Relation& add_column(Column column);

    /**
     * @brief Mark an existing column as the primary key
     * @throws OrmError(SCHEMA_ERROR) if the column does not exist
     */
    Relation& set_primary_key(const std::string& column_name);

    /**
     * @brief Declare a foreign key from one of this relation's columns to parent
     *
     * parent_column defaults to the parent's primary key. The child column type
     * must be comparable with the parent column type.
     *
     * @throws OrmError(SCHEMA_ERROR) on unknown columns, missing parent key or
     *         incomparable types
     */
    Association references(const std::string& child_column,
                           const Relation& parent,
                           ForeignKeyAction on_delete = ForeignKeyAction::NO_ACTION,
                           ForeignKeyAction on_update = ForeignKeyAction::NO_ACTION,
                           const std::optional<std::string>& parent_column = std::nullopt);

    bool operator==(const Relation& other) const {
        return qualified_name_ == other.qualified_name_;
    }

protected:
    /** @brief Tag that limits concrete relation constructors to the create() factories */
    struct Passkey {
        explicit Passkey() = default;
    };

    Relation(std::string name, std::string schema);

private:
    std::string name_;
    std::string schema_;
    std::string qualified_name_;
    std::vector<Column> columns_;
    std::unordered_map<std::string, size_t> column_index_;  // name -> index
    std::optional<size_t> primary_key_;
    std::vector<Association> associations_;
};

class Table : public Relation {
public:
    [[nodiscard]] static std::shared_ptr<Table> create(std::string name, std::string schema = "");

    Table(Passkey, std::string name, std::string schema)
        : Relation(std::move(name), std::move(schema)) {}

    [[nodiscard]] RelationKind kind() const override { return RelationKind::TABLE; }
};

class View : public Relation {
public:
    [[nodiscard]] static std::shared_ptr<View> create(std::string name, std::string schema = "",
                                                      std::string definition = "");

    View(Passkey, std::string name, std::string schema, std::string definition)
        : Relation(std::move(name), std::move(schema)), definition_(std::move(definition)) {}

    [[nodiscard]] RelationKind kind() const override { return RelationKind::VIEW; }

    /** @brief Defining query ("select ..."), may be empty */
    [[nodiscard]] const std::string& definition() const { return definition_; }

private:
    std::string definition_;
};

} // namespace sqlrel
