#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sqlrel {

class Schema;

// ============================================================================
// Configuration Types (mirror the TOML layout)
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

struct ColumnConfig {
    std::string name;
    std::string type;
    bool nullable = true;
    bool unique = false;
    std::optional<std::string> default_value;
};

struct AssociationConfig {
    std::string column;                         // Child column on the declaring relation
    std::string references;                     // Parent relation, qualified or plain name
    std::optional<std::string> parent_column;   // Defaults to the parent's primary key
    std::string on_delete = "no_action";
    std::string on_update = "no_action";
};

struct RelationConfig {
    std::string name;
    std::string schema;
    std::string kind = "table";                 // "table" | "view"
    std::string definition;                     // View query, ignored for tables
    std::optional<std::string> primary_key;
    std::vector<ColumnConfig> columns;
    std::vector<AssociationConfig> associations;

    [[nodiscard]] std::string qualified_name() const {
        return schema.empty() ? name : (schema + "." + name);
    }
};

struct OrmConfig {
    std::string dialect = "ansi";
    LoggingConfig logging;
    std::vector<RelationConfig> relations;

    // Built from `relations` once the config has been validated
    std::shared_ptr<Schema> schema;
};

} // namespace sqlrel
