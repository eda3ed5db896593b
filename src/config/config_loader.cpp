#include "config/config_loader.hpp"
#include "core/column_type.hpp"
#include "core/database_type.hpp"
#include "core/utils.hpp"
#include "schema/schema.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

using namespace std::string_literals;

namespace sqlrel {

// ============================================================================
// TOML Parsing Helpers
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

std::optional<std::string> toml_optional_string(const toml::table& tbl, const std::string_view key) {
    if (const auto* v = tbl[key].as_string()) {
        return std::string(v->get());
    }
    return std::nullopt;
}

// ---- Section extractors ----------------------------------------------------

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

std::string extract_dialect(const toml::table& root) {
    const auto* orm = root["orm"].as_table();
    if (!orm) return "ansi";
    return (*orm)["dialect"].value_or("ansi"s);
}

std::vector<ColumnConfig> extract_columns(const toml::table& relation) {
    std::vector<ColumnConfig> result;
    const auto* arr = relation["columns"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        const auto* c = elem.as_table();
        if (!c) continue;

        ColumnConfig cfg;
        cfg.name = (*c)["name"].value_or(""s);
        cfg.type = (*c)["type"].value_or(""s);
        cfg.nullable = (*c)["nullable"].value_or(true);
        cfg.unique = (*c)["unique"].value_or(false);
        cfg.default_value = toml_optional_string(*c, "default");
        result.push_back(std::move(cfg));
    }
    return result;
}

std::vector<AssociationConfig> extract_associations(const toml::table& relation) {
    std::vector<AssociationConfig> result;
    const auto* arr = relation["associations"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        const auto* a = elem.as_table();
        if (!a) continue;

        AssociationConfig cfg;
        cfg.column = (*a)["column"].value_or(""s);
        cfg.references = (*a)["references"].value_or(""s);
        cfg.parent_column = toml_optional_string(*a, "parent_column");
        cfg.on_delete = (*a)["on_delete"].value_or("no_action"s);
        cfg.on_update = (*a)["on_update"].value_or("no_action"s);
        result.push_back(std::move(cfg));
    }
    return result;
}

std::vector<RelationConfig> extract_relations(const toml::table& root) {
    std::vector<RelationConfig> result;
    const auto* arr = root["relations"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        const auto* r = elem.as_table();
        if (!r) continue;

        RelationConfig cfg;
        cfg.name = (*r)["name"].value_or(""s);
        cfg.schema = (*r)["schema"].value_or(""s);
        cfg.kind = utils::to_lower((*r)["kind"].value_or("table"s));
        cfg.definition = (*r)["definition"].value_or(""s);
        cfg.primary_key = toml_optional_string(*r, "primary_key");
        cfg.columns = extract_columns(*r);
        cfg.associations = extract_associations(*r);
        result.push_back(std::move(cfg));
    }
    return result;
}

OrmConfig extract_all_sections(const toml::table& tbl) {
    OrmConfig config;
    config.dialect = extract_dialect(tbl);
    config.logging = extract_logging(tbl);
    config.relations = extract_relations(tbl);
    return config;
}

/**
 * @brief Find the relation an association points at
 *
 * Tries the name as written, then qualified with the declaring relation's
 * schema, then as a plain name shared by exactly one relation.
 */
const RelationConfig* resolve_reference(const std::vector<RelationConfig>& relations,
                                        const RelationConfig& declaring,
                                        const std::string& reference) {
    std::vector<const RelationConfig*> by_plain_name;
    const std::string same_schema = declaring.schema.empty()
        ? reference : (declaring.schema + "." + reference);

    for (const auto& r : relations) {
        if (r.qualified_name() == reference) return &r;
    }
    for (const auto& r : relations) {
        if (r.qualified_name() == same_schema) return &r;
    }
    for (const auto& r : relations) {
        if (r.name == reference) by_plain_name.push_back(&r);
    }
    return (by_plain_name.size() == 1) ? by_plain_name.front() : nullptr;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

Result<std::shared_ptr<Schema>> ConfigLoader::build_schema(
    const std::vector<RelationConfig>& relations) {

    auto schema = std::make_shared<Schema>();
    std::unordered_map<std::string, std::shared_ptr<Relation>> built;

    try {
        // Pass 1: relations, columns, primary keys
        for (const auto& rc : relations) {
            std::shared_ptr<Relation> relation;
            if (rc.kind == "view") {
                relation = View::create(rc.name, rc.schema, rc.definition);
            } else {
                relation = Table::create(rc.name, rc.schema);
            }

            for (const auto& cc : rc.columns) {
                const auto type = parse_column_type(cc.type);
                if (!type) {
                    return Result<std::shared_ptr<Schema>>::error(ErrorCategory::CONFIG_ERROR,
                        std::format("{}.{}: unknown column type '{}'",
                            rc.qualified_name(), cc.name, cc.type));
                }
                Column column(cc.name, *type, cc.nullable);
                column.unique = cc.unique;
                column.default_value = cc.default_value;
                relation->add_column(std::move(column));
            }

            if (rc.primary_key) {
                relation->set_primary_key(*rc.primary_key);
            }
            built.emplace(rc.qualified_name(), std::move(relation));
        }

        // Pass 2: associations (every parent now exists)
        for (const auto& rc : relations) {
            auto& child = built.at(rc.qualified_name());
            for (const auto& ac : rc.associations) {
                const RelationConfig* parent_cfg = resolve_reference(relations, rc, ac.references);
                if (!parent_cfg) {
                    return Result<std::shared_ptr<Schema>>::error(ErrorCategory::CONFIG_ERROR,
                        std::format("{}.{}: referenced relation '{}' is not declared",
                            rc.qualified_name(), ac.column, ac.references));
                }
                const auto on_delete = parse_foreign_key_action(ac.on_delete);
                const auto on_update = parse_foreign_key_action(ac.on_update);
                if (!on_delete || !on_update) {
                    return Result<std::shared_ptr<Schema>>::error(ErrorCategory::CONFIG_ERROR,
                        std::format("{}.{}: unknown referential action", rc.qualified_name(), ac.column));
                }
                [[maybe_unused]] const auto assoc = child->references(ac.column,
                    *built.at(parent_cfg->qualified_name()), *on_delete, *on_update, ac.parent_column);
            }
        }

        // Pass 3: freeze and register in declaration order
        for (const auto& rc : relations) {
            schema->add(built.at(rc.qualified_name()));
        }
    } catch (const OrmError& e) {
        return Result<std::shared_ptr<Schema>>::error(e.category(), e.what());
    }

    return Result<std::shared_ptr<Schema>>::ok(std::move(schema));
}

void ConfigLoader::apply_logging(const LoggingConfig& logging) {
    if (const auto level = utils::log::parse_level(logging.level)) {
        utils::log::set_level(*level);
    } else {
        utils::log::warn(std::format("Unknown log level '{}', keeping current level", logging.level));
    }
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(OrmConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }

    auto schema = build_schema(config.relations);
    if (schema.is_error()) {
        return ConfigLoader::LoadResult::error(
            std::format("Failed to build schema: {}", schema.error_message()));
    }
    config.schema = std::move(schema.value());
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const OrmConfig& config) {
    std::vector<std::string> errors;

    try {
        [[maybe_unused]] const auto type = parse_database_type(config.dialect);
    } catch (const std::runtime_error&) {
        errors.push_back(std::format("orm.dialect '{}' is not a known dialect", config.dialect));
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level '{}' must be debug, info, warn or error",
            config.logging.level));
    }

    std::unordered_set<std::string> names;
    for (size_t i = 0; i < config.relations.size(); ++i) {
        const auto& rc = config.relations[i];
        if (rc.name.empty()) {
            errors.push_back(std::format("relations[{}].name must not be empty", i));
            continue;
        }
        if (!names.insert(rc.qualified_name()).second) {
            errors.push_back(std::format("relations[{}]: duplicate relation {}", i, rc.qualified_name()));
        }
        if (rc.kind != "table" && rc.kind != "view") {
            errors.push_back(std::format("relations[{}].kind must be table or view, got '{}'", i, rc.kind));
        }
        for (size_t j = 0; j < rc.columns.size(); ++j) {
            if (rc.columns[j].name.empty()) {
                errors.push_back(std::format("relations[{}].columns[{}].name must not be empty", i, j));
            }
            if (!parse_column_type(rc.columns[j].type)) {
                errors.push_back(std::format("relations[{}].columns[{}].type '{}' is not supported",
                    i, j, rc.columns[j].type));
            }
        }
        for (size_t j = 0; j < rc.associations.size(); ++j) {
            const auto& ac = rc.associations[j];
            if (ac.column.empty() || ac.references.empty()) {
                errors.push_back(std::format(
                    "relations[{}].associations[{}] requires column and references", i, j));
            }
            if (!parse_foreign_key_action(ac.on_delete)) {
                errors.push_back(std::format("relations[{}].associations[{}].on_delete '{}' is not valid",
                    i, j, ac.on_delete));
            }
            if (!parse_foreign_key_action(ac.on_update)) {
                errors.push_back(std::format("relations[{}].associations[{}].on_update '{}' is not valid",
                    i, j, ac.on_update));
            }
        }
    }

    return errors;
}

} // namespace sqlrel
