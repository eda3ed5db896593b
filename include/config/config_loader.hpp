#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"

#include <memory>
#include <string>
#include <vector>

namespace sqlrel {

/**
 * @brief Extract typed configuration from a TOML document
 *
 * Sections:
 *   [orm]            dialect = "ansi" | "postgresql" | "mysql" (and aliases)
 *   [logging]        level = "debug" | "info" | "warn" | "error"
 *   [[relations]]    name, schema, kind, definition, primary_key
 *     [[relations.columns]]       name, type, nullable, unique, default
 *     [[relations.associations]]  column, references, parent_column, on_delete, on_update
 *
 * String values may contain ${VAR} references, expanded from the environment.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        OrmConfig config;

        static LoadResult ok(OrmConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from a TOML file
     * @return LoadResult with parsed config and built schema, or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML text
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Build and register every declared relation
     *
     * Relations are created first, then associations are attached (so a
     * relation may reference one declared after it, or itself).
     */
    [[nodiscard]] static Result<std::shared_ptr<Schema>> build_schema(
        const std::vector<RelationConfig>& relations);

    /** @brief Apply the [logging] section to the process-wide log threshold */
    static void apply_logging(const LoggingConfig& logging);

private:
    static LoadResult validate_and_return(OrmConfig config);
    static std::vector<std::string> validate_config(const OrmConfig& config);
};

} // namespace sqlrel
