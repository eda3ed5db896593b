#pragma once

#include "core/utils.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace sqlrel {

/**
 * @brief Database-agnostic column type tag
 *
 * Relation descriptors carry this tag for every column. Foreign-key
 * declarations are validated against it.
 */
enum class GenericColumnType : uint16_t {
    UNKNOWN = 0,

    // Integer family
    SMALLINT,
    INTEGER,
    BIGINT,

    // Floating point
    REAL,
    DOUBLE_PRECISION,
    NUMERIC,

    // String family
    TEXT,
    VARCHAR,
    CHAR,

    // Boolean
    BOOLEAN,

    // Date/Time
    DATE,
    TIME,
    TIMESTAMP,
    TIMESTAMP_TZ,

    // Binary
    BLOB,

    // JSON
    JSON,
    JSONB,

    // UUID
    UUID,
};

/**
 * @brief Scalar domain a column type belongs to
 *
 * Two columns are comparable when they share a family.
 */
enum class ColumnTypeFamily : uint8_t {
    UNKNOWN,
    INTEGER,
    FLOATING,
    STRING,
    BOOLEAN,
    TEMPORAL,
    BINARY,
    JSON,
    UUID,
};

[[nodiscard]] inline ColumnTypeFamily column_type_family(GenericColumnType type) {
    switch (type) {
        case GenericColumnType::SMALLINT:
        case GenericColumnType::INTEGER:
        case GenericColumnType::BIGINT:
            return ColumnTypeFamily::INTEGER;
        case GenericColumnType::REAL:
        case GenericColumnType::DOUBLE_PRECISION:
        case GenericColumnType::NUMERIC:
            return ColumnTypeFamily::FLOATING;
        case GenericColumnType::TEXT:
        case GenericColumnType::VARCHAR:
        case GenericColumnType::CHAR:
            return ColumnTypeFamily::STRING;
        case GenericColumnType::BOOLEAN:
            return ColumnTypeFamily::BOOLEAN;
        case GenericColumnType::DATE:
        case GenericColumnType::TIME:
        case GenericColumnType::TIMESTAMP:
        case GenericColumnType::TIMESTAMP_TZ:
            return ColumnTypeFamily::TEMPORAL;
        case GenericColumnType::BLOB:
            return ColumnTypeFamily::BINARY;
        case GenericColumnType::JSON:
        case GenericColumnType::JSONB:
            return ColumnTypeFamily::JSON;
        case GenericColumnType::UUID:
            return ColumnTypeFamily::UUID;
        case GenericColumnType::UNKNOWN:
            break;
    }
    return ColumnTypeFamily::UNKNOWN;
}

// UNKNOWN is never comparable, not even with itself
[[nodiscard]] inline bool column_types_comparable(GenericColumnType a, GenericColumnType b) {
    const auto fa = column_type_family(a);
    return fa != ColumnTypeFamily::UNKNOWN && fa == column_type_family(b);
}

[[nodiscard]] inline std::string_view column_type_to_string(GenericColumnType type) {
    switch (type) {
        case GenericColumnType::UNKNOWN: return "unknown";
        case GenericColumnType::SMALLINT: return "smallint";
        case GenericColumnType::INTEGER: return "integer";
        case GenericColumnType::BIGINT: return "bigint";
        case GenericColumnType::REAL: return "real";
        case GenericColumnType::DOUBLE_PRECISION: return "double precision";
        case GenericColumnType::NUMERIC: return "numeric";
        case GenericColumnType::TEXT: return "text";
        case GenericColumnType::VARCHAR: return "varchar";
        case GenericColumnType::CHAR: return "char";
        case GenericColumnType::BOOLEAN: return "boolean";
        case GenericColumnType::DATE: return "date";
        case GenericColumnType::TIME: return "time";
        case GenericColumnType::TIMESTAMP: return "timestamp";
        case GenericColumnType::TIMESTAMP_TZ: return "timestamptz";
        case GenericColumnType::BLOB: return "blob";
        case GenericColumnType::JSON: return "json";
        case GenericColumnType::JSONB: return "jsonb";
        case GenericColumnType::UUID: return "uuid";
    }
    return "unknown";
}

/**
 * @brief Map a declared type name ("bigint", "INT8", "varchar") to its tag
 * @return std::nullopt for names outside the supported set
 */
[[nodiscard]] inline std::optional<GenericColumnType> parse_column_type(std::string_view name) {
    static const std::unordered_map<std::string, GenericColumnType> lookup = {
        {"smallint",         GenericColumnType::SMALLINT},
        {"int2",             GenericColumnType::SMALLINT},
        {"integer",          GenericColumnType::INTEGER},
        {"int",              GenericColumnType::INTEGER},
        {"int4",             GenericColumnType::INTEGER},
        {"bigint",           GenericColumnType::BIGINT},
        {"int8",             GenericColumnType::BIGINT},
        {"long",             GenericColumnType::BIGINT},
        {"real",             GenericColumnType::REAL},
        {"float4",           GenericColumnType::REAL},
        {"double",           GenericColumnType::DOUBLE_PRECISION},
        {"double precision", GenericColumnType::DOUBLE_PRECISION},
        {"float8",           GenericColumnType::DOUBLE_PRECISION},
        {"numeric",          GenericColumnType::NUMERIC},
        {"decimal",          GenericColumnType::NUMERIC},
        {"text",             GenericColumnType::TEXT},
        {"string",           GenericColumnType::TEXT},
        {"varchar",          GenericColumnType::VARCHAR},
        {"char",             GenericColumnType::CHAR},
        {"boolean",          GenericColumnType::BOOLEAN},
        {"bool",             GenericColumnType::BOOLEAN},
        {"date",             GenericColumnType::DATE},
        {"time",             GenericColumnType::TIME},
        {"timestamp",        GenericColumnType::TIMESTAMP},
        {"timestamptz",      GenericColumnType::TIMESTAMP_TZ},
        {"blob",             GenericColumnType::BLOB},
        {"bytea",            GenericColumnType::BLOB},
        {"json",             GenericColumnType::JSON},
        {"jsonb",            GenericColumnType::JSONB},
        {"uuid",             GenericColumnType::UUID},
    };

    const auto it = lookup.find(utils::to_lower(utils::trim(std::string(name))));
    if (it == lookup.end()) return std::nullopt;
    return it->second;
}

} // namespace sqlrel
