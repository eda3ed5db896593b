#pragma once

#include "core/column_type.hpp"

#include <optional>
#include <string>

namespace sqlrel {

/**
 * @brief Column descriptor
 *
 * Opaque value data for the query layer. relation_name is filled in when the
 * column is added to a relation.
 */
struct Column {
    std::string name;
    GenericColumnType type = GenericColumnType::UNKNOWN;
    bool nullable = true;
    bool unique = false;
    std::optional<std::string> default_value;   // SQL expression
    std::string relation_name;                  // Qualified name of the owning relation

    Column() = default;
    Column(std::string n, GenericColumnType t, bool is_nullable = true)
        : name(std::move(n)), type(t), nullable(is_nullable) {}

    bool operator==(const Column&) const = default;
};

} // namespace sqlrel
