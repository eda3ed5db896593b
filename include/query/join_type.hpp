#pragma once

#include <string_view>

namespace sqlrel {

/**
 * @brief Join flavour; the SQL keyword is supplied by the active dialect
 */
enum class JoinType {
    INNER,
    LEFT,
    RIGHT,
    FULL
};

[[nodiscard]] inline std::string_view join_type_to_string(JoinType type) {
    switch (type) {
        case JoinType::INNER: return "inner";
        case JoinType::LEFT: return "left";
        case JoinType::RIGHT: return "right";
        case JoinType::FULL: return "full";
    }
    return "left";
}

} // namespace sqlrel
