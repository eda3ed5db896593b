#include "dialect/ansi_dialect.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "query/join_node.hpp"
#include "query/projection.hpp"
#include "schema/relation.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>

namespace sqlrel {

// ============================================================================
// Dialect
// ============================================================================

std::string Dialect::join_keyword(JoinType type) const {
    switch (type) {
        case JoinType::INNER: return inner_join();
        case JoinType::LEFT: return left_join();
        case JoinType::RIGHT: return right_join();
        case JoinType::FULL: return full_join();
    }
    return left_join();
}

// ============================================================================
// AnsiDialect
// ============================================================================

namespace {

// Words reserved by the standard or by PostgreSQL/MySQL that are likely to
// show up as aliases or column names
constexpr std::array<std::string_view, 62> kReservedWords = {
    "all", "and", "any", "as", "asc", "between", "both", "by", "case", "check",
    "column", "constraint", "create", "cross", "current_date", "current_time",
    "current_user", "default", "delete", "desc", "distinct", "drop", "else", "end",
    "except", "exists", "false", "fetch", "for", "foreign", "from", "full", "group",
    "having", "in", "index", "inner", "insert", "intersect", "into", "is", "join",
    "key", "left", "like", "limit", "natural", "not", "null", "offset", "on", "or",
    "order", "outer", "primary", "references", "right", "select", "table", "union",
    "user", "where",
};

} // anonymous namespace

bool AnsiDialect::needs_quoting(std::string_view identifier) {
    if (identifier.empty()) return true;
    if (std::isdigit(static_cast<unsigned char>(identifier.front()))) return true;
    for (const char c : identifier) {
        const auto uc = static_cast<unsigned char>(c);
        if (!(std::islower(uc) || std::isdigit(uc) || c == '_')) {
            return true;
        }
    }
    return std::find(kReservedWords.begin(), kReservedWords.end(), identifier) != kReservedWords.end();
}

std::string AnsiDialect::quote(std::string_view identifier) const {
    if (!needs_quoting(identifier)) {
        return std::string(identifier);
    }
    const char q = quote_char();
    std::string result;
    result.reserve(identifier.size() + 2);
    result += q;
    for (const char c : identifier) {
        if (c == q) result += q;    // Embedded quote characters are doubled
        result += c;
    }
    result += q;
    return result;
}

std::string AnsiDialect::qualified_name(const Relation& relation) const {
    if (relation.schema_name().empty()) {
        return quote(relation.name());
    }
    return quote(relation.schema_name()) + "." + quote(relation.name());
}

std::string AnsiDialect::table_alias(const Table& table, const std::string& alias) const {
    return qualified_name(table) + " as " + quote(alias);
}

std::string AnsiDialect::view_alias(const View& view, const std::string& alias) const {
    return qualified_name(view) + " as " + quote(alias);
}

std::string AnsiDialect::join(const JoinNode& node) const {
    std::string right = node.right()->to_sql(*this);
    // A nested join on the right must stay grouped
    if (dynamic_cast<const JoinNode*>(node.right().get())) {
        right = "(" + right + ")";
    }
    return std::format("{} {} {} on ({})",
        node.left()->to_sql(*this), join_keyword(node.join_type()), right,
        node.rendered_condition(*this));
}

std::string AnsiDialect::projection(const Projection& projection) const {
    const auto columns = projection.columns();
    const auto aliases = projection.sql_aliases();
    const auto& node_alias = projection.node().alias();

    std::vector<std::string> items;
    items.reserve(columns.size());
    for (size_t i = 0; i < columns.size() && i < aliases.size(); ++i) {
        items.push_back(std::format("{}.{} as {}",
            quote(node_alias), quote(columns[i].name), quote(aliases[i])));
    }
    return utils::join(items, ", ");
}

std::string AnsiDialect::select(const SelectParts& parts) const {
    std::string sql = "select " + utils::join(parts.projections, ", ") + " from " + parts.from;

    if (!parts.restrictions.empty()) {
        sql += " where ";
        if (parts.restrictions.size() == 1) {
            sql += parts.restrictions.front();
        } else {
            for (size_t i = 0; i < parts.restrictions.size(); ++i) {
                if (i > 0) sql += " and ";
                sql += "(" + parts.restrictions[i] + ")";
            }
        }
    }

    if (!parts.orders.empty()) {
        sql += " order by " + utils::join(parts.orders, ", ");
    }

    sql += limit_offset(parts.limit, parts.offset);
    return sql;
}

std::string AnsiDialect::limit_offset(const std::optional<size_t>& limit,
                                      const std::optional<size_t>& offset) const {
    std::string result;
    if (limit) result += std::format(" limit {}", *limit);
    if (offset) result += std::format(" offset {}", *offset);
    return result;
}

// ============================================================================
// MySqlDialect
// ============================================================================

std::string MySqlDialect::full_join() const {
    throw OrmError(ErrorCategory::UNSUPPORTED_FEATURE, "MySQL does not support full outer joins");
}

std::string MySqlDialect::limit_offset(const std::optional<size_t>& limit,
                                       const std::optional<size_t>& offset) const {
    if (offset && !limit) {
        return std::format(" limit 18446744073709551615 offset {}", *offset);
    }
    return AnsiDialect::limit_offset(limit, offset);
}

} // namespace sqlrel
