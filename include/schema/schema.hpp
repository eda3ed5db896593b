#pragma once

#include "schema/relation.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sqlrel {

/**
 * @brief Registry of immutable relation descriptors
 *
 * Relations are registered once at startup and are read-only afterwards.
 * Lookups take a shared lock, so concurrent query builders may read the
 * registry while it is still being populated.
 *
 * The registry also answers the reverse question a relation cannot answer on
 * its own: which associations point *at* a given relation.
 */
class Schema {
public:
    Schema() = default;

    Schema(const Schema&) = delete;
    Schema& operator=(const Schema&) = delete;

    /**
     * @brief Register a finished relation descriptor
     * @throws OrmError(SCHEMA_ERROR) if a relation with the same qualified name exists
     */
    std::shared_ptr<const Relation> add(std::shared_ptr<const Relation> relation);

    /** @brief Lookup by qualified name, nullptr if unknown */
    [[nodiscard]] std::shared_ptr<const Relation> find(const std::string& qualified_name) const;

    /**
     * @brief Lookup by qualified name
     * @throws OrmError(SCHEMA_ERROR) if unknown
     */
    [[nodiscard]] std::shared_ptr<const Relation> get(const std::string& qualified_name) const;

    [[nodiscard]] bool contains(const std::string& qualified_name) const;
    [[nodiscard]] size_t size() const;

    /** @brief All relations in registration order */
    [[nodiscard]] std::vector<std::shared_ptr<const Relation>> relations() const;

    /** @brief Associations declared by any registered relation with parent as target */
    [[nodiscard]] std::vector<Association> incoming_associations(const Relation& parent) const;

    /**
     * @brief Check that every association targets a registered relation
     * @return One message per dangling association (empty when consistent)
     */
    [[nodiscard]] std::vector<std::string> validate() const;

private:
    mutable std::shared_mutex mutex_;
    std::vector<std::shared_ptr<const Relation>> ordered_;
    std::unordered_map<std::string, std::shared_ptr<const Relation>> by_name_;
};

} // namespace sqlrel
