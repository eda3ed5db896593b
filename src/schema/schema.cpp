#include "schema/schema.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <mutex>

namespace sqlrel {

std::shared_ptr<const Relation> Schema::add(std::shared_ptr<const Relation> relation) {
    if (!relation) {
        throw OrmError(ErrorCategory::SCHEMA_ERROR, "Cannot register a null relation");
    }

    {
        std::unique_lock lock(mutex_);
        const auto& name = relation->qualified_name();
        if (by_name_.contains(name)) {
            throw OrmError(ErrorCategory::SCHEMA_ERROR,
                std::format("Relation {} is already registered", name));
        }
        by_name_.emplace(name, relation);
        ordered_.push_back(relation);
    }

    utils::log::info(std::format("Registered {} {} ({} columns, {} associations)",
        relation->kind() == RelationKind::TABLE ? "table" : "view",
        relation->qualified_name(), relation->columns().size(),
        relation->associations().size()));
    return relation;
}

std::shared_ptr<const Relation> Schema::find(const std::string& qualified_name) const {
    std::shared_lock lock(mutex_);
    const auto it = by_name_.find(qualified_name);
    return (it != by_name_.end()) ? it->second : nullptr;
}

std::shared_ptr<const Relation> Schema::get(const std::string& qualified_name) const {
    auto relation = find(qualified_name);
    if (!relation) {
        throw OrmError(ErrorCategory::SCHEMA_ERROR,
            std::format("Relation {} is not registered", qualified_name));
    }
    return relation;
}

bool Schema::contains(const std::string& qualified_name) const {
    std::shared_lock lock(mutex_);
    return by_name_.contains(qualified_name);
}

size_t Schema::size() const {
    std::shared_lock lock(mutex_);
    return ordered_.size();
}

std::vector<std::shared_ptr<const Relation>> Schema::relations() const {
    std::shared_lock lock(mutex_);
    return ordered_;
}

std::vector<Association> Schema::incoming_associations(const Relation& parent) const {
    std::shared_lock lock(mutex_);
    std::vector<Association> result;
    for (const auto& relation : ordered_) {
        for (const auto& assoc : relation->associations()) {
            if (assoc.parent_relation == parent.qualified_name()) {
                result.push_back(assoc);
            }
        }
    }
    return result;
}

std::vector<std::string> Schema::validate() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> errors;
    for (const auto& relation : ordered_) {
        for (const auto& assoc : relation->associations()) {
            if (!by_name_.contains(assoc.parent_relation)) {
                errors.push_back(std::format("{} references unregistered relation {}",
                    assoc.describe(), assoc.parent_relation));
            }
        }
    }
    return errors;
}

} // namespace sqlrel
