#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sqlrel {

/**
 * @brief Error categories for relation, schema and join construction
 */
enum class ErrorCategory {
    NONE,
    ASSOCIATION_NOT_FOUND,
    AMBIGUOUS_ASSOCIATION,
    INVALID_ASSOCIATION,
    DUPLICATE_ALIAS,
    UNSUPPORTED_FEATURE,
    SCHEMA_ERROR,
    CONFIG_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline std::string_view error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "none";
        case ErrorCategory::ASSOCIATION_NOT_FOUND: return "association_not_found";
        case ErrorCategory::AMBIGUOUS_ASSOCIATION: return "ambiguous_association";
        case ErrorCategory::INVALID_ASSOCIATION: return "invalid_association";
        case ErrorCategory::DUPLICATE_ALIAS: return "duplicate_alias";
        case ErrorCategory::UNSUPPORTED_FEATURE: return "unsupported_feature";
        case ErrorCategory::SCHEMA_ERROR: return "schema_error";
        case ErrorCategory::CONFIG_ERROR: return "config_error";
        case ErrorCategory::INTERNAL_ERROR: return "internal_error";
    }
    return "unknown";
}

/**
 * @brief Exception thrown by the fluent construction APIs
 *
 * Every failure is a construction-time failure: the query tree cannot be built.
 */
class OrmError : public std::runtime_error {
public:
    OrmError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    [[nodiscard]] ErrorCategory category() const { return category_; }

private:
    ErrorCategory category_;
};

/**
 * @brief Outcome of a non-throwing construction call
 *
 * Carries either a value or the category and message an OrmError would have
 * carried. value_or_throw() converts back to the throwing form.
 */
template<typename T>
class Result {
public:
    [[nodiscard]] static Result ok(T value) {
        Result r;
        r.value_.emplace(std::move(value));
        return r;
    }

    [[nodiscard]] static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    [[nodiscard]] bool is_ok() const { return value_.has_value(); }
    [[nodiscard]] bool is_error() const { return !value_.has_value(); }
    explicit operator bool() const { return is_ok(); }

    [[nodiscard]] const T& value() const { return *value_; }
    [[nodiscard]] T& value() { return *value_; }

    /** @throws OrmError with the stored category and message on failure */
    [[nodiscard]] T& value_or_throw() {
        if (!value_) {
            throw OrmError(error_category_, error_message_);
        }
        return *value_;
    }

    [[nodiscard]] ErrorCategory error_category() const { return error_category_; }
    [[nodiscard]] const std::string& error_message() const { return error_message_; }

private:
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

} // namespace sqlrel
