#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace rowmap {

/**
 * @brief Error categories for mapping failures
 */
enum class ErrorCategory {
    NONE,
    INTROSPECTION,
    NO_MATCH,
    INCOMPLETE,
    INSTANTIATION,
    PROPERTY_WRITE,
    NULL_VALUE,
    SIGNATURE_MISMATCH
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:               return "NONE";
        case ErrorCategory::INTROSPECTION:      return "INTROSPECTION";
        case ErrorCategory::NO_MATCH:           return "NO_MATCH";
        case ErrorCategory::INCOMPLETE:         return "INCOMPLETE";
        case ErrorCategory::INSTANTIATION:      return "INSTANTIATION";
        case ErrorCategory::PROPERTY_WRITE:     return "PROPERTY_WRITE";
        case ErrorCategory::NULL_VALUE:         return "NULL_VALUE";
        case ErrorCategory::SIGNATURE_MISMATCH: return "SIGNATURE_MISMATCH";
        default:                                return "UNKNOWN";
    }
}

// ============================================================================
// Mapping Errors
// ============================================================================

/**
 * @brief Base of every error raised while resolving or applying a mapping plan
 */
class MappingError : public std::runtime_error {
public:
    MappingError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    [[nodiscard]] ErrorCategory category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

// Type is unknown to the introspection strategy or has no usable shape
class IntrospectionError : public MappingError {
public:
    IntrospectionError(std::string type_name, const std::string& detail)
        : MappingError(ErrorCategory::INTROSPECTION,
                       "Cannot introspect type " + type_name + ": " + detail),
          type_name_(std::move(type_name)) {}

    [[nodiscard]] const std::string& type_name() const noexcept { return type_name_; }

private:
    std::string type_name_;
};

class NoMatchingColumnsError : public MappingError {
public:
    explicit NoMatchingColumnsError(std::string type_name)
        : MappingError(ErrorCategory::NO_MATCH,
                       "Mapping type " + type_name +
                       " didn't find any matching columns in result set"),
          type_name_(std::move(type_name)) {}

    [[nodiscard]] const std::string& type_name() const noexcept { return type_name_; }

private:
    std::string type_name_;
};

class IncompleteMappingError : public MappingError {
public:
    IncompleteMappingError(std::string type_name, size_t matched, size_t total)
        : MappingError(ErrorCategory::INCOMPLETE,
                       "Mapping type " + type_name + " only matched properties for " +
                       std::to_string(matched) + " of " + std::to_string(total) + " columns"),
          type_name_(std::move(type_name)), matched_(matched), total_(total) {}

    [[nodiscard]] const std::string& type_name() const noexcept { return type_name_; }
    [[nodiscard]] size_t matched() const noexcept { return matched_; }
    [[nodiscard]] size_t total() const noexcept { return total_; }

private:
    std::string type_name_;
    size_t matched_;
    size_t total_;
};

class InstantiationError : public MappingError {
public:
    InstantiationError(std::string type_name, const std::string& cause)
        : MappingError(ErrorCategory::INSTANTIATION,
                       "Type " + type_name + " was mapped but is not instantiable: " + cause),
          type_name_(std::move(type_name)) {}

    [[nodiscard]] const std::string& type_name() const noexcept { return type_name_; }

private:
    std::string type_name_;
};

/**
 * @brief A converted column value could not be written to its property
 *
 * Carries the property name and the underlying cause so the caller can tell
 * which slot of which row failed.
 */
class PropertyWriteError : public MappingError {
public:
    PropertyWriteError(std::string property, std::string cause)
        : PropertyWriteError(ErrorCategory::PROPERTY_WRITE, std::move(property),
                             std::move(cause)) {}

    [[nodiscard]] const std::string& property() const noexcept { return property_; }
    [[nodiscard]] const std::string& cause() const noexcept { return cause_; }

protected:
    PropertyWriteError(ErrorCategory category, std::string property, std::string cause)
        : MappingError(category, "Unable to write property " + property + ": " + cause),
          property_(std::move(property)), cause_(std::move(cause)) {}

private:
    std::string property_;
    std::string cause_;
};

// SQL NULL reached a slot that cannot represent it (anything but std::optional)
class NullValueError : public PropertyWriteError {
public:
    explicit NullValueError(std::string property)
        : PropertyWriteError(ErrorCategory::NULL_VALUE, std::move(property),
                             "NULL value for non-nullable property") {}
};

// ============================================================================
// Transaction Errors
// ============================================================================

class TransactionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class TransactionIsolationConflictError : public TransactionError {
public:
    TransactionIsolationConflictError(IsolationLevel requested, IsolationLevel current)
        : TransactionError(std::string("Tried to execute nested transaction(") +
                           isolation_level_to_string(requested) +
                           "), but already running in a transaction with isolation level " +
                           isolation_level_to_string(current) + "."),
          requested_(requested), current_(current) {}

    [[nodiscard]] IsolationLevel requested() const noexcept { return requested_; }
    [[nodiscard]] IsolationLevel current() const noexcept { return current_; }

private:
    IsolationLevel requested_;
    IsolationLevel current_;
};

} // namespace rowmap
