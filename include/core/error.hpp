#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace logcleaner {

/**
 * @brief Error categories for a cleaning run
 *
 * Only MALFORMED_INPUT is recovered locally (per line). Every other
 * category ends the run it occurs in.
 */
enum class ErrorCategory {
    NONE,
    CONFIG_ERROR,
    IO_ERROR,
    MALFORMED_INPUT,
    RULE_EVALUATION_ERROR,
    BACKUP_FAILURE,
    COMMIT_FAILURE,
    RENAME_FAILURE
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                  return "none";
        case ErrorCategory::CONFIG_ERROR:          return "config_error";
        case ErrorCategory::IO_ERROR:              return "io_error";
        case ErrorCategory::MALFORMED_INPUT:       return "malformed_input";
        case ErrorCategory::RULE_EVALUATION_ERROR: return "rule_evaluation_error";
        case ErrorCategory::BACKUP_FAILURE:        return "backup_failure";
        case ErrorCategory::COMMIT_FAILURE:        return "commit_failure";
        case ErrorCategory::RENAME_FAILURE:        return "rename_failure";
    }
    return "unknown";
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

/**
 * @brief Raised by the rule engine when a predicate fails on a parsed record
 */
class RuleEvaluationError : public std::runtime_error {
public:
    RuleEvaluationError(std::string rule_name, size_t line_number, const std::string& what)
        : std::runtime_error(what),
          rule_name_(std::move(rule_name)),
          line_number_(line_number) {}

    [[nodiscard]] const std::string& rule_name() const { return rule_name_; }
    [[nodiscard]] size_t line_number() const { return line_number_; }

private:
    std::string rule_name_;
    size_t line_number_;
};

} // namespace logcleaner
