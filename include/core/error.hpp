#pragma once

#include <string>
#include <optional>

namespace urlrelay {

/**
 * @brief Error categories for the relay
 *
 * CONFIG_ERROR is fatal at startup; every other category is contained in
 * a single request/response cycle.
 */
enum class ErrorCategory {
    NONE,
    CONFIG_ERROR,
    ORIGIN_DENIED,
    AUTH_DENIED,
    MALFORMED_REQUEST,
    OPEN_FAILURE,
    INTERNAL_ERROR
};

inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "NONE";
        case ErrorCategory::CONFIG_ERROR: return "CONFIG_ERROR";
        case ErrorCategory::ORIGIN_DENIED: return "ORIGIN_DENIED";
        case ErrorCategory::AUTH_DENIED: return "AUTH_DENIED";
        case ErrorCategory::MALFORMED_REQUEST: return "MALFORMED_REQUEST";
        case ErrorCategory::OPEN_FAILURE: return "OPEN_FAILURE";
        case ErrorCategory::INTERNAL_ERROR: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
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

} // namespace urlrelay
