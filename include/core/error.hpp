#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace edgeguard {

/**
 * @brief Error categories for the admission engine
 */
enum class ErrorCategory {
    NONE,
    CONFIG_ERROR,
    STORE_UNAVAILABLE
};

[[nodiscard]] inline constexpr const char* error_category_to_string(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::NONE:              return "none";
        case ErrorCategory::CONFIG_ERROR:      return "config_error";
        case ErrorCategory::STORE_UNAVAILABLE: return "store_unavailable";
    }
    return "unknown";
}

/**
 * @brief Thrown by a window store when a transaction cannot be executed
 * (connection lost, timeout, script failure).
 */
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

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

} // namespace edgeguard
