#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace gatekeeper {

/**
 * @brief Error categories carried by Result<T>
 *
 * Denials, config and upstream failures are reported through their own
 * channels (AdmissionDecision, ConfigError, RpcError), not Result<T>.
 */
enum class ErrorCategory {
    NONE,
    NOT_FOUND
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

/**
 * @brief Misconfiguration detected at registration/startup time
 *
 * Thrown for limit entries with limit <= 0 or window <= 0, empty or
 * duplicate names, and policies that reference unknown limits.
 */
class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace gatekeeper
