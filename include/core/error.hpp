#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace dirauth {

/**
 * @brief Failure kinds reported by the directory and authentication layers
 */
enum class AuthFailure {
    NONE,
    TRANSPORT_FAILURE,        // DNS/connect/TLS failure, timeout before a bind
    BIND_FAILURE,             // directory rejected the bind credentials
    DIRECTORY_QUERY_FAILURE,  // search returned nothing or timed out
    GROUP_MEMBERSHIP_DENIED,  // entry is not in any allow-listed group
    INVALID_CREDENTIALS,      // end-user credentials rejected
    CONFIG_ERROR
};

[[nodiscard]] inline constexpr std::string_view failure_name(AuthFailure f) {
    switch (f) {
        case AuthFailure::NONE:                    return "none";
        case AuthFailure::TRANSPORT_FAILURE:       return "transport_failure";
        case AuthFailure::BIND_FAILURE:            return "bind_failure";
        case AuthFailure::DIRECTORY_QUERY_FAILURE: return "directory_query_failure";
        case AuthFailure::GROUP_MEMBERSHIP_DENIED: return "group_membership_denied";
        case AuthFailure::INVALID_CREDENTIALS:     return "invalid_credentials";
        case AuthFailure::CONFIG_ERROR:            return "config_error";
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

    static Result error(AuthFailure failure, std::string message) {
        Result r;
        r.success_ = false;
        r.failure_ = failure;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    AuthFailure failure() const { return failure_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    AuthFailure failure_ = AuthFailure::NONE;
    std::string error_message_;
};

/**
 * @brief Outcome of an operation that produces no value
 */
class Status {
public:
    static Status ok() { return Status{}; }

    static Status error(AuthFailure failure, std::string message) {
        Status s;
        s.failure_ = failure;
        s.error_message_ = std::move(message);
        return s;
    }

    bool is_ok() const { return failure_ == AuthFailure::NONE; }
    bool is_error() const { return !is_ok(); }

    AuthFailure failure() const { return failure_; }
    const std::string& error_message() const { return error_message_; }

    // Carry this failure over into a Result of another type
    template<typename T>
    Result<T> as_result() const {
        return Result<T>::error(failure_, error_message_);
    }

private:
    AuthFailure failure_ = AuthFailure::NONE;
    std::string error_message_;
};

} // namespace dirauth
