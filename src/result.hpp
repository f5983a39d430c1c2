// =============================================================================
// mirrorhub - Result Type for Unified Error Handling
// =============================================================================
// A Result<T, E> type that encapsulates either a success value or an error.
// Every engine operation reports failure through Result<..., Error>; the
// ErrorCode names the failure kind, the message carries the human-readable
// reason and `field` names the offending input for validation errors.
//
// Usage:
//   Result<int> parsePort(const std::string& s) {
//       if (s.empty()) return Err<int>(ErrorCode::ValidationError, "empty", "port");
//       return Ok(std::stoi(s));
//   }
// =============================================================================

#pragma once

#include <variant>
#include <string>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace mirrorhub {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode {
    DeviceUnauthorized,
    DeviceOffline,
    DeviceNotFound,
    DeployFailed,
    SessionStartFailed,
    SessionConflict,
    SessionCrashed,
    SessionNotFound,
    SubscriberAttachFailed,
    StreamNotFound,
    ValidationError,
    Timeout,
    Disconnected,
    PermissionDenied,
    IoError,
    Internal,
};

inline const char* errorCodeName(ErrorCode c) {
    switch (c) {
        case ErrorCode::DeviceUnauthorized:     return "DEVICE_UNAUTHORIZED";
        case ErrorCode::DeviceOffline:          return "DEVICE_OFFLINE";
        case ErrorCode::DeviceNotFound:         return "DEVICE_NOT_FOUND";
        case ErrorCode::DeployFailed:           return "DEPLOY_FAILED";
        case ErrorCode::SessionStartFailed:     return "SESSION_START_FAILED";
        case ErrorCode::SessionConflict:        return "SESSION_CONFLICT";
        case ErrorCode::SessionCrashed:         return "SESSION_CRASHED";
        case ErrorCode::SessionNotFound:        return "SESSION_NOT_FOUND";
        case ErrorCode::SubscriberAttachFailed: return "SUBSCRIBER_ATTACH_FAILED";
        case ErrorCode::StreamNotFound:         return "STREAM_NOT_FOUND";
        case ErrorCode::ValidationError:        return "VALIDATION_ERROR";
        case ErrorCode::Timeout:                return "TIMEOUT";
        case ErrorCode::Disconnected:           return "DISCONNECTED";
        case ErrorCode::PermissionDenied:       return "PERMISSION_DENIED";
        case ErrorCode::IoError:                return "IO_ERROR";
        case ErrorCode::Internal:               return "INTERNAL";
    }
    return "UNKNOWN";
}

struct Error {
    ErrorCode code = ErrorCode::Internal;
    std::string message;
    std::string field;  // offending input, validation errors only

    Error() = default;
    Error(ErrorCode c, std::string msg, std::string fld = {})
        : code(c), message(std::move(msg)), field(std::move(fld)) {}

    bool operator==(const Error& other) const {
        return code == other.code && message == other.message && field == other.field;
    }

    std::string describe() const {
        std::string s = errorCodeName(code);
        if (!field.empty()) s += "(" + field + ")";
        s += ": " + message;
        return s;
    }
};

// =============================================================================
// Result<T, E> Type
// =============================================================================

template<typename T, typename E = Error>
class Result {
public:
    // Success constructor
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

    // Error constructor (from E or derived)
    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(std::in_place_index<1>, E(std::move(error))) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }

    explicit operator bool() const { return is_ok(); }

    // Access value (throws if error)
    T& value() & {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    const T& value() const& {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    T&& value() && {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(std::move(data_));
    }

    // Access error (throws if success)
    E& error() & {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    T value_or(T default_value) const& {
        return is_ok() ? std::get<0>(data_) : std::move(default_value);
    }

    T value_or(T default_value) && {
        return is_ok() ? std::get<0>(std::move(data_)) : std::move(default_value);
    }

    std::optional<T> ok() const& {
        if (is_ok()) return std::get<0>(data_);
        return std::nullopt;
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<1>(data_);
        return std::nullopt;
    }

    template<typename F>
    auto map(F&& f) const& -> Result<decltype(f(std::declval<T>())), E> {
        using U = decltype(f(std::declval<T>()));
        if (is_ok()) return Result<U, E>(f(std::get<0>(data_)));
        return Result<U, E>(std::get<1>(data_));
    }

private:
    std::variant<T, E> data_;
};

// =============================================================================
// Result<void, E> Specialization
// =============================================================================

template<typename E>
class Result<void, E> {
public:
    Result() : data_(std::monostate{}) {}

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(E(std::move(error))) {}

    bool is_ok() const { return std::holds_alternative<std::monostate>(data_); }
    bool is_err() const { return std::holds_alternative<E>(data_); }
    explicit operator bool() const { return is_ok(); }

    void value() const {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
    }

    E& error() & {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<E>(data_);
        return std::nullopt;
    }

private:
    std::variant<std::monostate, E> data_;
};

// =============================================================================
// Helper Functions
// =============================================================================

template<typename T>
Result<std::decay_t<T>, Error> Ok(T&& value) {
    return Result<std::decay_t<T>, Error>(std::forward<T>(value));
}

inline Result<void, Error> Ok() {
    return Result<void, Error>();
}

template<typename T>
Result<T, Error> Err(Error error) {
    return Result<T, Error>(std::move(error));
}

template<typename T>
Result<T, Error> Err(ErrorCode code, std::string message, std::string field = {}) {
    return Result<T, Error>(Error(code, std::move(message), std::move(field)));
}

// =============================================================================
// Macros for Early Return
// =============================================================================

// TRY macro: unwrap result or return error
// Usage: auto value = MIRRORHUB_TRY(some_function());
#define MIRRORHUB_TRY(expr) \
    ({ \
        auto _result = (expr); \
        if (_result.is_err()) return _result.error(); \
        std::move(_result).value(); \
    })

// Statement form for Result<void>
#define MIRRORHUB_TRY_VOID(expr) \
    do { \
        auto _result = (expr); \
        if (_result.is_err()) return _result.error(); \
    } while (0)

} // namespace mirrorhub
