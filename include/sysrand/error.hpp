#pragma once

#include "sysrand/common.hpp"
#include <stdexcept>
#include <string>
#include <variant>
#include <optional>
#include <utility>

namespace sysrand {

// Error codes for structured error handling
enum class ErrorCode {
    Success = 0,
    Unknown,
    InvalidArgument,

    // Resource errors: fatal, never retried
    DeviceOpenFailed,
    DeviceNotCharacter,
    LibraryLoadFailed,
    SymbolNotFound,
    SyscallProbeFailed,
    ReadFailed,

    // The source stopped producing data before the request was satisfied
    SourceExhausted
};

// Convert error code to string
const char* error_code_to_string(ErrorCode code);

// Error class with structured information
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, int os_error)
        : code_(code), message_(std::move(message)), os_error_(os_error) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    // errno (or GetLastError() on Windows) captured when the error was
    // raised, 0 when the failure did not come from the OS
    int os_error() const { return os_error_; }

    std::string to_string() const;

private:
    ErrorCode code_;
    std::string message_;
    int os_error_ = 0;
};

// Result type for the non-throwing entry points
template<typename T>
class Result {
public:
    static Result Ok(T value) {
        return Result(std::move(value));
    }

    static Result Err(Error error) {
        return Result(std::move(error));
    }

    static Result Err(ErrorCode code, const std::string& message) {
        return Result(Error(code, message));
    }

    bool is_ok() const { return std::holds_alternative<T>(value_); }
    bool is_err() const { return std::holds_alternative<Error>(value_); }

    // Get the value (throws if error)
    const T& value() const {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result: " + error().to_string());
        }
        return std::get<T>(value_);
    }

    // Get the error (throws if ok)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return std::get<Error>(value_);
    }

    T value_or(T default_value) const {
        if (is_ok()) {
            return std::get<T>(value_);
        }
        return default_value;
    }

    std::optional<T> ok() const {
        if (is_ok()) {
            return std::get<T>(value_);
        }
        return std::nullopt;
    }

private:
    explicit Result(T value) : value_(std::move(value)) {}
    explicit Result(Error error) : value_(std::move(error)) {}

    std::variant<T, Error> value_;
};

template<>
class Result<void> {
public:
    static Result Ok() {
        return Result(true);
    }

    static Result Err(Error error) {
        return Result(std::move(error));
    }

    static Result Err(ErrorCode code, const std::string& message) {
        return Result(Error(code, message));
    }

    bool is_ok() const { return !error_.has_value(); }
    bool is_err() const { return error_.has_value(); }

    const Error& error() const {
        if (!error_) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return *error_;
    }

    void unwrap() const {
        if (is_err()) {
            throw std::runtime_error("Called unwrap() on error Result: " + error().to_string());
        }
    }

private:
    explicit Result(bool) : error_(std::nullopt) {}
    explicit Result(Error error) : error_(std::move(error)) {}

    std::optional<Error> error_;
};

// Exception hierarchy
class SysrandException : public std::runtime_error {
public:
    SysrandException(ErrorCode code, const std::string& message, int os_error = 0)
        : std::runtime_error(message), code_(code), os_error_(os_error) {}

    ErrorCode code() const { return code_; }
    int os_error() const { return os_error_; }

    Error to_error() const { return Error(code_, what(), os_error_); }

private:
    ErrorCode code_;
    int os_error_;
};

/**
 * The random source could not be acquired or used: open/load failure,
 * missing symbol, wrong device type, failed probe, hard read error.
 * Not retryable.
 */
class ResourceError : public SysrandException {
public:
    ResourceError(ErrorCode code, const std::string& message, int os_error = 0)
        : SysrandException(code, "Resource error: " + message, os_error) {}
};

/**
 * The source returned end-of-data before the requested length was read.
 */
class ExhaustionError : public SysrandException {
public:
    ExhaustionError(const std::string& message, size_t requested, size_t received)
        : SysrandException(ErrorCode::SourceExhausted, "Exhaustion error: " + message),
          requested_(requested), received_(received) {}

    size_t requested() const { return requested_; }
    size_t received() const { return received_; }

private:
    size_t requested_;
    size_t received_;
};

// Describe an OS error number, e.g. "No such file or directory (error 2)"
std::string describe_os_error(int os_error);

} // namespace sysrand
