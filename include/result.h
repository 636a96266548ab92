#pragma once

#include <optional>
#include <string>
#include <utility>

namespace facegate {

/**
 * @brief Failure categories reported by pipeline operations
 */
enum class ErrorKind {
    None,
    NetworkTimeout,      ///< Remote call exceeded its bounded timeout
    NetworkUnreachable,  ///< Connection refused, DNS failure, reset
    MalformedResponse,   ///< Non-2xx status, invalid JSON or service-reported error
    EmptyFrame,          ///< Capture returned no image
    EncodeFailure,       ///< JPEG encoding failed
    SourceUnavailable,   ///< Video source could not be opened
    IoError,             ///< Local persistence or socket failure
    InvalidConfig        ///< Configuration value missing or out of range
};

/**
 * @brief Convert an error kind to its display name
 */
const char* errorKindToString(ErrorKind kind);

/**
 * @brief Error carried by a failed Result
 */
struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    std::string toString() const {
        return std::string(errorKindToString(kind)) + ": " + message;
    }
};

/**
 * @brief Result type for error handling
 */
template<typename T>
class Result {
private:
    std::optional<T> value_;
    Error error_;

    explicit Result(T value) : value_(std::move(value)) {}
    explicit Result(Error error) : error_(std::move(error)) {}

public:
    static Result<T> success(T value) { return Result(std::move(value)); }
    static Result<T> error(ErrorKind kind, const std::string& msg) { return Result(Error{kind, msg}); }
    static Result<T> error(Error err) { return Result(std::move(err)); }

    bool isSuccess() const { return value_.has_value(); }
    bool isError() const { return !value_.has_value(); }
    const T& getValue() const { return *value_; }
    const std::string& getError() const { return error_.message; }
    ErrorKind getErrorKind() const { return error_.kind; }
    const Error& getErrorDetail() const { return error_; }

    // Allow move semantics
    T&& moveValue() { return std::move(*value_); }
};

/**
 * @brief Specialization for void type
 */
template<>
class Result<void> {
private:
    bool success_;
    Error error_;

    explicit Result(bool success) : success_(success) {}
    explicit Result(Error error) : success_(false), error_(std::move(error)) {}

public:
    static Result<void> success() { return Result(true); }
    static Result<void> error(ErrorKind kind, const std::string& msg) { return Result(Error{kind, msg}); }
    static Result<void> error(Error err) { return Result(std::move(err)); }

    bool isSuccess() const { return success_; }
    bool isError() const { return !success_; }
    const std::string& getError() const { return error_.message; }
    ErrorKind getErrorKind() const { return error_.kind; }
    const Error& getErrorDetail() const { return error_; }
};

inline const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:               return "None";
        case ErrorKind::NetworkTimeout:     return "NetworkTimeout";
        case ErrorKind::NetworkUnreachable: return "NetworkUnreachable";
        case ErrorKind::MalformedResponse:  return "MalformedResponse";
        case ErrorKind::EmptyFrame:         return "EmptyFrame";
        case ErrorKind::EncodeFailure:      return "EncodeFailure";
        case ErrorKind::SourceUnavailable:  return "SourceUnavailable";
        case ErrorKind::IoError:            return "IoError";
        case ErrorKind::InvalidConfig:      return "InvalidConfig";
        default:                            return "Unknown";
    }
}

} // namespace facegate
