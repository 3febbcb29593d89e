#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace nodeward {

/// Broad failure classes surfaced to the presentation layer.
enum class ErrorKind {
    Validation,
    Conflict,
    Process,
    Transfer,
    NotFound,
};

enum class ErrorCode {
    InvalidConfig,
    AlreadyRunning,
    NotRunning,
    Busy,
    ExecutableMissing,
    SpawnRejected,
    SpawnFailed,
    TerminateFailed,
    NetworkError,
    NoReleaseFound,
    IncompleteTransfer,
    IOError,
};

[[nodiscard]] ErrorKind kind_of(ErrorCode code);
[[nodiscard]] const char* to_string(ErrorKind kind);
[[nodiscard]] const char* to_string(ErrorCode code);

struct Error {
    ErrorCode   code;
    std::string message;

    [[nodiscard]] ErrorKind kind() const { return kind_of(code); }
};

/**
 * Outcome of an operation that produces no value.
 */
class Status {
public:
    Status() = default;
    Status(Error error) : error_(std::move(error)) {}

    static Status ok() { return {}; }

    [[nodiscard]] bool is_ok() const { return !error_.has_value(); }
    explicit operator bool() const { return is_ok(); }

    /// Only valid when !is_ok().
    [[nodiscard]] const Error& error() const { return *error_; }

private:
    std::optional<Error> error_;
};

/**
 * Either a value or an Error.
 */
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    [[nodiscard]] bool is_ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return is_ok(); }

    [[nodiscard]] const T& value() const { return std::get<T>(data_); }
    [[nodiscard]] T&       value()       { return std::get<T>(data_); }
    [[nodiscard]] const Error& error() const { return std::get<Error>(data_); }

private:
    std::variant<T, Error> data_;
};

}  // namespace nodeward
