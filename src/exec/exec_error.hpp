#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "exec/exec_types.hpp"

namespace codebox::exec {

enum class ErrorKind {
    kUnsupportedLanguage,
    kCompilationFailed,
    kRuntimeFailed,
    kTimeout,
    kResourceExceeded,
    kInternal
};

const char* ToString(ErrorKind kind);

// Thrown by the decoder, the engine and the registry.
class ExecError : public std::runtime_error {
public:
    ExecError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind) {}

    ErrorKind Kind() const { return kind_; }

    static ExecError UnsupportedLanguage(const std::string& name) {
        return ExecError(ErrorKind::kUnsupportedLanguage, "Unsupported language: " + name);
    }
    static ExecError Timeout() {
        return ExecError(ErrorKind::kTimeout, "Timeout");
    }
    static ExecError Internal(const std::string& message) {
        return ExecError(ErrorKind::kInternal, message);
    }

private:
    ErrorKind kind_;
};

// Error as seen across the boundary. stage is set for the two
// stage-shaped kinds only; message is set for kInternal only.
struct Error {
    ErrorKind kind = ErrorKind::kInternal;
    std::optional<StageResult> stage;
    std::string message;
};

Error ToBoundaryError(const ExecError& error);
Error IoError(const std::string& detail);
Error InternalError(const std::string& message);

// One-line human readable diagnostic.
std::string Describe(const Error& error);

template <typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}
    Result(Error error) : error_(std::move(error)) {}

    bool Ok() const { return value_.has_value(); }
    explicit operator bool() const { return Ok(); }

    const T& Value() const { return *value_; }
    T& Value() { return *value_; }
    const Error& GetError() const { return *error_; }

private:
    std::optional<T> value_;
    std::optional<Error> error_;
};

template <>
class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)) {}

    bool Ok() const { return !error_.has_value(); }
    explicit operator bool() const { return Ok(); }

    const Error& GetError() const { return *error_; }

private:
    std::optional<Error> error_;
};

}  // namespace codebox::exec
