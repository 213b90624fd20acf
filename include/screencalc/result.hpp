#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace screencalc {

enum class ErrorKind : uint8_t {
    Generic = 0,
    UnrecognizedUnit,
    MissingUnit,
    InvalidNumber,
    InvalidInteger,
    InvalidAspectSyntax,
    UnexpectedArgument,
    UnknownParameter,
    ConfigError,
};

inline const char* errorKindName(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::Generic:             return "Generic";
    case ErrorKind::UnrecognizedUnit:    return "UnrecognizedUnit";
    case ErrorKind::MissingUnit:         return "MissingUnit";
    case ErrorKind::InvalidNumber:       return "InvalidNumber";
    case ErrorKind::InvalidInteger:      return "InvalidInteger";
    case ErrorKind::InvalidAspectSyntax: return "InvalidAspectSyntax";
    case ErrorKind::UnexpectedArgument:  return "UnexpectedArgument";
    case ErrorKind::UnknownParameter:    return "UnknownParameter";
    case ErrorKind::ConfigError:         return "ConfigError";
    }
    return "Generic";
}

/**
 * Error - message plus kind, optionally wrapping the error that caused it.
 *
 * The kind of a wrapping error defaults to the kind of its cause, so the
 * original classification survives when callers add context.
 */
class Error {
public:
    Error() = default;

    explicit Error(std::string message, ErrorKind kind = ErrorKind::Generic)
        : _message(std::move(message)), _kind(kind) {}

    Error(std::string message, const Error& cause)
        : _message(std::move(message))
        , _kind(cause.kind())
        , _cause(std::make_shared<const Error>(cause)) {}

    [[nodiscard]] const std::string& message() const noexcept { return _message; }
    [[nodiscard]] ErrorKind kind() const noexcept { return _kind; }
    [[nodiscard]] const Error* cause() const noexcept { return _cause.get(); }

    // "outer: inner: innermost"
    [[nodiscard]] std::string fullMessage() const {
        std::string msg = _message;
        for (const Error* c = cause(); c != nullptr; c = c->cause()) {
            msg += ": ";
            msg += c->message();
        }
        return msg;
    }

private:
    std::string _message;
    ErrorKind _kind = ErrorKind::Generic;
    std::shared_ptr<const Error> _cause;
};

template<typename T = void>
using Result = std::expected<T, Error>;

inline Result<void> Ok() {
    return {};
}

// Ok(value) deduces the result type, Ok<T>(value) converts to it
template<typename T = void, typename U>
auto Ok(U&& value) {
    if constexpr (std::is_void_v<T>) {
        return Result<std::decay_t<U>>(std::forward<U>(value));
    } else {
        return Result<T>(std::forward<U>(value));
    }
}

template<typename T = void>
Result<T> Err(std::string message, ErrorKind kind = ErrorKind::Generic) {
    return std::unexpected(Error(std::move(message), kind));
}

template<typename T = void>
Result<T> Err(Error error) {
    return std::unexpected(std::move(error));
}

template<typename T, typename U>
Result<T> Err(std::string message, const Result<U>& cause) {
    return std::unexpected(Error(std::move(message), cause.error()));
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    return result ? std::string() : result.error().fullMessage();
}

} // namespace screencalc
