#pragma once

#include <expected>
#include <string>
#include <memory>
#include <source_location>

namespace filebase {

// Error categories surfaced by the library
enum class ErrorCode {
    Generic,
    IncompleteIdentity,
    FileDeleted,
    Encode,
    Decode,
    Io,
    Disposed,
    Watch,
    Config
};

// Error with code, chaining and source location
class Error {
public:
    explicit Error(std::string msg, std::source_location loc = std::source_location::current())
        : _msg(std::move(msg)), _loc(loc) {}

    Error(ErrorCode code, std::string msg, std::source_location loc = std::source_location::current())
        : _code(code), _msg(std::move(msg)), _loc(loc) {}

    // Wrapping keeps the code of the wrapped error
    Error(std::string msg, Error prev_error, std::source_location loc = std::source_location::current())
        : _code(prev_error.code()), _msg(std::move(msg)),
          _prev_error(std::make_unique<Error>(std::move(prev_error))), _loc(loc) {}

    Error(const Error& other)
        : _code(other._code), _msg(other._msg), _loc(other._loc) {
        if (other._prev_error) _prev_error = std::make_unique<Error>(*other._prev_error);
    }

    Error& operator=(const Error& other) {
        if (this != &other) {
            _code = other._code;
            _msg = other._msg;
            _loc = other._loc;
            _prev_error = other._prev_error ? std::make_unique<Error>(*other._prev_error) : nullptr;
        }
        return *this;
    }

    Error(Error&&) = default;
    Error& operator=(Error&&) = default;

    [[nodiscard]] ErrorCode code() const { return _code; }
    [[nodiscard]] const std::string& message() const { return _msg; }

    [[nodiscard]] std::string to_string() const {
        std::string result = _msg;
        result += " [";
        result += _loc.file_name();
        result += ":";
        result += std::to_string(_loc.line());
        result += "]";
        if (_prev_error) {
            result += " <- ";
            result += _prev_error->to_string();
        }
        return result;
    }

private:
    ErrorCode _code = ErrorCode::Generic;
    std::string _msg;
    std::unique_ptr<Error> _prev_error;
    std::source_location _loc;
};

template<typename T>
using Result = std::expected<T, Error>;

// Helper functions for creating results
template<typename T>
[[nodiscard]] inline Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

[[nodiscard]] inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
[[nodiscard]] inline std::unexpected<Error> Err(std::string msg, std::source_location loc = std::source_location::current()) {
    return std::unexpected(Error(std::move(msg), loc));
}

template<typename T = void>
[[nodiscard]] inline std::unexpected<Error> Err(ErrorCode code, std::string msg, std::source_location loc = std::source_location::current()) {
    return std::unexpected(Error(code, std::move(msg), loc));
}

template<typename T, typename U>
[[nodiscard]] inline std::unexpected<Error> Err(std::string msg, const Result<U>& prev, std::source_location loc = std::source_location::current()) {
    if (!prev.has_value()) {
        return std::unexpected(Error(std::move(msg), prev.error(), loc));
    }
    return std::unexpected(Error(std::move(msg), loc));
}

// Get error message from result
template<typename T>
[[nodiscard]] inline std::string error_msg(const Result<T>& res) {
    return res.has_value() ? "" : res.error().to_string();
}

// Get error code from result, Generic when the result holds a value
template<typename T>
[[nodiscard]] inline ErrorCode error_code(const Result<T>& res) {
    return res.has_value() ? ErrorCode::Generic : res.error().code();
}

} // namespace filebase
