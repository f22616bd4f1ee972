#pragma once

#include <expected>
#include <string>
#include <utility>

namespace pictura {

//=============================================================================
// Error
//=============================================================================

class Error {
public:
    enum class Code {
        Generic,
        BackendUnavailable,
        SanityCheckFailed,
        MalformedSerialization,
        NotFound,
        InvalidIndex,
        GpuFailure,
        Io,
    };

    Error() = default;
    explicit Error(std::string message, Code code = Code::Generic)
        : _message(std::move(message)), _code(code) {}

    // Chains the cause so the full context survives propagation
    Error(std::string message, const Error& cause)
        : _message(std::move(message) + ": " + cause._message), _code(cause._code) {}

    Error(std::string message, Code code, const Error& cause)
        : _message(std::move(message) + ": " + cause._message), _code(code) {}

    const std::string& message() const { return _message; }
    Code code() const { return _code; }

private:
    std::string _message;
    Code _code = Code::Generic;
};

template<typename T>
using Result = std::expected<T, Error>;

//=============================================================================
// Helpers
//=============================================================================

inline Result<void> Ok() {
    return {};
}

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T = void>
Result<T> Err(const std::string& message, Error::Code code = Error::Code::Generic) {
    return std::unexpected(Error(message, code));
}

template<typename T = void, typename U>
Result<T> Err(const std::string& message, const Result<U>& cause) {
    return std::unexpected(Error(message, cause.error()));
}

template<typename T = void, typename U>
Result<T> Err(const std::string& message, Error::Code code, const Result<U>& cause) {
    return std::unexpected(Error(message, code, cause.error()));
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    return result ? std::string() : result.error().message();
}

} // namespace pictura
