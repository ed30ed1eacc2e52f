#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace dsync {

/**
 * @brief Failure categories shared by every layer of the agent
 *
 * Remote failures are mapped onto these from HTTP status codes, local
 * failures from filesystem errors. The engine only records the kind; it
 * never branches on it.
 */
enum class ErrorKind {
    Io,        // Local file could not be opened or read
    Network,   // Connection, TLS or socket failure
    Timeout,   // Remote operation exceeded the transport deadline
    Auth,      // Rejected credentials (HTTP 401)
    NotFound,  // Remote resource absent (HTTP 404)
    Conflict,  // Remote resource already exists (HTTP 409)
    Http,      // Any other non-2xx status
    Protocol,  // Malformed response (bad status line, bad JSON, missing field)
    Config     // Invalid or missing configuration value
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Io: return "io";
        case ErrorKind::Network: return "network";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Auth: return "auth";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Conflict: return "conflict";
        case ErrorKind::Http: return "http";
        case ErrorKind::Protocol: return "protocol";
        case ErrorKind::Config: return "config";
    }
    return "unknown";
}

struct Error {
    ErrorKind kind = ErrorKind::Io;
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    bool is(ErrorKind k) const { return kind == k; }

    std::string describe() const {
        return std::string(to_string(kind)) + ": " + message;
    }
};

// Helper wrapper types for disambiguation when T == E
template<typename T>
struct OkValue {
    T value;
    explicit OkValue(T v) : value(std::move(v)) {}
};

template<typename E>
struct ErrValue {
    E error;
    explicit ErrValue(E e) : error(std::move(e)) {}
};

template<typename T, typename E = Error>
class Result {
private:
    std::variant<T, E> data_;

public:
    Result(OkValue<T> ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}

    Result(ErrValue<E> err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& error() { return std::get<1>(data_); }
    const E& error() const { return std::get<1>(data_); }

    T value_or(T default_value) const {
        return is_ok() ? value() : std::move(default_value);
    }
};

template<typename E>
class Result<void, E> {
public:
    Result() : error_(std::nullopt) {}
    Result(ErrValue<E> err) : error_(std::move(err.error)) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    const E& error() const { return error_.value(); }

private:
    std::optional<E> error_;
};

template<typename T>
Result<T> Ok(T value) { return Result<T>(OkValue<T>(std::move(value))); }

template<typename E = Error>
Result<void, E> Ok() { return Result<void, E>(); }

template<typename T, typename E = Error>
Result<T, E> Err(E error) { return Result<T, E>(ErrValue<E>(std::move(error))); }

template<typename T>
Result<T> Err(ErrorKind kind, std::string message) {
    return Result<T>(ErrValue<Error>(Error{kind, std::move(message)}));
}

} // namespace dsync
