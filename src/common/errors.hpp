#pragma once

#include <optional>
#include <string>
#include <utility>

namespace officebridge {

enum class ErrorKind {
    NotFound,
    Conflict,
    IoFailure,
    SerializationFailure,
    Unreachable,
    RemoteRejected,
    ResponseShapeMismatch,
    AlreadyRunning,
    NotRunning,
    SpawnFailure,
    ProbeFailure,
    InvalidArgument
};

struct Error {
    ErrorKind kind = ErrorKind::IoFailure;
    std::string message;
};

inline Error makeError(ErrorKind kind, std::string message)
{
    return Error{kind, std::move(message)};
}

inline std::string toErrorKindString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::NotFound:
        return "not_found";
    case ErrorKind::Conflict:
        return "conflict";
    case ErrorKind::IoFailure:
        return "io_failure";
    case ErrorKind::SerializationFailure:
        return "serialization_failure";
    case ErrorKind::Unreachable:
        return "unreachable";
    case ErrorKind::RemoteRejected:
        return "remote_rejected";
    case ErrorKind::ResponseShapeMismatch:
        return "response_shape_mismatch";
    case ErrorKind::AlreadyRunning:
        return "already_running";
    case ErrorKind::NotRunning:
        return "not_running";
    case ErrorKind::SpawnFailure:
        return "spawn_failure";
    case ErrorKind::ProbeFailure:
        return "probe_failure";
    case ErrorKind::InvalidArgument:
        return "invalid_argument";
    }
    return "io_failure";
}

// Result holds either a value or an Error. Components return it instead of
// throwing across their boundary.
template <typename T>
class Result {
public:
    Result(T value)
        : m_value(std::move(value))
    {
    }

    Result(Error error)
        : m_error(std::move(error))
    {
    }

    bool ok() const
    {
        return !m_error.has_value();
    }

    explicit operator bool() const
    {
        return ok();
    }

    const T &value() const &
    {
        return *m_value;
    }

    T &value() &
    {
        return *m_value;
    }

    T &&value() &&
    {
        return std::move(*m_value);
    }

    const Error &error() const
    {
        return *m_error;
    }

private:
    std::optional<T> m_value;
    std::optional<Error> m_error;
};

// Operations with no value on success report only their failure.
using Status = std::optional<Error>;

} // namespace officebridge
