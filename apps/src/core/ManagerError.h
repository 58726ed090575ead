#pragma once

#include "core/Result.h"
#include <string>
#include <variant>

namespace BjornManager {

enum class ErrorKind {
    Busy,
    Cancelled,
    Config,
    Connection,
    Discovery,
    NotConnected,
    RemoteExecution,
    Timeout,
    Transfer,
    Validation,
};

const char* toString(ErrorKind kind);

struct ManagerError {
    ErrorKind kind = ErrorKind::RemoteExecution;
    std::string message;

    ManagerError() = default;
    ManagerError(ErrorKind kind, std::string message) : kind(kind), message(std::move(message))
    {}
};

template <typename T>
using Outcome = Result<T, ManagerError>;

using VoidOutcome = Result<std::monostate, ManagerError>;

inline VoidOutcome okayVoid()
{
    return VoidOutcome::okay(std::monostate{});
}

template <typename T>
Outcome<T> fail(ErrorKind kind, std::string message)
{
    return Outcome<T>::error(ManagerError(kind, std::move(message)));
}

inline VoidOutcome failVoid(ErrorKind kind, std::string message)
{
    return VoidOutcome::error(ManagerError(kind, std::move(message)));
}

} // namespace BjornManager
