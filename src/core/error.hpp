#pragma once

#include <string>

namespace gzs {

/// Failure categories surfaced at the HTTP boundary.
enum class ErrorKind {
    InvalidInput,          ///< Bad id, hostname, path or request body
    SecurityViolation,     ///< Path escapes an allow-listed directory
    PathError,             ///< CGI script outside document root / cgi-bin
    NotFound,
    MountError,            ///< Archive missing, unreadable or corrupt
    ExecutionError,        ///< CGI subprocess failed, see ExecutionFailure
    ResourceLimitExceeded, ///< Body or response over its cap
    Internal,
};

/// Sub-classification of ErrorKind::ExecutionError. CGI invocations may
/// have side effects, so none of these are retried.
enum class ExecutionFailure {
    None,
    ProcessSpawnFailure,
    SignalTermination,
    NonZeroExit,
    Timeout,
};

struct Error {
    ErrorKind kind = ErrorKind::Internal;
    ExecutionFailure failure = ExecutionFailure::None;
    std::string message;

    Error() = default;
    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    static Error execution(ExecutionFailure f, std::string msg) {
        Error err(ErrorKind::ExecutionError, std::move(msg));
        err.failure = f;
        return err;
    }

    bool is(ErrorKind k) const { return kind == k; }
    bool is(ExecutionFailure f) const {
        return kind == ErrorKind::ExecutionError && failure == f;
    }
};

const char* to_string(ErrorKind kind);
const char* to_string(ExecutionFailure failure);

/// HTTP status code a client should see for this error.
int http_status_for(const Error& err);

} // namespace gzs
