#include "core/error.hpp"

namespace gzs {

const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidInput: return "InvalidInput";
    case ErrorKind::SecurityViolation: return "SecurityViolation";
    case ErrorKind::PathError: return "PathError";
    case ErrorKind::NotFound: return "NotFound";
    case ErrorKind::MountError: return "MountError";
    case ErrorKind::ExecutionError: return "ExecutionError";
    case ErrorKind::ResourceLimitExceeded: return "ResourceLimitExceeded";
    case ErrorKind::Internal: return "Internal";
    }
    return "Unknown";
}

const char* to_string(ExecutionFailure failure) {
    switch (failure) {
    case ExecutionFailure::None: return "None";
    case ExecutionFailure::ProcessSpawnFailure: return "ProcessSpawnFailure";
    case ExecutionFailure::SignalTermination: return "SignalTermination";
    case ExecutionFailure::NonZeroExit: return "NonZeroExit";
    case ExecutionFailure::Timeout: return "Timeout";
    }
    return "Unknown";
}

int http_status_for(const Error& err) {
    switch (err.kind) {
    case ErrorKind::InvalidInput: return 400;
    case ErrorKind::SecurityViolation: return 403;
    case ErrorKind::PathError: return 403;
    case ErrorKind::NotFound: return 404;
    case ErrorKind::ResourceLimitExceeded: return 413;
    case ErrorKind::ExecutionError:
        return err.failure == ExecutionFailure::Timeout ? 504 : 500;
    case ErrorKind::MountError:
    case ErrorKind::Internal:
        return 500;
    }
    return 500;
}

} // namespace gzs
