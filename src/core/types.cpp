#include <sandkernel/core/types.hpp>

namespace sandkernel {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::BlockedCapability: return "blocked_capability";
        case ErrorKind::PathRejected: return "path_rejected";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::ResourceExceeded: return "resource_exceeded";
        case ErrorKind::ScriptRuntimeError: return "script_runtime_error";
        case ErrorKind::CapacityExceeded: return "capacity_exceeded";
        case ErrorKind::InvalidRequest: return "invalid_request";
        case ErrorKind::InternalError: return "internal_error";
    }
    return "unknown";
}

bool parse_error_kind(const std::string& name, ErrorKind& out) {
    static const ErrorKind kinds[] = {
        ErrorKind::None, ErrorKind::BlockedCapability, ErrorKind::PathRejected, ErrorKind::Timeout,
        ErrorKind::ResourceExceeded, ErrorKind::ScriptRuntimeError, ErrorKind::CapacityExceeded,
        ErrorKind::InvalidRequest, ErrorKind::InternalError
    };
    for (ErrorKind kind : kinds) {
        if (name == error_kind_name(kind)) {
            out = kind;
            return true;
        }
    }
    return false;
}

} // namespace sandkernel
