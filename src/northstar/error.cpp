#include "northstar/error.h"

#include <cstring>

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConfigError:
            return "ConfigError";
        case ErrorCode::SignatureInvalid:
            return "SignatureInvalid";
        case ErrorCode::IntegrityMismatch:
            return "IntegrityMismatch";
        case ErrorCode::ResourceExhausted:
            return "ResourceExhausted";
        case ErrorCode::MountFailure:
            return "MountFailure";
        case ErrorCode::CgroupFailure:
            return "CgroupFailure";
        case ErrorCode::ProcessSpawnFailure:
            return "ProcessSpawnFailure";
        case ErrorCode::Timeout:
            return "Timeout";
        case ErrorCode::ProtocolError:
            return "ProtocolError";
        case ErrorCode::NotFound:
            return "NotFound";
        case ErrorCode::InvalidState:
            return "InvalidState";
        case ErrorCode::InvalidPackage:
            return "InvalidPackage";
        case ErrorCode::Io:
            return "Io";
    }
    return "Unknown";
}

NorthstarError system_failure(ErrorCode code, const std::string& what, int errnum) {
    return NorthstarError(code, what + ": " + std::strerror(errnum));
}
