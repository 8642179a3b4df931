#pragma once

#include <stdexcept>
#include <string>

enum class ErrorCode {
    ConfigError,
    SignatureInvalid,
    IntegrityMismatch,
    ResourceExhausted,
    MountFailure,
    CgroupFailure,
    ProcessSpawnFailure,
    Timeout,
    ProtocolError,
    NotFound,
    InvalidState,
    InvalidPackage,
    Io
};

const char* error_code_name(ErrorCode code);

class NorthstarError : public std::runtime_error {
public:
    NorthstarError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

// Builds a NorthstarError whose message ends with strerror(errnum).
NorthstarError system_failure(ErrorCode code, const std::string& what, int errnum);
