#pragma once

#include <cstdint>
#include <string>

enum class ErrorKind {
    None,
    Config,        // missing/malformed config.json
    Environment,   // virtual environment cannot be created
    Dependency,    // required files or python packages missing
    PortConflict,  // port still held after remediation
    Spawn,         // child could not be created
    EarlyExit      // child died inside its settle window
};

struct SupervisorError {
    ErrorKind kind = ErrorKind::None;
    std::string message;
    uint16_t port = 0;  // set for PortConflict

    explicit operator bool() const { return kind != ErrorKind::None; }
};

/// Short name used in log lines ("PortConflictError", ...)
const char* error_kind_name(ErrorKind kind);

/// Process exit status for a fatal error of the given kind
int exit_code_for(ErrorKind kind);

/// Exit status when a child dies while the supervisor is running
constexpr int EXIT_CHILD_EXITED = 1;
