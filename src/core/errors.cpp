#include "core/errors.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:         return "None";
        case ErrorKind::Config:       return "ConfigError";
        case ErrorKind::Environment:  return "EnvironmentError";
        case ErrorKind::Dependency:   return "DependencyError";
        case ErrorKind::PortConflict: return "PortConflictError";
        case ErrorKind::Spawn:        return "SpawnError";
        case ErrorKind::EarlyExit:    return "EarlyExitError";
    }
    return "UnknownError";
}

int exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:         return 0;
        case ErrorKind::Config:       return 2;
        case ErrorKind::Environment:  return 3;
        case ErrorKind::Dependency:   return 4;
        case ErrorKind::PortConflict: return 5;
        case ErrorKind::Spawn:        return 6;
        case ErrorKind::EarlyExit:    return 7;
    }
    return 1;
}
