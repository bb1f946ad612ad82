#include "types.hpp"

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:                   return "ok";
        case ErrorCode::InvalidPath:            return "invalid path";
        case ErrorCode::SessionAlreadyActive:   return "session already active";
        case ErrorCode::NoActiveSession:        return "no active session";
        case ErrorCode::ProjectPathUnavailable: return "project path unavailable";
        case ErrorCode::CorruptRecord:          return "corrupt session record";
        case ErrorCode::IoError:                return "i/o error";
    }
    return "unknown";
}
