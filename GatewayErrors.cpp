#include "GatewayErrors.h"

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
    case ErrorCode::DuplicateIdentity: return "DuplicateIdentity";
    case ErrorCode::UnknownDevice:     return "UnknownDevice";
    case ErrorCode::NotBound:          return "NotBound";
    case ErrorCode::DeviceUnavailable: return "DeviceUnavailable";
    case ErrorCode::ValidationError:   return "ValidationError";
    case ErrorCode::CommandFailed:     return "CommandFailed";
    case ErrorCode::ProtocolError:     return "ProtocolError";
    case ErrorCode::AuthRejected:      return "AuthRejected";
    }
    return "Unknown";
}
