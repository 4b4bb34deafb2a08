// GatewayErrors.h
#pragma once

#include <exception>
#include <stdexcept>
#include <string>

enum class ErrorCode {
    DuplicateIdentity,
    UnknownDevice,
    NotBound,
    DeviceUnavailable, // Bound but not connected
    ValidationError,
    CommandFailed,     // Device answered with a non-success status
    ProtocolError,
    AuthRejected       // Upgrade refused; reported as HTTP 401/403, never as a frame
};

const char* ErrorCodeName(ErrorCode code);

// --- GatewayError ---
// what() is the string sent back to clients in the "error" field.
class GatewayError : public std::runtime_error {
public:
    GatewayError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), m_code(code) {
    }

    ErrorCode Code() const { return m_code; }

private:
    ErrorCode m_code;
};

// --- ConfigError ---
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

// Message of a captured exception, for logging.
inline std::string DescribeException(const std::exception_ptr& error) {
    if (!error) return "no error";
    try {
        std::rethrow_exception(error);
    }
    catch (const std::exception& e) {
        return e.what();
    }
    catch (...) {
        return "unknown exception";
    }
}
