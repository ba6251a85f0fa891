#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

enum class ConfigErrorKind {
    Io,
    Parse,
    InvalidValue,
    InvalidLayout
};

class ConfigError : public std::runtime_error {
public:
    ConfigError(ConfigErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ConfigErrorKind kind() const { return kind_; }

private:
    ConfigErrorKind kind_;
};

enum class DeviceErrorCode {
    NotFound,
    PermissionDenied,
    ProtocolError,
    IoError,
    SessionInvalid,
    InvalidArgument
};

inline const char* DeviceErrorCodeName(DeviceErrorCode code) {
    switch (code) {
        case DeviceErrorCode::NotFound: return "NotFound";
        case DeviceErrorCode::PermissionDenied: return "PermissionDenied";
        case DeviceErrorCode::ProtocolError: return "ProtocolError";
        case DeviceErrorCode::IoError: return "IoError";
        case DeviceErrorCode::SessionInvalid: return "SessionInvalid";
        case DeviceErrorCode::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}

class DeviceError : public std::runtime_error {
public:
    DeviceError(DeviceErrorCode code, const std::string& message)
        : std::runtime_error(std::string(DeviceErrorCodeName(code)) + ": " + message), code_(code) {}

    DeviceErrorCode code() const { return code_; }

private:
    DeviceErrorCode code_;
};

#endif // ERRORS_H
