#pragma once

#include <stdexcept>
#include <string>

namespace tabmux {

enum class ErrorKind {
    SpawnError,         // child could not be launched; no tab is created
    ProtocolViolation,  // unexpected embedding message or window
    UnknownTarget,      // command names a tab or window that does not exist
    InvalidCommand,     // control line outside the command set
    ConnectionLost      // X connection broke; fatal
};

const char *to_string(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }
    bool fatal() const { return kind_ == ErrorKind::ConnectionLost; }

private:
    ErrorKind kind_;
};

inline const char *to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SpawnError: return "SpawnError";
        case ErrorKind::ProtocolViolation: return "ProtocolViolation";
        case ErrorKind::UnknownTarget: return "UnknownTarget";
        case ErrorKind::InvalidCommand: return "InvalidCommand";
        case ErrorKind::ConnectionLost: return "ConnectionLost";
    }
    return "Unknown";
}

}  // namespace tabmux
