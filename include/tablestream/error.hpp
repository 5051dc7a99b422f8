#pragma once
/**
 * @file error.hpp
 * @brief Error taxonomy shared by every tablestream layer.
 *
 * Functions in this library never throw. They return `bool` and fill an
 * `Error&` out-parameter, the same way the dispatcher helpers hand back a
 * reason string. Callers decide whether to log, abort a run, or exit.
 *
 * Kinds:
 *  - Protocol:     the device answered with something we cannot parse.
 *  - Device:       the device answered `ERR ...` or refused a write.
 *  - Verification: captured data diverged from what was injected.
 *  - Connection:   socket level failure (connect, send, recv).
 *  - Config:       run parameters rejected before touching the wire.
 */

#include <string>
#include <utility>

namespace tablestream {

enum class ErrorKind {
    None,
    Protocol,
    Device,
    Verification,
    Connection,
    Config
};

/** Short snake_case name used in `status=error kind=...` lines. */
inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:         return "none";
        case ErrorKind::Protocol:     return "protocol_error";
        case ErrorKind::Device:       return "device_error";
        case ErrorKind::Verification: return "verification_error";
        case ErrorKind::Connection:   return "connection_error";
        case ErrorKind::Config:       return "config_error";
    }
    return "unknown";
}

struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    bool ok() const { return kind == ErrorKind::None; }

    void clear() {
        kind = ErrorKind::None;
        message.clear();
    }

    /** Fill this error and return false so callers can `return err.set(...)`. */
    bool set(ErrorKind k, std::string msg) {
        kind = k;
        message = std::move(msg);
        return false;
    }
};

} // namespace tablestream
