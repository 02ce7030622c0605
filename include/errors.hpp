#pragma once

/**
 * Error taxonomy for the monitoring client.
 *
 * Only connection-level errors (ConnectError, TransportReadError) end a
 * session. DecodeError and HandlerFault are scoped to a single frame.
 */

#include <stdexcept>
#include <string>

namespace exomon {

/// Transport handshake failed. Fatal to the session, no receive loop starts.
class ConnectError : public std::runtime_error {
public:
    explicit ConnectError(const std::string& what) : std::runtime_error(what) {}
};

/// Frame is not valid JSON or does not have the shape its type declares.
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

/// Read failed on an established connection.
class TransportReadError : public std::runtime_error {
public:
    TransportReadError(const std::string& what, int error_code)
        : std::runtime_error(what), error_code_(error_code) {}

    int error_code() const { return error_code_; }

private:
    int error_code_;
};

/// Unexpected failure inside a handler for an otherwise well-formed envelope.
class HandlerFault : public std::runtime_error {
public:
    HandlerFault(const std::string& message_type, const std::string& what)
        : std::runtime_error(what), message_type_(message_type) {}

    const std::string& message_type() const { return message_type_; }

private:
    std::string message_type_;
};

/// Configuration file missing, malformed, or holding out-of-range values.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace exomon
