#pragma once

#include <cstddef>
#include <string>

namespace exomon {
namespace network {

/**
 * Byte-stream transport consumed by the Session.
 *
 * One reader thread calls read(); interrupt() may be called from any other
 * thread to make a blocked read() return.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Establish the connection. Throws ConnectError.
    virtual void open() = 0;

    /// Blocking read. Returns bytes read, 0 when the peer closed the stream.
    /// Throws TransportReadError on failure.
    virtual size_t read(char* buffer, size_t capacity) = 0;

    /// Unblock a pending read() without releasing the handle
    virtual void interrupt() = 0;

    /// Release the handle. Idempotent.
    virtual void close() = 0;

    virtual bool is_open() const = 0;

    /// Endpoint label for diagnostics, e.g. "localhost:52417"
    virtual std::string endpoint() const = 0;
};

} // namespace network
} // namespace exomon
