#pragma once

#include "transport.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace exomon {
namespace network {

/**
 * Blocking TCP client connection.
 *
 * open() resolves the host (name or literal address) and tries each
 * address in turn. No connect or read timeout is applied: an unreachable
 * server blocks open() until the kernel gives up.
 *
 * Usage:
 *   TcpConnection conn("localhost", 52417);
 *   conn.open();                       // throws ConnectError
 *   size_t n = conn.read(buf, sizeof(buf));
 */
class TcpConnection : public ITransport {
public:
    TcpConnection(std::string host, uint16_t port);
    ~TcpConnection() override;

    // Non-copyable
    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    void open() override;
    size_t read(char* buffer, size_t capacity) override;
    void interrupt() override;
    void close() override;

    bool is_open() const override { return socket_fd_.load(std::memory_order_acquire) >= 0; }
    std::string endpoint() const override;

    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }

    // Statistics
    uint64_t bytes_received() const { return bytes_received_; }

private:
    std::string host_;
    uint16_t port_;
    std::atomic<int> socket_fd_;
    std::atomic<bool> interrupted_;
    uint64_t bytes_received_;
};

} // namespace network
} // namespace exomon
