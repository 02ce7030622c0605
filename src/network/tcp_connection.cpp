#include "../../include/network/tcp_connection.hpp"
#include "../../include/errors.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

namespace exomon::network {

TcpConnection::TcpConnection(std::string host, uint16_t port)
    : host_(std::move(host))
    , port_(port)
    , socket_fd_(-1)
    , interrupted_(false)
    , bytes_received_(0)
{}

TcpConnection::~TcpConnection() {
    close();
}

std::string TcpConnection::endpoint() const {
    return host_ + ":" + std::to_string(port_);
}

void TcpConnection::open() {
    if (is_open()) {
        throw ConnectError("already connected to " + endpoint());
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* results = nullptr;
    std::string port_str = std::to_string(port_);
    int rc = getaddrinfo(host_.c_str(), port_str.c_str(), &hints, &results);
    if (rc != 0) {
        throw ConnectError("cannot resolve " + host_ + ": " + gai_strerror(rc));
    }

    int last_errno = 0;
    int fd = -1;
    for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_errno = errno;
            continue;
        }

        // Detect a dead server on an idle stream
        int opt = 1;
        setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));

        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            break;
        }

        last_errno = errno;
        ::close(fd);
        fd = -1;
    }
    freeaddrinfo(results);

    if (fd < 0) {
        throw ConnectError(endpoint() + ": " + std::strerror(last_errno));
    }

    interrupted_.store(false, std::memory_order_release);
    socket_fd_.store(fd, std::memory_order_release);
}

size_t TcpConnection::read(char* buffer, size_t capacity) {
    int fd = socket_fd_.load(std::memory_order_acquire);
    if (fd < 0) {
        throw TransportReadError("connection is not open", EBADF);
    }

    while (true) {
        ssize_t n = recv(fd, buffer, capacity, 0);
        if (n > 0) {
            bytes_received_ += static_cast<uint64_t>(n);
            return static_cast<size_t>(n);
        }
        if (n == 0) {
            return 0; // Peer closed (or shutdown by interrupt())
        }

        int err = errno;
        if (interrupted_.load(std::memory_order_acquire)) {
            return 0;
        }
        if (err == EINTR) {
            continue;
        }
        throw TransportReadError(std::string("recv() failed: ") + std::strerror(err), err);
    }
}

void TcpConnection::interrupt() {
    interrupted_.store(true, std::memory_order_release);
    int fd = socket_fd_.load(std::memory_order_acquire);
    if (fd >= 0) {
        shutdown(fd, SHUT_RDWR);
    }
}

void TcpConnection::close() {
    int fd = socket_fd_.exchange(-1, std::memory_order_acq_rel);
    if (fd >= 0) {
        ::close(fd);
    }
}

} // namespace exomon::network
