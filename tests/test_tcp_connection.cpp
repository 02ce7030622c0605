#include "../include/errors.hpp"
#include "../include/network/tcp_connection.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

using namespace exomon;
using namespace exomon::network;

#define TEST(name) void name()
#define RUN_TEST(name)                                                                                                 \
    do {                                                                                                               \
        std::cout << "Running " << #name << "... ";                                                                    \
        name();                                                                                                        \
        std::cout << "PASSED\n";                                                                                       \
    } while (0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))

namespace {

// Loopback listener on an ephemeral port
class Listener {
public:
    Listener() {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        assert(fd_ >= 0);
        int reuse = 1;
        ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        int rc = ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        assert(rc == 0);
        rc = ::listen(fd_, 4);
        assert(rc == 0);

        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
        (void)rc;
    }

    ~Listener() {
        if (fd_ >= 0)
            ::close(fd_);
    }

    int accept_one() { return ::accept(fd_, nullptr, nullptr); }

    uint16_t port() const { return port_; }

    // Closes the listening socket so the port refuses connections
    uint16_t release() {
        ::close(fd_);
        fd_ = -1;
        return port_;
    }

private:
    int fd_ = -1;
    uint16_t port_ = 0;
};

void send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, 0);
        assert(n > 0);
        sent += static_cast<size_t>(n);
    }
}

} // namespace

TEST(test_connect_and_read) {
    Listener listener;
    TcpConnection conn("127.0.0.1", listener.port());
    ASSERT_FALSE(conn.is_open());
    ASSERT_EQ(conn.endpoint(), "127.0.0.1:" + std::to_string(listener.port()));

    conn.open();
    ASSERT_TRUE(conn.is_open());

    int peer = listener.accept_one();
    ASSERT_TRUE(peer >= 0);
    send_all(peer, "{\"type\":\"welcome\"}\n");

    std::string received;
    char buf[64];
    while (received.size() < 19) {
        size_t n = conn.read(buf, sizeof(buf));
        ASSERT_TRUE(n > 0);
        received.append(buf, n);
    }
    ASSERT_EQ(received, "{\"type\":\"welcome\"}\n");
    ASSERT_EQ(conn.bytes_received(), 19u);

    // Peer close reads as 0
    ::close(peer);
    ASSERT_EQ(conn.read(buf, sizeof(buf)), 0u);

    conn.close();
    ASSERT_FALSE(conn.is_open());
    conn.close(); // Idempotent
}

TEST(test_resolves_hostname) {
    Listener listener;
    TcpConnection conn("localhost", listener.port());
    conn.open();
    int peer = listener.accept_one();
    ASSERT_TRUE(peer >= 0);
    ::close(peer);
}

TEST(test_connection_refused) {
    uint16_t port;
    {
        Listener listener;
        port = listener.release();
    }

    TcpConnection conn("127.0.0.1", port);
    bool threw = false;
    try {
        conn.open();
    } catch (const ConnectError& e) {
        threw = true;
        ASSERT_TRUE(std::string(e.what()).find("127.0.0.1") != std::string::npos);
    }
    ASSERT_TRUE(threw);
    ASSERT_FALSE(conn.is_open());
}

TEST(test_unresolvable_host) {
    TcpConnection conn("host.invalid", 52417);
    bool threw = false;
    try {
        conn.open();
    } catch (const ConnectError&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
}

TEST(test_interrupt_unblocks_read) {
    Listener listener;
    TcpConnection conn("127.0.0.1", listener.port());
    conn.open();
    int peer = listener.accept_one();
    ASSERT_TRUE(peer >= 0);

    size_t result = 1;
    std::thread reader([&]() {
        char buf[16];
        result = conn.read(buf, sizeof(buf));
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    conn.interrupt();
    reader.join();

    ASSERT_EQ(result, 0u);
    ::close(peer);
}

TEST(test_read_when_closed_throws) {
    TcpConnection conn("127.0.0.1", 1);
    char buf[8];
    bool threw = false;
    try {
        conn.read(buf, sizeof(buf));
    } catch (const TransportReadError& e) {
        threw = true;
        ASSERT_TRUE(e.error_code() != 0);
    }
    ASSERT_TRUE(threw);
}

int main() {
    std::cout << "=== TCP Connection Tests ===\n";

    RUN_TEST(test_connect_and_read);
    RUN_TEST(test_resolves_hostname);
    RUN_TEST(test_connection_refused);
    RUN_TEST(test_unresolvable_host);
    RUN_TEST(test_interrupt_unblocks_read);
    RUN_TEST(test_read_when_closed_throws);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
