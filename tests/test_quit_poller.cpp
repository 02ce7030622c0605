#include "../include/util/quit_poller.hpp"

#include <unistd.h>

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

using namespace exomon::util;

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

constexpr std::chrono::milliseconds kPoll{10};

struct Pipe {
    int fds[2] = {-1, -1};

    Pipe() {
        int rc = ::pipe(fds);
        assert(rc == 0);
        (void)rc;
    }

    ~Pipe() {
        close_write();
        if (fds[0] >= 0)
            ::close(fds[0]);
    }

    void write(const std::string& s) {
        ssize_t n = ::write(fds[1], s.data(), s.size());
        assert(n == static_cast<ssize_t>(s.size()));
        (void)n;
    }

    void close_write() {
        if (fds[1] >= 0) {
            ::close(fds[1]);
            fds[1] = -1;
        }
    }
};

} // namespace

TEST(test_is_quit) {
    ASSERT_TRUE(QuitPoller::is_quit("q"));
    ASSERT_TRUE(QuitPoller::is_quit("Q"));
    ASSERT_TRUE(QuitPoller::is_quit("  q \r"));
    ASSERT_FALSE(QuitPoller::is_quit("quit"));
    ASSERT_FALSE(QuitPoller::is_quit(""));
    ASSERT_FALSE(QuitPoller::is_quit("x"));
}

TEST(test_timeout_without_input) {
    Pipe pipe;
    QuitPoller poller(pipe.fds[0]);

    auto start = std::chrono::steady_clock::now();
    ASSERT_FALSE(poller.poll(kPoll));
    ASSERT_TRUE(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(5));
}

TEST(test_quit_line) {
    Pipe pipe;
    QuitPoller poller(pipe.fds[0]);

    pipe.write("hello\n");
    ASSERT_FALSE(poller.poll(kPoll));

    pipe.write("q\n");
    ASSERT_TRUE(poller.poll(kPoll));
}

TEST(test_quit_split_across_reads) {
    Pipe pipe;
    QuitPoller poller(pipe.fds[0]);

    pipe.write("q");
    ASSERT_FALSE(poller.poll(kPoll)); // Line not complete yet
    pipe.write("\n");
    ASSERT_TRUE(poller.poll(kPoll));
}

TEST(test_eof_does_not_quit) {
    Pipe pipe;
    QuitPoller poller(pipe.fds[0]);

    pipe.close_write();
    ASSERT_FALSE(poller.poll(kPoll));
    ASSERT_TRUE(poller.at_eof());
    ASSERT_FALSE(poller.poll(kPoll)); // Just sleeps now
}

int main() {
    std::cout << "=== Quit Poller Tests ===\n";

    RUN_TEST(test_is_quit);
    RUN_TEST(test_timeout_without_input);
    RUN_TEST(test_quit_line);
    RUN_TEST(test_quit_split_across_reads);
    RUN_TEST(test_eof_does_not_quit);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
