#pragma once

#include "../network/frame_decoder.hpp"

#include <cctype>
#include <cerrno>
#include <chrono>
#include <string>
#include <string_view>
#include <sys/select.h>
#include <thread>
#include <unistd.h>

namespace exomon {
namespace util {

/**
 * Non-blocking quit-key poller
 *
 * Waits up to one poll interval for input on `fd` and reports whether a
 * complete line equal to "q" (case-insensitive, surrounding whitespace
 * ignored) has arrived. Other lines are ignored. After EOF on the input the
 * poller just sleeps, so a detached stdin never ends the session.
 */
class QuitPoller {
public:
    explicit QuitPoller(int fd = STDIN_FILENO) : fd_(fd), eof_(false) {}

    /**
     * @return true once a quit line has been read
     */
    bool poll(std::chrono::milliseconds timeout) {
        if (eof_ || fd_ < 0) {
            std::this_thread::sleep_for(timeout);
            return false;
        }

        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(fd_, &readfds);

        timeval tv{};
        tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);

        int ready = ::select(fd_ + 1, &readfds, nullptr, nullptr, &tv);
        if (ready <= 0) {
            // Timeout, or EINTR from a shutdown signal
            return false;
        }

        char buf[256];
        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n == 0) {
            eof_ = true;
            return false;
        }
        if (n < 0) {
            if (errno != EINTR && errno != EAGAIN)
                eof_ = true;
            return false;
        }

        bool quit = false;
        lines_.feed(buf, static_cast<size_t>(n), [&](std::string_view line) {
            if (is_quit(line))
                quit = true;
        });
        return quit;
    }

    bool at_eof() const { return eof_; }

    static bool is_quit(std::string_view line) {
        size_t first = line.find_first_not_of(" \t\r");
        if (first == std::string_view::npos)
            return false;
        size_t last = line.find_last_not_of(" \t\r");
        std::string_view word = line.substr(first, last - first + 1);
        return word.size() == 1 && std::tolower(static_cast<unsigned char>(word[0])) == 'q';
    }

private:
    int fd_;
    bool eof_;
    network::FrameDecoder lines_; // Reuses newline framing for stdin
};

} // namespace util
} // namespace exomon
