#pragma once

/**
 * System utilities for the monitoring client
 *
 * Signal handling and terminal detection. POSIX implementations.
 */

#include <atomic>
#include <csignal>
#include <cstdio>
#include <unistd.h>

namespace exomon {
namespace util {

// ============================================================================
// Signal Handler
// ============================================================================

namespace detail {
inline std::atomic<bool>* g_running_flag = nullptr;
inline void (*g_pre_shutdown_callback)() = nullptr;
inline std::atomic<int> g_last_signal{0};
} // namespace detail

/**
 * Graceful shutdown signal handler.
 *
 * Sets running flag to false and optionally calls pre-shutdown callback.
 * Installed via install_shutdown_handler(). The foreground loop notices the
 * flag on its next poll and stops the session.
 */
inline void graceful_shutdown_handler(int sig) {
    detail::g_last_signal.store(sig);
    if (detail::g_pre_shutdown_callback) {
        detail::g_pre_shutdown_callback();
    }
    static const char msg[] = "\n[SHUTDOWN] Signal received, stopping...\n";
    ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
    (void)ignored;
    if (detail::g_running_flag) {
        detail::g_running_flag->store(false);
    }
}

/**
 * Install graceful shutdown handler for SIGINT and SIGTERM.
 *
 * @param running Atomic flag to set to false on signal
 * @param pre_shutdown Optional callback to invoke before setting flag
 */
inline void install_shutdown_handler(std::atomic<bool>& running, void (*pre_shutdown)() = nullptr) {
    detail::g_running_flag = &running;
    detail::g_pre_shutdown_callback = pre_shutdown;
    detail::g_last_signal.store(0);
    std::signal(SIGINT, graceful_shutdown_handler);
    std::signal(SIGTERM, graceful_shutdown_handler);
}

// Last signal caught by the shutdown handler, 0 if none
inline int last_shutdown_signal() {
    return detail::g_last_signal.load();
}

// ============================================================================
// Terminal
// ============================================================================

inline bool is_terminal(int fd) {
    return ::isatty(fd) == 1;
}

} // namespace util
} // namespace exomon
