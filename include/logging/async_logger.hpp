#pragma once

#include "../util/time_utils.hpp"

#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <functional>
#include <string>
#include <string_view>
#include <thread>

namespace exomon {
namespace logging {

enum class LogLevel : uint8_t { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Fatal = 5 };

inline const char* level_to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    default:
        return "?";
    }
}

/**
 * Parse a level name ("debug", "WARN", "warning", ...).
 * Returns false for unrecognized names and leaves `out` untouched.
 */
inline bool level_from_string(const std::string& name, LogLevel& out) {
    std::string s;
    s.reserve(name.size());
    for (char c : name) {
        s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (s == "trace") {
        out = LogLevel::Trace;
    } else if (s == "debug") {
        out = LogLevel::Debug;
    } else if (s == "info") {
        out = LogLevel::Info;
    } else if (s == "warn" || s == "warning") {
        out = LogLevel::Warn;
    } else if (s == "error") {
        out = LogLevel::Error;
    } else if (s == "fatal") {
        out = LogLevel::Fatal;
    } else {
        return false;
    }
    return true;
}

// Which part of the client produced an entry
namespace LogCategory {
constexpr uint8_t System = 0;
constexpr uint8_t Transport = 1;
constexpr uint8_t Decode = 2;
constexpr uint8_t Dispatch = 3;
constexpr uint8_t Session = 4;
} // namespace LogCategory

inline const char* category_name(uint8_t category) {
    switch (category) {
    case LogCategory::System:
        return "system";
    case LogCategory::Transport:
        return "tcp";
    case LogCategory::Decode:
        return "decode";
    case LogCategory::Dispatch:
        return "dispatch";
    case LogCategory::Session:
        return "session";
    default:
        return "?";
    }
}

/**
 * Log entry, four cache lines. The message holds a host:port plus an
 * errno string with room to spare; longer text is cut.
 */
struct alignas(64) LogEntry {
    uint64_t timestamp_ns; // Wall clock
    LogLevel level;
    uint8_t category;      // LogCategory
    uint8_t length;        // strlen(message)
    char message[240];     // Padded to 256 by the alignment

    void set_message(const char* msg) {
        size_t len = std::strlen(msg);
        if (len >= sizeof(message))
            len = sizeof(message) - 1;
        std::memcpy(message, msg, len);
        message[len] = '\0';
        length = static_cast<uint8_t>(len);
    }

    std::string_view text() const { return std::string_view(message, length); }
};
static_assert(sizeof(LogEntry) == 256, "LogEntry must be 256 bytes");

/**
 * Diagnostic line as it appears in the console feed:
 *   "   [10:30:45] [WARN] [tcp] Connect to localhost:52417 failed: ..."
 */
inline std::string format_feed_line(const LogEntry& entry) {
    std::string line = "   [";
    line += util::format_local_hms(static_cast<std::time_t>(entry.timestamp_ns / 1000000000ULL));
    line += "] [";
    line += level_to_string(entry.level);
    line += "] [";
    line += category_name(entry.category);
    line += "] ";
    line += entry.text();
    return line;
}

/**
 * Bounded SPSC entry queue.
 *
 * Read and write positions run freely and are masked on access, so all
 * Capacity slots are usable. One producer thread and one consumer thread.
 */
template <size_t Capacity>
class EntryQueue {
public:
    static_assert(Capacity > 0 && (Capacity & (Capacity - 1)) == 0, "Capacity must be power of 2");

    EntryQueue() : write_pos_(0), read_pos_(0) {}

    bool try_push(const LogEntry& entry) {
        uint64_t write = write_pos_.load(std::memory_order_relaxed);
        if (write - read_pos_.load(std::memory_order_acquire) == Capacity)
            return false;
        slots_[write & (Capacity - 1)] = entry;
        write_pos_.store(write + 1, std::memory_order_release);
        return true;
    }

    bool try_pop(LogEntry& entry) {
        uint64_t read = read_pos_.load(std::memory_order_relaxed);
        if (read == write_pos_.load(std::memory_order_acquire))
            return false;
        entry = slots_[read & (Capacity - 1)];
        read_pos_.store(read + 1, std::memory_order_release);
        return true;
    }

    size_t size() const {
        return static_cast<size_t>(write_pos_.load(std::memory_order_acquire) -
                                   read_pos_.load(std::memory_order_acquire));
    }

    bool empty() const { return size() == 0; }

    static constexpr size_t capacity() { return Capacity; }

private:
    alignas(64) std::atomic<uint64_t> write_pos_;
    alignas(64) std::atomic<uint64_t> read_pos_;
    alignas(64) std::array<LogEntry, Capacity> slots_;
};

/**
 * Async Logger
 *
 * log() copies the entry into the queue and returns. A background thread
 * hands entries to the sink; exomon_client's sink writes them into the
 * console feed. Without a sink, entries go to stderr as feed lines.
 *
 * Single producer: the session logs from the foreground before the
 * receive thread starts and after it is joined, and from the receive
 * thread in between. A full queue drops the entry and counts it.
 *
 * Usage:
 *   AsyncLogger logger;
 *   logger.set_sink([&](const LogEntry& e) { ... });
 *   logger.start();
 *   LOGF_INFO(logger, Transport, "Connected to %s", endpoint.c_str());
 *   logger.stop();   // drains what is left
 */
class AsyncLogger {
public:
    static constexpr size_t QUEUE_CAPACITY = 4096;

    using Sink = std::function<void(const LogEntry&)>;

    AsyncLogger() : running_(false), min_level_(LogLevel::Info), dropped_(0), accepted_(0) {}

    ~AsyncLogger() { stop(); }

    // Non-copyable
    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    void start() {
        if (running_.exchange(true))
            return;
        drain_thread_ = std::thread([this]() {
            while (running_.load(std::memory_order_acquire)) {
                if (drain() == 0)
                    std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        });
    }

    // Joins the drain thread, then writes out anything still queued
    void stop() {
        if (!running_.exchange(false))
            return;
        if (drain_thread_.joinable())
            drain_thread_.join();
        drain();
    }

    void log(LogLevel level, uint8_t category, const char* message) {
        if (level < min_level_)
            return;

        LogEntry entry;
        entry.timestamp_ns = util::wall_clock_ns();
        entry.level = level;
        entry.category = category;
        entry.set_message(message);

        if (queue_.try_push(entry)) {
            accepted_.fetch_add(1, std::memory_order_relaxed);
        } else {
            dropped_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    // printf-style; pass std::string arguments as c_str()
    template <typename... Args>
    void logf(LogLevel level, uint8_t category, const char* fmt, Args... args) {
        if (level < min_level_)
            return;
        char text[sizeof(LogEntry::message)];
        std::snprintf(text, sizeof(text), fmt, args...);
        log(level, category, text);
    }

    void set_min_level(LogLevel level) { min_level_ = level; }
    void set_sink(Sink sink) { sink_ = std::move(sink); }

    uint64_t dropped_count() const { return dropped_.load(); }
    uint64_t total_logged() const { return accepted_.load(); }

private:
    EntryQueue<QUEUE_CAPACITY> queue_;
    std::atomic<bool> running_;
    std::thread drain_thread_;
    LogLevel min_level_;
    Sink sink_;

    std::atomic<uint64_t> dropped_;
    std::atomic<uint64_t> accepted_;

    size_t drain() {
        size_t count = 0;
        LogEntry entry;
        while (queue_.try_pop(entry)) {
            if (sink_) {
                sink_(entry);
            } else {
                std::string line = format_feed_line(entry);
                std::fprintf(stderr, "%s\n", line.c_str());
            }
            ++count;
        }
        return count;
    }
};

// printf-style, tagged with a LogCategory name
#define LOGF_DEBUG(logger, cat, fmt, ...)                                                                              \
    logger.logf(exomon::logging::LogLevel::Debug, exomon::logging::LogCategory::cat, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGF_INFO(logger, cat, fmt, ...)                                                                               \
    logger.logf(exomon::logging::LogLevel::Info, exomon::logging::LogCategory::cat, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGF_WARN(logger, cat, fmt, ...)                                                                               \
    logger.logf(exomon::logging::LogLevel::Warn, exomon::logging::LogCategory::cat, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGF_ERROR(logger, cat, fmt, ...)                                                                              \
    logger.logf(exomon::logging::LogLevel::Error, exomon::logging::LogCategory::cat, fmt __VA_OPT__(, ) __VA_ARGS__)

} // namespace logging
} // namespace exomon
