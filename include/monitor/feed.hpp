#pragma once

#include "../config/defaults.hpp"
#include "aggregate_stats.hpp"

#include <cstdint>
#include <iomanip>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace exomon {
namespace monitor {

// ============================================================================
// Terminal Colors (ANSI)
// ============================================================================

namespace term {
constexpr const char* RESET = "\033[0m";
constexpr const char* BOLD = "\033[1m";
constexpr const char* DIM = "\033[2m";

constexpr const char* BRED = "\033[91m";
constexpr const char* BGREEN = "\033[92m";
constexpr const char* BYELLOW = "\033[93m";
constexpr const char* BCYAN = "\033[96m";
constexpr const char* BWHITE = "\033[97m";
} // namespace term

/**
 * Presentation class of a feed line. Mapped to a color by the console;
 * ignored by sinks without color.
 */
enum class Tone : uint8_t { Plain = 0, Info, Success, Warning, Error, Highlight, Dim };

inline const char* tone_color(Tone tone) {
    switch (tone) {
    case Tone::Info:
        return term::BCYAN;
    case Tone::Success:
        return term::BGREEN;
    case Tone::Warning:
        return term::BYELLOW;
    case Tone::Error:
        return term::BRED;
    case Tone::Highlight:
        return term::BWHITE;
    case Tone::Dim:
        return term::DIM;
    default:
        return "";
    }
}

struct FeedLine {
    Tone tone = Tone::Plain;
    std::string text;
};

/**
 * Lines produced for one message, written together
 */
struct RenderRequest {
    std::vector<FeedLine> lines;

    RenderRequest& add(Tone tone, std::string text) {
        lines.push_back(FeedLine{tone, std::move(text)});
        return *this;
    }

    bool empty() const { return lines.empty(); }
};

/**
 * Output surface for render requests
 */
class IFeedSink {
public:
    virtual ~IFeedSink() = default;
    virtual void emit(const RenderRequest& request) = 0;
};

/**
 * Console feed
 *
 * Thread-safe: both the receive thread and the foreground write here. The
 * lines of one request are never interleaved with another request.
 */
class ConsoleFeed : public IFeedSink {
public:
    explicit ConsoleFeed(std::ostream& out, bool color = true) : out_(out), color_(color) {}

    void emit(const RenderRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& line : request.lines) {
            const char* color = color_ ? tone_color(line.tone) : "";
            if (*color) {
                out_ << color << line.text << term::RESET << '\n';
            } else {
                out_ << line.text << '\n';
            }
        }
        out_.flush();
    }

private:
    std::ostream& out_;
    const bool color_;
    std::mutex mutex_;
};

// ============================================================================
// Formatting helpers
// ============================================================================

inline std::string format_fixed(double value, int precision = 1) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

inline std::string separator(char c = '=', int width = config::feed::SEPARATOR_WIDTH) {
    return std::string(static_cast<size_t>(width), c);
}

/**
 * End-of-session statistics block
 */
inline RenderRequest render_summary(const SessionSummary& summary) {
    RenderRequest r;
    r.add(Tone::Plain, "");
    r.add(Tone::Highlight, separator());
    r.add(Tone::Highlight, "STATISTICS");
    r.add(Tone::Highlight, separator());
    r.add(Tone::Plain, "Total Messages: " + std::to_string(summary.messages.total));
    r.add(Tone::Plain, "Errors: " + std::to_string(summary.messages.errors));
    r.add(Tone::Plain, "Warnings: " + std::to_string(summary.messages.warnings));
    r.add(Tone::Plain, "Info: " + std::to_string(summary.messages.info));

    if (summary.avg_cpu && summary.avg_memory) {
        r.add(Tone::Plain, "Average CPU: " + format_fixed(*summary.avg_cpu) + "%");
        r.add(Tone::Plain, "Average Memory: " + format_fixed(*summary.avg_memory) + "%");
    }

    const auto& p = summary.pipeline;
    r.add(Tone::Dim, separator('-'));
    r.add(Tone::Dim, "Bytes Received: " + std::to_string(p.bytes_received) +
                         " | Frames: " + std::to_string(p.frames) +
                         " | Decode Failures: " + std::to_string(p.decode_failures));
    r.add(Tone::Dim, "Oversized Frames: " + std::to_string(p.oversized_frames) +
                         " | Handler Faults: " + std::to_string(p.handler_faults) +
                         " | Unknown Types: " + std::to_string(p.unknown_types));
    return r;
}

} // namespace monitor
} // namespace exomon
