#pragma once

#include "../config/defaults.hpp"
#include "../types.hpp"
#include "rolling_window.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace exomon {
namespace monitor {

/**
 * Point-in-time resource snapshot from a performance_metrics message
 */
struct PerformanceSample {
    Timestamp captured_at_ns = 0; // Wall clock at receipt
    Percent cpu = 0.0;
    Percent memory = 0.0;
    Percent disk = 0.0;
    Percent gpu = 0.0;
};

/**
 * Message counters. `total` counts every decoded envelope; the severity
 * split counts log_entry messages only.
 */
struct MessageCounters {
    uint64_t total = 0;
    uint64_t errors = 0;
    uint64_t warnings = 0;
    uint64_t info = 0;
};

/**
 * Pipeline health counters (frames that never reached a handler, or
 * failed in one)
 */
struct PipelineCounters {
    uint64_t bytes_received = 0;
    uint64_t frames = 0;
    uint64_t decode_failures = 0;
    uint64_t oversized_frames = 0;
    uint64_t handler_faults = 0;
    uint64_t unknown_types = 0;
};

/**
 * End-of-session report
 */
struct SessionSummary {
    MessageCounters messages;
    PipelineCounters pipeline;
    size_t samples_retained = 0;
    std::optional<double> avg_cpu;    // Empty when no samples
    std::optional<double> avg_memory;
};

/**
 * Severity of a log_entry: the explicit error flag wins, then the level.
 * `level` must already be upper-cased.
 */
inline Severity classify_log_entry(bool is_error, std::string_view level) {
    if (is_error || level == "ERROR")
        return Severity::Error;
    if (level == "WARNING")
        return Severity::Warning;
    return Severity::Info;
}

/**
 * Aggregate State Store
 *
 * Written only by the receive thread. The foreground reads it through
 * summarize() after that thread has been joined, so no locking.
 */
class AggregateStats {
public:
    static constexpr size_t WINDOW_CAPACITY = config::window::PERFORMANCE_CAPACITY;
    using PerformanceWindow = RollingWindow<PerformanceSample, WINDOW_CAPACITY>;

    void record_message() { ++messages_.total; }

    Severity record_log_entry(bool is_error, std::string_view level) {
        Severity severity = classify_log_entry(is_error, level);
        switch (severity) {
        case Severity::Error:
            ++messages_.errors;
            break;
        case Severity::Warning:
            ++messages_.warnings;
            break;
        default:
            ++messages_.info;
            break;
        }
        return severity;
    }

    void record_performance(const PerformanceSample& sample) { performance_.push(sample); }

    void record_bytes(uint64_t n) { pipeline_.bytes_received += n; }
    void record_frame() { ++pipeline_.frames; }
    void record_decode_failure() { ++pipeline_.decode_failures; }
    void record_oversized_frame() { ++pipeline_.oversized_frames; }
    void record_handler_fault() { ++pipeline_.handler_faults; }
    void record_unknown_type() { ++pipeline_.unknown_types; }

    const MessageCounters& messages() const { return messages_; }
    const PipelineCounters& pipeline() const { return pipeline_; }
    const PerformanceWindow& performance() const { return performance_; }

    std::optional<double> average_cpu() const {
        return average([](const PerformanceSample& s) { return s.cpu; });
    }

    std::optional<double> average_memory() const {
        return average([](const PerformanceSample& s) { return s.memory; });
    }

    SessionSummary summarize() const {
        SessionSummary summary;
        summary.messages = messages_;
        summary.pipeline = pipeline_;
        summary.samples_retained = performance_.size();
        summary.avg_cpu = average_cpu();
        summary.avg_memory = average_memory();
        return summary;
    }

private:
    MessageCounters messages_;
    PipelineCounters pipeline_;
    PerformanceWindow performance_;

    template <typename Field>
    std::optional<double> average(Field field) const {
        if (performance_.empty())
            return std::nullopt;
        double sum = 0.0;
        performance_.for_each([&](const PerformanceSample& s) { sum += field(s); });
        return sum / static_cast<double>(performance_.size());
    }
};

} // namespace monitor
} // namespace exomon
