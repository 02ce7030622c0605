#include "../include/monitor/aggregate_stats.hpp"
#include "../include/monitor/rolling_window.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace exomon;
using namespace exomon::monitor;

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
#define ASSERT_NEAR(a, b, eps) assert(std::abs((a) - (b)) < (eps))

TEST(test_window_starts_empty) {
    RollingWindow<int, 4> window;
    ASSERT_TRUE(window.empty());
    ASSERT_FALSE(window.full());
    ASSERT_EQ(window.size(), 0u);
    ASSERT_EQ(window.capacity(), 4u);
}

TEST(test_window_evicts_oldest) {
    RollingWindow<int, 4> window;
    for (int i = 1; i <= 6; ++i) {
        window.push(i);
    }

    ASSERT_TRUE(window.full());
    ASSERT_EQ(window.size(), 4u);
    ASSERT_EQ(window.evicted(), 2u);
    ASSERT_EQ(window.oldest(), 3);
    ASSERT_EQ(window.newest(), 6);
    ASSERT_EQ(window[0], 3);
    ASSERT_EQ(window[3], 6);
}

TEST(test_window_for_each_in_arrival_order) {
    RollingWindow<int, 3> window;
    for (int i = 0; i < 10; ++i) {
        window.push(i);
    }

    int expected = 7;
    window.for_each([&](int v) {
        ASSERT_EQ(v, expected);
        ++expected;
    });
    ASSERT_EQ(expected, 10);
}

TEST(test_window_clear) {
    RollingWindow<int, 3> window;
    window.push(1);
    window.push(2);
    window.clear();
    ASSERT_TRUE(window.empty());
    window.push(9);
    ASSERT_EQ(window.oldest(), 9);
    ASSERT_EQ(window.newest(), 9);
}

TEST(test_performance_window_keeps_last_100) {
    AggregateStats stats;
    for (int i = 0; i < 150; ++i) {
        PerformanceSample s;
        s.cpu = static_cast<double>(i);
        s.memory = 2.0 * i;
        stats.record_performance(s);
    }

    const auto& window = stats.performance();
    ASSERT_EQ(window.size(), 100u);
    for (size_t i = 0; i < window.size(); ++i) {
        ASSERT_TRUE(window[i].cpu == static_cast<double>(50 + i));
    }

    // Mean of 50..149
    ASSERT_NEAR(*stats.average_cpu(), 99.5, 1e-9);
    ASSERT_NEAR(*stats.average_memory(), 199.0, 1e-9);
}

TEST(test_no_samples_no_average) {
    AggregateStats stats;
    ASSERT_FALSE(stats.average_cpu().has_value());
    ASSERT_FALSE(stats.average_memory().has_value());

    SessionSummary summary = stats.summarize();
    ASSERT_FALSE(summary.avg_cpu.has_value());
    ASSERT_EQ(summary.samples_retained, 0u);
}

TEST(test_log_classification) {
    ASSERT_TRUE(classify_log_entry(true, "INFO") == Severity::Error);
    ASSERT_TRUE(classify_log_entry(true, "WARNING") == Severity::Error);
    ASSERT_TRUE(classify_log_entry(false, "ERROR") == Severity::Error);
    ASSERT_TRUE(classify_log_entry(false, "WARNING") == Severity::Warning);
    ASSERT_TRUE(classify_log_entry(false, "WARN") == Severity::Info);
    ASSERT_TRUE(classify_log_entry(false, "DEBUG") == Severity::Info);
    ASSERT_TRUE(classify_log_entry(false, "UNKNOWN") == Severity::Info);
}

TEST(test_log_counters) {
    AggregateStats stats;
    stats.record_log_entry(true, "INFO");
    stats.record_log_entry(false, "ERROR");
    stats.record_log_entry(false, "WARNING");
    stats.record_log_entry(false, "INFO");
    stats.record_log_entry(false, "TRACE");

    const auto& m = stats.messages();
    ASSERT_EQ(m.errors, 2u);
    ASSERT_EQ(m.warnings, 1u);
    ASSERT_EQ(m.info, 2u);
    ASSERT_EQ(m.total, 0u); // Counted by the router, not here
}

TEST(test_summary_snapshot) {
    AggregateStats stats;
    stats.record_message();
    stats.record_message();
    stats.record_log_entry(false, "ERROR");
    stats.record_bytes(128);
    stats.record_frame();
    stats.record_decode_failure();
    stats.record_unknown_type();

    PerformanceSample s;
    s.cpu = 40.0;
    s.memory = 60.0;
    stats.record_performance(s);

    SessionSummary summary = stats.summarize();
    ASSERT_EQ(summary.messages.total, 2u);
    ASSERT_EQ(summary.messages.errors, 1u);
    ASSERT_EQ(summary.pipeline.bytes_received, 128u);
    ASSERT_EQ(summary.pipeline.frames, 1u);
    ASSERT_EQ(summary.pipeline.decode_failures, 1u);
    ASSERT_EQ(summary.pipeline.unknown_types, 1u);
    ASSERT_EQ(summary.samples_retained, 1u);
    ASSERT_NEAR(*summary.avg_cpu, 40.0, 1e-9);
    ASSERT_NEAR(*summary.avg_memory, 60.0, 1e-9);
}

int main() {
    std::cout << "=== Aggregate Stats Tests ===\n";

    RUN_TEST(test_window_starts_empty);
    RUN_TEST(test_window_evicts_oldest);
    RUN_TEST(test_window_for_each_in_arrival_order);
    RUN_TEST(test_window_clear);
    RUN_TEST(test_performance_window_keeps_last_100);
    RUN_TEST(test_no_samples_no_average);
    RUN_TEST(test_log_classification);
    RUN_TEST(test_log_counters);
    RUN_TEST(test_summary_snapshot);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
