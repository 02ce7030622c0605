#include "../include/monitor/aggregate_stats.hpp"
#include "../include/monitor/feed.hpp"
#include "../include/monitor/message_router.hpp"
#include "../include/protocol/message.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace exomon;
using namespace exomon::monitor;
using namespace exomon::protocol;

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

// Records every emitted line
class CaptureFeed : public IFeedSink {
public:
    std::vector<FeedLine> lines;

    void emit(const RenderRequest& request) override {
        for (const auto& line : request.lines)
            lines.push_back(line);
    }

    bool contains(const std::string& text) const {
        for (const auto& line : lines) {
            if (line.text.find(text) != std::string::npos)
                return true;
        }
        return false;
    }
};

// Fails on any line containing the trigger text
class ThrowingFeed : public CaptureFeed {
public:
    explicit ThrowingFeed(std::string trigger) : trigger_(std::move(trigger)) {}

    void emit(const RenderRequest& request) override {
        for (const auto& line : request.lines) {
            if (line.text.find(trigger_) != std::string::npos)
                throw std::runtime_error("console write failed");
        }
        CaptureFeed::emit(request);
    }

private:
    std::string trigger_;
};

Envelope make(Payload payload, const std::string& time = "10:30:45") {
    Envelope env;
    env.payload = std::move(payload);
    env.time = time;
    env.timestamp_present = true;
    return env;
}

} // namespace

TEST(test_welcome_renders_banner) {
    AggregateStats stats;
    CaptureFeed feed;
    MessageRouter router(stats, feed);

    WelcomePayload p;
    p.server = "ExoManager MCP Server";
    p.version = "1.0.0";
    p.capabilities = {"logs", "metrics"};
    router.dispatch(make(p));

    ASSERT_EQ(feed.lines.size(), 3u);
    ASSERT_EQ(feed.lines[0].text, "[10:30:45] Connected to ExoManager MCP Server v1.0.0");
    ASSERT_EQ(feed.lines[1].text, "   Capabilities: logs, metrics");
    ASSERT_EQ(feed.lines[2].text, std::string(60, '-'));

    // Only the total moves
    ASSERT_EQ(stats.messages().total, 1u);
    ASSERT_EQ(stats.messages().errors, 0u);
    ASSERT_EQ(stats.messages().warnings, 0u);
    ASSERT_EQ(stats.messages().info, 0u);
    ASSERT_TRUE(stats.performance().empty());
}

TEST(test_log_entry_counting) {
    AggregateStats stats;
    CaptureFeed feed;
    MessageRouter router(stats, feed);

    LogEntryPayload err;
    err.level = "INFO";
    err.message = "flagged";
    err.is_error = true;
    router.dispatch(make(err));

    LogEntryPayload warn;
    warn.level = "WARNING";
    warn.message = "careful";
    router.dispatch(make(warn));

    LogEntryPayload other;
    other.level = "DEBUG";
    other.message = "noise";
    router.dispatch(make(other));

    const auto& m = stats.messages();
    ASSERT_EQ(m.total, 3u);
    ASSERT_EQ(m.errors, 1u);
    ASSERT_EQ(m.warnings, 1u);
    ASSERT_EQ(m.info, 1u);

    ASSERT_EQ(feed.lines[0].text, "[10:30:45] [INFO] flagged");
    ASSERT_TRUE(feed.lines[0].tone == Tone::Error);
    ASSERT_TRUE(feed.lines[1].tone == Tone::Warning);
    ASSERT_EQ(feed.lines[2].text, "[10:30:45] [DEBUG] noise");
}

TEST(test_performance_records_sample) {
    AggregateStats stats;
    CaptureFeed feed;
    MessageRouter router(stats, feed);

    PerformanceMetricsPayload p;
    p.cpu = 55.24;
    p.memory = 70.0;
    p.disk = 3.14;
    p.gpu = 0.0;
    p.network_status = "Connected";
    p.web_interface_accessible = true;
    router.dispatch(make(p));

    ASSERT_EQ(stats.performance().size(), 1u);
    ASSERT_TRUE(stats.performance().newest().memory == 70.0);
    ASSERT_TRUE(stats.performance().newest().captured_at_ns > 0);

    ASSERT_EQ(feed.lines.size(), 2u);
    ASSERT_EQ(feed.lines[0].text, "[10:30:45] CPU: 55.2% | Memory: 70.0% | Disk: 3.1% | GPU: 0.0%");
    ASSERT_EQ(feed.lines[1].text, "   Network: Connected | Web: up | API: down");
}

TEST(test_service_status_priority) {
    AggregateStats stats;
    CaptureFeed feed;
    MessageRouter router(stats, feed);

    ServiceStatusPayload installing;
    installing.is_installing = true;
    installing.is_installed = true;
    installing.is_running = true;
    installing.installation_progress = "Downloading";
    router.dispatch(make(installing));
    ASSERT_EQ(feed.lines.back().text, "[10:30:45] Service: Installing - Downloading");

    ServiceStatusPayload uninstalling;
    uninstalling.is_uninstalling = true;
    uninstalling.is_installed = true;
    router.dispatch(make(uninstalling));
    ASSERT_EQ(feed.lines.back().text, "[10:30:45] Service: Uninstalling");

    ServiceStatusPayload running;
    running.is_installed = true;
    running.is_running = true;
    router.dispatch(make(running));
    ASSERT_EQ(feed.lines.back().text, "[10:30:45] Service: Running");

    ServiceStatusPayload stopped;
    stopped.is_installed = true;
    stopped.last_error = "exited with 1";
    router.dispatch(make(stopped));
    ASSERT_EQ(feed.lines[feed.lines.size() - 2].text, "[10:30:45] Service: Stopped");
    ASSERT_EQ(feed.lines.back().text, "   Error: exited with 1");

    router.dispatch(make(ServiceStatusPayload{}));
    ASSERT_EQ(feed.lines.back().text, "[10:30:45] Service: Not Installed");

    ASSERT_EQ(stats.messages().total, 5u);
    ASSERT_EQ(stats.messages().errors, 0u);
}

TEST(test_network_discovery_last_three_nodes) {
    AggregateStats stats;
    CaptureFeed feed;
    MessageRouter router(stats, feed);

    NetworkDiscoveryPayload p;
    p.is_discovering = true;
    p.discovered_nodes_count = 5;
    p.last_error = "mdns timeout";
    for (int i = 1; i <= 5; ++i) {
        DiscoveredNode node;
        node.name = "node-" + std::to_string(i);
        node.address = "10.0.0." + std::to_string(i);
        node.is_online = (i % 2) == 1;
        p.nodes.push_back(node);
    }
    router.dispatch(make(p));

    ASSERT_EQ(feed.lines.size(), 5u);
    ASSERT_EQ(feed.lines[0].text, "[10:30:45] Network Discovery: Scanning | Nodes: 5");
    ASSERT_EQ(feed.lines[1].text, "   Error: mdns timeout");
    ASSERT_EQ(feed.lines[2].text, "   [online] node-3 (10.0.0.3)");
    ASSERT_EQ(feed.lines[3].text, "   [offline] node-4 (10.0.0.4)");
    ASSERT_EQ(feed.lines[4].text, "   [online] node-5 (10.0.0.5)");
}

TEST(test_network_discovery_idle_no_nodes) {
    AggregateStats stats;
    CaptureFeed feed;
    MessageRouter router(stats, feed);

    router.dispatch(make(NetworkDiscoveryPayload{}));
    ASSERT_EQ(feed.lines.size(), 1u);
    ASSERT_EQ(feed.lines[0].text, "[10:30:45] Network Discovery: Idle | Nodes: 0");
}

TEST(test_debug_message_source) {
    AggregateStats stats;
    CaptureFeed feed;
    MessageRouter router(stats, feed);

    DebugMessagePayload p;
    p.level = "WARNING";
    p.message = "slow response";
    p.source = "ExoNetworkDiscovery";

    // Envelope has no source: data.source is used
    router.dispatch(make(p));
    ASSERT_EQ(feed.lines.back().text, "[10:30:45] [ExoNetworkDiscovery] slow response");
    ASSERT_TRUE(feed.lines.back().tone == Tone::Warning);

    // Envelope source wins
    Envelope env = make(p);
    env.source = "ExoManager";
    env.source_present = true;
    router.dispatch(env);
    ASSERT_EQ(feed.lines.back().text, "[10:30:45] [ExoManager] slow response");

    // Debug messages never touch severity counters
    ASSERT_EQ(stats.messages().warnings, 0u);
    ASSERT_EQ(stats.messages().total, 2u);
}

TEST(test_unknown_type) {
    AggregateStats stats;
    CaptureFeed feed;
    MessageRouter router(stats, feed);

    router.dispatch(make(UnknownPayload{"heartbeat"}));
    ASSERT_EQ(feed.lines.size(), 1u);
    ASSERT_EQ(feed.lines[0].text, "[10:30:45] Unknown message type: heartbeat");
    ASSERT_EQ(stats.messages().total, 1u);
    ASSERT_EQ(stats.pipeline().unknown_types, 1u);

    router.set_show_unknown(false);
    router.dispatch(make(UnknownPayload{"heartbeat"}));
    ASSERT_EQ(feed.lines.size(), 1u);
    ASSERT_EQ(stats.messages().total, 2u);
    ASSERT_EQ(stats.pipeline().unknown_types, 2u);
}

TEST(test_handler_fault_is_contained) {
    AggregateStats stats;
    ThrowingFeed feed("explode");
    MessageRouter router(stats, feed);

    LogEntryPayload bad;
    bad.level = "INFO";
    bad.message = "explode";
    router.dispatch(make(bad));

    ASSERT_EQ(stats.pipeline().handler_faults, 1u);
    ASSERT_TRUE(feed.contains("Error processing log_entry message: console write failed"));

    // Next message goes through normally
    LogEntryPayload good;
    good.level = "INFO";
    good.message = "fine";
    router.dispatch(make(good));
    ASSERT_TRUE(feed.contains("[10:30:45] [INFO] fine"));
    ASSERT_EQ(stats.messages().total, 2u);
    ASSERT_EQ(stats.pipeline().handler_faults, 1u);
}

TEST(test_console_feed_color) {
    std::ostringstream plain_out;
    ConsoleFeed plain(plain_out, false);
    RenderRequest r;
    r.add(Tone::Error, "bad");
    plain.emit(r);
    ASSERT_EQ(plain_out.str(), "bad\n");

    std::ostringstream color_out;
    ConsoleFeed colored(color_out, true);
    colored.emit(r);
    ASSERT_EQ(color_out.str(), std::string(term::BRED) + "bad" + term::RESET + "\n");
}

TEST(test_summary_rendering) {
    SessionSummary summary;
    summary.messages.total = 3;
    summary.messages.errors = 1;
    summary.messages.info = 1;
    summary.avg_cpu = 55.2;
    summary.avg_memory = 70.0;

    CaptureFeed feed;
    feed.emit(render_summary(summary));
    ASSERT_TRUE(feed.contains("STATISTICS"));
    ASSERT_TRUE(feed.contains("Total Messages: 3"));
    ASSERT_TRUE(feed.contains("Errors: 1"));
    ASSERT_TRUE(feed.contains("Warnings: 0"));
    ASSERT_TRUE(feed.contains("Info: 1"));
    ASSERT_TRUE(feed.contains("Average CPU: 55.2%"));
    ASSERT_TRUE(feed.contains("Average Memory: 70.0%"));

    CaptureFeed empty;
    empty.emit(render_summary(SessionSummary{}));
    ASSERT_FALSE(empty.contains("Average CPU"));
}

int main() {
    std::cout << "=== Message Router Tests ===\n";

    RUN_TEST(test_welcome_renders_banner);
    RUN_TEST(test_log_entry_counting);
    RUN_TEST(test_performance_records_sample);
    RUN_TEST(test_service_status_priority);
    RUN_TEST(test_network_discovery_last_three_nodes);
    RUN_TEST(test_network_discovery_idle_no_nodes);
    RUN_TEST(test_debug_message_source);
    RUN_TEST(test_unknown_type);
    RUN_TEST(test_handler_fault_is_contained);
    RUN_TEST(test_console_feed_color);
    RUN_TEST(test_summary_rendering);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
