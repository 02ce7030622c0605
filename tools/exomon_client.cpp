/**
 * ExoManager MCP Monitoring Client
 *
 * Connects to the ExoManager MCP server, prints its live stream of logs,
 * performance metrics, service and discovery status, and a statistics
 * summary on exit.
 *
 * Usage:
 *   exomon_client                         # localhost:52417
 *   exomon_client -H 10.0.0.5 -p 52417    # Remote server
 *   exomon_client -c exomon.json          # Settings from file
 *
 * Quit with 'q' + Enter, or Ctrl+C.
 */

#include "../include/config/client_config.hpp"
#include "../include/errors.hpp"
#include "../include/logging/async_logger.hpp"
#include "../include/monitor/aggregate_stats.hpp"
#include "../include/monitor/feed.hpp"
#include "../include/monitor/ingest_pipeline.hpp"
#include "../include/monitor/session.hpp"
#include "../include/network/tcp_connection.hpp"
#include "../include/util/cli.hpp"
#include "../include/util/quit_poller.hpp"
#include "../include/util/system.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

using namespace exomon;

namespace {

std::atomic<bool> g_running{true};

void print_banner(monitor::IFeedSink& feed) {
    monitor::RenderRequest r;
    r.add(monitor::Tone::Highlight, "ExoManager MCP Client");
    r.add(monitor::Tone::Highlight, monitor::separator());
    r.add(monitor::Tone::Plain, "This client connects to the ExoManager MCP server and displays");
    r.add(monitor::Tone::Plain, "real-time debug information, logs, and performance metrics.");
    r.add(monitor::Tone::Highlight, monitor::separator());
    r.add(monitor::Tone::Plain, "Press 'q' and Enter to quit");
    r.add(monitor::Tone::Highlight, monitor::separator());
    feed.emit(r);
}

monitor::Tone tone_for(logging::LogLevel level) {
    if (level >= logging::LogLevel::Error)
        return monitor::Tone::Error;
    if (level == logging::LogLevel::Warn)
        return monitor::Tone::Warning;
    return monitor::Tone::Dim;
}

} // namespace

int main(int argc, char* argv[]) {
    util::CLIArgs args;
    if (!util::parse_args(argc, argv, args)) {
        return 1;
    }
    if (args.help) {
        util::print_help();
        return 0;
    }

    config::ClientConfig cfg;
    if (!args.config_path.empty()) {
        try {
            cfg = config::ConfigLoader::load(args.config_path);
        } catch (const ConfigError& e) {
            std::cerr << "Config error: " << e.what() << "\n";
            return 1;
        }
    }
    util::apply_overrides(args, cfg);
    if (!util::is_terminal(STDOUT_FILENO)) {
        cfg.color = false;
    }

    monitor::ConsoleFeed feed(std::cout, cfg.color);

    // Diagnostics share the console with the message feed
    logging::AsyncLogger logger;
    logger.set_min_level(cfg.log_level);
    logger.set_sink([&feed](const logging::LogEntry& entry) {
        monitor::RenderRequest r;
        r.add(tone_for(entry.level), logging::format_feed_line(entry));
        feed.emit(r);
    });
    logger.start();

    print_banner(feed);

    monitor::AggregateStats stats;
    monitor::IngestPipeline pipeline(stats, feed, cfg.max_frame_bytes, cfg.show_unknown);
    monitor::Session session(std::make_unique<network::TcpConnection>(cfg.host, cfg.port), pipeline, stats, feed,
                             logger);

    try {
        session.connect();
    } catch (const ConnectError& e) {
        monitor::RenderRequest r;
        r.add(monitor::Tone::Error, std::string("Failed to connect to MCP server: ") + e.what());
        feed.emit(r);
        logger.stop();
        return 1;
    }

    {
        monitor::RenderRequest r;
        r.add(monitor::Tone::Success, "Connected to ExoManager MCP Server at " + cfg.endpoint());
        r.add(monitor::Tone::Plain, "Receiving real-time debug information...");
        r.add(monitor::Tone::Highlight, monitor::separator());
        feed.emit(r);
    }

    util::install_shutdown_handler(g_running);
    session.start();

    // Foreground: wait for 'q', a signal, or the end of the stream
    util::QuitPoller quit(STDIN_FILENO);
    const auto interval = std::chrono::milliseconds(cfg.poll_interval_ms);
    while (g_running.load() && session.is_receiving()) {
        if (quit.poll(interval)) {
            break;
        }
    }

    session.request_stop();
    session.finish();

    if (int sig = util::last_shutdown_signal()) {
        LOGF_INFO(logger, System, "Stopped by signal %d", sig);
    }
    if (session.ended_with_error()) {
        LOGF_WARN(logger, Session, "Session ended: %s", session.end_reason().c_str());
    }
    logger.stop();
    if (logger.dropped_count() > 0) {
        monitor::RenderRequest r;
        r.add(monitor::Tone::Warning, "   " + std::to_string(logger.dropped_count()) + " diagnostic lines dropped");
        feed.emit(r);
    }

    monitor::RenderRequest bye;
    bye.add(monitor::Tone::Plain, "");
    bye.add(monitor::Tone::Plain, "Disconnected from MCP server");
    feed.emit(bye);
    return 0;
}
