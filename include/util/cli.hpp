#pragma once

/**
 * CLI utilities for the monitoring client
 *
 * Provides command-line argument parsing and related utilities.
 */

#include "../config/client_config.hpp"
#include "../config/defaults.hpp"

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace exomon {
namespace util {

/**
 * Command-line arguments for exomon_client.
 *
 * Unset optionals leave the config file (or default) value in place.
 */
struct CLIArgs {
    bool help = false;
    bool verbose = false;
    bool no_color = false;
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::optional<size_t> max_frame_bytes;
    std::string config_path; // Empty = no config file
};

/**
 * Print help message for exomon_client.
 */
inline void print_help(std::ostream& out = std::cout) {
    out << "ExoManager MCP Monitoring Client\n"
           "================================\n"
           "\n"
           "Usage: exomon_client [options]\n"
           "\n"
           "Options:\n"
           "  -H, --host HOST          MCP server host (default: "
        << config::server::HOST
        << ")\n"
           "  -p, --port PORT          MCP server port (default: "
        << config::server::PORT
        << ")\n"
           "  -c, --config FILE        Load settings from a JSON file\n"
           "  --max-frame-bytes N      Discard frames longer than N bytes (0 = unbounded)\n"
           "  --no-color               Disable ANSI colors\n"
           "  -v, --verbose            Show debug diagnostics\n"
           "  -h, --help               Show this help\n"
           "\n"
           "While running:\n"
           "  q + Enter                Quit and print statistics (Ctrl+C also works)\n"
           "\n"
           "Examples:\n"
           "  exomon_client                        # localhost:52417\n"
           "  exomon_client -H 10.0.0.5 -p 52417   # Remote server\n"
           "  exomon_client -c exomon.json -v      # Config file, verbose\n";
}

namespace detail {

inline bool parse_integer(const std::string& text, long long min, long long max, long long& out) {
    try {
        size_t used = 0;
        long long value = std::stoll(text, &used);
        if (used != text.size() || value < min || value > max)
            return false;
        out = value;
        return true;
    } catch (const std::logic_error&) {
        // invalid_argument / out_of_range
        return false;
    }
}

} // namespace detail

/**
 * Parse command-line arguments into CLIArgs struct.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output argument struct
 * @param err Stream for error messages
 * @return true if parsing succeeded, false on error
 */
inline bool parse_args(int argc, char* argv[], CLIArgs& args, std::ostream& err = std::cerr) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            args.help = true;
        }
        else if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        }
        else if (arg == "--no-color") {
            args.no_color = true;
        }
        else if ((arg == "--host" || arg == "-H") && has_value) {
            args.host = argv[++i];
            if (args.host->empty()) {
                err << "Invalid host: empty\n";
                return false;
            }
        }
        else if ((arg == "--port" || arg == "-p") && has_value) {
            long long port = 0;
            if (!detail::parse_integer(argv[++i], 1, 65535, port)) {
                err << "Invalid port: " << argv[i] << " (expected 1-65535)\n";
                return false;
            }
            args.port = static_cast<uint16_t>(port);
        }
        else if ((arg == "--config" || arg == "-c") && has_value) {
            args.config_path = argv[++i];
        }
        else if (arg == "--max-frame-bytes" && has_value) {
            long long bytes = 0;
            if (!detail::parse_integer(argv[++i], 0, INT64_MAX, bytes)) {
                err << "Invalid frame size: " << argv[i] << "\n";
                return false;
            }
            args.max_frame_bytes = static_cast<size_t>(bytes);
        }
        else {
            err << "Unknown option: " << arg << "\n";
            err << "Use --help for usage information.\n";
            return false;
        }
    }
    return true;
}

/**
 * Apply command-line overrides on top of a loaded config.
 */
inline void apply_overrides(const CLIArgs& args, config::ClientConfig& cfg) {
    if (args.host)
        cfg.host = *args.host;
    if (args.port)
        cfg.port = *args.port;
    if (args.max_frame_bytes)
        cfg.max_frame_bytes = *args.max_frame_bytes;
    if (args.no_color)
        cfg.color = false;
    if (args.verbose)
        cfg.log_level = logging::LogLevel::Debug;
}

} // namespace util
} // namespace exomon
