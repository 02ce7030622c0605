#pragma once

#include <cstddef>
#include <cstdint>

/**
 * Centralized configuration defaults for the monitoring client.
 *
 * All default values are defined here to avoid duplication across:
 * - ClientConfig
 * - CLI help text
 * - FrameDecoder / MessageRouter / Session
 */

namespace exomon::config {

// =============================================================================
// Server Endpoint
// =============================================================================
namespace server {
constexpr const char* HOST = "localhost";
constexpr uint16_t PORT = 52417; // ExoManager MCP server port
} // namespace server

// =============================================================================
// Session Loop
// =============================================================================
namespace session {
// Foreground quit-key poll interval
constexpr int POLL_INTERVAL_MS = 100;

// Bytes requested per transport read
constexpr size_t RECV_CHUNK_BYTES = 4096;
} // namespace session

// =============================================================================
// Framing
// =============================================================================
namespace framing {
constexpr char DELIMITER = '\n';

// 0 = no bound on a single frame
constexpr size_t MAX_FRAME_BYTES = 0;
} // namespace framing

// =============================================================================
// Aggregate State
// =============================================================================
namespace window {
// Performance samples retained for the session summary
constexpr size_t PERFORMANCE_CAPACITY = 100;
} // namespace window

// =============================================================================
// Feed Rendering
// =============================================================================
namespace feed {
// Characters of an undecodable frame shown in diagnostics
constexpr size_t PREVIEW_CHARS = 100;

// Discovered nodes listed per network_discovery message
constexpr size_t RECENT_NODES = 3;

constexpr int SEPARATOR_WIDTH = 60;
} // namespace feed

} // namespace exomon::config
