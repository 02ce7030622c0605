#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace exomon {
namespace protocol {

/**
 * Message kinds sent by the ExoManager MCP server.
 *
 * Order matches the alternatives of Payload, so a payload's index() is its
 * MessageType.
 */
enum class MessageType : uint8_t {
    Welcome = 0,
    LogEntry = 1,
    PerformanceMetrics = 2,
    ServiceStatus = 3,
    NetworkDiscovery = 4,
    DebugMessage = 5,
    Unknown = 6
};

// Wire tag for the "type" field
inline const char* message_type_tag(MessageType type) {
    switch (type) {
    case MessageType::Welcome:
        return "welcome";
    case MessageType::LogEntry:
        return "log_entry";
    case MessageType::PerformanceMetrics:
        return "performance_metrics";
    case MessageType::ServiceStatus:
        return "service_status";
    case MessageType::NetworkDiscovery:
        return "network_discovery";
    case MessageType::DebugMessage:
        return "debug_message";
    default:
        return "unknown";
    }
}

inline MessageType message_type_from_tag(std::string_view tag) {
    if (tag == "welcome") return MessageType::Welcome;
    if (tag == "log_entry") return MessageType::LogEntry;
    if (tag == "performance_metrics") return MessageType::PerformanceMetrics;
    if (tag == "service_status") return MessageType::ServiceStatus;
    if (tag == "network_discovery") return MessageType::NetworkDiscovery;
    if (tag == "debug_message") return MessageType::DebugMessage;
    return MessageType::Unknown;
}

// =============================================================================
// Typed payloads (the "data" member)
// =============================================================================

struct WelcomePayload {
    std::string server = "Unknown";
    std::string version = "Unknown";
    std::vector<std::string> capabilities;
};

struct LogEntryPayload {
    std::string level = "UNKNOWN"; // Upper-cased
    std::string message;
    bool is_error = false;
};

struct PerformanceMetricsPayload {
    double cpu = 0.0;
    double memory = 0.0;
    double disk = 0.0;
    double gpu = 0.0;
    std::string network_status = "Unknown";
    bool web_interface_accessible = false;
    bool api_endpoint_accessible = false;
};

struct ServiceStatusPayload {
    bool is_installed = false;
    bool is_running = false;
    bool is_installing = false;
    bool is_uninstalling = false;
    std::string last_error;
    std::string installation_progress;
};

struct DiscoveredNode {
    std::string name = "Unknown";
    std::string address = "Unknown";
    bool is_online = false;
};

struct NetworkDiscoveryPayload {
    bool is_discovering = false;
    int64_t discovered_nodes_count = 0;
    std::string last_error;
    std::vector<DiscoveredNode> nodes;
};

struct DebugMessagePayload {
    std::string level = "DEBUG"; // Upper-cased
    std::string message;
    std::string source;          // data.source, used when the envelope has none
};

struct UnknownPayload {
    std::string type_tag;
};

using Payload = std::variant<WelcomePayload,
                             LogEntryPayload,
                             PerformanceMetricsPayload,
                             ServiceStatusPayload,
                             NetworkDiscoveryPayload,
                             DebugMessagePayload,
                             UnknownPayload>;

static_assert(std::variant_size_v<Payload> == static_cast<size_t>(MessageType::Unknown) + 1,
              "Payload alternatives must match MessageType");

/**
 * One decoded frame.
 *
 * `time` is always displayable (HH:MM:SS, or the raw string when it could
 * not be parsed). `timestamp_present` records whether the server sent one.
 */
struct Envelope {
    Payload payload = UnknownPayload{"unknown"};
    std::string time;
    std::string raw_timestamp;
    bool timestamp_present = false;
    bool source_present = false;
    std::string source = "unknown";

    MessageType type() const { return static_cast<MessageType>(payload.index()); }

    std::string type_tag() const {
        if (const auto* unknown = std::get_if<UnknownPayload>(&payload)) {
            return unknown->type_tag;
        }
        return message_type_tag(type());
    }
};

} // namespace protocol
} // namespace exomon
