#include "../../include/protocol/message_parser.hpp"
#include "../../include/errors.hpp"
#include "../../include/util/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>

namespace exomon::protocol {

using json = nlohmann::json;

namespace {

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

[[noreturn]] void shape_error(const char* key, const char* expected) {
    throw DecodeError(std::string("field '") + key + "' is not " + expected);
}

// Scalar rendered as text; null/missing -> fallback
std::string scalar_text(const json& value, const char* key, const std::string& fallback) {
    if (value.is_null())
        return fallback;
    if (value.is_string())
        return value.get<std::string>();
    if (value.is_primitive())
        return value.dump();
    shape_error(key, "a scalar");
}

std::string get_string(const json& obj, const char* key, const std::string& fallback) {
    auto it = obj.find(key);
    if (it == obj.end())
        return fallback;
    return scalar_text(*it, key, fallback);
}

// Plain decimal only: strtod alone would also take "nan", "inf" and hex floats
bool is_decimal_text(const std::string& text) {
    return text.find_first_not_of("0123456789+-.eE") == std::string::npos;
}

double get_number(const json& obj, const char* key, double fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return fallback;
    if (it->is_number()) {
        double value = it->get<double>();
        if (std::isfinite(value))
            return value;
    } else if (it->is_boolean()) {
        return it->get<bool>() ? 1.0 : 0.0;
    } else if (it->is_string()) {
        std::string text = trim(it->get<std::string>());
        if (text.empty())
            return fallback;
        if (is_decimal_text(text)) {
            char* end = nullptr;
            errno = 0;
            double value = std::strtod(text.c_str(), &end);
            if (end == text.c_str() + text.size() && errno == 0 && std::isfinite(value))
                return value;
        }
    }
    shape_error(key, "numeric");
}

int64_t get_count(const json& obj, const char* key, int64_t fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return fallback;
    if (it->is_number_unsigned()) {
        uint64_t value = it->get<uint64_t>();
        if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
            shape_error(key, "an integer count");
        return static_cast<int64_t>(value);
    }
    if (it->is_number_integer())
        return it->get<int64_t>();

    // 2^63 is exact as a double; the range is [-2^63, 2^63)
    constexpr double limit = 9223372036854775808.0;
    double value = get_number(obj, key, static_cast<double>(fallback));
    if (!(value >= -limit && value < limit))
        shape_error(key, "an integer count");
    return static_cast<int64_t>(value);
}

bool get_flag(const json& obj, const char* key, bool fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return fallback;
    if (it->is_boolean())
        return it->get<bool>();
    if (it->is_number())
        return it->get<double>() != 0.0;
    if (it->is_string()) {
        std::string text = trim(it->get<std::string>());
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (text == "true" || text == "1" || text == "yes")
            return true;
        if (text == "false" || text == "0" || text == "no" || text.empty())
            return false;
    }
    shape_error(key, "a boolean");
}

/**
 * Array member, also accepting a string that holds a JSON array
 * (stringified by the server). Returns nullptr when missing or null.
 */
const json* get_array(const json& obj, const char* key, json& scratch) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return nullptr;
    if (it->is_array())
        return &*it;
    if (it->is_string()) {
        scratch = json::parse(it->get<std::string>(), nullptr, false);
        if (scratch.is_array())
            return &scratch;
    }
    shape_error(key, "an array");
}

// =============================================================================
// Per-type payload decoding
// =============================================================================

WelcomePayload decode_welcome(const json& data) {
    WelcomePayload p;
    p.server = get_string(data, "server", p.server);
    p.version = get_string(data, "version", p.version);

    json scratch;
    auto it = data.find("capabilities");
    if (it != data.end() && it->is_string()) {
        // Stringified list, or a single capability name
        scratch = json::parse(it->get<std::string>(), nullptr, false);
        if (!scratch.is_array()) {
            if (!it->get<std::string>().empty())
                p.capabilities.push_back(it->get<std::string>());
            return p;
        }
        for (const auto& cap : scratch)
            p.capabilities.push_back(scalar_text(cap, "capabilities", ""));
        return p;
    }

    if (const json* caps = get_array(data, "capabilities", scratch)) {
        for (const auto& cap : *caps)
            p.capabilities.push_back(scalar_text(cap, "capabilities", ""));
    }
    return p;
}

LogEntryPayload decode_log_entry(const json& data) {
    LogEntryPayload p;
    p.level = to_upper(get_string(data, "level", p.level));
    p.message = get_string(data, "message", "");
    p.is_error = get_flag(data, "isError", false);
    return p;
}

PerformanceMetricsPayload decode_performance(const json& data) {
    PerformanceMetricsPayload p;
    p.cpu = get_number(data, "cpu", 0.0);
    p.memory = get_number(data, "memory", 0.0);
    p.disk = get_number(data, "disk", 0.0);
    p.gpu = get_number(data, "gpu", 0.0);
    p.network_status = get_string(data, "network_status", p.network_status);
    p.web_interface_accessible = get_flag(data, "web_interface_accessible", false);
    p.api_endpoint_accessible = get_flag(data, "api_endpoint_accessible", false);
    return p;
}

ServiceStatusPayload decode_service_status(const json& data) {
    ServiceStatusPayload p;
    p.is_installed = get_flag(data, "is_installed", false);
    p.is_running = get_flag(data, "is_running", false);
    p.is_installing = get_flag(data, "is_installing", false);
    p.is_uninstalling = get_flag(data, "is_uninstalling", false);
    p.last_error = get_string(data, "last_error", "");
    p.installation_progress = get_string(data, "installation_progress", "");
    return p;
}

NetworkDiscoveryPayload decode_network_discovery(const json& data) {
    NetworkDiscoveryPayload p;
    p.is_discovering = get_flag(data, "is_discovering", false);
    p.discovered_nodes_count = get_count(data, "discovered_nodes_count", 0);
    p.last_error = get_string(data, "last_error", "");

    json scratch;
    if (const json* nodes = get_array(data, "nodes", scratch)) {
        p.nodes.reserve(nodes->size());
        for (const auto& entry : *nodes) {
            if (!entry.is_object())
                shape_error("nodes", "an array of objects");
            DiscoveredNode node;
            node.name = get_string(entry, "name", node.name);
            node.address = get_string(entry, "address", node.address);
            node.is_online = get_flag(entry, "is_online", false);
            p.nodes.push_back(std::move(node));
        }
    }
    return p;
}

DebugMessagePayload decode_debug_message(const json& data) {
    DebugMessagePayload p;
    p.level = to_upper(get_string(data, "level", p.level));
    p.message = get_string(data, "message", "");
    p.source = get_string(data, "source", "");
    return p;
}

Payload decode_payload(MessageType type, const std::string& tag, const json& data) {
    switch (type) {
    case MessageType::Welcome:
        return decode_welcome(data);
    case MessageType::LogEntry:
        return decode_log_entry(data);
    case MessageType::PerformanceMetrics:
        return decode_performance(data);
    case MessageType::ServiceStatus:
        return decode_service_status(data);
    case MessageType::NetworkDiscovery:
        return decode_network_discovery(data);
    case MessageType::DebugMessage:
        return decode_debug_message(data);
    default:
        return UnknownPayload{tag};
    }
}

} // namespace

// =============================================================================
// MessageParser
// =============================================================================

Envelope MessageParser::parse(std::string_view frame) const {
    json msg;
    try {
        msg = json::parse(frame.begin(), frame.end());
    } catch (const json::parse_error& e) {
        throw DecodeError(e.what());
    }

    if (!msg.is_object()) {
        throw DecodeError("message is not a JSON object");
    }

    Envelope env;
    std::string tag = "unknown";

    try {
        tag = get_string(msg, "type", tag);

        auto src = msg.find("source");
        if (src != msg.end() && !src->is_null()) {
            env.source = scalar_text(*src, "source", env.source);
            env.source_present = true;
        }

        auto ts = msg.find("timestamp");
        if (ts != msg.end() && !ts->is_null()) {
            env.raw_timestamp = scalar_text(*ts, "timestamp", "");
        }
        env.timestamp_present = !env.raw_timestamp.empty();
        env.time = env.timestamp_present ? normalize_timestamp(env.raw_timestamp) : util::now_local_hms();

        static const json empty_data = json::object();
        const json* data = &empty_data;
        auto it = msg.find("data");
        if (it != msg.end() && !it->is_null()) {
            if (!it->is_object()) {
                throw DecodeError("field 'data' is not an object");
            }
            data = &*it;
        }

        env.payload = decode_payload(message_type_from_tag(tag), tag, *data);
    } catch (const json::exception& e) {
        throw DecodeError(e.what());
    }

    return env;
}

std::string MessageParser::normalize_timestamp(std::string_view raw) {
    auto instant = util::parse_iso8601(raw);
    if (!instant) {
        return std::string(raw);
    }
    return util::format_local_hms(*instant);
}

std::string MessageParser::preview(std::string_view text, size_t max_chars) {
    size_t cut = std::min(text.size(), max_chars);
    // Don't split a multi-byte UTF-8 sequence
    while (cut > 0 && cut < text.size() && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    std::string out(text.substr(0, cut));
    out += "...";
    return out;
}

} // namespace exomon::protocol
