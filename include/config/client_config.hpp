#pragma once

#include "../errors.hpp"
#include "../logging/async_logger.hpp"
#include "defaults.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>

namespace exomon {
namespace config {

/**
 * Client settings. Built from defaults, then an optional JSON file, then
 * command-line overrides.
 */
struct ClientConfig {
    std::string host = server::HOST;
    uint16_t port = server::PORT;
    int poll_interval_ms = session::POLL_INTERVAL_MS;
    bool color = true;
    size_t max_frame_bytes = framing::MAX_FRAME_BYTES;
    logging::LogLevel log_level = logging::LogLevel::Info;
    bool show_unknown = true;

    std::string endpoint() const { return host + ":" + std::to_string(port); }
};

/**
 * JSON config file loader
 *
 * Format (every key optional, unknown keys ignored):
 * {
 *   "host": "localhost",
 *   "port": 52417,
 *   "poll_interval_ms": 100,
 *   "color": true,
 *   "max_frame_bytes": 0,
 *   "log_level": "info",
 *   "show_unknown": true
 * }
 */
class ConfigLoader {
public:
    static ClientConfig load(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            throw ConfigError("Cannot open config file: " + filename);
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        return parse(buffer.str());
    }

    static ClientConfig parse(const std::string& content, ClientConfig config = ClientConfig{}) {
        using json = nlohmann::json;

        json doc;
        try {
            doc = json::parse(content);
        } catch (const json::parse_error& e) {
            throw ConfigError(std::string("Invalid config JSON: ") + e.what());
        }
        if (!doc.is_object()) {
            throw ConfigError("Config root must be a JSON object");
        }

        if (auto it = doc.find("host"); it != doc.end()) {
            if (!it->is_string() || it->get<std::string>().empty())
                throw ConfigError("'host' must be a non-empty string");
            config.host = it->get<std::string>();
        }

        if (auto it = doc.find("port"); it != doc.end()) {
            if (!it->is_number_integer())
                throw ConfigError("'port' must be an integer");
            config.port = checked_port(it->get<int64_t>());
        }

        if (auto it = doc.find("poll_interval_ms"); it != doc.end()) {
            if (!it->is_number_integer() || it->get<int64_t>() <= 0 || it->get<int64_t>() > 60000)
                throw ConfigError("'poll_interval_ms' must be an integer in 1..60000");
            config.poll_interval_ms = static_cast<int>(it->get<int64_t>());
        }

        if (auto it = doc.find("color"); it != doc.end()) {
            if (!it->is_boolean())
                throw ConfigError("'color' must be a boolean");
            config.color = it->get<bool>();
        }

        if (auto it = doc.find("max_frame_bytes"); it != doc.end()) {
            if (!it->is_number_integer() || it->get<int64_t>() < 0)
                throw ConfigError("'max_frame_bytes' must be a non-negative integer");
            config.max_frame_bytes = static_cast<size_t>(it->get<int64_t>());
        }

        if (auto it = doc.find("log_level"); it != doc.end()) {
            if (!it->is_string() || !logging::level_from_string(it->get<std::string>(), config.log_level))
                throw ConfigError("'log_level' must be one of trace, debug, info, warn, error, fatal");
        }

        if (auto it = doc.find("show_unknown"); it != doc.end()) {
            if (!it->is_boolean())
                throw ConfigError("'show_unknown' must be a boolean");
            config.show_unknown = it->get<bool>();
        }

        return config;
    }

    static uint16_t checked_port(int64_t port) {
        if (port < 1 || port > 65535) {
            throw ConfigError("port out of range (1-65535): " + std::to_string(port));
        }
        return static_cast<uint16_t>(port);
    }
};

} // namespace config
} // namespace exomon
