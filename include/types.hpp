#pragma once

#include <cstddef>
#include <cstdint>

namespace exomon {

using Timestamp = uint64_t; // Nanoseconds
using Percent = double;     // 0.0 - 100.0

// Coarse classification of log and debug lines
enum class Severity : uint8_t { Info = 0, Warning = 1, Error = 2 };

// Session lifecycle: Disconnected -> Connected -> Receiving -> Terminating -> Disconnected
enum class SessionState : uint8_t { Disconnected = 0, Connected, Receiving, Terminating };

inline const char* session_state_to_string(SessionState state) {
    switch (state) {
    case SessionState::Disconnected:
        return "Disconnected";
    case SessionState::Connected:
        return "Connected";
    case SessionState::Receiving:
        return "Receiving";
    case SessionState::Terminating:
        return "Terminating";
    default:
        return "Unknown";
    }
}

} // namespace exomon
