#pragma once

#include "dxwatch/types.hpp"

#include <string>
#include <variant>

namespace dxwatch {
namespace cluster {

// Link lifecycle
enum class ConnectionState {
    Idle,
    Connecting,
    Authenticating,
    Streaming,
    Reconnecting,
    Disconnecting,
    Stopped
};

inline const char* connectionStateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Idle:           return "Idle";
        case ConnectionState::Connecting:     return "Connecting";
        case ConnectionState::Authenticating: return "Authenticating";
        case ConnectionState::Streaming:      return "Streaming";
        case ConnectionState::Reconnecting:   return "Reconnecting";
        case ConnectionState::Disconnecting:  return "Disconnecting";
        case ConnectionState::Stopped:        return "Stopped";
        default: return "Unknown";
    }
}

// State transition or link problem, text is meant for the operator
struct StatusEvent {
    ConnectionState state = ConnectionState::Idle;
    std::string text;
};

// Command channel traffic
struct CommandEvent {
    enum class Direction {
        Sent,       // written to the cluster
        Failed,     // write failed, connection may be going down
        Response    // non-spot text received from the cluster
    };

    Direction direction = Direction::Sent;
    std::string text;
};

inline const char* commandDirectionToString(CommandEvent::Direction dir) {
    switch (dir) {
        case CommandEvent::Direction::Sent:     return "Sent";
        case CommandEvent::Direction::Failed:   return "Failed";
        case CommandEvent::Direction::Response: return "Response";
        default: return "Unknown";
    }
}

// Everything the link publishes to its consumer
using LinkEvent = std::variant<Spot, SolarUpdate, StatusEvent, CommandEvent>;

} // namespace cluster
} // namespace dxwatch
