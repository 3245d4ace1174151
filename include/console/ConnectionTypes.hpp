#pragma once
#include <chrono>
#include <string>

// Destination of the console session. Immutable once the transport starts.
struct ControllerAddress {
    std::string host;
    int         port = 51325;   // A&H MIDI-over-TCP default

    std::string str() const { return host + ":" + std::to_string(port); }
};

enum class SessionState {
    Disconnected,
    Connecting,
    Connected
};

enum class ConnectError {
    None,
    Timeout,
    Refused,
    Unreachable
};

enum class SendStatus {
    Ok,
    NotConnected,   // no live session; nothing was written
    WriteFailed     // socket write failed; session is now Disconnected
};

// Timing constants of the console link
struct TransportTiming {
    std::chrono::milliseconds livenessInterval{300};
    std::chrono::milliseconds frameDelay{10};
    std::chrono::milliseconds keyPulseGap{50};
    std::chrono::milliseconds connectTimeout{5000};
    std::chrono::milliseconds reconnectBackoff{2000};
};

inline const char* toString(SessionState s) {
    switch (s) {
        case SessionState::Disconnected: return "disconnected";
        case SessionState::Connecting:   return "connecting";
        case SessionState::Connected:    return "connected";
    }
    return "unknown";
}

inline const char* toString(ConnectError e) {
    switch (e) {
        case ConnectError::None:        return "none";
        case ConnectError::Timeout:     return "timeout";
        case ConnectError::Refused:     return "refused";
        case ConnectError::Unreachable: return "unreachable";
    }
    return "unknown";
}

inline const char* toString(SendStatus s) {
    switch (s) {
        case SendStatus::Ok:           return "ok";
        case SendStatus::NotConnected: return "not_connected";
        case SendStatus::WriteFailed:  return "write_failed";
    }
    return "unknown";
}
