// =============================================================================
// mirrorhub - Shared Types
// =============================================================================
// Identifiers and state enums shared by the registry, the session supervisor,
// the stream router and the event bus.
// =============================================================================
#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace mirrorhub {

using SessionId = uint64_t;
using SubscriberId = uint64_t;

// -----------------------------------------------------------------------------
// Devices
// -----------------------------------------------------------------------------
enum class TransportKind : uint8_t { Usb, Network, Virtual };

enum class LinkState : uint8_t {
    Discovered,
    Connecting,
    Connected,
    Unauthorized,
    Offline,
    Disconnected,
};

inline const char* transportKindName(TransportKind k) {
    switch (k) {
        case TransportKind::Usb:     return "usb";
        case TransportKind::Network: return "network";
        case TransportKind::Virtual: return "virtual";
    }
    return "?";
}

inline const char* linkStateName(LinkState s) {
    switch (s) {
        case LinkState::Discovered:   return "Discovered";
        case LinkState::Connecting:   return "Connecting";
        case LinkState::Connected:    return "Connected";
        case LinkState::Unauthorized: return "Unauthorized";
        case LinkState::Offline:      return "Offline";
        case LinkState::Disconnected: return "Disconnected";
    }
    return "?";
}

// "192.168.0.5:5555" -> Network, "emulator-5554" -> Virtual, otherwise Usb
inline TransportKind classifySerial(const std::string& serial) {
    if (serial.rfind("emulator-", 0) == 0) return TransportKind::Virtual;
    auto colon = serial.find(':');
    if (colon != std::string::npos && colon > 0 && colon + 1 < serial.size()) {
        return TransportKind::Network;
    }
    return TransportKind::Usb;
}

// -----------------------------------------------------------------------------
// Sessions
// -----------------------------------------------------------------------------
enum class SessionState : uint8_t {
    Idle,
    Deploying,
    Starting,
    Running,
    Stopping,
    Stopped,
    Crashed,
};

inline const char* sessionStateName(SessionState s) {
    switch (s) {
        case SessionState::Idle:      return "Idle";
        case SessionState::Deploying: return "Deploying";
        case SessionState::Starting:  return "Starting";
        case SessionState::Running:   return "Running";
        case SessionState::Stopping:  return "Stopping";
        case SessionState::Stopped:   return "Stopped";
        case SessionState::Crashed:   return "Crashed";
    }
    return "?";
}

inline bool isTerminal(SessionState s) {
    return s == SessionState::Stopped || s == SessionState::Crashed;
}

// -----------------------------------------------------------------------------
// Streams
// -----------------------------------------------------------------------------
enum class StreamKind : uint8_t { Video = 0, Audio = 1, Control = 2 };

static constexpr size_t STREAM_KIND_COUNT = 3;

using StreamKindMask = uint8_t;

constexpr StreamKindMask kindBit(StreamKind k) {
    return static_cast<StreamKindMask>(1u << static_cast<uint8_t>(k));
}

constexpr StreamKindMask ALL_STREAM_KINDS =
    kindBit(StreamKind::Video) | kindBit(StreamKind::Audio) | kindBit(StreamKind::Control);

inline bool hasKind(StreamKindMask mask, StreamKind k) { return (mask & kindBit(k)) != 0; }

inline size_t kindIndex(StreamKind k) { return static_cast<size_t>(k); }

inline const char* streamKindName(StreamKind k) {
    switch (k) {
        case StreamKind::Video:   return "video";
        case StreamKind::Audio:   return "audio";
        case StreamKind::Control: return "control";
    }
    return "?";
}

inline StreamKindMask makeMask(const std::vector<StreamKind>& kinds) {
    StreamKindMask m = 0;
    for (auto k : kinds) m |= kindBit(k);
    return m;
}

// Why a subscriber stopped receiving data
enum class TerminalCause : uint8_t {
    SessionStopped,
    SessionCrashed,
    AttachmentFailed,
};

inline const char* terminalCauseName(TerminalCause c) {
    switch (c) {
        case TerminalCause::SessionStopped:   return "stopped";
        case TerminalCause::SessionCrashed:   return "crashed";
        case TerminalCause::AttachmentFailed: return "attachment_failed";
    }
    return "?";
}

} // namespace mirrorhub
