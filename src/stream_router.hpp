// =============================================================================
// mirrorhub - Stream Router
// =============================================================================
// Binds subscribers to sessions and moves frames between them:
//   helper sockets -> publishInbound() -> SubscriberHub -> subscribers
//   subscribers    -> publishControl() -> session control writer -> device
//
// Each session keeps the codec meta frame and the latest config packet per
// media kind; a subscriber attaching mid-stream receives them first.
// =============================================================================
#pragma once
#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "config_loader.hpp"
#include "event_bus.hpp"
#include "helper_protocol.hpp"
#include "mirrorhub_types.hpp"
#include "result.hpp"
#include "subscriber_hub.hpp"

namespace mirrorhub {

// Writes raw control bytes to the session's control socket
using ControlWriter = std::function<Result<void>(const uint8_t* data, size_t len)>;

class StreamRouter {
public:
    StreamRouter(SubscriberHub& hub, EventBus& bus, config::FanoutConfig cfg);
    ~StreamRouter();

    StreamRouter(const StreamRouter&) = delete;
    StreamRouter& operator=(const StreamRouter&) = delete;

    // Registers a session route; replaces a previous route for the same id
    void openSession(SessionId id, const std::string& serial, StreamKindMask kinds);
    // Starts (or restarts) accepting frames; clears the replay cache
    void activateSession(SessionId id, StreamKindMask kinds, ControlWriter writer);
    // Stops accepting frames, sends every subscriber a terminal notice and
    // waits (bounded) for it to be delivered. SessionStopped also drops the route.
    void notifyTerminal(SessionId id, TerminalCause cause, const std::string& reason);
    // Drops the route and detaches its subscribers
    void removeSession(SessionId id);
    bool hasSession(SessionId id) const;

    // Errors: SessionNotFound, SubscriberAttachFailed (empty or unavailable kinds)
    Result<SubscriberId> attach(SessionId id, StreamKindMask kinds, SubscriberCallbacks callbacks);
    // Errors: SessionNotFound (unknown subscriber)
    Result<void> detach(SubscriberId id);

    // Frames for unknown or inactive sessions are discarded
    void publishInbound(SessionId id, Frame frame);
    // Errors: SessionNotFound, StreamNotFound (no control attachment or control closed)
    Result<void> publishControl(SubscriberId id, const uint8_t* data, size_t len);

    size_t subscriberCount(SessionId id) const;
    std::vector<SubscriberId> subscribers(SessionId id) const;
    std::optional<SessionId> sessionOf(SubscriberId id) const;

private:
    struct Route {
        SessionId id = 0;
        std::string serial;
        StreamKindMask kinds = 0;
        bool accepting = false;
        ControlWriter control_writer;
        std::vector<SubscriberId> subscribers;
        std::array<std::optional<Frame>, STREAM_KIND_COUNT> codec_meta;
        std::array<std::optional<Frame>, STREAM_KIND_COUNT> last_config;
        std::array<uint64_t, STREAM_KIND_COUNT> next_sequence{};
        std::mutex mutex;
    };

    struct Binding {
        SessionId session = 0;
        StreamKindMask kinds = 0;
    };

    std::shared_ptr<Route> findRoute(SessionId id) const;
    void onHubRemoved(SubscriberId sub, SessionId session, const std::string& reason);
    void dropBinding(SubscriberId sub, SessionId session, const std::string& reason);

    SubscriberHub& hub_;
    EventBus& bus_;
    config::FanoutConfig cfg_;

    mutable std::mutex mutex_;
    std::unordered_map<SessionId, std::shared_ptr<Route>> routes_;
    std::unordered_map<SubscriberId, Binding> bindings_;
};

} // namespace mirrorhub
