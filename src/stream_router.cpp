// =============================================================================
// mirrorhub - Stream Router
// =============================================================================
#include "stream_router.hpp"
#include <algorithm>
#include "mirrorhub_log.hpp"

namespace mirrorhub {

static constexpr const char* TAG = "Router";

StreamRouter::StreamRouter(SubscriberHub& hub, EventBus& bus, config::FanoutConfig cfg)
    : hub_(hub), bus_(bus), cfg_(std::move(cfg)) {
    hub_.setRemovedCallback([this](SubscriberId sub, SessionId session, const std::string& reason) {
        onHubRemoved(sub, session, reason);
    });
}

StreamRouter::~StreamRouter() {
    hub_.setRemovedCallback(nullptr);
}

std::shared_ptr<StreamRouter::Route> StreamRouter::findRoute(SessionId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = routes_.find(id);
    return it == routes_.end() ? nullptr : it->second;
}

// =============================================================================
// Session routes
// =============================================================================

void StreamRouter::openSession(SessionId id, const std::string& serial, StreamKindMask kinds) {
    auto route = std::make_shared<Route>();
    route->id = id;
    route->serial = serial;
    route->kinds = kinds;

    std::shared_ptr<Route> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = routes_.find(id);
        if (it != routes_.end()) previous = it->second;
        routes_[id] = route;
    }
    if (previous) {
        MHLOG_WARN(TAG, "Session %llu route replaced", (unsigned long long)id);
    }
    MHLOG_DEBUG(TAG, "Session %llu route opened (%s, kinds=0x%02x)",
                (unsigned long long)id, serial.c_str(), kinds);
}

void StreamRouter::activateSession(SessionId id, StreamKindMask kinds, ControlWriter writer) {
    auto route = findRoute(id);
    if (!route) return;
    std::lock_guard<std::mutex> lock(route->mutex);
    route->kinds = kinds;
    route->control_writer = std::move(writer);
    for (auto& f : route->codec_meta) f.reset();
    for (auto& f : route->last_config) f.reset();
    route->accepting = true;
    MHLOG_DEBUG(TAG, "Session %llu route active", (unsigned long long)id);
}

void StreamRouter::notifyTerminal(SessionId id, TerminalCause cause, const std::string& reason) {
    auto route = findRoute(id);
    if (!route) return;

    std::vector<SubscriberId> targets;
    TerminalNotice notice;
    {
        std::lock_guard<std::mutex> lock(route->mutex);
        route->accepting = false;
        route->control_writer = nullptr;
        targets = route->subscribers;
        notice.serial = route->serial;
    }
    notice.session_id = id;
    notice.cause = cause;
    notice.reason = reason;

    MHLOG_INFO(TAG, "Session %llu terminal (%s): notifying %zu subscriber(s)",
               (unsigned long long)id, terminalCauseName(cause), targets.size());
    hub_.notifyTerminal(targets, notice);
    hub_.awaitTerminal(targets, std::chrono::milliseconds(cfg_.terminal_drain_ms));

    if (cause == TerminalCause::SessionStopped) removeSession(id);
}

void StreamRouter::removeSession(SessionId id) {
    std::vector<SubscriberId> subs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = routes_.find(id);
        if (it == routes_.end()) return;
        std::shared_ptr<Route> route = it->second;
        routes_.erase(it);
        std::lock_guard<std::mutex> route_lock(route->mutex);
        route->accepting = false;
        route->control_writer = nullptr;
        subs.swap(route->subscribers);
        for (SubscriberId sub : subs) bindings_.erase(sub);
    }

    for (SubscriberId sub : subs) {
        hub_.remove(sub);
        SubscriberEvent ev;
        ev.subscriber_id = sub;
        ev.session_id = id;
        ev.attached = false;
        ev.reason = "session closed";
        bus_.publish(ev);
    }
    MHLOG_DEBUG(TAG, "Session %llu route removed (%zu subscriber(s) released)",
                (unsigned long long)id, subs.size());
}

bool StreamRouter::hasSession(SessionId id) const {
    return findRoute(id) != nullptr;
}

// =============================================================================
// Subscribers
// =============================================================================

Result<SubscriberId> StreamRouter::attach(SessionId id, StreamKindMask kinds, SubscriberCallbacks callbacks) {
    if ((kinds & ALL_STREAM_KINDS) == 0 || (kinds & ~ALL_STREAM_KINDS) != 0) {
        return Err<SubscriberId>(ErrorCode::SubscriberAttachFailed,
                                 "at least one valid stream kind is required", "kinds");
    }

    SubscriberId sub = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = routes_.find(id);
        if (it == routes_.end()) {
            return Err<SubscriberId>(ErrorCode::SessionNotFound,
                                     "no session " + std::to_string(id));
        }
        std::shared_ptr<Route> route = it->second;
        std::lock_guard<std::mutex> route_lock(route->mutex);

        if ((kinds & ~route->kinds) != 0) {
            return Err<SubscriberId>(ErrorCode::SubscriberAttachFailed,
                                     "requested stream kind is not enabled for this session", "kinds");
        }

        sub = hub_.add(id, kinds, std::move(callbacks));
        for (StreamKind k : {StreamKind::Video, StreamKind::Audio}) {
            if (!hasKind(kinds, k)) continue;
            const auto& meta = route->codec_meta[kindIndex(k)];
            const auto& config = route->last_config[kindIndex(k)];
            if (meta) hub_.deliver(sub, *meta);
            if (config) hub_.deliver(sub, *config);
        }
        route->subscribers.push_back(sub);
        bindings_[sub] = Binding{id, kinds};
    }

    SubscriberEvent ev;
    ev.subscriber_id = sub;
    ev.session_id = id;
    ev.attached = true;
    bus_.publish(ev);

    MHLOG_INFO(TAG, "Subscriber %llu attached to session %llu",
               (unsigned long long)sub, (unsigned long long)id);
    return Ok(sub);
}

Result<void> StreamRouter::detach(SubscriberId sub) {
    SessionId session = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = bindings_.find(sub);
        if (it == bindings_.end()) {
            return Err<void>(ErrorCode::SessionNotFound, "unknown subscriber " + std::to_string(sub));
        }
        session = it->second.session;
    }

    hub_.remove(sub);
    dropBinding(sub, session, "detached");
    return Ok();
}

void StreamRouter::onHubRemoved(SubscriberId sub, SessionId session, const std::string& reason) {
    dropBinding(sub, session, reason);
}

void StreamRouter::dropBinding(SubscriberId sub, SessionId session, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (bindings_.erase(sub) == 0) return;
        auto it = routes_.find(session);
        if (it != routes_.end()) {
            std::lock_guard<std::mutex> route_lock(it->second->mutex);
            auto& subs = it->second->subscribers;
            subs.erase(std::remove(subs.begin(), subs.end(), sub), subs.end());
        }
    }

    SubscriberEvent ev;
    ev.subscriber_id = sub;
    ev.session_id = session;
    ev.attached = false;
    ev.reason = reason;
    bus_.publish(ev);

    MHLOG_INFO(TAG, "Subscriber %llu detached from session %llu (%s)",
               (unsigned long long)sub, (unsigned long long)session, reason.c_str());
}

// =============================================================================
// Data paths
// =============================================================================

void StreamRouter::publishInbound(SessionId id, Frame frame) {
    auto route = findRoute(id);
    if (!route) return;

    std::vector<SubscriberId> targets;
    {
        std::lock_guard<std::mutex> lock(route->mutex);
        if (!route->accepting || !hasKind(route->kinds, frame.kind)) return;
        size_t k = kindIndex(frame.kind);
        frame.sequence = route->next_sequence[k]++;
        if (frame.codec_meta) {
            route->codec_meta[k] = frame;
            route->last_config[k].reset();
        } else if (frame.config) {
            route->last_config[k] = frame;
        }
        targets = route->subscribers;
    }
    hub_.broadcast(targets, frame);
}

Result<void> StreamRouter::publishControl(SubscriberId sub, const uint8_t* data, size_t len) {
    ControlWriter writer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = bindings_.find(sub);
        if (it == bindings_.end()) {
            return Err<void>(ErrorCode::SessionNotFound, "unknown subscriber " + std::to_string(sub));
        }
        if (!hasKind(it->second.kinds, StreamKind::Control)) {
            return Err<void>(ErrorCode::StreamNotFound, "subscriber has no control attachment");
        }
        auto rit = routes_.find(it->second.session);
        if (rit == routes_.end()) {
            return Err<void>(ErrorCode::StreamNotFound, "session closed");
        }
        std::lock_guard<std::mutex> route_lock(rit->second->mutex);
        if (!rit->second->accepting || !rit->second->control_writer) {
            return Err<void>(ErrorCode::StreamNotFound, "control stream is not open");
        }
        writer = rit->second->control_writer;
    }
    return writer(data, len);
}

size_t StreamRouter::subscriberCount(SessionId id) const {
    auto route = findRoute(id);
    if (!route) return 0;
    std::lock_guard<std::mutex> lock(route->mutex);
    return route->subscribers.size();
}

std::vector<SubscriberId> StreamRouter::subscribers(SessionId id) const {
    auto route = findRoute(id);
    if (!route) return {};
    std::lock_guard<std::mutex> lock(route->mutex);
    return route->subscribers;
}

std::optional<SessionId> StreamRouter::sessionOf(SubscriberId sub) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = bindings_.find(sub);
    if (it == bindings_.end()) return std::nullopt;
    return it->second.session;
}

} // namespace mirrorhub
