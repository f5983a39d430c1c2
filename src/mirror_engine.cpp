// =============================================================================
// mirrorhub - Mirror Engine
// =============================================================================
#include "mirror_engine.hpp"
#include "adb_security.hpp"
#include "mirrorhub_log.hpp"

namespace mirrorhub {

static constexpr const char* TAG = "Engine";

MirrorEngine::MirrorEngine(config::AppConfig cfg,
                           std::shared_ptr<TransportFactory> factory,
                           std::shared_ptr<const HelperArtifact> artifact)
    : cfg_(std::move(cfg)),
      factory_(std::move(factory)),
      artifact_(std::move(artifact)),
      hub_(cfg_.fanout),
      router_(hub_, bus_, cfg_.fanout),
      registry_(factory_, cfg_.link, cfg_.discovery, bus_),
      created_at_(std::chrono::steady_clock::now()) {
    registry_.setLinkEventCallback([this](const std::string& serial, DeviceRegistry::LinkEvent ev,
                                          const std::string& reason) {
        onLinkEvent(serial, ev, reason);
    });
}

MirrorEngine::~MirrorEngine() {
    shutdown();
}

void MirrorEngine::init() {
    if (running_.exchange(true)) return;
    registry_.start();
    MHLOG_INFO(TAG, "Engine started (helper %s)", artifact_->version.c_str());
}

void MirrorEngine::shutdown() {
    if (shut_down_.exchange(true)) return;
    MHLOG_INFO(TAG, "Shutting down");
    bus_.publish(ShutdownEvent{});
    registry_.setLinkEventCallback(nullptr);
    registry_.stop();
    running_ = false;

    std::vector<std::shared_ptr<SessionSupervisor>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [serial, slot] : sessions_) {
            if (slot.supervisor) sessions.push_back(slot.supervisor);
        }
    }
    for (auto& s : sessions) s->forceStop("engine shutdown");
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.clear();
    }
    sessions.clear();
    hub_.removeAll();
    MHLOG_INFO(TAG, "Shutdown complete");
}

std::shared_ptr<SessionSupervisor> MirrorEngine::findSession(const std::string& serial) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(serial);
    return it == sessions_.end() ? nullptr : it->second.supervisor;
}

std::shared_ptr<SessionSupervisor> MirrorEngine::findSession(SessionId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [serial, slot] : sessions_) {
        if (slot.supervisor && slot.supervisor->id() == id) return slot.supervisor;
    }
    return nullptr;
}

void MirrorEngine::releaseReservation(const std::string& serial) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(serial);
    if (it == sessions_.end()) return;
    it->second.starting = false;
    if (!it->second.supervisor) sessions_.erase(it);
}

// =============================================================================
// Sessions
// =============================================================================

Result<SessionId> MirrorEngine::startSession(const std::string& serial, const ConfigOverrides& overrides) {
    if (shut_down_) return Err<SessionId>(ErrorCode::SessionStartFailed, "engine is shut down");
    if (!security::isValidSerial(serial)) {
        return Err<SessionId>(ErrorCode::DeviceNotFound, "invalid serial", "serial");
    }

    // Reserve the serial so concurrent starts conflict instead of racing
    std::shared_ptr<SessionSupervisor> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        SessionSlot& slot = sessions_[serial];
        if (slot.starting) {
            return Err<SessionId>(ErrorCode::SessionConflict, "a session is already starting on " + serial);
        }
        if (slot.supervisor && !isTerminal(slot.supervisor->state())) {
            return Err<SessionId>(ErrorCode::SessionConflict,
                                  "session " + std::to_string(slot.supervisor->id()) + " is " +
                                  sessionStateName(slot.supervisor->state()) + " on " + serial);
        }
        slot.starting = true;
        previous = slot.supervisor;
    }

    auto link = registry_.getOrConnect(serial);
    if (link.is_err()) {
        releaseReservation(serial);
        return Err<SessionId>(link.error());
    }

    HelperCapabilities caps;
    caps.helper_version = artifact_->version;
    caps.device_sdk = link.value()->properties().sdk_level;

    auto defaults = defaultsFromConfig(cfg_.stream);
    if (defaults.is_err()) {
        releaseReservation(serial);
        return Err<SessionId>(defaults.error());
    }
    auto config = SessionConfig::build(defaults.value(), overrides, caps);
    if (config.is_err()) {
        MHLOG_WARN(TAG, "%s: rejected config: %s", serial.c_str(), config.error().describe().c_str());
        releaseReservation(serial);
        return Err<SessionId>(config.error());
    }

    // A finished session on this serial is replaced; its subscribers are released
    if (previous) {
        Result<void> stopped = previous->stop("replaced by a new session");
        if (stopped.is_err()) {
            MHLOG_WARN(TAG, "%s: stopping previous session: %s", serial.c_str(),
                       stopped.error().describe().c_str());
        }
        router_.removeSession(previous->id());
    }

    SessionId id = next_session_id_.fetch_add(1);
    router_.openSession(id, serial, config.value().enabledKinds());
    auto supervisor = std::make_shared<SessionSupervisor>(id, config.value(), link.value(), artifact_,
                                                          deployer_, router_, bus_, cfg_.session);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        SessionSlot& slot = sessions_[serial];
        slot.supervisor = supervisor;
        slot.overrides = overrides;
        slot.starting = false;
    }
    previous.reset();

    MHLOG_INFO(TAG, "%s: starting session %llu", serial.c_str(), (unsigned long long)id);
    Result<void> started = supervisor->start();
    if (started.is_err()) {
        MHLOG_ERROR(TAG, "%s: session %llu failed to start: %s", serial.c_str(),
                    (unsigned long long)id, started.error().describe().c_str());
        return Err<SessionId>(started.error());
    }
    return Ok(id);
}

Result<void> MirrorEngine::stopSession(const std::string& serial) {
    auto supervisor = findSession(serial);
    if (!supervisor) return Err<void>(ErrorCode::SessionNotFound, "no session on " + serial);
    return supervisor->stop();
}

Result<SessionId> MirrorEngine::restartSession(const std::string& serial) {
    ConfigOverrides overrides;
    std::shared_ptr<SessionSupervisor> supervisor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(serial);
        if (it == sessions_.end() || !it->second.supervisor) {
            return Err<SessionId>(ErrorCode::SessionNotFound, "no session on " + serial);
        }
        supervisor = it->second.supervisor;
        overrides = it->second.overrides;
    }

    SessionState state = supervisor->state();
    if (state == SessionState::Stopped) return startSession(serial, overrides);
    if (state != SessionState::Crashed) {
        return Err<SessionId>(ErrorCode::SessionConflict,
                              std::string("session is ") + sessionStateName(state));
    }

    auto link = registry_.getOrConnect(serial);
    if (link.is_err()) return Err<SessionId>(link.error());
    Result<void> r = supervisor->restart(link.value());
    if (r.is_err()) return Err<SessionId>(r.error());
    return Ok(supervisor->id());
}

Result<SessionStatus> MirrorEngine::getSessionStatus(const std::string& serial) const {
    auto supervisor = findSession(serial);
    if (!supervisor) return Err<SessionStatus>(ErrorCode::SessionNotFound, "no session on " + serial);
    return Ok(supervisor->status());
}

void MirrorEngine::onLinkEvent(const std::string& serial, DeviceRegistry::LinkEvent ev,
                               const std::string& reason) {
    auto supervisor = findSession(serial);
    if (!supervisor) return;
    if (ev == DeviceRegistry::LinkEvent::Lost) {
        supervisor->notifyLinkLost("device link lost: " + reason);
    } else {
        supervisor->forceStop(reason);
    }
}

// =============================================================================
// Streams
// =============================================================================

Result<SubscriberId> MirrorEngine::attachSubscriber(SessionId session, StreamKindMask kinds,
                                                    SubscriberCallbacks callbacks) {
    auto supervisor = findSession(session);
    if (!supervisor) {
        return Err<SubscriberId>(ErrorCode::SessionNotFound, "no session " + std::to_string(session));
    }
    SessionState state = supervisor->state();
    if (isTerminal(state)) {
        return Err<SubscriberId>(ErrorCode::SubscriberAttachFailed,
                                 std::string("session is ") + sessionStateName(state));
    }
    return router_.attach(session, kinds, std::move(callbacks));
}

Result<void> MirrorEngine::detachSubscriber(SubscriberId id) {
    return router_.detach(id);
}

Result<void> MirrorEngine::sendControl(SubscriberId id, const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) return Err<void>(ErrorCode::ValidationError, "empty control message", "bytes");
    return router_.publishControl(id, bytes.data(), bytes.size());
}

// =============================================================================
// Devices
// =============================================================================

std::vector<Device> MirrorEngine::listDevices() const {
    return registry_.listDevices();
}

Result<Device> MirrorEngine::getDevice(const std::string& serial) const {
    auto d = registry_.findDevice(serial);
    if (!d) return Err<Device>(ErrorCode::DeviceNotFound, "unknown device " + serial);
    return Ok(*d);
}

Result<Device> MirrorEngine::connectDevice(const std::string& serial) {
    auto link = registry_.getOrConnect(serial);
    if (link.is_err()) return Err<Device>(link.error());
    return getDevice(serial);
}

Result<void> MirrorEngine::disconnectDevice(const std::string& serial) {
    return registry_.disconnect(serial);
}

// =============================================================================
// Health
// =============================================================================

EngineStats MirrorEngine::stats() const {
    EngineStats st;
    st.active_devices = registry_.connectedCount();
    std::vector<std::shared_ptr<SessionSupervisor>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [serial, slot] : sessions_) {
            if (slot.supervisor) sessions.push_back(slot.supervisor);
        }
    }
    for (const auto& s : sessions) {
        if (!isTerminal(s->state())) st.active_sessions++;
        st.subscribers_per_session[s->id()] = router_.subscriberCount(s->id());
    }
    st.uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - created_at_);
    return st;
}

} // namespace mirrorhub
