// =============================================================================
// mirrorhub - Mirror Engine
// =============================================================================
// Entry point for the API layer. Owns the event bus, device registry, session
// table, stream router and subscriber hub; everything is built in the
// constructor and injected, nothing is global.
//
// Sessions are keyed by serial. A finished (Stopped/Crashed) session stays in
// the table until the next start on that serial replaces it, so its status and
// a repeated stop remain answerable.
// =============================================================================
#pragma once
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "config_loader.hpp"
#include "deployer.hpp"
#include "device_registry.hpp"
#include "device_transport.hpp"
#include "event_bus.hpp"
#include "result.hpp"
#include "session_config.hpp"
#include "session_supervisor.hpp"
#include "stream_router.hpp"
#include "subscriber_hub.hpp"

namespace mirrorhub {

struct EngineStats {
    size_t active_devices = 0;
    size_t active_sessions = 0;
    std::map<SessionId, size_t> subscribers_per_session;
    std::chrono::seconds uptime{0};
};

class MirrorEngine {
public:
    MirrorEngine(config::AppConfig cfg,
                 std::shared_ptr<TransportFactory> factory,
                 std::shared_ptr<const HelperArtifact> artifact);
    ~MirrorEngine();

    MirrorEngine(const MirrorEngine&) = delete;
    MirrorEngine& operator=(const MirrorEngine&) = delete;

    // Starts discovery and health polling
    void init();
    // Stops every session and the background threads. Idempotent.
    void shutdown();

    // --- sessions ---
    // Blocks until the session is Running. Errors: SessionConflict, ValidationError,
    // DeviceNotFound/Unauthorized/Offline, DeployFailed, SessionStartFailed
    Result<SessionId> startSession(const std::string& serial, const ConfigOverrides& overrides = {});
    // Errors: SessionNotFound
    Result<void> stopSession(const std::string& serial);
    // Crashed: restarts in place. Stopped: starts a new session with the same overrides.
    Result<SessionId> restartSession(const std::string& serial);
    Result<SessionStatus> getSessionStatus(const std::string& serial) const;

    // --- streams ---
    // Errors: SessionNotFound, SubscriberAttachFailed
    Result<SubscriberId> attachSubscriber(SessionId session, StreamKindMask kinds,
                                          SubscriberCallbacks callbacks);
    Result<void> detachSubscriber(SubscriberId id);
    // Errors: SessionNotFound, StreamNotFound, Disconnected
    Result<void> sendControl(SubscriberId id, const std::vector<uint8_t>& bytes);

    // --- devices ---
    std::vector<Device> listDevices() const;
    Result<Device> getDevice(const std::string& serial) const;
    Result<Device> connectDevice(const std::string& serial);
    Result<void> disconnectDevice(const std::string& serial);

    // --- health ---
    EngineStats stats() const;

    EventBus& events() { return bus_; }
    const config::AppConfig& config() const { return cfg_; }

private:
    struct SessionSlot {
        std::shared_ptr<SessionSupervisor> supervisor;
        ConfigOverrides overrides;
        bool starting = false;
    };

    std::shared_ptr<SessionSupervisor> findSession(const std::string& serial) const;
    std::shared_ptr<SessionSupervisor> findSession(SessionId id) const;
    void releaseReservation(const std::string& serial);
    void onLinkEvent(const std::string& serial, DeviceRegistry::LinkEvent ev, const std::string& reason);

    config::AppConfig cfg_;
    std::shared_ptr<TransportFactory> factory_;
    std::shared_ptr<const HelperArtifact> artifact_;

    EventBus bus_;
    SubscriberHub hub_;
    StreamRouter router_;
    Deployer deployer_;
    DeviceRegistry registry_;

    mutable std::mutex mutex_;
    std::map<std::string, SessionSlot> sessions_;
    std::atomic<SessionId> next_session_id_{1};

    std::chrono::steady_clock::time_point created_at_;
    std::atomic<bool> running_{false};
    std::atomic<bool> shut_down_{false};
};

} // namespace mirrorhub
