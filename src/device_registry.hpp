#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "config_loader.hpp"
#include "device_link.hpp"
#include "device_transport.hpp"
#include "event_bus.hpp"
#include "mirrorhub_types.hpp"
#include "result.hpp"

namespace mirrorhub {

// =============================================================================
// Device: one known device (snapshot form)
// =============================================================================
struct Device {
    // --- identity ---
    std::string serial;
    TransportKind transport = TransportKind::Usb;

    // --- link ---
    LinkState state = LinkState::Discovered;
    bool has_link = false;
    std::chrono::system_clock::time_point last_health_check{};

    // --- properties (filled after connect) ---
    std::string model;
    std::string manufacturer;
    std::string android_version;
    int sdk_level = 0;
    int screen_width = 0;
    int screen_height = 0;
};

// =============================================================================
// DeviceRegistry: serial -> (Device, optional DeviceLink)
// =============================================================================
// Background threads (start/stop):
//   discovery - reconciles against the transport's device list
//   health    - probes every held link, invalidates it after N failures
// =============================================================================
class DeviceRegistry {
public:
    enum class LinkEvent { Lost, Disconnected };
    // Fired before the link is closed, outside the registry lock
    using LinkEventCallback = std::function<void(const std::string& serial, LinkEvent ev,
                                                 const std::string& reason)>;

    DeviceRegistry(std::shared_ptr<TransportFactory> factory,
                   config::LinkConfig link_cfg,
                   config::DiscoveryConfig discovery_cfg,
                   EventBus& bus);
    ~DeviceRegistry();

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    void start();
    void stop();

    // --- lookup ---
    std::vector<Device> listDevices() const;
    std::optional<Device> findDevice(const std::string& serial) const;
    std::shared_ptr<DeviceLink> findLink(const std::string& serial) const;
    size_t connectedCount() const;

    // --- links ---
    // Concurrent calls for one serial share a single connect attempt.
    // Errors: DeviceNotFound, DeviceUnauthorized, DeviceOffline, Timeout.
    Result<std::shared_ptr<DeviceLink>> getOrConnect(const std::string& serial);
    // Closes the link and forgets the device. Errors: DeviceNotFound.
    Result<void> disconnect(const std::string& serial);

    // --- polling (also driven directly by tests) ---
    void pollOnce(std::chrono::steady_clock::time_point now);
    void healthCheckOnce();

    void setLinkEventCallback(LinkEventCallback cb);

private:
    using LinkResult = Result<std::shared_ptr<DeviceLink>>;

    struct Entry {
        Device device;
        std::shared_ptr<DeviceLink> link;
        bool connecting = false;
        std::shared_future<LinkResult> pending;
        std::optional<std::chrono::steady_clock::time_point> missing_since;
    };

    Entry& entryFor(const std::string& serial);  // caller holds mutex_
    void publishState(const std::string& serial, LinkState old_state, LinkState new_state,
                      const std::string& reason, bool removed = false);
    void fireLinkEvent(const std::string& serial, LinkEvent ev, const std::string& reason);
    static LinkState stateFromReport(const std::string& reported);
    void discoveryLoop();
    void healthLoop();

    std::shared_ptr<TransportFactory> factory_;
    config::LinkConfig link_cfg_;
    config::DiscoveryConfig discovery_cfg_;
    EventBus& bus_;

    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
    LinkEventCallback link_event_cb_;

    std::atomic<bool> running_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    std::thread discovery_thread_;
    std::thread health_thread_;
};

} // namespace mirrorhub
