#include "device_registry.hpp"
#include "adb_security.hpp"
#include "mirrorhub_log.hpp"

namespace mirrorhub {

static constexpr const char* TAG = "Registry";

DeviceRegistry::DeviceRegistry(std::shared_ptr<TransportFactory> factory,
                               config::LinkConfig link_cfg,
                               config::DiscoveryConfig discovery_cfg,
                               EventBus& bus)
    : factory_(std::move(factory)),
      link_cfg_(link_cfg),
      discovery_cfg_(discovery_cfg),
      bus_(bus) {}

DeviceRegistry::~DeviceRegistry() {
    stop();
    std::map<std::string, Entry> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries.swap(entries_);
    }
    for (auto& [serial, e] : entries) {
        if (e.link) e.link->close();
    }
}

// =============================================================================
// Background threads
// =============================================================================

void DeviceRegistry::start() {
    if (running_.exchange(true)) return;
    if (discovery_cfg_.enabled) {
        discovery_thread_ = std::thread(&DeviceRegistry::discoveryLoop, this);
    }
    health_thread_ = std::thread(&DeviceRegistry::healthLoop, this);
    MHLOG_INFO(TAG, "Started (discovery %s, poll %dms, health %dms)",
               discovery_cfg_.enabled ? "on" : "off",
               discovery_cfg_.poll_interval_ms, link_cfg_.health_interval_ms);
}

void DeviceRegistry::stop() {
    if (!running_.exchange(false)) return;
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        wake_cv_.notify_all();
    }
    if (discovery_thread_.joinable()) discovery_thread_.join();
    if (health_thread_.joinable()) health_thread_.join();
    MHLOG_INFO(TAG, "Stopped");
}

void DeviceRegistry::discoveryLoop() {
    while (running_) {
        pollOnce(std::chrono::steady_clock::now());
        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_for(lock, std::chrono::milliseconds(discovery_cfg_.poll_interval_ms),
                          [this] { return !running_.load(); });
    }
}

void DeviceRegistry::healthLoop() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_cv_.wait_for(lock, std::chrono::milliseconds(link_cfg_.health_interval_ms),
                              [this] { return !running_.load(); });
        }
        if (!running_) break;
        healthCheckOnce();
    }
}

// =============================================================================
// Lookup
// =============================================================================

DeviceRegistry::Entry& DeviceRegistry::entryFor(const std::string& serial) {
    auto it = entries_.find(serial);
    if (it != entries_.end()) return it->second;
    Entry& e = entries_[serial];
    e.device.serial = serial;
    e.device.transport = classifySerial(serial);
    e.device.state = LinkState::Discovered;
    MHLOG_INFO(TAG, "New device: %s (%s)", serial.c_str(), transportKindName(e.device.transport));
    return e;
}

std::vector<Device> DeviceRegistry::listDevices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Device> out;
    out.reserve(entries_.size());
    for (const auto& [serial, e] : entries_) {
        out.push_back(e.device);
        out.back().has_link = e.link != nullptr;
    }
    return out;
}

std::optional<Device> DeviceRegistry::findDevice(const std::string& serial) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(serial);
    if (it == entries_.end()) return std::nullopt;
    Device d = it->second.device;
    d.has_link = it->second.link != nullptr;
    return d;
}

std::shared_ptr<DeviceLink> DeviceRegistry::findLink(const std::string& serial) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(serial);
    return it == entries_.end() ? nullptr : it->second.link;
}

size_t DeviceRegistry::connectedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& [serial, e] : entries_) {
        if (e.link && e.device.state == LinkState::Connected) n++;
    }
    return n;
}

void DeviceRegistry::setLinkEventCallback(LinkEventCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    link_event_cb_ = std::move(cb);
}

void DeviceRegistry::publishState(const std::string& serial, LinkState old_state, LinkState new_state,
                                  const std::string& reason, bool removed) {
    MHLOG_INFO(TAG, "%s: %s -> %s%s%s", serial.c_str(), linkStateName(old_state),
               linkStateName(new_state), removed ? " (removed)" : "",
               reason.empty() ? "" : (" - " + reason).c_str());
    DeviceStateEvent ev;
    ev.serial = serial;
    ev.old_state = old_state;
    ev.new_state = new_state;
    ev.removed = removed;
    ev.reason = reason;
    bus_.publish(ev);
}

void DeviceRegistry::fireLinkEvent(const std::string& serial, LinkEvent ev, const std::string& reason) {
    LinkEventCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cb = link_event_cb_;
    }
    if (cb) cb(serial, ev, reason);
}

// =============================================================================
// Links
// =============================================================================

Result<std::shared_ptr<DeviceLink>> DeviceRegistry::getOrConnect(const std::string& serial) {
    if (!security::isValidSerial(serial)) {
        MHLOG_ERROR(TAG, "Invalid serial rejected");
        return LinkResult(Error(ErrorCode::DeviceNotFound, "invalid serial", "serial"));
    }

    std::promise<LinkResult> promise;
    std::shared_future<LinkResult> pending;
    LinkState old_state = LinkState::Discovered;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry& e = entryFor(serial);
        if (e.link && e.link->isOpen()) return LinkResult(e.link);
        if (e.connecting) {
            pending = e.pending;
        } else {
            e.connecting = true;
            e.pending = promise.get_future().share();
            old_state = e.device.state;
            e.device.state = LinkState::Connecting;
        }
    }
    if (pending.valid()) {
        MHLOG_DEBUG(TAG, "%s: joining in-flight connect", serial.c_str());
        return pending.get();
    }
    publishState(serial, old_state, LinkState::Connecting, "connect requested");

    LinkResult result = DeviceLink::connect(*factory_, serial, link_cfg_);
    DeviceProperties props;
    if (result.is_ok()) props = result.value()->properties();

    LinkState new_state = LinkState::Connected;
    std::string reason = "connected";
    if (result.is_err()) {
        reason = result.error().describe();
        switch (result.error().code) {
            case ErrorCode::DeviceUnauthorized: new_state = LinkState::Unauthorized; break;
            case ErrorCode::DeviceOffline:      new_state = LinkState::Offline; break;
            default:                            new_state = LinkState::Disconnected; break;
        }
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry& e = entryFor(serial);
        e.connecting = false;
        e.device.state = new_state;
        if (result.is_ok()) {
            e.link = result.value();
            e.missing_since.reset();
            e.device.model = props.model;
            e.device.manufacturer = props.manufacturer;
            e.device.android_version = props.android_version;
            e.device.sdk_level = props.sdk_level;
            e.device.screen_width = props.screen_width;
            e.device.screen_height = props.screen_height;
        }
    }
    promise.set_value(result);
    publishState(serial, LinkState::Connecting, new_state, reason);
    return result;
}

Result<void> DeviceRegistry::disconnect(const std::string& serial) {
    std::shared_ptr<DeviceLink> link;
    LinkState old_state = LinkState::Disconnected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(serial);
        if (it == entries_.end()) {
            return Err<void>(ErrorCode::DeviceNotFound, "unknown device " + serial);
        }
        link = it->second.link;
        old_state = it->second.device.state;
        it->second.link.reset();
        it->second.device.state = LinkState::Disconnected;
    }

    // Sessions on this device stop before the link goes away
    fireLinkEvent(serial, LinkEvent::Disconnected, "device disconnected");
    if (link) link->close();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(serial);
        if (it != entries_.end() && !it->second.link && !it->second.connecting) entries_.erase(it);
    }
    publishState(serial, old_state, LinkState::Disconnected, "disconnect requested", true);
    return Ok();
}

// =============================================================================
// Polling
// =============================================================================

LinkState DeviceRegistry::stateFromReport(const std::string& reported) {
    if (reported == "device") return LinkState::Discovered;
    if (reported == "unauthorized") return LinkState::Unauthorized;
    return LinkState::Offline;
}

void DeviceRegistry::pollOnce(std::chrono::steady_clock::time_point now) {
    auto reachable = factory_->listReachable(link_cfg_.shell_timeout_ms);
    if (reachable.is_err()) {
        MHLOG_WARN(TAG, "Discovery failed: %s", reachable.error().describe().c_str());
        return;
    }

    struct Change { std::string serial; LinkState from; LinkState to; std::string reason; bool removed; };
    std::vector<Change> changes;
    auto grace = std::chrono::milliseconds(discovery_cfg_.vanish_grace_ms);
    auto removal = grace + std::chrono::milliseconds(discovery_cfg_.remove_after_ms);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, std::string> seen;
        for (const auto& d : reachable.value()) seen[d.serial] = d.state;

        for (const auto& [serial, reported] : seen) {
            bool is_new = entries_.find(serial) == entries_.end();
            Entry& e = entryFor(serial);
            e.missing_since.reset();
            if (e.link || e.connecting) continue;
            LinkState from = is_new ? LinkState::Discovered : e.device.state;
            LinkState to = stateFromReport(reported);
            e.device.state = to;
            if (is_new || from != to) changes.push_back({serial, from, to, "reported " + reported, false});
        }

        for (auto it = entries_.begin(); it != entries_.end();) {
            Entry& e = it->second;
            if (seen.count(it->first) || e.link || e.connecting) {
                ++it;
                continue;
            }
            if (!e.missing_since) e.missing_since = now;
            auto gone = now - *e.missing_since;
            if (gone >= removal) {
                changes.push_back({it->first, e.device.state, LinkState::Disconnected, "unreachable", true});
                it = entries_.erase(it);
                continue;
            }
            if (gone >= grace && e.device.state != LinkState::Disconnected) {
                changes.push_back({it->first, e.device.state, LinkState::Disconnected, "vanished", false});
                e.device.state = LinkState::Disconnected;
            }
            ++it;
        }
    }

    for (const auto& c : changes) publishState(c.serial, c.from, c.to, c.reason, c.removed);
}

void DeviceRegistry::healthCheckOnce() {
    std::vector<std::shared_ptr<DeviceLink>> links;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [serial, e] : entries_) {
            if (e.link) links.push_back(e.link);
        }
    }

    for (auto& link : links) {
        bool ok = link->healthCheck();
        bool lost = false;
        LinkState old_state = LinkState::Connected;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(link->serial());
            if (it == entries_.end() || it->second.link != link) continue;
            it->second.device.last_health_check = link->lastHealthCheck();
            if (!ok && link->consecutiveFailures() >= link_cfg_.health_failure_threshold) {
                old_state = it->second.device.state;
                it->second.link.reset();
                it->second.device.state = LinkState::Offline;
                lost = true;
            }
        }
        if (!lost) continue;

        std::string reason = std::to_string(link->consecutiveFailures()) + " consecutive health check failures";
        MHLOG_WARN(TAG, "%s: link lost (%s)", link->serial().c_str(), reason.c_str());
        publishState(link->serial(), old_state, LinkState::Offline, reason);
        fireLinkEvent(link->serial(), LinkEvent::Lost, reason);
        link->close();
    }
}

} // namespace mirrorhub
