// =============================================================================
// mirrorhub - Device Link
// =============================================================================
#include "device_link.hpp"
#include "adb_security.hpp"
#include "adb_transport.hpp"

#include <cstdlib>

namespace mirrorhub {

Result<std::shared_ptr<DeviceLink>> DeviceLink::connect(TransportFactory& factory,
                                                        const std::string& serial,
                                                        const config::LinkConfig& cfg) {
    using LinkResult = Result<std::shared_ptr<DeviceLink>>;
    if (!security::isValidSerial(serial)) {
        MHLOG_ERROR("link", "Invalid serial rejected");
        return LinkResult(Error(ErrorCode::DeviceNotFound, "invalid serial", "serial"));
    }

    auto transport = retryWithBackoff<std::shared_ptr<DeviceTransport>>(
        "connect", BackoffPolicy::fromConfig(cfg),
        [&]() { return factory.connect(serial, cfg.connect_timeout_ms); });
    if (transport.is_err()) {
        MHLOG_WARN("link", "connect %s failed: %s", serial.c_str(), transport.error().describe().c_str());
        return LinkResult(transport.error());
    }
    return LinkResult(std::make_shared<DeviceLink>(std::move(transport).value(), cfg));
}

DeviceLink::DeviceLink(std::shared_ptr<DeviceTransport> transport, config::LinkConfig cfg)
    : transport_(std::move(transport)),
      cfg_(cfg),
      backoff_(BackoffPolicy::fromConfig(cfg)),
      serial_(transport_->serial()),
      kind_(classifySerial(serial_)) {}

DeviceLink::~DeviceLink() {
    close();
}

TransportCapabilities DeviceLink::capabilities() const {
    return transport_->capabilities();
}

Result<std::string> DeviceLink::execShell(const std::string& command, int timeout_ms) {
    if (closed_) return Err<std::string>(ErrorCode::Disconnected, "link closed");
    int timeout = timeout_ms > 0 ? timeout_ms : cfg_.shell_timeout_ms;
    return retryWithBackoff<std::string>("shell", backoff_, [&]() -> Result<std::string> {
        auto r = transport_->shell(command, timeout);
        if (r.is_err() && r.error().code == ErrorCode::IoError) {
            return Err<std::string>(ErrorCode::Disconnected, r.error().message);
        }
        return r;
    });
}

Result<void> DeviceLink::pushFile(const std::vector<uint8_t>& bytes, const std::string& remote_path) {
    if (closed_) return Err<void>(ErrorCode::Disconnected, "link closed");
    if (!security::isAllowedRemotePath(remote_path)) {
        MHLOG_ERROR("link", "Remote path rejected: %s", remote_path.c_str());
        return Err<void>(ErrorCode::PermissionDenied, "remote path not allowed", "remote_path");
    }
    return transport_->push(bytes, remote_path, cfg_.push_timeout_ms);
}

Result<std::unique_ptr<RemoteProcess>> DeviceLink::spawn(const std::string& command) {
    if (closed_) {
        return Result<std::unique_ptr<RemoteProcess>>(Error(ErrorCode::Disconnected, "link closed"));
    }
    return transport_->spawn(command);
}

Result<std::unique_ptr<ByteStream>> DeviceLink::openSocket(const std::string& name, int timeout_ms) {
    if (closed_) {
        return Result<std::unique_ptr<ByteStream>>(Error(ErrorCode::Disconnected, "link closed"));
    }
    return transport_->openSocket(name, timeout_ms);
}

bool DeviceLink::healthCheck() {
    bool ok = false;
    if (!closed_) {
        auto r = transport_->shell("echo ping", cfg_.health_timeout_ms);
        ok = r.is_ok() && r.value().find("ping") != std::string::npos;
        if (!ok) {
            MHLOG_WARN("link", "Health check failed for %s: %s", serial_.c_str(),
                       r.is_err() ? r.error().message.c_str() : "unexpected reply");
        }
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_health_check_ = std::chrono::system_clock::now();
    }
    if (ok) {
        consecutive_failures_ = 0;
    } else {
        consecutive_failures_++;
    }
    return ok;
}

std::chrono::system_clock::time_point DeviceLink::lastHealthCheck() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_health_check_;
}

DeviceProperties DeviceLink::properties() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (props_loaded_) return props_;
    }

    DeviceProperties p;
    bool any_failed = false;
    auto getprop = [&](const char* name) -> std::string {
        auto r = execShell(std::string("getprop ") + name);
        if (r.is_err()) {
            any_failed = true;
            return "";
        }
        return adb::trimRight(r.value());
    };
    p.model = getprop("ro.product.model");
    p.manufacturer = getprop("ro.product.manufacturer");
    p.android_version = getprop("ro.build.version.release");
    std::string sdk = getprop("ro.build.version.sdk");
    if (!sdk.empty()) p.sdk_level = std::atoi(sdk.c_str());

    auto wm = execShell("wm size");
    if (wm.is_ok()) {
        adb::parseScreenSize(wm.value(), p.screen_width, p.screen_height);
    } else {
        any_failed = true;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!any_failed) {
        props_ = p;
        props_loaded_ = true;
        MHLOG_INFO("link", "%s: %s %s Android %s (SDK %d) %dx%d", serial_.c_str(),
                   p.manufacturer.c_str(), p.model.c_str(), p.android_version.c_str(),
                   p.sdk_level, p.screen_width, p.screen_height);
    }
    return p;
}

void DeviceLink::close() {
    if (closed_.exchange(true)) return;
    transport_->close();
    MHLOG_INFO("link", "Link closed: %s", serial_.c_str());
}

} // namespace mirrorhub
