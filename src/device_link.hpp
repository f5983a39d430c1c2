// =============================================================================
// mirrorhub - Device Link
// =============================================================================
// One live connection to a device. Wraps a DeviceTransport with the engine's
// timeout and retry policy and tracks health-check results.
// =============================================================================
#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "config_loader.hpp"
#include "device_transport.hpp"
#include "mirrorhub_log.hpp"
#include "mirrorhub_types.hpp"

namespace mirrorhub {

// Properties queried once after connect
struct DeviceProperties {
    std::string model;
    std::string manufacturer;
    std::string android_version;
    int sdk_level = 0;
    int screen_width = 0;
    int screen_height = 0;
};

struct BackoffPolicy {
    int attempts = 3;
    int base_ms = 200;
    int max_ms = 2000;

    static BackoffPolicy fromConfig(const config::LinkConfig& cfg) {
        return BackoffPolicy{cfg.retry_attempts, cfg.retry_base_ms, cfg.retry_max_ms};
    }

    // Delay before retry number `retry` (1-based): base * 2^(retry-1), capped
    int delayMs(int retry) const {
        long long d = base_ms;
        for (int i = 1; i < retry && d < max_ms; ++i) d *= 2;
        return static_cast<int>(std::min<long long>(d, max_ms));
    }
};

// Retries fn while it fails with Timeout.
template<typename T>
Result<T> retryWithBackoff(const char* what, const BackoffPolicy& policy,
                           const std::function<Result<T>()>& fn) {
    int attempts = std::max(1, policy.attempts);
    for (int attempt = 1;; ++attempt) {
        Result<T> r = fn();
        if (r.is_ok() || attempt >= attempts || r.error().code != ErrorCode::Timeout) {
            return r;
        }
        int delay = policy.delayMs(attempt);
        MHLOG_WARN("link", "%s failed (%s), retry %d/%d in %dms", what,
                   r.error().message.c_str(), attempt, attempts - 1, delay);
        std::this_thread::sleep_for(std::chrono::milliseconds(delay));
    }
}

class DeviceLink {
public:
    // Connects with retry on Timeout. Errors: DeviceUnauthorized, DeviceOffline,
    // DeviceNotFound, Timeout.
    static Result<std::shared_ptr<DeviceLink>> connect(TransportFactory& factory,
                                                       const std::string& serial,
                                                       const config::LinkConfig& cfg);

    DeviceLink(std::shared_ptr<DeviceTransport> transport, config::LinkConfig cfg);
    ~DeviceLink();

    DeviceLink(const DeviceLink&) = delete;
    DeviceLink& operator=(const DeviceLink&) = delete;

    const std::string& serial() const { return serial_; }
    TransportKind transportKind() const { return kind_; }
    TransportCapabilities capabilities() const;

    // timeout_ms <= 0 uses link.shell_timeout_ms. Errors: Disconnected, Timeout.
    Result<std::string> execShell(const std::string& command, int timeout_ms = 0);

    // Errors: Disconnected, PermissionDenied, Timeout.
    Result<void> pushFile(const std::vector<uint8_t>& bytes, const std::string& remote_path);

    Result<std::unique_ptr<RemoteProcess>> spawn(const std::string& command);
    Result<std::unique_ptr<ByteStream>> openSocket(const std::string& name, int timeout_ms);

    // Never throws; records the outcome
    bool healthCheck();
    int consecutiveFailures() const { return consecutive_failures_.load(); }
    std::chrono::system_clock::time_point lastHealthCheck() const;

    // Queries getprop / wm size; cached after the first successful call
    DeviceProperties properties();

    void close();
    bool isOpen() const { return !closed_.load(); }

private:
    std::shared_ptr<DeviceTransport> transport_;
    config::LinkConfig cfg_;
    BackoffPolicy backoff_;
    std::string serial_;
    TransportKind kind_;

    std::atomic<bool> closed_{false};
    std::atomic<int> consecutive_failures_{0};

    mutable std::mutex mutex_;
    std::chrono::system_clock::time_point last_health_check_{};
    bool props_loaded_ = false;
    DeviceProperties props_;
};

} // namespace mirrorhub
