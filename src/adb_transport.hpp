// =============================================================================
// mirrorhub - ADB Transport
// =============================================================================
// DeviceTransport backed by the adb command line client:
//   shell   -> adb -s SERIAL shell CMD
//   push    -> adb -s SERIAL push TMPFILE REMOTE
//   spawn   -> long-running adb -s SERIAL shell CMD child
//   sockets -> adb forward tcp:0 localabstract:NAME + TCP connect to 127.0.0.1
// =============================================================================
#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include "config_loader.hpp"
#include "device_transport.hpp"

namespace mirrorhub {

namespace adb {

// "List of devices attached\nSERIAL\tdevice\n..." -> entries (mDNS records skipped)
std::vector<ReachableDevice> parseDevicesOutput(const std::string& output);

// Output of "adb forward tcp:0 ..." is the allocated port. Returns 0 if unparsable.
int parseForwardPort(const std::string& output);

// Maps adb client error text to an error code (DeviceNotFound, DeviceUnauthorized,
// DeviceOffline, Disconnected, PermissionDenied). IoError when unrecognized.
ErrorCode classifyError(const std::string& output);

// "Physical size: 1080x2400" (prefers Override size when present)
bool parseScreenSize(const std::string& output, int& width, int& height);

std::string trimRight(std::string s);

} // namespace adb

class AdbTransportFactory : public TransportFactory {
public:
    explicit AdbTransportFactory(config::AdbConfig cfg);

    Result<std::shared_ptr<DeviceTransport>> connect(const std::string& serial,
                                                     int timeout_ms) override;
    Result<std::vector<ReachableDevice>> listReachable(int timeout_ms) override;

private:
    config::AdbConfig cfg_;
};

class AdbTransport : public DeviceTransport {
public:
    AdbTransport(config::AdbConfig cfg, std::string serial);
    ~AdbTransport() override;

    const std::string& serial() const override { return serial_; }
    TransportCapabilities capabilities() const override { return {}; }

    Result<std::string> shell(const std::string& command, int timeout_ms) override;
    Result<void> push(const std::vector<uint8_t>& bytes,
                      const std::string& remote_path, int timeout_ms) override;
    Result<std::unique_ptr<RemoteProcess>> spawn(const std::string& command) override;
    Result<std::unique_ptr<ByteStream>> openSocket(const std::string& name,
                                                   int timeout_ms) override;
    void close() override;

private:
    std::vector<std::string> adbArgs(std::initializer_list<std::string> tail) const;

    config::AdbConfig cfg_;
    std::string serial_;
    std::atomic<bool> closed_{false};
};

// Base argv for the adb client honoring the configured server address
std::vector<std::string> adbBaseArgs(const config::AdbConfig& cfg);

} // namespace mirrorhub
