// =============================================================================
// mirrorhub - Device Transport Abstraction
// =============================================================================
// The seam between the engine and the device connection layer. The adb
// implementation lives in adb_transport.*; tests plug in an in-process fake.
// =============================================================================
#pragma once
#include <cstdint>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "result.hpp"

namespace mirrorhub {

// Bidirectional byte stream to a device-side socket.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    // Reads up to len bytes. Returns 0 on orderly EOF, Timeout when nothing
    // arrived within timeout_ms.
    virtual Result<size_t> read(uint8_t* buf, size_t len, int timeout_ms) = 0;

    virtual Result<void> writeAll(const uint8_t* data, size_t len, int timeout_ms) = 0;

    // Wakes up blocked readers/writers; safe to call from any thread.
    virtual void interrupt() = 0;

    // Releases the underlying handle. Only the owner calls this, once.
    virtual void close() = 0;

    virtual bool isOpen() const = 0;
};

// Handle to a long-running process started through the device shell.
class RemoteProcess {
public:
    virtual ~RemoteProcess() = default;

    virtual bool running() = 0;
    virtual std::optional<int> exitCode() = 0;
    virtual void terminate() = 0;
    virtual void kill() = 0;
    // true once the process has exited
    virtual bool waitFor(int timeout_ms) = 0;
    // Last lines the process printed, for crash reports
    virtual std::string outputTail() = 0;
};

struct TransportCapabilities {
    bool shell = true;
    bool file_transfer = true;
};

// One connected device.
class DeviceTransport {
public:
    virtual ~DeviceTransport() = default;

    virtual const std::string& serial() const = 0;
    virtual TransportCapabilities capabilities() const = 0;

    // Output of the command (stdout and stderr). Errors: Timeout, Disconnected.
    virtual Result<std::string> shell(const std::string& command, int timeout_ms) = 0;

    // Errors: Disconnected, PermissionDenied, Timeout, IoError.
    virtual Result<void> push(const std::vector<uint8_t>& bytes,
                              const std::string& remote_path, int timeout_ms) = 0;

    virtual Result<std::unique_ptr<RemoteProcess>> spawn(const std::string& command) = 0;

    // Connects to the device-local abstract socket `name`.
    virtual Result<std::unique_ptr<ByteStream>> openSocket(const std::string& name,
                                                           int timeout_ms) = 0;

    virtual void close() = 0;
};

// Device as reported by the transport's own enumeration
struct ReachableDevice {
    std::string serial;
    std::string state;   // "device", "unauthorized", "offline", ...
};

class TransportFactory {
public:
    virtual ~TransportFactory() = default;

    // Errors: DeviceUnauthorized, DeviceOffline, DeviceNotFound, Timeout.
    virtual Result<std::shared_ptr<DeviceTransport>> connect(const std::string& serial,
                                                             int timeout_ms) = 0;

    virtual Result<std::vector<ReachableDevice>> listReachable(int timeout_ms) = 0;
};

} // namespace mirrorhub
