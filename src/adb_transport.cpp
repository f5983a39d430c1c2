// =============================================================================
// mirrorhub - ADB Transport
// =============================================================================
#include "adb_transport.hpp"
#include "adb_security.hpp"
#include "mirrorhub_log.hpp"
#include "mirrorhub_types.hpp"
#include "process_util.hpp"
#include "socket_stream.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <fcntl.h>
#include <unistd.h>

namespace mirrorhub {

// =============================================================================
// Output parsing
// =============================================================================
namespace adb {

std::string trimRight(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' || s.back() == '\t')) {
        s.pop_back();
    }
    return s;
}

std::vector<ReachableDevice> parseDevicesOutput(const std::string& output) {
    std::vector<ReachableDevice> devices;
    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        // Skip header, daemon chatter and empty lines
        if (line.find("List of devices") != std::string::npos) continue;
        if (line.empty() || line[0] == '*') continue;

        // Parse "serial\tdevice" or "serial\toffline"
        size_t tab_pos = line.find('\t');
        if (tab_pos == std::string::npos) continue;

        ReachableDevice dev;
        dev.serial = line.substr(0, tab_pos);
        dev.state = trimRight(line.substr(tab_pos + 1));

        // Ignore mDNS ADB records (e.g. adb-XXXX._adb-tls-connect._tcp)
        if (dev.serial.rfind("adb-", 0) == 0 && dev.serial.find("._adb") != std::string::npos) {
            continue;
        }
        if (!security::isValidSerial(dev.serial)) {
            MHLOG_WARN("adb", "Ignoring malformed serial in device list");
            continue;
        }
        devices.push_back(std::move(dev));
    }
    return devices;
}

int parseForwardPort(const std::string& output) {
    std::string s = trimRight(output);
    if (s.empty() || s.size() > 5) return 0;
    int port = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return 0;
        port = port * 10 + (c - '0');
    }
    return (port > 0 && port < 65536) ? port : 0;
}

ErrorCode classifyError(const std::string& output) {
    if (output.find("unauthorized") != std::string::npos ||
        output.find("failed to authenticate") != std::string::npos) {
        return ErrorCode::DeviceUnauthorized;
    }
    if (output.find("offline") != std::string::npos) {
        return ErrorCode::DeviceOffline;
    }
    if (output.find("not found") != std::string::npos ||
        output.find("no devices") != std::string::npos) {
        return ErrorCode::DeviceNotFound;
    }
    if (output.find("Permission denied") != std::string::npos ||
        output.find("Read-only file system") != std::string::npos) {
        return ErrorCode::PermissionDenied;
    }
    if (output.find("closed") != std::string::npos ||
        output.find("protocol fault") != std::string::npos ||
        output.find("cannot connect") != std::string::npos) {
        return ErrorCode::Disconnected;
    }
    return ErrorCode::IoError;
}

bool parseScreenSize(const std::string& output, int& width, int& height) {
    auto parseWH = [&](const std::string& s) {
        int w = 0, h = 0;
        if (sscanf(s.c_str(), "%*[^0-9]%dx%d", &w, &h) == 2 && w > 0 && h > 0) {
            width = w;
            height = h;
            return true;
        }
        return false;
    };
    // Override size wins when the user changed the resolution
    size_t pos = output.find("Override size");
    if (pos != std::string::npos && parseWH(output.substr(pos))) return true;
    pos = output.find("Physical size");
    if (pos != std::string::npos) return parseWH(output.substr(pos));
    return parseWH(output);
}

} // namespace adb

std::vector<std::string> adbBaseArgs(const config::AdbConfig& cfg) {
    return {cfg.adb_path, "-H", cfg.server_host, "-P", std::to_string(cfg.server_port)};
}

namespace {

bool isClientError(const std::string& output) {
    return output.rfind("error:", 0) == 0 || output.rfind("adb: ", 0) == 0;
}

// Adb client/device errors seen by an already connected link
ErrorCode linkErrorCode(const std::string& output) {
    ErrorCode c = adb::classifyError(output);
    switch (c) {
        case ErrorCode::DeviceNotFound:
        case ErrorCode::DeviceOffline:
        case ErrorCode::DeviceUnauthorized:
            return ErrorCode::Disconnected;
        default:
            return c;
    }
}

std::string tempDirectory() {
    const char* dir = std::getenv("TMPDIR");
    if (dir && *dir) return dir;
    return "/tmp";
}

// ---------------------------------------------------------------------------
// Stream over an adb forward; removes the forward on close
// ---------------------------------------------------------------------------
class ForwardedStream : public ByteStream {
public:
    ForwardedStream(std::unique_ptr<SocketStream> sock, config::AdbConfig cfg,
                    std::string serial, int port)
        : sock_(std::move(sock)), cfg_(std::move(cfg)), serial_(std::move(serial)), port_(port) {}

    ~ForwardedStream() override { close(); }

    Result<size_t> read(uint8_t* buf, size_t len, int timeout_ms) override {
        return sock_->read(buf, len, timeout_ms);
    }
    Result<void> writeAll(const uint8_t* data, size_t len, int timeout_ms) override {
        return sock_->writeAll(data, len, timeout_ms);
    }
    void interrupt() override { sock_->interrupt(); }
    bool isOpen() const override { return sock_->isOpen(); }

    void close() override {
        if (!sock_->isOpen()) return;
        sock_->close();
        auto argv = adbBaseArgs(cfg_);
        argv.insert(argv.end(), {"-s", serial_, "forward", "--remove", "tcp:" + std::to_string(port_)});
        auto r = runCommand(argv, 5000);
        if (r.is_err() || r.value().exit_code != 0) {
            MHLOG_WARN("adb", "forward --remove tcp:%d failed (serial=%s)", port_, serial_.c_str());
        } else {
            MHLOG_DEBUG("adb", "Removed forward tcp:%d (serial=%s)", port_, serial_.c_str());
        }
    }

private:
    std::unique_ptr<SocketStream> sock_;
    config::AdbConfig cfg_;
    std::string serial_;
    int port_;
};

// ---------------------------------------------------------------------------
// Remote helper process: the local adb shell child stands in for it
// ---------------------------------------------------------------------------
class AdbRemoteProcess : public RemoteProcess {
public:
    explicit AdbRemoteProcess(std::unique_ptr<ChildProcess> child) : child_(std::move(child)) {}

    bool running() override { return child_->running(); }
    std::optional<int> exitCode() override { return child_->exitCode(); }
    void terminate() override { child_->terminate(); }
    void kill() override { child_->kill(); }
    bool waitFor(int timeout_ms) override { return child_->waitFor(timeout_ms); }

    std::string outputTail() override {
        std::string out = child_->output();
        if (out.size() > 512) out.erase(0, out.size() - 512);
        return adb::trimRight(out);
    }

private:
    std::unique_ptr<ChildProcess> child_;
};

} // namespace

// =============================================================================
// AdbTransportFactory
// =============================================================================

AdbTransportFactory::AdbTransportFactory(config::AdbConfig cfg) : cfg_(std::move(cfg)) {}

Result<std::shared_ptr<DeviceTransport>> AdbTransportFactory::connect(const std::string& serial,
                                                                      int timeout_ms) {
    using R = Result<std::shared_ptr<DeviceTransport>>;

    if (!security::isValidSerial(serial)) {
        MHLOG_ERROR("adb", "Invalid serial rejected");
        return R(Error(ErrorCode::DeviceNotFound, "invalid serial", "serial"));
    }

    if (classifySerial(serial) == TransportKind::Network) {
        auto argv = adbBaseArgs(cfg_);
        argv.insert(argv.end(), {"connect", serial});
        auto r = runCommand(argv, timeout_ms);
        if (r.is_err()) return R(r.error());
        const auto& res = r.value();
        if (res.timed_out) return R(Error(ErrorCode::Timeout, "adb connect timed out"));
        if (res.output.find("connected to") == std::string::npos) {
            ErrorCode c = adb::classifyError(res.output);
            if (c != ErrorCode::DeviceUnauthorized) c = ErrorCode::DeviceOffline;
            return R(Error(c, "adb connect: " + adb::trimRight(res.output)));
        }
    }

    auto argv = adbBaseArgs(cfg_);
    argv.insert(argv.end(), {"-s", serial, "get-state"});
    auto r = runCommand(argv, timeout_ms);
    if (r.is_err()) return R(r.error());
    const auto& res = r.value();
    if (res.timed_out) return R(Error(ErrorCode::Timeout, "adb get-state timed out"));

    std::string state = adb::trimRight(res.output);
    if (res.exit_code == 0 && state == "device") {
        MHLOG_INFO("adb", "Connected to %s (%s)", serial.c_str(),
                   transportKindName(classifySerial(serial)));
        return R(std::shared_ptr<DeviceTransport>(std::make_shared<AdbTransport>(cfg_, serial)));
    }
    if (state == "unauthorized") {
        return R(Error(ErrorCode::DeviceUnauthorized, "device unauthorized"));
    }
    if (res.exit_code == 0) {
        return R(Error(ErrorCode::DeviceOffline, "device state: " + state));
    }
    ErrorCode c = adb::classifyError(state);
    if (c == ErrorCode::IoError || c == ErrorCode::PermissionDenied || c == ErrorCode::Disconnected) {
        c = ErrorCode::DeviceOffline;
    }
    return R(Error(c, state));
}

Result<std::vector<ReachableDevice>> AdbTransportFactory::listReachable(int timeout_ms) {
    auto argv = adbBaseArgs(cfg_);
    argv.push_back("devices");
    auto r = runCommand(argv, timeout_ms);
    if (r.is_err()) return r.error();
    const auto& res = r.value();
    if (res.timed_out) {
        return Err<std::vector<ReachableDevice>>(ErrorCode::Timeout, "adb devices timed out");
    }
    if (res.exit_code != 0) {
        return Err<std::vector<ReachableDevice>>(ErrorCode::IoError,
            "adb devices failed: " + adb::trimRight(res.output));
    }
    return Ok(adb::parseDevicesOutput(res.output));
}

// =============================================================================
// AdbTransport
// =============================================================================

AdbTransport::AdbTransport(config::AdbConfig cfg, std::string serial)
    : cfg_(std::move(cfg)), serial_(std::move(serial)) {}

AdbTransport::~AdbTransport() { close(); }

std::vector<std::string> AdbTransport::adbArgs(std::initializer_list<std::string> tail) const {
    auto argv = adbBaseArgs(cfg_);
    argv.push_back("-s");
    argv.push_back(serial_);
    argv.insert(argv.end(), tail.begin(), tail.end());
    return argv;
}

Result<std::string> AdbTransport::shell(const std::string& command, int timeout_ms) {
    if (closed_) return Err<std::string>(ErrorCode::Disconnected, "link closed");

    auto r = runCommand(adbArgs({"shell", command}), timeout_ms);
    if (r.is_err()) return r.error();
    auto res = std::move(r).value();
    if (res.timed_out) {
        return Err<std::string>(ErrorCode::Timeout, "shell timed out after " + std::to_string(timeout_ms) + "ms");
    }
    // A non-zero exit of the remote command is not a transport failure
    if (res.exit_code != 0 && isClientError(res.output)) {
        return Err<std::string>(linkErrorCode(res.output), adb::trimRight(res.output));
    }
    return Ok(adb::trimRight(std::move(res.output)));
}

Result<void> AdbTransport::push(const std::vector<uint8_t>& bytes,
                                const std::string& remote_path, int timeout_ms) {
    if (closed_) return Err<void>(ErrorCode::Disconnected, "link closed");
    if (!security::isAllowedRemotePath(remote_path)) {
        MHLOG_ERROR("adb", "Remote path rejected: %s", remote_path.c_str());
        return Err<void>(ErrorCode::PermissionDenied, "remote path not allowed", "remote_path");
    }

    std::string tmpl = tempDirectory() + "/mirrorhub-push-XXXXXX";
    std::vector<char> path(tmpl.begin(), tmpl.end());
    path.push_back('\0');
    int fd = mkstemp(path.data());
    if (fd < 0) {
        return Err<void>(ErrorCode::IoError, std::string("mkstemp: ") + strerror(errno));
    }
    std::string local(path.data());

    size_t written = 0;
    while (written < bytes.size()) {
        ssize_t n = ::write(fd, bytes.data() + written, bytes.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            unlink(local.c_str());
            return Err<void>(ErrorCode::IoError, std::string("write temp file: ") + strerror(err));
        }
        written += static_cast<size_t>(n);
    }
    ::close(fd);

    auto r = runCommand(adbArgs({"push", local, remote_path}), timeout_ms);
    unlink(local.c_str());
    if (r.is_err()) return r.error();
    const auto& res = r.value();
    if (res.timed_out) return Err<void>(ErrorCode::Timeout, "push timed out");
    if (res.exit_code != 0) {
        ErrorCode c = linkErrorCode(res.output);
        return Err<void>(c, "push failed: " + adb::trimRight(res.output));
    }
    MHLOG_INFO("adb", "Pushed %zu bytes to %s (serial=%s)", bytes.size(), remote_path.c_str(), serial_.c_str());
    return Ok();
}

Result<std::unique_ptr<RemoteProcess>> AdbTransport::spawn(const std::string& command) {
    using R = Result<std::unique_ptr<RemoteProcess>>;
    if (closed_) return R(Error(ErrorCode::Disconnected, "link closed"));

    auto child = ChildProcess::spawn(adbArgs({"shell", command}));
    if (child.is_err()) return R(child.error());
    MHLOG_INFO("adb", "Spawned remote process (serial=%s pid=%d)",
               serial_.c_str(), (int)child.value()->pid());
    return R(std::unique_ptr<RemoteProcess>(new AdbRemoteProcess(std::move(child).value())));
}

Result<std::unique_ptr<ByteStream>> AdbTransport::openSocket(const std::string& name,
                                                             int timeout_ms) {
    using R = Result<std::unique_ptr<ByteStream>>;
    if (closed_) return R(Error(ErrorCode::Disconnected, "link closed"));
    if (!security::isSafeToken(name)) {
        return R(Error(ErrorCode::ValidationError, "invalid socket name", "name"));
    }

    auto fwd = runCommand(adbArgs({"forward", "tcp:0", "localabstract:" + name}), timeout_ms);
    if (fwd.is_err()) return R(fwd.error());
    if (fwd.value().timed_out) return R(Error(ErrorCode::Timeout, "adb forward timed out"));
    int port = adb::parseForwardPort(fwd.value().output);
    if (fwd.value().exit_code != 0 || port == 0) {
        return R(Error(linkErrorCode(fwd.value().output),
                       "adb forward failed: " + adb::trimRight(fwd.value().output)));
    }

    auto sock = connectTcp("127.0.0.1", port, timeout_ms);
    if (sock.is_err()) {
        auto rm = runCommand(adbArgs({"forward", "--remove", "tcp:" + std::to_string(port)}), 5000);
        if (rm.is_err()) {
            MHLOG_WARN("adb", "forward --remove tcp:%d: %s", port, rm.error().message.c_str());
        }
        return R(sock.error());
    }

    MHLOG_DEBUG("adb", "Socket %s via tcp:%d (serial=%s)", name.c_str(), port, serial_.c_str());
    return R(std::unique_ptr<ByteStream>(
        new ForwardedStream(std::move(sock).value(), cfg_, serial_, port)));
}

void AdbTransport::close() {
    if (closed_.exchange(true)) return;
    MHLOG_INFO("adb", "Transport closed (serial=%s)", serial_.c_str());
}

} // namespace mirrorhub
