// =============================================================================
// mirrorhub - Session Supervisor
// =============================================================================
// Drives one helper run on one device:
//
//   Idle -> Deploying -> Starting -> Running -> Stopping -> Stopped
//                          |           |
//                          +-> Crashed <+        Crashed -> Idle on restart()
//
// A worker thread owns the state: public calls and the monitor/reader threads
// post commands into its queue, stale events of an earlier run are dropped by
// generation. The worker owns the process and the sockets; readers only read
// their own socket, sendControl() writes the control socket under write_mutex_.
//
// SessionStateEvent handlers run on the worker. A start/stop/restart issued from
// such a handler is queued behind the current command and returns Ok at once;
// a failure of the queued command is only logged.
// =============================================================================
#pragma once
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "config_loader.hpp"
#include "deployer.hpp"
#include "device_link.hpp"
#include "event_bus.hpp"
#include "mirrorhub_types.hpp"
#include "result.hpp"
#include "session_config.hpp"
#include "stream_router.hpp"

namespace mirrorhub {

struct SessionStatus {
    SessionId id = 0;
    std::string serial;
    SessionState state = SessionState::Idle;
    std::chrono::system_clock::time_point created_at;
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::string last_crash_reason;
    std::string last_error;
    std::string device_name;
    int restart_count = 0;
    StreamKindMask kinds = 0;
    std::string video_codec;
    uint32_t video_width = 0;
    uint32_t video_height = 0;
    std::string audio_codec;
    bool audio_disabled_by_device = false;
    std::array<uint64_t, STREAM_KIND_COUNT> frames{};
    std::array<uint64_t, STREAM_KIND_COUNT> bytes{};
};

class SessionSupervisor : public std::enable_shared_from_this<SessionSupervisor> {
public:
    SessionSupervisor(SessionId id,
                      SessionConfig config,
                      std::shared_ptr<DeviceLink> link,
                      std::shared_ptr<const HelperArtifact> artifact,
                      Deployer& deployer,
                      StreamRouter& router,
                      EventBus& bus,
                      config::SessionTiming timing);
    ~SessionSupervisor();

    SessionSupervisor(const SessionSupervisor&) = delete;
    SessionSupervisor& operator=(const SessionSupervisor&) = delete;

    // Blocks until Running or a failure.
    // Errors: DeployFailed, SessionStartFailed, SessionConflict (already started)
    Result<void> start();
    // Idempotent; Crashed/Running/Idle -> Stopped
    Result<void> stop(const std::string& reason = "stop requested");
    // Crashed -> Idle -> ... -> Running. A non-null link replaces the current one.
    // Errors: SessionConflict (not crashed), plus those of start()
    Result<void> restart(std::shared_ptr<DeviceLink> link = nullptr);
    // Device went away: aborts a pending start, any state -> Stopped
    void forceStop(const std::string& reason);
    // Link invalidated by health checks: Running/Starting -> Crashed
    void notifyLinkLost(const std::string& reason);

    // Serialized per session. Errors: StreamNotFound (no open control socket), Disconnected.
    Result<void> sendControl(const uint8_t* data, size_t len);

    SessionId id() const { return id_; }
    const std::string& serial() const { return serial_; }
    const SessionConfig& config() const { return config_; }
    SessionState state() const;
    SessionStatus status() const;
    bool waitForState(SessionState s, std::chrono::milliseconds timeout) const;

private:
    enum class CommandType { Start, Stop, Restart, ForceStop, ProcessExited, SocketClosed, LinkLost, Quit };
    enum class AbortKind : int { None = 0, Stop = 1, LinkLost = 2 };

    struct Command {
        CommandType type = CommandType::Start;
        uint64_t generation = 0;
        std::string reason;
        std::shared_ptr<DeviceLink> link;
        std::shared_ptr<std::promise<Result<void>>> done;
    };

    static const char* commandName(CommandType type);
    Result<void> call(CommandType type, const std::string& reason,
                      std::shared_ptr<DeviceLink> link = nullptr);
    void post(Command cmd);
    void workerLoop();
    Result<void> handle(const Command& cmd);

    Result<void> runStart();
    Result<void> failStart(const std::string& reason);
    Result<std::unique_ptr<ByteStream>> connectSocket(const std::string& name, bool first);
    Result<void> readExact(ByteStream& stream, uint8_t* buf, size_t len, int timeout_ms);
    Result<void> handleStop(const std::string& reason);
    void crash(const std::string& reason);
    void releaseResources();
    void readerLoop(StreamKind kind, uint64_t generation);
    void monitorLoop(uint64_t generation);
    void transition(SessionState next, const std::string& reason);
    bool aborted() const { return abort_kind_.load() != static_cast<int>(AbortKind::None); }

    const SessionId id_;
    const std::string serial_;
    const SessionConfig config_;
    std::shared_ptr<DeviceLink> link_;
    std::shared_ptr<const HelperArtifact> artifact_;
    Deployer& deployer_;
    StreamRouter& router_;
    EventBus& bus_;
    config::SessionTiming timing_;

    // State, written by the worker only
    mutable std::mutex state_mutex_;
    mutable std::condition_variable state_cv_;
    SessionState state_ = SessionState::Idle;
    std::chrono::system_clock::time_point created_at_;
    std::optional<std::chrono::system_clock::time_point> started_at_;
    std::string last_crash_reason_;
    std::string last_error_;
    std::string device_name_;
    int restart_count_ = 0;
    std::string video_codec_;
    uint32_t video_width_ = 0;
    uint32_t video_height_ = 0;
    std::string audio_codec_;
    bool audio_disabled_ = false;

    // Command queue
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<Command> queue_;
    std::thread worker_;
    std::atomic<int> abort_kind_{0};
    std::atomic<uint64_t> generation_{0};

    // Live run
    uint32_t scid_ = 0;
    std::unique_ptr<RemoteProcess> process_;
    std::array<std::unique_ptr<ByteStream>, STREAM_KIND_COUNT> sockets_;
    std::array<std::thread, STREAM_KIND_COUNT> readers_;
    std::thread monitor_;
    std::atomic<bool> io_running_{false};
    std::mutex write_mutex_;

    std::array<std::atomic<uint64_t>, STREAM_KIND_COUNT> frame_count_{};
    std::array<std::atomic<uint64_t>, STREAM_KIND_COUNT> byte_count_{};
};

} // namespace mirrorhub
