// =============================================================================
// mirrorhub - Session Supervisor
// =============================================================================
#include "session_supervisor.hpp"
#include <cstdio>
#include <random>
#include "adb_security.hpp"
#include "helper_protocol.hpp"
#include "mirrorhub_log.hpp"

namespace mirrorhub {

static constexpr const char* TAG = "Session";
static constexpr int READ_POLL_MS = 200;
static constexpr int CONTROL_WRITE_TIMEOUT_MS = 2000;
static constexpr int KILL_WAIT_MS = 1000;
static constexpr size_t READ_CHUNK = 64 * 1024;

static uint32_t randomScid() {
    static std::mutex rng_mutex;
    static std::mt19937 rng{std::random_device{}()};
    std::lock_guard<std::mutex> lock(rng_mutex);
    return std::uniform_int_distribution<uint32_t>(1, 0x7FFFFFFF)(rng);
}

const char* SessionSupervisor::commandName(CommandType type) {
    switch (type) {
        case CommandType::Start:         return "start";
        case CommandType::Stop:          return "stop";
        case CommandType::Restart:       return "restart";
        case CommandType::ForceStop:     return "force stop";
        case CommandType::ProcessExited: return "process exit";
        case CommandType::SocketClosed:  return "socket close";
        case CommandType::LinkLost:      return "link loss";
        case CommandType::Quit:          return "quit";
    }
    return "unknown";
}

SessionSupervisor::SessionSupervisor(SessionId id,
                                     SessionConfig config,
                                     std::shared_ptr<DeviceLink> link,
                                     std::shared_ptr<const HelperArtifact> artifact,
                                     Deployer& deployer,
                                     StreamRouter& router,
                                     EventBus& bus,
                                     config::SessionTiming timing)
    : id_(id),
      serial_(link->serial()),
      config_(std::move(config)),
      link_(std::move(link)),
      artifact_(std::move(artifact)),
      deployer_(deployer),
      router_(router),
      bus_(bus),
      timing_(timing),
      created_at_(std::chrono::system_clock::now()) {
    worker_ = std::thread(&SessionSupervisor::workerLoop, this);
}

SessionSupervisor::~SessionSupervisor() {
    abort_kind_ = static_cast<int>(AbortKind::Stop);
    Command quit;
    quit.type = CommandType::Quit;
    quit.reason = "shutdown";
    post(std::move(quit));
    if (worker_.joinable()) worker_.join();
}

// =============================================================================
// Public API (posts into the worker queue)
// =============================================================================

Result<void> SessionSupervisor::start() {
    return call(CommandType::Start, "start requested");
}

Result<void> SessionSupervisor::stop(const std::string& reason) {
    int none = static_cast<int>(AbortKind::None);
    abort_kind_.compare_exchange_strong(none, static_cast<int>(AbortKind::Stop));
    return call(CommandType::Stop, reason);
}

Result<void> SessionSupervisor::restart(std::shared_ptr<DeviceLink> link) {
    return call(CommandType::Restart, "restart requested", std::move(link));
}

void SessionSupervisor::forceStop(const std::string& reason) {
    abort_kind_ = static_cast<int>(AbortKind::Stop);
    Result<void> r = call(CommandType::ForceStop, reason);
    if (r.is_err()) {
        MHLOG_WARN(TAG, "[%llu] force stop: %s", (unsigned long long)id_, r.error().describe().c_str());
    }
}

void SessionSupervisor::notifyLinkLost(const std::string& reason) {
    int none = static_cast<int>(AbortKind::None);
    abort_kind_.compare_exchange_strong(none, static_cast<int>(AbortKind::LinkLost));
    Command cmd;
    cmd.type = CommandType::LinkLost;
    cmd.generation = generation_.load();
    cmd.reason = reason;
    post(std::move(cmd));
}

Result<void> SessionSupervisor::call(CommandType type, const std::string& reason,
                                     std::shared_ptr<DeviceLink> link) {
    Command cmd;
    cmd.type = type;
    cmd.reason = reason;
    cmd.link = std::move(link);
    // From a state-event handler on the worker itself: queue behind the running
    // command instead of waiting on our own thread
    if (std::this_thread::get_id() == worker_.get_id()) {
        MHLOG_DEBUG(TAG, "[%llu] %s queued from worker (%s)", (unsigned long long)id_,
                    commandName(type), reason.c_str());
        post(std::move(cmd));
        return Ok();
    }
    cmd.done = std::make_shared<std::promise<Result<void>>>();
    auto fut = cmd.done->get_future();
    post(std::move(cmd));
    return fut.get();
}

void SessionSupervisor::post(Command cmd) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.push_back(std::move(cmd));
    queue_cv_.notify_one();
}

SessionState SessionSupervisor::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

bool SessionSupervisor::waitForState(SessionState s, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_mutex_);
    return state_cv_.wait_for(lock, timeout, [&] { return state_ == s; });
}

SessionStatus SessionSupervisor::status() const {
    SessionStatus st;
    st.id = id_;
    st.serial = serial_;
    st.kinds = config_.enabledKinds();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        st.state = state_;
        st.created_at = created_at_;
        st.started_at = started_at_;
        st.last_crash_reason = last_crash_reason_;
        st.last_error = last_error_;
        st.device_name = device_name_;
        st.restart_count = restart_count_;
        st.video_codec = video_codec_;
        st.video_width = video_width_;
        st.video_height = video_height_;
        st.audio_codec = audio_codec_;
        st.audio_disabled_by_device = audio_disabled_;
    }
    for (size_t i = 0; i < STREAM_KIND_COUNT; i++) {
        st.frames[i] = frame_count_[i].load();
        st.bytes[i] = byte_count_[i].load();
    }
    return st;
}

Result<void> SessionSupervisor::sendControl(const uint8_t* data, size_t len) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    ByteStream* control = sockets_[kindIndex(StreamKind::Control)].get();
    if (!io_running_ || !control || !control->isOpen()) {
        return Err<void>(ErrorCode::StreamNotFound, "control stream is not open");
    }
    auto r = control->writeAll(data, len, CONTROL_WRITE_TIMEOUT_MS);
    if (r.is_err()) {
        MHLOG_WARN(TAG, "[%llu] control write failed: %s", (unsigned long long)id_,
                   r.error().describe().c_str());
        return Err<void>(ErrorCode::Disconnected, "control write failed: " + r.error().message);
    }
    return Ok();
}

// =============================================================================
// Worker
// =============================================================================

void SessionSupervisor::workerLoop() {
    while (true) {
        Command cmd;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !queue_.empty(); });
            cmd = std::move(queue_.front());
            queue_.pop_front();
        }

        Result<void> r = Ok();
        if (cmd.type == CommandType::Quit) {
            r = handleStop(cmd.reason);
        } else {
            r = handle(cmd);
        }
        if (cmd.done) {
            cmd.done->set_value(r);
        } else if (r.is_err()) {
            MHLOG_WARN(TAG, "[%llu] queued %s failed: %s", (unsigned long long)id_,
                       commandName(cmd.type), r.error().describe().c_str());
        }
        if (cmd.type == CommandType::Quit) break;
    }

    // Anyone still waiting gets an answer
    std::lock_guard<std::mutex> lock(queue_mutex_);
    for (auto& cmd : queue_) {
        if (cmd.done) cmd.done->set_value(Err<void>(ErrorCode::SessionNotFound, "session shut down"));
    }
    queue_.clear();
}

Result<void> SessionSupervisor::handle(const Command& cmd) {
    SessionState current = state();
    switch (cmd.type) {
        case CommandType::Start:
            if (current != SessionState::Idle) {
                return Err<void>(ErrorCode::SessionConflict,
                                 std::string("session is ") + sessionStateName(current));
            }
            return runStart();

        case CommandType::Restart:
            if (current != SessionState::Crashed) {
                return Err<void>(ErrorCode::SessionConflict,
                                 std::string("restart requires a crashed session, state is ") +
                                 sessionStateName(current));
            }
            if (cmd.link) link_ = cmd.link;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                restart_count_++;
            }
            transition(SessionState::Idle, cmd.reason);
            return runStart();

        case CommandType::Stop:
        case CommandType::ForceStop:
            return handleStop(cmd.reason);

        case CommandType::ProcessExited:
        case CommandType::SocketClosed:
        case CommandType::LinkLost:
            if (cmd.generation != generation_.load() || current != SessionState::Running) {
                MHLOG_DEBUG(TAG, "[%llu] stale event ignored: %s", (unsigned long long)id_, cmd.reason.c_str());
                return Ok();
            }
            crash(cmd.reason);
            return Ok();

        case CommandType::Quit:
            return handleStop(cmd.reason);
    }
    return Ok();
}

void SessionSupervisor::transition(SessionState next, const std::string& reason) {
    SessionState prev;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        prev = state_;
        state_ = next;
    }
    state_cv_.notify_all();
    if (prev == next) return;

    if (next == SessionState::Crashed) {
        MHLOG_ERROR(TAG, "[%llu] %s: %s -> %s (%s)", (unsigned long long)id_, serial_.c_str(),
                    sessionStateName(prev), sessionStateName(next), reason.c_str());
    } else {
        MHLOG_INFO(TAG, "[%llu] %s: %s -> %s (%s)", (unsigned long long)id_, serial_.c_str(),
                   sessionStateName(prev), sessionStateName(next), reason.c_str());
    }

    SessionStateEvent ev;
    ev.session_id = id_;
    ev.serial = serial_;
    ev.old_state = prev;
    ev.new_state = next;
    ev.reason = reason;
    bus_.publish(ev);
}

// =============================================================================
// Start sequence
// =============================================================================

Result<void> SessionSupervisor::runStart() {
    abort_kind_ = static_cast<int>(AbortKind::None);
    uint64_t gen = ++generation_;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_error_.clear();
        device_name_.clear();
        audio_disabled_ = false;
    }
    for (size_t i = 0; i < STREAM_KIND_COUNT; i++) {
        frame_count_[i] = 0;
        byte_count_[i] = 0;
    }

    transition(SessionState::Deploying, "deploying helper " + artifact_->version);
    auto deployed = deployer_.deploy(*link_, *artifact_);
    if (deployed.is_err()) {
        std::string reason = deployed.error().message;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            last_error_ = deployed.error().describe();
        }
        transition(SessionState::Stopped, "deploy failed: " + reason);
        router_.notifyTerminal(id_, TerminalCause::SessionStopped, "deploy failed: " + reason);
        return Err<void>(ErrorCode::DeployFailed, reason);
    }

    transition(SessionState::Starting, "spawning helper");
    if (aborted()) return failStart("start aborted");

    scid_ = randomScid();
    std::string command = buildCommand(config_, artifact_->remote_path, scid_);
    MHLOG_DEBUG(TAG, "[%llu] %s", (unsigned long long)id_, command.c_str());
    auto spawned = link_->spawn(command);
    if (spawned.is_err()) {
        return failStart("spawn failed: " + spawned.error().describe());
    }
    process_ = std::move(spawned).value();

    // The helper accepts connections in this order; the first one carries the device meta
    std::string name = socketName(scid_);
    bool first = true;
    for (StreamKind k : {StreamKind::Control, StreamKind::Video, StreamKind::Audio}) {
        if (!config_.isEnabled(k)) continue;
        auto sock = connectSocket(name, first);
        if (sock.is_err()) {
            return failStart(std::string(streamKindName(k)) + " socket: " + sock.error().message);
        }
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            sockets_[kindIndex(k)] = std::move(sock).value();
        }
        first = false;
        MHLOG_DEBUG(TAG, "[%llu] %s socket connected", (unsigned long long)id_, streamKindName(k));
    }
    if (aborted()) return failStart("start aborted");

    io_running_ = true;
    std::weak_ptr<SessionSupervisor> weak = weak_from_this();
    router_.activateSession(id_, config_.enabledKinds(), [weak](const uint8_t* data, size_t len) {
        auto self = weak.lock();
        if (!self) return Err<void>(ErrorCode::StreamNotFound, "session closed");
        return self->sendControl(data, len);
    });
    for (StreamKind k : {StreamKind::Video, StreamKind::Audio, StreamKind::Control}) {
        if (sockets_[kindIndex(k)]) {
            readers_[kindIndex(k)] = std::thread(&SessionSupervisor::readerLoop, this, k, gen);
        }
    }
    monitor_ = std::thread(&SessionSupervisor::monitorLoop, this, gen);

    std::string device;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        started_at_ = std::chrono::system_clock::now();
        device = device_name_;
    }
    transition(SessionState::Running, "helper ready on " + (device.empty() ? serial_ : device));
    return Ok();
}

Result<void> SessionSupervisor::failStart(const std::string& reason) {
    AbortKind kind = static_cast<AbortKind>(abort_kind_.load());
    if (kind == AbortKind::Stop) {
        // A stop/forced stop arrived while starting
        io_running_ = false;
        releaseResources();
        transition(SessionState::Stopped, reason);
        router_.notifyTerminal(id_, TerminalCause::SessionStopped, reason);
        return Err<void>(ErrorCode::SessionStartFailed, reason);
    }

    std::string why = reason;
    if (kind == AbortKind::LinkLost) why = "device link lost during start";
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_error_ = why;
    }
    crash(why);
    return Err<void>(ErrorCode::SessionStartFailed, why);
}

Result<void> SessionSupervisor::readExact(ByteStream& stream, uint8_t* buf, size_t len, int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    size_t got = 0;
    while (got < len) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) return Err<void>(ErrorCode::Timeout, "handshake timed out");
        if (aborted()) return Err<void>(ErrorCode::SessionStartFailed, "start aborted");
        int wait = static_cast<int>(std::min<long long>(remaining, READ_POLL_MS));
        auto r = stream.read(buf + got, len - got, wait);
        if (r.is_err()) {
            if (r.error().code == ErrorCode::Timeout) continue;
            return r.error();
        }
        if (r.value() == 0) return Err<void>(ErrorCode::Disconnected, "closed during handshake");
        got += r.value();
    }
    return Ok();
}

Result<std::unique_ptr<ByteStream>> SessionSupervisor::connectSocket(const std::string& name, bool first) {
    using StreamResult = Result<std::unique_ptr<ByteStream>>;
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(timing_.socket_connect_timeout_ms);
    std::string last = "not connected";

    while (true) {
        if (aborted()) return StreamResult(Error(ErrorCode::SessionStartFailed, "start aborted"));
        if (!process_->running()) {
            auto code = process_->exitCode();
            std::string tail = process_->outputTail();
            return StreamResult(Error(ErrorCode::SessionStartFailed,
                "helper exited (" + (code ? std::to_string(*code) : std::string("?")) +
                ") before sockets were ready" + (tail.empty() ? "" : ": " + tail)));
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            return StreamResult(Error(ErrorCode::Timeout, "connect timed out (" + last + ")"));
        }

        auto opened = link_->openSocket(name, static_cast<int>(remaining));
        if (opened.is_ok()) {
            std::unique_ptr<ByteStream> stream = std::move(opened).value();
            if (!first) return StreamResult(std::move(stream));

            uint8_t meta[protocol::DEVICE_NAME_FIELD_LENGTH];
            auto hs = readExact(*stream, meta, sizeof(meta), timing_.handshake_timeout_ms);
            if (hs.is_ok()) {
                std::lock_guard<std::mutex> lock(state_mutex_);
                device_name_ = protocol::parseDeviceName(meta, sizeof(meta));
                return StreamResult(std::move(stream));
            }
            stream->close();
            if (hs.error().code != ErrorCode::Disconnected) {
                return StreamResult(Error(hs.error().code, "device meta: " + hs.error().message));
            }
            // Forward accepted before the helper listened; try again
            last = hs.error().message;
        } else {
            last = opened.error().message;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(timing_.connect_retry_interval_ms));
    }
}

// =============================================================================
// Stop / crash / teardown
// =============================================================================

Result<void> SessionSupervisor::handleStop(const std::string& reason) {
    switch (state()) {
        case SessionState::Stopped:
            return Ok();
        case SessionState::Idle:
            transition(SessionState::Stopped, reason);
            return Ok();
        case SessionState::Crashed:
            transition(SessionState::Stopped, reason);
            router_.notifyTerminal(id_, TerminalCause::SessionStopped, reason);
            return Ok();
        case SessionState::Running:
        case SessionState::Deploying:
        case SessionState::Starting:
        case SessionState::Stopping:
            break;
    }

    transition(SessionState::Stopping, reason);
    io_running_ = false;
    router_.notifyTerminal(id_, TerminalCause::SessionStopped, reason);
    releaseResources();
    transition(SessionState::Stopped, reason);
    return Ok();
}

void SessionSupervisor::crash(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_crash_reason_ = reason;
    }
    io_running_ = false;
    transition(SessionState::Crashed, reason);
    router_.notifyTerminal(id_, TerminalCause::SessionCrashed, reason);
    releaseResources();
}

void SessionSupervisor::releaseResources() {
    io_running_ = false;
    for (auto& s : sockets_) {
        if (s) s->interrupt();
    }
    for (auto& t : readers_) {
        if (t.joinable()) t.join();
    }
    if (monitor_.joinable()) monitor_.join();

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        for (auto& s : sockets_) {
            if (s) {
                s->close();
                s.reset();
            }
        }
    }

    if (process_) {
        if (process_->running()) {
            process_->terminate();
            if (!process_->waitFor(timing_.stop_grace_ms)) {
                MHLOG_WARN(TAG, "[%llu] helper ignored terminate, killing", (unsigned long long)id_);
                process_->kill();
                process_->waitFor(KILL_WAIT_MS);
            }
        }
        process_.reset();
    }

    // The device-side helper may outlive its shell; best effort
    if (scid_ != 0 && link_ && link_->isOpen()) {
        char pattern[32];
        snprintf(pattern, sizeof(pattern), "scid=%08x", scid_);
        auto r = link_->execShell("pkill -f " + security::quoteShellArg(pattern) + " || true");
        if (r.is_err()) {
            MHLOG_DEBUG(TAG, "[%llu] helper cleanup: %s", (unsigned long long)id_, r.error().describe().c_str());
        }
    }
    scid_ = 0;
}

// =============================================================================
// IO threads
// =============================================================================

void SessionSupervisor::readerLoop(StreamKind kind, uint64_t generation) {
    ByteStream* stream = sockets_[kindIndex(kind)].get();
    protocol::MediaStreamParser media(kind);
    protocol::ControlMessageParser control;
    std::vector<uint8_t> buf(READ_CHUNK);
    size_t k = kindIndex(kind);

    auto report = [&](const std::string& reason) {
        if (!io_running_) return;
        Command cmd;
        cmd.type = CommandType::SocketClosed;
        cmd.generation = generation;
        cmd.reason = reason;
        post(std::move(cmd));
    };

    while (io_running_) {
        auto r = stream->read(buf.data(), buf.size(), READ_POLL_MS);
        if (r.is_err()) {
            if (r.error().code == ErrorCode::Timeout) continue;
            report(std::string(streamKindName(kind)) + " socket error: " + r.error().message);
            break;
        }
        if (r.value() == 0) {
            report(std::string(streamKindName(kind)) + " socket closed");
            break;
        }
        if (!io_running_) break;

        protocol::ParseResult parsed = kind == StreamKind::Control
            ? control.feed(buf.data(), r.value())
            : media.feed(buf.data(), r.value());

        for (auto& frame : parsed.frames) {
            if (frame.codec_meta) {
                std::lock_guard<std::mutex> lock(state_mutex_);
                if (kind == StreamKind::Video) {
                    video_codec_ = protocol::codecIdString(media.codecId());
                    video_width_ = media.width();
                    video_height_ = media.height();
                } else {
                    audio_codec_ = protocol::codecIdString(media.codecId());
                }
            }
            frame_count_[k]++;
            byte_count_[k] += frame.size();
            router_.publishInbound(id_, std::move(frame));
        }

        if (parsed.stream_disabled) {
            std::lock_guard<std::mutex> lock(state_mutex_);
            audio_disabled_ = true;
            MHLOG_WARN(TAG, "[%llu] device reported audio unavailable, audio stream idle",
                       (unsigned long long)id_);
            break;
        }
        if (parsed.protocol_error) {
            report(std::string(streamKindName(kind)) + " protocol error: " + parsed.error);
            break;
        }
    }
}

void SessionSupervisor::monitorLoop(uint64_t generation) {
    while (io_running_) {
        if (!process_->waitFor(timing_.monitor_interval_ms)) continue;
        if (!io_running_) break;
        auto code = process_->exitCode();
        std::string tail = process_->outputTail();
        Command cmd;
        cmd.type = CommandType::ProcessExited;
        cmd.generation = generation;
        cmd.reason = "helper exited (" + (code ? std::to_string(*code) : std::string("?")) + ")" +
                     (tail.empty() ? "" : ": " + tail);
        post(std::move(cmd));
        break;
    }
}

} // namespace mirrorhub
