// =============================================================================
// mirrorhub - Child Process Helpers
// =============================================================================
#include "process_util.hpp"
#include "mirrorhub_log.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mirrorhub {

namespace {

constexpr int DRAIN_POLL_MS = 100;
constexpr int DRAIN_EOF_WAIT_MS = 200;

} // namespace

// =============================================================================
// ChildProcess
// =============================================================================

Result<std::unique_ptr<ChildProcess>> ChildProcess::spawn(const std::vector<std::string>& argv,
                                                          size_t output_limit) {
    if (argv.empty()) {
        return Err<std::unique_ptr<ChildProcess>>(ErrorCode::Internal, "empty argv");
    }

    // Everything the child touches is prepared before fork()
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        return Err<std::unique_ptr<ChildProcess>>(ErrorCode::IoError,
            std::string("pipe2 failed: ") + strerror(errno));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        return Err<std::unique_ptr<ChildProcess>>(ErrorCode::IoError,
            std::string("fork failed: ") + strerror(err));
    }

    if (pid == 0) {
        setpgid(0, 0);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        execvp(cargv[0], cargv.data());
        _exit(127);
    }

    ::close(fds[1]);
    MHLOG_DEBUG("process", "spawned pid=%d: %s", (int)pid, argv[0].c_str());
    return Ok(std::unique_ptr<ChildProcess>(new ChildProcess(pid, fds[0], output_limit)));
}

ChildProcess::ChildProcess(pid_t pid, int out_fd, size_t output_limit)
    : pid_(pid), out_fd_(out_fd), output_limit_(output_limit) {
    drain_thread_ = std::thread(&ChildProcess::drainLoop, this);
}

ChildProcess::~ChildProcess() {
    if (!reap(false)) {
        kill();
        reap(true);
    }
    stopDrain();
    if (out_fd_ >= 0) ::close(out_fd_);
}

void ChildProcess::drainLoop() {
    char buf[4096];
    while (!drain_stop_.load()) {
        struct pollfd pfd{out_fd_, POLLIN, 0};
        int pr = poll(&pfd, 1, DRAIN_POLL_MS);
        if (pr < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (pr == 0) continue;

        ssize_t n = ::read(out_fd_, buf, sizeof(buf));
        if (n > 0) {
            std::lock_guard<std::mutex> lock(output_mutex_);
            output_.append(buf, static_cast<size_t>(n));
            if (output_.size() > output_limit_) {
                output_.erase(0, output_.size() - output_limit_);
            }
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;  // EOF or error
    }
    drain_eof_ = true;
}

void ChildProcess::stopDrain() {
    std::lock_guard<std::mutex> lock(drain_mutex_);
    drain_stop_ = true;
    if (drain_thread_.joinable()) drain_thread_.join();
}

bool ChildProcess::reap(bool block) {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (exited_) return true;
    int status = 0;
    pid_t r = waitpid(pid_, &status, block ? 0 : WNOHANG);
    if (r == pid_) {
        exited_ = true;
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = 128 + WTERMSIG(status);
        }
        return true;
    }
    if (r < 0 && errno == ECHILD) {
        exited_ = true;
        return true;
    }
    return false;
}

bool ChildProcess::running() {
    return !reap(false);
}

std::optional<int> ChildProcess::exitCode() {
    if (!reap(false)) return std::nullopt;
    std::lock_guard<std::mutex> lock(reap_mutex_);
    return exit_code_;
}

static void signalGroup(pid_t pid, int sig) {
    if (::kill(-pid, sig) != 0) {
        ::kill(pid, sig);
    }
}

void ChildProcess::terminate() {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (!exited_) signalGroup(pid_, SIGTERM);
}

void ChildProcess::kill() {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (!exited_) signalGroup(pid_, SIGKILL);
}

bool ChildProcess::waitFor(int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    for (;;) {
        if (reap(false)) {
            // Let the drain thread pick up the remaining output
            auto eof_deadline = std::chrono::steady_clock::now() +
                                std::chrono::milliseconds(DRAIN_EOF_WAIT_MS);
            while (!drain_eof_.load() && std::chrono::steady_clock::now() < eof_deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            stopDrain();
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

std::string ChildProcess::output() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    return output_;
}

// =============================================================================
// runCommand
// =============================================================================

Result<CommandResult> runCommand(const std::vector<std::string>& argv, int timeout_ms,
                                 size_t max_output) {
    auto spawned = ChildProcess::spawn(argv, max_output);
    if (spawned.is_err()) return spawned.error();
    auto proc = std::move(spawned).value();

    CommandResult result;
    if (!proc->waitFor(timeout_ms)) {
        MHLOG_WARN("process", "Command timed out after %dms: %s", timeout_ms, argv[0].c_str());
        result.timed_out = true;
        proc->kill();
        proc->waitFor(2000);
    }
    result.exit_code = proc->exitCode().value_or(-1);
    result.output = proc->output();
    if (result.exit_code == 127 && result.output.empty()) {
        return Err<CommandResult>(ErrorCode::IoError, "failed to execute " + argv[0]);
    }
    return Ok(std::move(result));
}

} // namespace mirrorhub
