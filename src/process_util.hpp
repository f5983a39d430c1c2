// =============================================================================
// mirrorhub - Child Process Helpers
// =============================================================================
// fork/exec wrappers used to drive the adb executable: one-shot commands with
// a timeout and output cap, and long-running children with a captured
// output tail.
// =============================================================================
#pragma once
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h>
#include "result.hpp"

namespace mirrorhub {

static constexpr size_t MAX_COMMAND_OUTPUT = 1024 * 1024;  // 1MB
static constexpr size_t PROCESS_TAIL_BYTES = 16 * 1024;

struct CommandResult {
    int exit_code = -1;
    std::string output;     // stdout + stderr
    bool timed_out = false;
};

// Runs argv[0] (PATH lookup) and waits up to timeout_ms.
// Fails only when the process cannot be started; a timeout is reported in
// the result and the child is killed.
Result<CommandResult> runCommand(const std::vector<std::string>& argv, int timeout_ms,
                                 size_t max_output = MAX_COMMAND_OUTPUT);

class ChildProcess {
public:
    static Result<std::unique_ptr<ChildProcess>> spawn(const std::vector<std::string>& argv,
                                                       size_t output_limit = PROCESS_TAIL_BYTES);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    bool running();
    std::optional<int> exitCode();
    void terminate();   // SIGTERM
    void kill();        // SIGKILL
    bool waitFor(int timeout_ms);

    // Captured stdout/stderr (last output_limit bytes)
    std::string output();
    pid_t pid() const { return pid_; }

private:
    ChildProcess(pid_t pid, int out_fd, size_t output_limit);
    bool reap(bool block);
    void drainLoop();
    void stopDrain();

    pid_t pid_;
    int out_fd_;
    size_t output_limit_;

    std::mutex reap_mutex_;
    bool exited_ = false;
    int exit_code_ = -1;

    std::mutex output_mutex_;
    std::string output_;

    std::mutex drain_mutex_;
    std::atomic<bool> drain_stop_{false};
    std::atomic<bool> drain_eof_{false};
    std::thread drain_thread_;
};

} // namespace mirrorhub
